#include "executor.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

std::string to_string(RpcMode mode) {
    return mode == RpcMode::Jito ? "JITO" : "STANDARD";
}

nlohmann::json RpcHealth::to_json() const {
    nlohmann::json j = {
        {"mode", to_string(mode)},
        {"failure_count", failure_count}
    };
    j["fallback_since"] = fallback_since ? nlohmann::json(util::to_iso8601(*fallback_since))
                                         : nlohmann::json(nullptr);
    j["last_probe_at"] = last_probe_at ? nlohmann::json(util::to_iso8601(*last_probe_at))
                                       : nlohmann::json(nullptr);
    if (last_probe) {
        j["last_probe"] = {{"healthy", last_probe->healthy}, {"latency_ms", last_probe->latency_ms}};
    }
    return j;
}

Executor::Executor(const ExecutorConfig& config,
                   std::shared_ptr<RpcClient> primary_rpc,
                   std::shared_ptr<RpcClient> fallback_rpc,
                   std::vector<std::shared_ptr<BundleRelay>> relays,
                   std::shared_ptr<TransactionBuilder> builder,
                   std::shared_ptr<TipStrategy> tips,
                   std::shared_ptr<CircuitBreaker> breaker,
                   std::shared_ptr<TradeStore> store,
                   std::shared_ptr<EventSink> events,
                   util::Clock clock)
    : config_(config)
    , primary_rpc_(primary_rpc)
    , fallback_rpc_(fallback_rpc)
    , relays_(std::move(relays))
    , builder_(builder)
    , tips_(tips)
    , breaker_(breaker)
    , store_(store)
    , events_(events)
    , clock_(std::move(clock))
{
    spdlog::info("Executor: positions {}..{} SOL, tips {}..{} SOL (max {} bps), {} bundle relays",
                 config_.min_position.to_string(), config_.max_position.to_string(),
                 config_.tip_floor.to_string(), config_.tip_ceiling.to_string(),
                 config_.tip_percent_max_bps, relays_.size());
}

RpcHealth Executor::health() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return health_;
}

RpcMode Executor::mode() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return health_.mode;
}

SolAmount Executor::clamp_tip(const SolAmount& proposed, const SolAmount& amount) const {
    auto tip = std::min(proposed, config_.tip_ceiling);
    tip = std::min(tip, amount.percent_bps(config_.tip_percent_max_bps));
    return std::max(tip, config_.tip_floor);
}

ExecutionResult Executor::execute(const Signal& signal) {
    if (breaker_ && !breaker_->is_trading_allowed()) {
        throw TradeError(ErrorCode::TradingHalted, "Trading halted by circuit breaker");
    }

    maybe_probe_primary();
    RpcMode current = mode();

    try {
        auto result = dispatch(signal, current);
        record_success();
        spdlog::info("Executed trade_uuid={} {} {} {} SOL via {} sig={}",
                     signal.trade_uuid, to_string(signal.strategy), to_string(signal.action),
                     signal.amount.to_string(), result.route, result.signature);
        return result;
    } catch (const TradeError& e) {
        if (is_execution_error(e.code())) {
            record_failure(e.what());
        }
        throw;
    } catch (const std::exception& e) {
        record_failure(e.what());
        throw TradeError(ErrorCode::SubmitFailed, e.what());
    }
}

ExecutionResult Executor::dispatch(const Signal& signal, RpcMode mode) {
    if (signal.strategy == Strategy::Aggressive && mode == RpcMode::Standard) {
        throw TradeError(ErrorCode::StrategyDisabled,
                         "AGGRESSIVE strategy disabled while in STANDARD RPC mode");
    }
    if (signal.amount < config_.min_position) {
        throw TradeError(ErrorCode::AmountTooSmall,
                         fmt::format("Amount {} SOL below minimum {} SOL",
                                     signal.amount.to_string(), config_.min_position.to_string()));
    }
    if (signal.amount > config_.max_position) {
        throw TradeError(ErrorCode::AmountTooLarge,
                         fmt::format("Amount {} SOL above maximum {} SOL",
                                     signal.amount.to_string(), config_.max_position.to_string()));
    }

    return mode == RpcMode::Jito ? execute_bundle(signal) : execute_direct(signal);
}

SolAmount Executor::propose_tip(const Signal& signal) {
    try {
        return clamp_tip(tips_->calculate_tip(signal.strategy, signal.amount), signal.amount);
    } catch (const std::exception& e) {
        spdlog::warn("Tip strategy failed for {}, using floor: {}", signal.trade_uuid, e.what());
        return config_.tip_floor;
    }
}

ExecutionResult Executor::execute_bundle(const Signal& signal) {
    auto blockhash = primary_rpc_->get_latest_blockhash();
    auto swap = builder_->build_swap(signal, blockhash);
    auto tip = propose_tip(signal);

    std::optional<SignedTransaction> tip_tx;
    try {
        tip_tx = builder_->build_tip(tip, blockhash);
    } catch (const std::exception& e) {
        spdlog::warn("Tip transaction build failed for {}, skipping bundle relays: {}",
                     signal.trade_uuid, e.what());
    }

    if (tip_tx) {
        for (const auto& relay : relays_) {
            try {
                auto bundle_id = relay->submit_bundle({tip_tx->base64, swap.base64});
                spdlog::info("Bundle {} accepted by {} (tip {} SOL)", bundle_id, relay->name(), tip.to_string());

                tips_->record_landed_tip(tip);
                try {
                    store_->record_tip({signal.trade_uuid, tip, relay->name(), bundle_id});
                } catch (const std::exception& e) {
                    spdlog::warn("Failed to record tip for {}: {}", signal.trade_uuid, e.what());
                }
                return {swap.signature, "bundle:" + relay->name(), tip};
            } catch (const std::exception& e) {
                spdlog::warn("Relay {} failed for {}: {}", relay->name(), signal.trade_uuid, e.what());
            }
        }
    }

    spdlog::warn("All bundle relays failed for {}, submitting directly to {}",
                 signal.trade_uuid, primary_rpc_->endpoint());
    auto signature = primary_rpc_->send_transaction(swap.base64);
    return {signature, "rpc:primary", std::nullopt};
}

ExecutionResult Executor::execute_direct(const Signal& signal) {
    auto blockhash = fallback_rpc_->get_latest_blockhash();
    auto swap = builder_->build_swap(signal, blockhash);
    auto signature = fallback_rpc_->send_transaction(swap.base64);
    return {signature, "rpc:fallback", std::nullopt};
}

void Executor::maybe_probe_primary() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (health_.mode != RpcMode::Standard || !health_.fallback_since) {
            return;
        }
        auto now = clock_();
        if (now - *health_.fallback_since < config_.recovery_probe_interval) {
            return;
        }
        if (health_.last_probe_at && now - *health_.last_probe_at < config_.recovery_probe_interval) {
            return;
        }
        health_.last_probe_at = now;
    }

    HealthProbe probe;
    try {
        probe = primary_rpc_->probe_health();
    } catch (const std::exception& e) {
        spdlog::warn("Primary RPC probe failed: {}", e.what());
        probe.healthy = false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        health_.last_probe = probe;
        if (!probe.healthy) {
            spdlog::warn("Primary RPC still unhealthy, staying in STANDARD mode");
            return;
        }
        health_.mode = RpcMode::Jito;
        health_.failure_count = 0;
        health_.fallback_since.reset();
        health_.last_probe_at.reset();
    }

    spdlog::info("Primary RPC healthy ({}ms), restored JITO mode", probe.latency_ms);
    audit_mode_change("STANDARD", "JITO", "SYSTEM_RECOVERY",
                      fmt::format("Primary RPC health probe succeeded ({}ms)", probe.latency_ms));
    emit_notification(events_.get(), NotificationLevel::Info, "rpc_restored", {
        {"latency_ms", probe.latency_ms}
    });
}

void Executor::record_success() {
    std::lock_guard<std::mutex> lock(mutex_);
    health_.failure_count = 0;
}

void Executor::record_failure(const std::string& error) {
    int failures;
    bool switched = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        failures = ++health_.failure_count;
        if (health_.mode == RpcMode::Jito && failures >= config_.max_consecutive_failures) {
            health_.mode = RpcMode::Standard;
            health_.fallback_since = clock_();
            health_.last_probe_at.reset();
            switched = true;
        }
    }

    spdlog::warn("Execution failure {}/{}: {}", failures, config_.max_consecutive_failures, error);
    if (!switched) {
        return;
    }

    spdlog::error("Switching to STANDARD RPC mode after {} consecutive failures", failures);
    audit_mode_change("JITO", "STANDARD", "SYSTEM_FAILOVER",
                      "Consecutive RPC failures exceeded threshold");
    emit_notification(events_.get(), NotificationLevel::Important, "rpc_fallback", {
        {"reason", fmt::format("{} consecutive failures, last: {}", failures, error)}
    });
}

void Executor::audit_mode_change(const std::string& old_mode, const std::string& new_mode,
                                 const std::string& actor, const std::string& reason) {
    try {
        store_->log_config_change("rpc_mode", old_mode, new_mode, actor, reason);
    } catch (const std::exception& e) {
        spdlog::error("Failed to audit rpc_mode change {} -> {}: {}", old_mode, new_mode, e.what());
    }
}
