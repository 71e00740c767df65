#include "config.hpp"
#include "admin_api.hpp"
#include "bundle_relay.hpp"
#include "circuit_breaker.hpp"
#include "executor.hpp"
#include "health.hpp"
#include "jupiter_builder.hpp"
#include "keypair.hpp"
#include "postgres_store.hpp"
#include "recovery.hpp"
#include "redis_bus.hpp"
#include "rpc_solana.hpp"
#include "signal_queue.hpp"
#include "tip_manager.hpp"
#include "trade_engine.hpp"
#include "util.hpp"
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <signal.h>
#include <atomic>
#include <thread>

std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    spdlog::info("Received signal {}, initiating shutdown", signal);
    shutdown_requested = true;
}

void setup_logging(const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("solrelay", console_sink);

    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

void handle_rejection(const nlohmann::json& payload,
                      std::string trade_uuid,
                      const TradeError& error,
                      PostgresStore& pg,
                      RedisBus& redis) {
    if (trade_uuid.empty() && payload.is_object() &&
        payload.contains("trade_uuid") && payload["trade_uuid"].is_string()) {
        trade_uuid = payload["trade_uuid"].get<std::string>();
    }

    spdlog::warn("Rejected signal trade_uuid={} reason={}: {}",
                 trade_uuid.empty() ? "<none>" : trade_uuid, error.reason_code(), error.what());

    try {
        switch (error.code()) {
            case ErrorCode::ValidationFailed:
            case ErrorCode::TradingHalted:
                pg.insert_dead_letter(std::nullopt, payload, error.reason_code(), error.what());
                break;
            case ErrorCode::DuplicateTrade:
                pg.insert_dead_letter(trade_uuid, payload, error.reason_code(), error.what());
                break;
            default:
                // queue refusals and store failures were dead-lettered during admission
                break;
        }
    } catch (const std::exception& e) {
        spdlog::error("Failed to dead-letter rejected signal: {}", e.what());
    }

    emit_rejection(&redis, trade_uuid, error.reason_code(), error.what());
}

void signal_intake_loop(std::shared_ptr<Config> config,
                        std::shared_ptr<RedisBus> redis,
                        std::shared_ptr<PostgresStore> pg,
                        std::shared_ptr<TradeEngine> engine,
                        std::atomic<bool>& running) {

    spdlog::info("Starting signal intake on {}", config->stream_signals);
    redis->create_consumer_group(config->stream_signals, config->consumer_group);

    while (running) {
        try {
            auto messages = redis->read_signals(config->stream_signals, config->consumer_group,
                                                config->consumer_name, 10, 1000);

            for (const auto& [msg_id, payload] : messages) {
                std::string trade_uuid;
                try {
                    auto signal = Signal::from_json(payload);
                    trade_uuid = signal.trade_uuid;
                    engine->admit(signal);
                } catch (const TradeError& e) {
                    handle_rejection(payload, trade_uuid, e, *pg, *redis);
                } catch (const std::exception& e) {
                    spdlog::error("Failed to admit signal {}: {}", msg_id, e.what());
                    emit_rejection(redis.get(), trade_uuid, "INTERNAL_ERROR", e.what());
                }

                redis->ack_message(config->stream_signals, config->consumer_group, msg_id);
            }

        } catch (const std::exception& e) {
            spdlog::error("Signal intake error: {}", e.what());
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
    }

    spdlog::info("Signal intake stopped");
}

void breaker_loop(std::shared_ptr<CircuitBreaker> breaker,
                  bool auto_cooldown,
                  std::atomic<bool>& running) {
    spdlog::info("Starting circuit breaker monitor");

    while (running) {
        auto tripped = breaker->evaluate();
        if (tripped && auto_cooldown) {
            breaker->enter_cooldown();
        }
        std::this_thread::sleep_for(std::chrono::seconds(1));
    }

    spdlog::info("Circuit breaker monitor stopped");
}

int main(int argc, char* argv[]) {
    try {
        auto config = std::make_shared<Config>(Config::from_env());
        setup_logging(config->log_level);

        spdlog::info("==============================================");
        spdlog::info("SolRelay Trade Executor v1.0");
        spdlog::info("==============================================");

        config->validate();

        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        // Infrastructure
        auto pg = std::make_shared<PostgresStore>(config->pg_dsn);
        pg->init_schema();

        StreamNames streams{config->stream_notifications,
                            config->stream_trade_updates,
                            config->stream_rejections};
        auto redis = std::make_shared<RedisBus>(config->redis_url, streams);

        auto primary_rpc = std::make_shared<SolanaRPC>("primary", config->primary_rpc_url,
                                                       config->rpc_timeout_ms);
        auto fallback_rpc = std::make_shared<SolanaRPC>("fallback", config->fallback_rpc_url,
                                                        config->rpc_timeout_ms);

        std::vector<std::shared_ptr<BundleRelay>> relays;
        relays.push_back(std::make_shared<BundleRelayClient>("jito", config->jito_url,
                                                             config->rpc_timeout_ms));
        if (!config->secondary_relay_url.empty()) {
            relays.push_back(std::make_shared<BundleRelayClient>(config->secondary_relay_name,
                                                                 config->secondary_relay_url,
                                                                 config->rpc_timeout_ms));
        }

        auto keypair = Keypair::from_file(config->keypair_path);
        spdlog::info("Trading wallet: {}", keypair.pubkey_base58());
        auto builder = std::make_shared<JupiterTransactionBuilder>(config->jupiter_base, keypair,
                                                                   config->slippage_bps);

        // Trading components
        ExecutorConfig exec_config;
        exec_config.min_position = SolAmount::parse(config->min_position_sol);
        exec_config.max_position = SolAmount::parse(config->max_position_sol);
        exec_config.tip_floor = SolAmount::parse(config->tip_floor_sol);
        exec_config.tip_ceiling = SolAmount::parse(config->tip_ceiling_sol);
        exec_config.tip_percent_max_bps = config->tip_percent_max_bps;
        exec_config.max_consecutive_failures = config->max_consecutive_failures;
        exec_config.recovery_probe_interval = std::chrono::seconds(config->rpc_recovery_interval_secs);

        auto tips = std::make_shared<TipManager>(exec_config.tip_floor, exec_config.tip_ceiling,
                                                 config->tip_percentile);

        CircuitBreakerConfig cb_config;
        cb_config.max_loss_24h_usd = config->cb_max_loss_24h_usd;
        cb_config.max_consecutive_losses = config->cb_max_consecutive_losses;
        cb_config.max_drawdown_percent = config->cb_max_drawdown_percent;
        cb_config.cooldown = std::chrono::minutes(config->cb_cooldown_minutes);
        cb_config.check_interval = std::chrono::seconds(config->cb_check_interval_secs);
        auto breaker = std::make_shared<CircuitBreaker>(cb_config, pg, pg, redis);

        auto executor = std::make_shared<Executor>(exec_config, primary_rpc, fallback_rpc, relays,
                                                   builder, tips, breaker, pg, redis);

        auto queue = std::make_shared<SignalQueue>(config->queue_capacity,
                                                   config->load_shed_threshold_percent);
        auto engine = std::make_shared<TradeEngine>(queue, pg, breaker, executor, redis,
                                                    config->max_retries);

        RecoveryConfig recovery_config;
        recovery_config.interval = std::chrono::seconds(config->recovery_interval_secs);
        recovery_config.stuck_threshold = std::chrono::seconds(config->stuck_threshold_secs);
        auto recovery = std::make_shared<RecoveryManager>(recovery_config, pg, primary_rpc, redis);

        auto health = std::make_shared<HealthCheck>(config->service_name, redis, pg, primary_rpc,
                                                    breaker, executor);
        if (!health->is_healthy()) {
            spdlog::warn("Starting with degraded dependencies");
        }

        // Workers
        std::atomic<bool> running{true};
        std::thread intake_thread(signal_intake_loop, config, redis, pg, engine, std::ref(running));
        std::thread engine_thread([engine, &running]() { engine->run(running); });
        std::thread breaker_thread(breaker_loop, breaker, config->cb_auto_cooldown, std::ref(running));
        std::thread recovery_thread([recovery, &running]() { recovery->run(running); });

        // HTTP server
        httplib::Server server;
        AdminApi admin(health, queue, breaker, executor, pg, config->admin_api_key);
        admin.register_routes(server);

        std::thread http_thread([&server, config]() {
            spdlog::info("Starting HTTP server on {}:{}", config->listen_addr, config->listen_port);
            server.listen(config->listen_addr.c_str(), config->listen_port);
        });

        spdlog::info("Trader service started");

        while (!shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }

        spdlog::info("Stopping services...");
        running = false;
        server.stop();

        if (intake_thread.joinable()) intake_thread.join();
        if (engine_thread.joinable()) engine_thread.join();
        if (breaker_thread.joinable()) breaker_thread.join();
        if (recovery_thread.joinable()) recovery_thread.join();
        if (http_thread.joinable()) http_thread.join();

        spdlog::info("Shutdown complete");
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
