#pragma once

#include "chain.hpp"
#include "circuit_breaker.hpp"
#include "events.hpp"
#include "signal.hpp"
#include "store.hpp"
#include "tip_manager.hpp"
#include "util.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Jito: bundles through the block engine relays. Standard: direct sendTransaction on the fallback node.
enum class RpcMode {
    Jito,
    Standard
};

std::string to_string(RpcMode mode);

struct RpcHealth {
    RpcMode mode = RpcMode::Jito;
    int failure_count = 0;
    std::optional<util::TimePoint> fallback_since;
    std::optional<util::TimePoint> last_probe_at;
    std::optional<HealthProbe> last_probe;

    nlohmann::json to_json() const;
};

struct ExecutorConfig {
    SolAmount min_position = SolAmount::from_lamports(10000000);      // 0.01 SOL
    SolAmount max_position = SolAmount::from_lamports(1000000000);    // 1 SOL
    SolAmount tip_floor = SolAmount::from_lamports(1000000);          // 0.001 SOL
    SolAmount tip_ceiling = SolAmount::from_lamports(10000000);       // 0.01 SOL
    int64_t tip_percent_max_bps = 1000;
    int max_consecutive_failures = 3;
    std::chrono::seconds recovery_probe_interval{60};
};

struct ExecutionResult {
    std::string signature;
    std::string route;
    std::optional<SolAmount> tip;
};

class Executor {
public:
    Executor(const ExecutorConfig& config,
             std::shared_ptr<RpcClient> primary_rpc,
             std::shared_ptr<RpcClient> fallback_rpc,
             std::vector<std::shared_ptr<BundleRelay>> relays,
             std::shared_ptr<TransactionBuilder> builder,
             std::shared_ptr<TipStrategy> tips,
             std::shared_ptr<CircuitBreaker> breaker,
             std::shared_ptr<TradeStore> store,
             std::shared_ptr<EventSink> events,
             util::Clock clock = util::system_now);

    // One signal at a time; throws TradeError on refusal or failure
    ExecutionResult execute(const Signal& signal);

    SolAmount clamp_tip(const SolAmount& proposed, const SolAmount& amount) const;

    RpcHealth health() const;
    RpcMode mode() const;

private:
    void maybe_probe_primary();
    ExecutionResult dispatch(const Signal& signal, RpcMode mode);
    ExecutionResult execute_bundle(const Signal& signal);
    ExecutionResult execute_direct(const Signal& signal);
    SolAmount propose_tip(const Signal& signal);

    void record_success();
    void record_failure(const std::string& error);
    void audit_mode_change(const std::string& old_mode, const std::string& new_mode,
                           const std::string& actor, const std::string& reason);

    ExecutorConfig config_;
    std::shared_ptr<RpcClient> primary_rpc_;
    std::shared_ptr<RpcClient> fallback_rpc_;
    std::vector<std::shared_ptr<BundleRelay>> relays_;
    std::shared_ptr<TransactionBuilder> builder_;
    std::shared_ptr<TipStrategy> tips_;
    std::shared_ptr<CircuitBreaker> breaker_;
    std::shared_ptr<TradeStore> store_;
    std::shared_ptr<EventSink> events_;
    util::Clock clock_;

    mutable std::mutex mutex_;
    RpcHealth health_;
};
