#include "health.hpp"
#include "util.hpp"

HealthCheck::HealthCheck(const std::string& service_name,
                         std::shared_ptr<RedisBus> redis,
                         std::shared_ptr<PostgresStore> pg,
                         std::shared_ptr<RpcClient> primary_rpc,
                         std::shared_ptr<CircuitBreaker> breaker,
                         std::shared_ptr<Executor> executor)
    : service_name_(service_name)
    , redis_(redis)
    , pg_(pg)
    , primary_rpc_(primary_rpc)
    , breaker_(breaker)
    , executor_(executor)
{
}

nlohmann::json HealthCheck::get_status() const {
    bool redis_ok = redis_->ping();
    bool pg_ok = pg_->ping();
    auto probe = primary_rpc_->probe_health();

    return {
        {"service", service_name_},
        {"ok", redis_ok && pg_ok},
        {"dependencies", {
            {"redis", redis_ok ? "up" : "down"},
            {"postgres", pg_ok ? "up" : "down"},
            {"primary_rpc", {
                {"status", probe.healthy ? "up" : "degraded"},
                {"latency_ms", probe.latency_ms}
            }}
        }},
        {"rpc_mode", to_string(executor_->mode())},
        {"circuit_breaker", to_string(breaker_->state())},
        {"trading_allowed", breaker_->is_trading_allowed()},
        {"ts", util::current_iso8601()}
    };
}

bool HealthCheck::is_healthy() const {
    return redis_->ping() && pg_->ping();
}
