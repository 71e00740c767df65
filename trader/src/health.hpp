#pragma once

#include "chain.hpp"
#include "circuit_breaker.hpp"
#include "executor.hpp"
#include "postgres_store.hpp"
#include "redis_bus.hpp"
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

// Liveness of the stores and the primary node, plus the trading interlocks
class HealthCheck {
public:
    HealthCheck(const std::string& service_name,
                std::shared_ptr<RedisBus> redis,
                std::shared_ptr<PostgresStore> pg,
                std::shared_ptr<RpcClient> primary_rpc,
                std::shared_ptr<CircuitBreaker> breaker,
                std::shared_ptr<Executor> executor);

    nlohmann::json get_status() const;

    // Redis and Postgres only; a slow RPC node degrades but never fails the check
    bool is_healthy() const;

private:
    std::string service_name_;
    std::shared_ptr<RedisBus> redis_;
    std::shared_ptr<PostgresStore> pg_;
    std::shared_ptr<RpcClient> primary_rpc_;
    std::shared_ptr<CircuitBreaker> breaker_;
    std::shared_ptr<Executor> executor_;
};
