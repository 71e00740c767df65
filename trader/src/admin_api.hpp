#pragma once

#include "circuit_breaker.hpp"
#include "executor.hpp"
#include "health.hpp"
#include "signal_queue.hpp"
#include "store.hpp"
#include <memory>
#include <optional>
#include <string>
#include <httplib.h>

// Operator surface: health, runtime status, trade lookup and circuit breaker controls
class AdminApi {
public:
    AdminApi(std::shared_ptr<HealthCheck> health,
             std::shared_ptr<SignalQueue> queue,
             std::shared_ptr<CircuitBreaker> breaker,
             std::shared_ptr<Executor> executor,
             std::shared_ptr<TradeStore> trades,
             const std::string& admin_api_key);

    void register_routes(httplib::Server& server);

private:
    // Empty optional when the bearer key does not match; otherwise the X-Admin-Id actor
    std::optional<std::string> authorize(const httplib::Request& req) const;

    nlohmann::json status_json() const;

    static void reply(httplib::Response& res, int status, const nlohmann::json& body);

    std::shared_ptr<HealthCheck> health_;
    std::shared_ptr<SignalQueue> queue_;
    std::shared_ptr<CircuitBreaker> breaker_;
    std::shared_ptr<Executor> executor_;
    std::shared_ptr<TradeStore> trades_;
    std::string admin_api_key_;
};
