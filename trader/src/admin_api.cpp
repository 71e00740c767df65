#include "admin_api.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

AdminApi::AdminApi(std::shared_ptr<HealthCheck> health,
                   std::shared_ptr<SignalQueue> queue,
                   std::shared_ptr<CircuitBreaker> breaker,
                   std::shared_ptr<Executor> executor,
                   std::shared_ptr<TradeStore> trades,
                   const std::string& admin_api_key)
    : health_(health), queue_(queue), breaker_(breaker),
      executor_(executor), trades_(trades), admin_api_key_(admin_api_key) {}

void AdminApi::reply(httplib::Response& res, int status, const nlohmann::json& body) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

std::optional<std::string> AdminApi::authorize(const httplib::Request& req) const {
    if (admin_api_key_.empty()) {
        return std::nullopt;
    }

    std::string header = req.get_header_value("Authorization");
    const std::string prefix = "Bearer ";
    if (header.size() <= prefix.size() || header.compare(0, prefix.size(), prefix) != 0) {
        return std::nullopt;
    }
    if (header.substr(prefix.size()) != admin_api_key_) {
        return std::nullopt;
    }

    std::string actor = req.get_header_value("X-Admin-Id");
    return actor.empty() ? std::string("unknown") : actor;
}

nlohmann::json AdminApi::status_json() const {
    return {
        {"queue", queue_->depths().to_json()},
        {"circuit_breaker", breaker_->status().to_json()},
        {"rpc", executor_->health().to_json()},
        {"ts", util::current_iso8601()}
    };
}

void AdminApi::register_routes(httplib::Server& server) {
    server.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        auto status = health_->get_status();
        reply(res, status.value("ok", false) ? 200 : 503, status);
    });

    server.Get("/api/v1/status", [this](const httplib::Request&, httplib::Response& res) {
        reply(res, 200, status_json());
    });

    server.Get(R"(/api/v1/trades/([A-Za-z0-9_-]+))",
               [this](const httplib::Request& req, httplib::Response& res) {
        if (!authorize(req)) {
            reply(res, 401, {{"ok", false}, {"error", "unauthorized"}});
            return;
        }
        auto trade = trades_->get_trade(req.matches[1].str());
        if (!trade) {
            reply(res, 404, {{"ok", false}, {"error", "trade not found"}});
            return;
        }
        reply(res, 200, trade->to_json());
    });

    server.Post("/api/v1/circuit-breaker/reset",
                [this](const httplib::Request& req, httplib::Response& res) {
        auto actor = authorize(req);
        if (!actor) {
            reply(res, 401, {{"ok", false}, {"error", "unauthorized"}});
            return;
        }
        breaker_->reset(*actor);
        reply(res, 200, {{"ok", true}, {"circuit_breaker", breaker_->status().to_json()}});
    });

    server.Post("/api/v1/circuit-breaker/trip",
                [this](const httplib::Request& req, httplib::Response& res) {
        auto actor = authorize(req);
        if (!actor) {
            reply(res, 401, {{"ok", false}, {"error", "unauthorized"}});
            return;
        }

        std::string reason = "operator request";
        if (!req.body.empty()) {
            auto body = nlohmann::json::parse(req.body, nullptr, false);
            if (body.is_discarded() || !body.is_object()) {
                reply(res, 400, {{"ok", false}, {"error", "body must be a JSON object"}});
                return;
            }
            reason = body.value("reason", reason);
        }

        breaker_->manual_trip(*actor, reason);
        reply(res, 200, {{"ok", true}, {"circuit_breaker", breaker_->status().to_json()}});
    });

    server.Post("/api/v1/circuit-breaker/cooldown",
                [this](const httplib::Request& req, httplib::Response& res) {
        auto actor = authorize(req);
        if (!actor) {
            reply(res, 401, {{"ok", false}, {"error", "unauthorized"}});
            return;
        }
        if (!breaker_->enter_cooldown()) {
            reply(res, 409, {{"ok", false}, {"error", "circuit breaker is not tripped"},
                             {"state", to_string(breaker_->state())}});
            return;
        }
        spdlog::info("Circuit breaker cooldown started by ADMIN:{}", *actor);
        reply(res, 200, {{"ok", true}, {"circuit_breaker", breaker_->status().to_json()}});
    });

    server.set_exception_handler([](const httplib::Request& req, httplib::Response& res,
                                    std::exception_ptr ep) {
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            spdlog::error("HTTP {} {} failed: {}", req.method, req.path, e.what());
            reply(res, 500, {{"ok", false}, {"error", e.what()}});
        }
    });
}
