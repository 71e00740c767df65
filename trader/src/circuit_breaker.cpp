#include "circuit_breaker.hpp"
#include <spdlog/spdlog.h>
#include <cmath>
#include <mutex>

std::string to_string(BreakerState state) {
    switch (state) {
        case BreakerState::Active: return "ACTIVE";
        case BreakerState::Tripped: return "TRIPPED";
        case BreakerState::Cooldown: return "COOLDOWN";
    }
    return "UNKNOWN";
}

namespace {
template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;
}

std::string describe(const TripReason& reason) {
    return std::visit(overloaded{
        [](const MaxLoss24h& r) {
            return fmt::format("24h loss ${:.2f} exceeded threshold ${:.2f}", r.loss, r.threshold);
        },
        [](const ConsecutiveLosses& r) {
            return fmt::format("{} consecutive losses exceeded threshold {}", r.count, r.threshold);
        },
        [](const MaxDrawdown& r) {
            return fmt::format("Drawdown {:.1f}% exceeded threshold {:.1f}%", r.drawdown, r.threshold);
        },
        [](const ManualTrip& r) {
            return fmt::format("Manual: {}", r.reason);
        }
    }, reason);
}

std::string reason_kind(const TripReason& reason) {
    return std::visit(overloaded{
        [](const MaxLoss24h&) { return std::string("MAX_LOSS_24H"); },
        [](const ConsecutiveLosses&) { return std::string("CONSECUTIVE_LOSSES"); },
        [](const MaxDrawdown&) { return std::string("MAX_DRAWDOWN"); },
        [](const ManualTrip&) { return std::string("MANUAL"); }
    }, reason);
}

nlohmann::json CircuitBreakerStatus::to_json() const {
    nlohmann::json j = {
        {"state", to_string(state)},
        {"trading_allowed", state == BreakerState::Active}
    };
    j["trip_reason"] = trip_reason ? nlohmann::json(describe(*trip_reason)) : nlohmann::json(nullptr);
    j["trip_kind"] = trip_reason ? nlohmann::json(reason_kind(*trip_reason)) : nlohmann::json(nullptr);
    j["tripped_at"] = tripped_at ? nlohmann::json(util::to_iso8601(*tripped_at)) : nlohmann::json(nullptr);
    j["cooldown_remaining_secs"] = cooldown_remaining_secs ? nlohmann::json(*cooldown_remaining_secs)
                                                           : nlohmann::json(nullptr);
    j["last_check"] = last_check ? nlohmann::json(util::to_iso8601(*last_check)) : nlohmann::json(nullptr);
    return j;
}

CircuitBreaker::CircuitBreaker(const CircuitBreakerConfig& config,
                               std::shared_ptr<TradingMetrics> metrics,
                               std::shared_ptr<AuditLog> audit,
                               std::shared_ptr<EventSink> events,
                               util::Clock clock)
    : config_(config)
    , metrics_(metrics)
    , audit_(audit)
    , events_(events)
    , clock_(std::move(clock))
{
    spdlog::info("Circuit breaker: max_loss_24h=${:.2f}, max_consecutive_losses={}, "
                 "max_drawdown={:.1f}%, cooldown={}s",
                 config_.max_loss_24h_usd, config_.max_consecutive_losses,
                 config_.max_drawdown_percent, config_.cooldown.count());
}

std::optional<TripReason> CircuitBreaker::evaluate() {
    std::lock_guard<std::mutex> pass(evaluate_mutex_);
    auto now = clock_();
    bool cooldown_finished = false;

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (last_check_ && now - *last_check_ < config_.check_interval) {
            return std::nullopt;
        }
        last_check_ = now;

        if (state_ == BreakerState::Cooldown && tripped_at_ &&
            now - *tripped_at_ >= config_.cooldown) {
            state_ = BreakerState::Active;
            tripped_at_.reset();
            trip_reason_.reset();
            cooldown_finished = true;
        } else if (state_ != BreakerState::Active) {
            return std::nullopt;
        }
    }

    if (cooldown_finished) {
        spdlog::info("Circuit breaker cooldown complete, trading resumed");
        audit("COOLDOWN", "ACTIVE", "SYSTEM_CIRCUIT_BREAKER", "Cooldown period elapsed");
        return std::nullopt;
    }

    std::optional<TripReason> reason;
    try {
        reason = check_thresholds();
    } catch (const std::exception& e) {
        spdlog::error("Circuit breaker metrics unavailable, state unchanged: {}", e.what());
        return std::nullopt;
    }

    if (reason && !trip(*reason, "SYSTEM_CIRCUIT_BREAKER", true)) {
        return std::nullopt;
    }
    return reason;
}

std::optional<TripReason> CircuitBreaker::check_thresholds() {
    double pnl = metrics_->pnl_24h_usd();
    if (pnl < 0 && std::fabs(pnl) >= config_.max_loss_24h_usd) {
        return TripReason{MaxLoss24h{std::fabs(pnl), config_.max_loss_24h_usd}};
    }

    int losses = metrics_->consecutive_losses();
    if (losses >= config_.max_consecutive_losses) {
        return TripReason{ConsecutiveLosses{losses, config_.max_consecutive_losses}};
    }

    double drawdown = metrics_->max_drawdown_percent();
    if (drawdown >= config_.max_drawdown_percent) {
        return TripReason{MaxDrawdown{drawdown, config_.max_drawdown_percent}};
    }

    spdlog::debug("Circuit breaker check: pnl_24h=${:.2f}, losses={}, drawdown={:.1f}%",
                  pnl, losses, drawdown);
    return std::nullopt;
}

bool CircuitBreaker::trip(const TripReason& reason, const std::string& actor, bool require_active) {
    BreakerState previous;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (require_active && state_ != BreakerState::Active) {
            return false;
        }
        previous = state_;
        state_ = BreakerState::Tripped;
        tripped_at_ = clock_();
        trip_reason_ = reason;
    }

    auto text = describe(reason);
    spdlog::error("CIRCUIT BREAKER TRIPPED: {}", text);
    audit(to_string(previous), "TRIPPED", actor, text);

    emit_notification(events_.get(), NotificationLevel::Critical, "circuit_breaker_triggered", {
        {"reason", text},
        {"kind", reason_kind(reason)},
        {"actor", actor}
    });
    return true;
}

void CircuitBreaker::audit(const std::string& old_value, const std::string& new_value,
                           const std::string& actor, const std::string& reason) {
    if (!audit_) return;
    try {
        audit_->log_config_change("circuit_breaker", old_value, new_value, actor, reason);
    } catch (const std::exception& e) {
        spdlog::error("Failed to audit circuit breaker change {} -> {}: {}",
                      old_value, new_value, e.what());
    }
}

bool CircuitBreaker::is_trading_allowed() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return state_ == BreakerState::Active;
}

BreakerState CircuitBreaker::state() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return state_;
}

CircuitBreakerStatus CircuitBreaker::status() const {
    auto now = clock_();
    std::shared_lock<std::shared_mutex> lock(mutex_);

    CircuitBreakerStatus s;
    s.state = state_;
    s.trip_reason = trip_reason_;
    s.tripped_at = tripped_at_;
    s.last_check = last_check_;

    if (state_ == BreakerState::Cooldown && tripped_at_) {
        auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - *tripped_at_);
        auto remaining = (config_.cooldown - elapsed).count();
        s.cooldown_remaining_secs = remaining > 0 ? remaining : 0;
    }
    return s;
}

bool CircuitBreaker::enter_cooldown() {
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (state_ != BreakerState::Tripped) {
            return false;
        }
        state_ = BreakerState::Cooldown;
    }

    spdlog::info("Circuit breaker entering cooldown for {}s", config_.cooldown.count());
    audit("TRIPPED", "COOLDOWN", "SYSTEM_CIRCUIT_BREAKER", "Cooldown started");
    return true;
}

void CircuitBreaker::reset(const std::string& admin_id) {
    BreakerState previous;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        previous = state_;
        state_ = BreakerState::Active;
        tripped_at_.reset();
        trip_reason_.reset();
    }

    spdlog::warn("Circuit breaker reset by {} (was {})", admin_id, to_string(previous));
    audit(to_string(previous), "ACTIVE", "ADMIN:" + admin_id, "Manual reset");
}

void CircuitBreaker::manual_trip(const std::string& admin_id, const std::string& reason) {
    trip(ManualTrip{reason}, "ADMIN:" + admin_id);
}
