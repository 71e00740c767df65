#pragma once

#include "store.hpp"
#include "events.hpp"
#include "util.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

enum class BreakerState {
    Active,
    Tripped,
    Cooldown
};

std::string to_string(BreakerState state);

struct MaxLoss24h {
    double loss;
    double threshold;
};

struct ConsecutiveLosses {
    int count;
    int threshold;
};

struct MaxDrawdown {
    double drawdown;
    double threshold;
};

struct ManualTrip {
    std::string reason;
};

using TripReason = std::variant<MaxLoss24h, ConsecutiveLosses, MaxDrawdown, ManualTrip>;

std::string describe(const TripReason& reason);
std::string reason_kind(const TripReason& reason);

struct CircuitBreakerConfig {
    double max_loss_24h_usd = 500.0;
    int max_consecutive_losses = 5;
    double max_drawdown_percent = 15.0;
    std::chrono::seconds cooldown{30 * 60};
    std::chrono::seconds check_interval{30};
};

struct CircuitBreakerStatus {
    BreakerState state = BreakerState::Active;
    std::optional<TripReason> trip_reason;
    std::optional<util::TimePoint> tripped_at;
    std::optional<int64_t> cooldown_remaining_secs;
    std::optional<util::TimePoint> last_check;

    nlohmann::json to_json() const;
};

class CircuitBreaker {
public:
    CircuitBreaker(const CircuitBreakerConfig& config,
                   std::shared_ptr<TradingMetrics> metrics,
                   std::shared_ptr<AuditLog> audit,
                   std::shared_ptr<EventSink> events,
                   util::Clock clock = util::system_now);

    // Rate-limited to one pass per check interval. Returns the reason when this pass tripped.
    std::optional<TripReason> evaluate();

    bool is_trading_allowed() const;
    BreakerState state() const;
    CircuitBreakerStatus status() const;

    // Tripped -> Cooldown; no-op from any other state
    bool enter_cooldown();

    void reset(const std::string& admin_id);
    void manual_trip(const std::string& admin_id, const std::string& reason);

private:
    std::optional<TripReason> check_thresholds();
    // With require_active, returns false and changes nothing unless the breaker is Active
    bool trip(const TripReason& reason, const std::string& actor, bool require_active = false);
    void audit(const std::string& old_value, const std::string& new_value,
               const std::string& actor, const std::string& reason);

    CircuitBreakerConfig config_;
    std::shared_ptr<TradingMetrics> metrics_;
    std::shared_ptr<AuditLog> audit_;
    std::shared_ptr<EventSink> events_;
    util::Clock clock_;

    mutable std::shared_mutex mutex_;
    BreakerState state_ = BreakerState::Active;
    std::optional<util::TimePoint> tripped_at_;
    std::optional<TripReason> trip_reason_;
    std::optional<util::TimePoint> last_check_;

    // serializes evaluation passes; state reads never wait on it
    std::mutex evaluate_mutex_;
};
