#include <catch2/catch_test_macros.hpp>
#include "../src/circuit_breaker.hpp"
#include "fakes.hpp"

using namespace std::chrono_literals;

TEST_CASE("Circuit breaker thresholds", "[circuit_breaker]") {
    FakeClock clock;
    auto store = std::make_shared<MemoryStore>(&clock);
    auto events = std::make_shared<RecordingEvents>();
    CircuitBreaker breaker(CircuitBreakerConfig{}, store, store, events, clock.clock());

    SECTION("Loss just under the limit keeps trading") {
        store->pnl_24h = -499.99;
        REQUIRE_FALSE(breaker.evaluate().has_value());
        REQUIRE(breaker.is_trading_allowed());
    }

    SECTION("Loss at the limit trips") {
        store->pnl_24h = -500.0;
        auto reason = breaker.evaluate();

        REQUIRE(reason.has_value());
        REQUIRE(std::holds_alternative<MaxLoss24h>(*reason));
        REQUIRE(describe(*reason) == "24h loss $500.00 exceeded threshold $500.00");
        REQUIRE(breaker.state() == BreakerState::Tripped);
        REQUIRE_FALSE(breaker.is_trading_allowed());
    }

    SECTION("Profit never counts as loss") {
        store->pnl_24h = 900.0;
        REQUIRE_FALSE(breaker.evaluate().has_value());
    }

    SECTION("Consecutive losses at the limit trip") {
        store->losses = 4;
        REQUIRE_FALSE(breaker.evaluate().has_value());

        clock.advance(30s);
        store->losses = 5;
        auto reason = breaker.evaluate();
        REQUIRE(reason.has_value());
        REQUIRE(reason_kind(*reason) == "CONSECUTIVE_LOSSES");
        REQUIRE(describe(*reason) == "5 consecutive losses exceeded threshold 5");
    }

    SECTION("Drawdown at the limit trips") {
        store->drawdown = 15.0;
        auto reason = breaker.evaluate();
        REQUIRE(reason.has_value());
        REQUIRE(std::holds_alternative<MaxDrawdown>(*reason));
        REQUIRE(describe(*reason) == "Drawdown 15.0% exceeded threshold 15.0%");
    }

    SECTION("Loss is checked before streak and drawdown") {
        store->pnl_24h = -600.0;
        store->losses = 9;
        store->drawdown = 40.0;
        auto reason = breaker.evaluate();
        REQUIRE(std::holds_alternative<MaxLoss24h>(*reason));
    }

    SECTION("Trip is audited and notified") {
        store->losses = 6;
        breaker.evaluate();

        REQUIRE(store->audits.size() == 1);
        REQUIRE(store->audits[0].key == "circuit_breaker");
        REQUIRE(store->audits[0].old_value == "ACTIVE");
        REQUIRE(store->audits[0].new_value == "TRIPPED");
        REQUIRE(store->audits[0].changed_by == "SYSTEM_CIRCUIT_BREAKER");

        REQUIRE(events->notifications.size() == 1);
        REQUIRE(events->notifications[0].first == NotificationLevel::Critical);
        REQUIRE(events->notifications[0].second == "circuit_breaker_triggered");
    }

    SECTION("A failing notifier does not stop the trip") {
        events->fail = true;
        store->losses = 6;
        REQUIRE(breaker.evaluate().has_value());
        REQUIRE(breaker.state() == BreakerState::Tripped);
    }

    SECTION("Unavailable metrics leave state unchanged") {
        store->metrics_down = true;
        REQUIRE_FALSE(breaker.evaluate().has_value());
        REQUIRE(breaker.state() == BreakerState::Active);
    }
}

TEST_CASE("Circuit breaker rate limiting", "[circuit_breaker]") {
    FakeClock clock;
    auto store = std::make_shared<MemoryStore>(&clock);
    CircuitBreaker breaker(CircuitBreakerConfig{}, store, store, nullptr, clock.clock());

    breaker.evaluate();
    REQUIRE(store->metric_reads == 1);

    clock.advance(29s);
    store->losses = 10;
    REQUIRE_FALSE(breaker.evaluate().has_value());
    REQUIRE(store->metric_reads == 1);

    clock.advance(1s);
    REQUIRE(breaker.evaluate().has_value());
    REQUIRE(store->metric_reads == 2);
}

TEST_CASE("Circuit breaker cooldown", "[circuit_breaker]") {
    FakeClock clock;
    auto store = std::make_shared<MemoryStore>(&clock);
    CircuitBreaker breaker(CircuitBreakerConfig{}, store, store, nullptr, clock.clock());

    store->losses = 5;
    REQUIRE(breaker.evaluate().has_value());
    store->losses = 0;

    SECTION("Cooldown only starts from tripped") {
        REQUIRE(breaker.enter_cooldown());
        REQUIRE(breaker.state() == BreakerState::Cooldown);
        REQUIRE_FALSE(breaker.enter_cooldown());
        REQUIRE_FALSE(breaker.is_trading_allowed());
    }

    SECTION("Remaining time counts from the trip") {
        breaker.enter_cooldown();
        clock.advance(20min);
        auto status = breaker.status();
        REQUIRE(status.state == BreakerState::Cooldown);
        REQUIRE(*status.cooldown_remaining_secs == 600);
    }

    SECTION("Remaining time never goes negative") {
        breaker.enter_cooldown();
        clock.advance(45min);
        REQUIRE(*breaker.status().cooldown_remaining_secs == 0);
    }

    SECTION("Elapsed cooldown reactivates on the next check") {
        breaker.enter_cooldown();
        clock.advance(29min);
        breaker.evaluate();
        REQUIRE(breaker.state() == BreakerState::Cooldown);

        clock.advance(2min);
        breaker.evaluate();
        REQUIRE(breaker.state() == BreakerState::Active);
        REQUIRE(breaker.is_trading_allowed());
        REQUIRE_FALSE(breaker.status().trip_reason.has_value());
        REQUIRE(store->audits.back().old_value == "COOLDOWN");
        REQUIRE(store->audits.back().new_value == "ACTIVE");
    }

    SECTION("Tripped without cooldown stays tripped") {
        clock.advance(2h);
        breaker.evaluate();
        REQUIRE(breaker.state() == BreakerState::Tripped);
    }
}

TEST_CASE("Circuit breaker operator controls", "[circuit_breaker]") {
    FakeClock clock;
    auto store = std::make_shared<MemoryStore>(&clock);
    auto events = std::make_shared<RecordingEvents>();
    CircuitBreaker breaker(CircuitBreakerConfig{}, store, store, events, clock.clock());

    SECTION("Manual trip records the admin") {
        breaker.manual_trip("alice", "exchange maintenance");

        REQUIRE(breaker.state() == BreakerState::Tripped);
        auto status = breaker.status();
        REQUIRE(describe(*status.trip_reason) == "Manual: exchange maintenance");
        REQUIRE(status.to_json()["trip_kind"] == "MANUAL");
        REQUIRE(store->audits.back().changed_by == "ADMIN:alice");
        REQUIRE(events->has("circuit_breaker_triggered"));
    }

    SECTION("Reset resumes trading from any state") {
        breaker.manual_trip("alice", "test");
        breaker.enter_cooldown();
        breaker.reset("bob");

        REQUIRE(breaker.state() == BreakerState::Active);
        REQUIRE(breaker.is_trading_allowed());
        REQUIRE(store->audits.back().old_value == "COOLDOWN");
        REQUIRE(store->audits.back().new_value == "ACTIVE");
        REQUIRE(store->audits.back().changed_by == "ADMIN:bob");
    }

    SECTION("Manual trip during a threshold check is kept") {
        store->pnl_24h = -900.0;
        store->before_metrics_read = [&breaker] { breaker.manual_trip("alice", "maintenance"); };

        REQUIRE_FALSE(breaker.evaluate().has_value());

        auto status = breaker.status();
        REQUIRE(status.state == BreakerState::Tripped);
        REQUIRE(describe(*status.trip_reason) == "Manual: maintenance");
        REQUIRE(store->audits.size() == 1);
        REQUIRE(store->audits.back().old_value == "ACTIVE");
        REQUIRE(store->audits.back().changed_by == "ADMIN:alice");
    }

    SECTION("Status json") {
        auto j = breaker.status().to_json();
        REQUIRE(j["state"] == "ACTIVE");
        REQUIRE(j["trading_allowed"] == true);
        REQUIRE(j["trip_reason"].is_null());
    }
}
