#include <catch2/catch_test_macros.hpp>
#include "../src/executor.hpp"
#include "fakes.hpp"

using namespace std::chrono_literals;

namespace {
struct ExecutorFixture {
    FakeClock clock;
    std::shared_ptr<MemoryStore> store = std::make_shared<MemoryStore>(&clock);
    std::shared_ptr<RecordingEvents> events = std::make_shared<RecordingEvents>();
    std::shared_ptr<FakeRpc> primary = std::make_shared<FakeRpc>("primary");
    std::shared_ptr<FakeRpc> fallback = std::make_shared<FakeRpc>("fallback");
    std::shared_ptr<FakeRelay> jito = std::make_shared<FakeRelay>("jito");
    std::shared_ptr<FakeRelay> secondary = std::make_shared<FakeRelay>("secondary");
    std::shared_ptr<FakeBuilder> builder = std::make_shared<FakeBuilder>();
    std::shared_ptr<FixedTip> tips = std::make_shared<FixedTip>(SolAmount::parse("0.005"));
    std::shared_ptr<CircuitBreaker> breaker;
    std::shared_ptr<Executor> executor;

    ExecutorFixture() {
        breaker = std::make_shared<CircuitBreaker>(CircuitBreakerConfig{}, store, store, events, clock.clock());
        executor = std::make_shared<Executor>(ExecutorConfig{}, primary, fallback,
                                              std::vector<std::shared_ptr<BundleRelay>>{jito, secondary},
                                              builder, tips, breaker, store, events, clock.clock());
    }

    ErrorCode fail(const Signal& signal) {
        try {
            executor->execute(signal);
        } catch (const TradeError& e) {
            return e.code();
        }
        FAIL("execution succeeded");
        return ErrorCode::SubmitFailed;
    }

    void force_fallback() {
        builder->fail_swap = true;
        for (int i = 0; i < 3; i++) {
            fail(make_signal("f" + std::to_string(i)));
        }
        builder->fail_swap = false;
    }
};
}

TEST_CASE("Executor bundle routing", "[executor]") {
    ExecutorFixture f;
    auto signal = make_signal("t1");

    SECTION("First relay takes the bundle, tip first") {
        auto result = f.executor->execute(signal);

        REQUIRE(result.route == "bundle:jito");
        REQUIRE(result.signature == "swap-sig-t1");
        REQUIRE(*result.tip == SolAmount::parse("0.005"));
        REQUIRE(f.jito->bundles.size() == 1);
        REQUIRE(f.jito->bundles[0][0] == "tip-tx-0.005");
        REQUIRE(f.jito->bundles[0][1] == "swap-tx-t1");
        REQUIRE(f.secondary->attempts == 0);
        REQUIRE(f.tips->landed_tips.size() == 1);
        REQUIRE(f.store->tips.size() == 1);
        REQUIRE(f.store->tips[0].route == "jito");
    }

    SECTION("Relays are tried in order") {
        f.jito->fail = true;
        auto result = f.executor->execute(signal);

        REQUIRE(result.route == "bundle:secondary");
        REQUIRE(f.jito->attempts == 1);
        REQUIRE(f.secondary->bundles.size() == 1);
    }

    SECTION("All relays failing falls through to the primary node") {
        f.jito->fail = true;
        f.secondary->fail = true;
        auto result = f.executor->execute(signal);

        REQUIRE(result.route == "rpc:primary");
        REQUIRE_FALSE(result.tip.has_value());
        REQUIRE(f.primary->sent == std::vector<std::string>{"swap-tx-t1"});
        REQUIRE(f.tips->landed_tips.empty());
    }

    SECTION("Tip build failure skips relays") {
        f.builder->fail_tip = true;
        auto result = f.executor->execute(signal);

        REQUIRE(result.route == "rpc:primary");
        REQUIRE(f.jito->attempts == 0);
    }

    SECTION("Success resets the failure counter") {
        f.builder->fail_swap = true;
        f.fail(make_signal("x1"));
        f.fail(make_signal("x2"));
        REQUIRE(f.executor->health().failure_count == 2);

        f.builder->fail_swap = false;
        f.executor->execute(signal);
        REQUIRE(f.executor->health().failure_count == 0);
        REQUIRE(f.executor->mode() == RpcMode::Jito);
    }
}

TEST_CASE("Executor tip bounds", "[executor]") {
    ExecutorFixture f;

    SECTION("Clamped to the ceiling") {
        REQUIRE(f.executor->clamp_tip(SolAmount::parse("0.5"), SolAmount::parse("1")) ==
                SolAmount::parse("0.01"));
    }

    SECTION("Clamped to a share of the amount") {
        // 10% of 0.05 SOL
        REQUIRE(f.executor->clamp_tip(SolAmount::parse("0.009"), SolAmount::parse("0.05")) ==
                SolAmount::parse("0.005"));
    }

    SECTION("Floor wins over the share of a small amount") {
        REQUIRE(f.executor->clamp_tip(SolAmount::parse("0.009"), SolAmount::parse("0.001")) ==
                SolAmount::parse("0.001"));
    }

    SECTION("Untrusted strategy output is re-clamped") {
        f.tips->tip = SolAmount::parse("5");
        auto result = f.executor->execute(make_signal("t1", Strategy::Conservative, Action::Buy, "1"));
        REQUIRE(*result.tip == SolAmount::parse("0.01"));
        REQUIRE(*f.builder->last_tip == SolAmount::parse("0.01"));
    }

    SECTION("Failing strategy falls back to the floor") {
        f.tips->fail = true;
        auto result = f.executor->execute(make_signal("t1"));
        REQUIRE(*result.tip == SolAmount::parse("0.001"));
    }
}

TEST_CASE("Executor refusals", "[executor]") {
    ExecutorFixture f;

    SECTION("Amount bounds") {
        REQUIRE(f.fail(make_signal("s", Strategy::Conservative, Action::Buy, "0.009")) == ErrorCode::AmountTooSmall);
        REQUIRE(f.fail(make_signal("l", Strategy::Conservative, Action::Buy, "1.000000001")) == ErrorCode::AmountTooLarge);
        REQUIRE_NOTHROW(f.executor->execute(make_signal("min", Strategy::Conservative, Action::Buy, "0.01")));
        REQUIRE_NOTHROW(f.executor->execute(make_signal("max", Strategy::Conservative, Action::Buy, "1")));
    }

    SECTION("Halted breaker refuses without touching the network") {
        f.breaker->manual_trip("ops", "halt");
        REQUIRE(f.fail(make_signal("t1")) == ErrorCode::TradingHalted);
        REQUIRE(f.builder->swaps == 0);
        REQUIRE(f.executor->health().failure_count == 0);
    }
}

TEST_CASE("Executor failover", "[executor]") {
    ExecutorFixture f;

    SECTION("Consecutive failures switch to standard mode") {
        f.builder->fail_swap = true;
        f.fail(make_signal("f0"));
        f.fail(make_signal("f1"));
        REQUIRE(f.executor->mode() == RpcMode::Jito);

        REQUIRE(f.fail(make_signal("f2")) == ErrorCode::BuildFailed);
        REQUIRE(f.executor->mode() == RpcMode::Standard);
        REQUIRE(f.events->has("rpc_fallback"));
        REQUIRE(f.store->audits.back().key == "rpc_mode");
        REQUIRE(f.store->audits.back().new_value == "STANDARD");
        REQUIRE(f.store->audits.back().changed_by == "SYSTEM_FAILOVER");
    }

    SECTION("Standard mode sends directly to the fallback node") {
        f.force_fallback();
        auto result = f.executor->execute(make_signal("t1"));

        REQUIRE(result.route == "rpc:fallback");
        REQUIRE(f.fallback->sent.size() == 1);
        REQUIRE(f.jito->attempts == 0);
    }

    SECTION("Aggressive is disabled in standard mode") {
        f.force_fallback();
        REQUIRE(f.fail(make_signal("a1", Strategy::Aggressive)) == ErrorCode::StrategyDisabled);
        REQUIRE_NOTHROW(f.executor->execute(make_signal("e1", Strategy::Exit, Action::Sell)));
    }

    SECTION("Primary is probed only after the recovery interval") {
        f.force_fallback();
        f.clock.advance(59s);
        f.executor->execute(make_signal("t1"));
        REQUIRE(f.primary->probes == 0);
        REQUIRE(f.executor->mode() == RpcMode::Standard);
    }

    SECTION("Healthy probe restores bundle mode") {
        f.force_fallback();
        f.clock.advance(60s);
        auto result = f.executor->execute(make_signal("t1"));

        REQUIRE(f.primary->probes == 1);
        REQUIRE(result.route == "bundle:jito");
        REQUIRE(f.executor->mode() == RpcMode::Jito);
        REQUIRE(f.executor->health().failure_count == 0);
        REQUIRE(f.events->has("rpc_restored"));
        REQUIRE(f.store->audits.back().old_value == "STANDARD");
        REQUIRE(f.store->audits.back().changed_by == "SYSTEM_RECOVERY");
    }

    SECTION("Unhealthy probe keeps standard mode and waits another interval") {
        f.force_fallback();
        f.primary->healthy = false;
        f.clock.advance(60s);
        f.executor->execute(make_signal("t1"));
        REQUIRE(f.primary->probes == 1);
        REQUIRE(f.executor->mode() == RpcMode::Standard);

        f.clock.advance(30s);
        f.executor->execute(make_signal("t2"));
        REQUIRE(f.primary->probes == 1);

        f.primary->healthy = true;
        f.clock.advance(30s);
        f.executor->execute(make_signal("t3"));
        REQUIRE(f.primary->probes == 2);
        REQUIRE(f.executor->mode() == RpcMode::Jito);
        REQUIRE_FALSE(f.executor->health().last_probe_at.has_value());
    }
}
