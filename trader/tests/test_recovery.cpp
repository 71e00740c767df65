#include <catch2/catch_test_macros.hpp>
#include "../src/recovery.hpp"
#include "fakes.hpp"

using namespace std::chrono_literals;

namespace {
Trade exiting_trade(const std::string& uuid, util::TimePoint updated_at,
                    std::optional<std::string> exit_sig) {
    auto t = Trade::from_signal(make_signal(uuid, Strategy::Exit, Action::Sell), updated_at);
    t.status = TradeStatus::Exiting;
    t.tx_signature = valid_signature(2);
    t.exit_tx_signature = exit_sig;
    return t;
}
}

TEST_CASE("Recovery of stuck exits", "[recovery]") {
    FakeClock clock;
    auto store = std::make_shared<MemoryStore>(&clock);
    auto rpc = std::make_shared<FakeRpc>("primary");
    auto events = std::make_shared<RecordingEvents>();
    RecoveryManager recovery(RecoveryConfig{}, store, rpc, events);

    auto sig = valid_signature(1);
    store->put(exiting_trade("stuck", clock.now, sig));
    clock.advance(61s);

    SECTION("Confirmed exit closes the trade") {
        rpc->statuses[sig] = OnChainStatus::Confirmed;
        REQUIRE(recovery.run_once() == 1);

        REQUIRE(store->trades["stuck"].status == TradeStatus::Closed);
        REQUIRE(store->reconciliations.size() == 1);
        REQUIRE(store->reconciliations[0].actual_on_chain == "FOUND");
        REQUIRE(store->reconciliations[0].action_taken == "MARKED_CLOSED");
        REQUIRE(events->trades.back().status == TradeStatus::Closed);
    }

    SECTION("Missing exit reverts to active and is audited") {
        rpc->statuses[sig] = OnChainStatus::NotFound;
        REQUIRE(recovery.run_once() == 1);

        auto& trade = store->trades["stuck"];
        REQUIRE(trade.status == TradeStatus::Active);
        REQUIRE_FALSE(trade.exit_tx_signature.has_value());
        REQUIRE(store->reconciliations[0].discrepancy == "MISSING_TX");
        REQUIRE(store->audits.back().key == "position:stuck");
        REQUIRE(store->audits.back().changed_by == "SYSTEM_RECOVERY");
    }

    SECTION("Indeterminate status leaves the trade for the next pass") {
        REQUIRE(recovery.run_once() == 0);
        REQUIRE(store->trades["stuck"].status == TradeStatus::Exiting);
        REQUIRE(store->reconciliations.empty());
        REQUIRE(rpc->status_queries.size() == 1);
    }

    SECTION("The exit signature is checked before the entry one") {
        rpc->statuses[sig] = OnChainStatus::Confirmed;
        recovery.run_once();
        REQUIRE(rpc->status_queries == std::vector<std::string>{sig});
    }

    SECTION("Recently updated trades are not stuck") {
        store->put(exiting_trade("fresh", clock.now, valid_signature(3)));
        rpc->statuses[sig] = OnChainStatus::Confirmed;
        recovery.run_once();
        REQUIRE(store->trades["fresh"].status == TradeStatus::Exiting);
    }

    SECTION("A failing notifier does not undo the recovery") {
        events->fail = true;
        rpc->statuses[sig] = OnChainStatus::Confirmed;
        REQUIRE(recovery.run_once() == 1);
        REQUIRE(store->trades["stuck"].status == TradeStatus::Closed);
    }
}

TEST_CASE("Recovery skips trades it cannot check", "[recovery]") {
    FakeClock clock;
    auto store = std::make_shared<MemoryStore>(&clock);
    auto rpc = std::make_shared<FakeRpc>("primary");
    RecoveryManager recovery(RecoveryConfig{}, store, rpc, nullptr);

    SECTION("No signature at all") {
        auto t = exiting_trade("nosig", clock.now, std::nullopt);
        t.tx_signature.reset();
        REQUIRE(recovery.recover(t) == RecoveryAction::Skipped);
        REQUIRE(rpc->status_queries.empty());
    }

    SECTION("Falls back to the entry signature") {
        auto t = exiting_trade("entry", clock.now, std::nullopt);
        store->put(t);
        REQUIRE(recovery.recover(t) == RecoveryAction::StillPending);
        REQUIRE(rpc->status_queries == std::vector<std::string>{valid_signature(2)});
    }

    SECTION("Malformed signature") {
        auto t = exiting_trade("bad", clock.now, std::string("not-a-signature!"));
        REQUIRE(recovery.recover(t) == RecoveryAction::Skipped);

        t.exit_tx_signature = util::base58_encode(std::vector<uint8_t>(32, 1));
        REQUIRE(recovery.recover(t) == RecoveryAction::Skipped);
        REQUIRE(rpc->status_queries.empty());
    }
}
