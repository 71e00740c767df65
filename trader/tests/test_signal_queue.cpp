#include <catch2/catch_test_macros.hpp>
#include "../src/signal_queue.hpp"
#include "../src/errors.hpp"
#include "fakes.hpp"
#include <atomic>
#include <thread>

namespace {
ErrorCode push_error(SignalQueue& queue, const Signal& signal) {
    try {
        queue.push(signal);
    } catch (const TradeError& e) {
        return e.code();
    }
    FAIL("push was accepted");
    return ErrorCode::QueueFull;
}
}

TEST_CASE("Signal queue priority", "[queue]") {
    SignalQueue queue(100, 80);

    SECTION("Exit drains before conservative before aggressive") {
        queue.push(make_signal("a1", Strategy::Aggressive));
        queue.push(make_signal("c1", Strategy::Conservative));
        queue.push(make_signal("e1", Strategy::Exit, Action::Sell));
        queue.push(make_signal("c2", Strategy::Conservative));

        REQUIRE(queue.pop()->trade_uuid == "e1");
        REQUIRE(queue.pop()->trade_uuid == "c1");
        REQUIRE(queue.pop()->trade_uuid == "c2");
        REQUIRE(queue.pop()->trade_uuid == "a1");
        REQUIRE_FALSE(queue.pop().has_value());
    }

    SECTION("FIFO within a lane") {
        for (int i = 0; i < 5; i++) {
            queue.push(make_signal("s" + std::to_string(i)));
        }
        for (int i = 0; i < 5; i++) {
            REQUIRE(queue.pop()->trade_uuid == "s" + std::to_string(i));
        }
    }

    SECTION("Depths per lane") {
        queue.push(make_signal("e1", Strategy::Exit, Action::Sell));
        queue.push(make_signal("c1", Strategy::Conservative));
        queue.push(make_signal("c2", Strategy::Conservative));
        queue.push(make_signal("a1", Strategy::Aggressive));

        auto d = queue.depths();
        REQUIRE(d.high == 1);
        REQUIRE(d.medium == 2);
        REQUIRE(d.low == 1);
        REQUIRE(d.total == 4);
        REQUIRE(d.capacity == 100);
        REQUIRE(d.to_json()["total"] == 4);
    }
}

TEST_CASE("Signal queue capacity and load shedding", "[queue]") {
    SECTION("Threshold is a share of capacity") {
        SignalQueue queue(1000, 80);
        REQUIRE(queue.shed_threshold() == 800);
    }

    SECTION("Aggressive shed at the threshold, others still admitted") {
        SignalQueue queue(10, 80);
        for (int i = 0; i < 7; i++) {
            queue.push(make_signal("c" + std::to_string(i)));
        }

        // depth 7 < 8: last aggressive slot
        queue.push(make_signal("a-ok", Strategy::Aggressive));
        REQUIRE(queue.depths().total == 8);

        REQUIRE(push_error(queue, make_signal("a-shed", Strategy::Aggressive)) == ErrorCode::LoadShed);

        queue.push(make_signal("c-ok", Strategy::Conservative));
        queue.push(make_signal("e-ok", Strategy::Exit, Action::Sell));
        REQUIRE(queue.depths().total == 10);
    }

    SECTION("Shedding starts once depth reaches the threshold") {
        SignalQueue queue(10, 80);
        for (int i = 0; i < 8; i++) {
            queue.push(make_signal("c" + std::to_string(i)));
        }

        REQUIRE(push_error(queue, make_signal("a", Strategy::Aggressive)) == ErrorCode::LoadShed);
        REQUIRE_NOTHROW(queue.push(make_signal("c8")));
        REQUIRE_NOTHROW(queue.push(make_signal("e", Strategy::Exit, Action::Sell)));
    }

    SECTION("Full queue rejects every strategy") {
        SignalQueue queue(3, 100);
        queue.push(make_signal("1"));
        queue.push(make_signal("2"));
        queue.push(make_signal("3"));

        REQUIRE(push_error(queue, make_signal("e", Strategy::Exit, Action::Sell)) == ErrorCode::QueueFull);
        REQUIRE(push_error(queue, make_signal("c")) == ErrorCode::QueueFull);
        REQUIRE(queue.depths().total == 3);

        queue.pop();
        queue.push(make_signal("4"));
        REQUIRE(queue.depths().total == 3);
    }

    SECTION("Full takes precedence over load shedding") {
        SignalQueue queue(2, 50);
        queue.push(make_signal("1"));
        queue.push(make_signal("2"));
        REQUIRE(push_error(queue, make_signal("a", Strategy::Aggressive)) == ErrorCode::QueueFull);
    }

    SECTION("Concurrent producers never exceed capacity") {
        SignalQueue queue(50, 100);
        std::atomic<int> accepted{0};
        std::atomic<int> rejected{0};
        std::vector<std::thread> producers;
        for (int t = 0; t < 4; t++) {
            producers.emplace_back([&queue, &accepted, &rejected, t]() {
                for (int i = 0; i < 40; i++) {
                    try {
                        queue.push(make_signal(std::to_string(t) + "-" + std::to_string(i)));
                        accepted++;
                    } catch (const TradeError& e) {
                        if (e.code() == ErrorCode::QueueFull) rejected++;
                    }
                }
            });
        }
        for (auto& p : producers) p.join();

        REQUIRE(accepted == 50);
        REQUIRE(rejected == 110);
        REQUIRE(queue.depths().total == 50);
    }
}

TEST_CASE("Signal queue blocking pop", "[queue]") {
    SignalQueue queue(10, 80);

    SECTION("Times out when empty") {
        REQUIRE_FALSE(queue.pop_wait(std::chrono::milliseconds(20)).has_value());
    }

    SECTION("Wakes on push") {
        std::thread producer([&queue]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            queue.push(make_signal("late"));
        });
        auto signal = queue.pop_wait(std::chrono::seconds(2));
        producer.join();

        REQUIRE(signal.has_value());
        REQUIRE(signal->trade_uuid == "late");
    }

    SECTION("Consumer receives every signal from concurrent producers") {
        std::atomic<bool> consistent{true};
        std::vector<std::thread> producers;
        for (int t = 0; t < 4; t++) {
            producers.emplace_back([&queue, &consistent, t]() {
                for (int i = 0; i < 25; i++) {
                    while (true) {
                        try {
                            queue.push(make_signal(std::to_string(t) + "-" + std::to_string(i)));
                            break;
                        } catch (const TradeError& e) {
                            if (e.code() != ErrorCode::QueueFull) throw;
                            std::this_thread::yield();
                        }
                    }
                    auto d = queue.depths();
                    if (d.total != d.high + d.medium + d.low || d.total > d.capacity) {
                        consistent = false;
                    }
                }
            });
        }

        int received = 0;
        int empty_wakeups = 0;
        while (received < 100 && empty_wakeups < 50) {
            if (queue.pop_wait(std::chrono::milliseconds(100))) {
                received++;
            } else {
                empty_wakeups++;
            }
        }
        for (auto& p : producers) p.join();

        REQUIRE(received == 100);
        REQUIRE(consistent);
        REQUIRE(queue.depths().total == 0);
    }
}
