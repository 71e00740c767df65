#pragma once

#include "circuit_breaker.hpp"
#include "errors.hpp"
#include "events.hpp"
#include "executor.hpp"
#include "signal_queue.hpp"
#include "store.hpp"
#include "util.hpp"
#include <atomic>
#include <chrono>
#include <memory>

// Admission into the queue and the single consumer that drives trades through execution
class TradeEngine {
public:
    TradeEngine(std::shared_ptr<SignalQueue> queue,
                std::shared_ptr<TradeStore> store,
                std::shared_ptr<CircuitBreaker> breaker,
                std::shared_ptr<Executor> executor,
                std::shared_ptr<EventSink> events,
                int max_retries = MAX_RETRY_ATTEMPTS,
                util::Clock clock = util::system_now);

    // Validates, records and enqueues. Throws TradeError with the rejection reason;
    // store failures surface as StoreUnavailable after being dead-lettered.
    Trade admit(const Signal& signal);

    // Pops and processes at most one signal; false when nothing arrived within wait
    bool process_next(std::chrono::milliseconds wait);

    void run(std::atomic<bool>& running);

private:
    void process(const Signal& signal);
    void handle_failure(const Signal& signal, const TradeError& error);
    void dead_letter(const Signal& signal, const std::string& reason, const std::string& details);
    void update(const std::string& trade_uuid, const StatusUpdate& change);

    std::shared_ptr<SignalQueue> queue_;
    std::shared_ptr<TradeStore> store_;
    std::shared_ptr<CircuitBreaker> breaker_;
    std::shared_ptr<Executor> executor_;
    std::shared_ptr<EventSink> events_;
    int max_retries_;
    util::Clock clock_;
};
