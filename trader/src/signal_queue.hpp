#pragma once

#include "signal.hpp"
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <nlohmann/json.hpp>

struct QueueDepths {
    size_t high = 0;
    size_t medium = 0;
    size_t low = 0;
    size_t total = 0;
    size_t capacity = 0;

    nlohmann::json to_json() const;
};

// Three FIFO lanes drained in strict priority order: Exit, Conservative, Aggressive
class SignalQueue {
public:
    SignalQueue(size_t capacity, int load_shed_threshold_percent);

    // Throws TradeError(QueueFull) or TradeError(LoadShed)
    void push(const Signal& signal);

    std::optional<Signal> pop();
    std::optional<Signal> pop_wait(std::chrono::milliseconds timeout);

    // Point-in-time reading; total is the sum of the lanes as read
    QueueDepths depths() const;

    size_t capacity() const { return capacity_; }
    size_t shed_threshold() const { return shed_threshold_; }

private:
    struct Lane {
        mutable std::mutex mutex;
        std::deque<Signal> items;
    };

    static size_t lane_index(Strategy strategy);
    size_t lane_depth(size_t index) const;

    size_t capacity_;
    size_t shed_threshold_;
    std::array<Lane, 3> lanes_;
    // Slots reserved by producers, including pushes not yet in a lane
    std::atomic<size_t> total_{0};
    // Signals actually sitting in a lane; what the consumer waits on
    std::atomic<size_t> ready_{0};

    std::mutex wait_mutex_;
    std::condition_variable not_empty_;
};
