#include "signal_queue.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>

nlohmann::json QueueDepths::to_json() const {
    return {
        {"high", high},
        {"medium", medium},
        {"low", low},
        {"total", total},
        {"capacity", capacity}
    };
}

SignalQueue::SignalQueue(size_t capacity, int load_shed_threshold_percent)
    : capacity_(capacity)
    , shed_threshold_(capacity * static_cast<size_t>(load_shed_threshold_percent) / 100)
{
    spdlog::info("Signal queue: capacity={}, load shedding at {} ({}%)",
                 capacity_, shed_threshold_, load_shed_threshold_percent);
}

size_t SignalQueue::lane_index(Strategy strategy) {
    switch (strategy) {
        case Strategy::Exit: return 0;
        case Strategy::Conservative: return 1;
        case Strategy::Aggressive: return 2;
    }
    return 2;
}

void SignalQueue::push(const Signal& signal) {
    // Reserve a slot first so concurrent producers can never overshoot capacity
    size_t current = total_.load();
    while (true) {
        if (current >= capacity_) {
            throw TradeError(ErrorCode::QueueFull,
                             fmt::format("Queue is full ({}/{})", current, capacity_));
        }
        if (signal.strategy == Strategy::Aggressive && current >= shed_threshold_) {
            throw TradeError(ErrorCode::LoadShed,
                             fmt::format("Load shedding active: depth {} >= {}, AGGRESSIVE rejected",
                                         current, shed_threshold_));
        }
        if (total_.compare_exchange_weak(current, current + 1)) {
            break;
        }
    }

    auto& lane = lanes_[lane_index(signal.strategy)];
    {
        std::lock_guard<std::mutex> lock(lane.mutex);
        lane.items.push_back(signal);
        ready_++;
    }

    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
    }
    not_empty_.notify_one();
}

std::optional<Signal> SignalQueue::pop() {
    for (auto& lane : lanes_) {
        std::lock_guard<std::mutex> lock(lane.mutex);
        if (!lane.items.empty()) {
            Signal signal = std::move(lane.items.front());
            lane.items.pop_front();
            ready_--;
            total_--;
            return signal;
        }
    }
    return std::nullopt;
}

std::optional<Signal> SignalQueue::pop_wait(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (auto signal = pop()) {
            return signal;
        }
        std::unique_lock<std::mutex> lock(wait_mutex_);
        if (!not_empty_.wait_until(lock, deadline, [this] { return ready_.load() > 0; })) {
            return std::nullopt;
        }
    }
}

size_t SignalQueue::lane_depth(size_t index) const {
    std::lock_guard<std::mutex> lock(lanes_[index].mutex);
    return lanes_[index].items.size();
}

QueueDepths SignalQueue::depths() const {
    QueueDepths d;
    d.high = lane_depth(0);
    d.medium = lane_depth(1);
    d.low = lane_depth(2);
    d.total = d.high + d.medium + d.low;
    d.capacity = capacity_;
    return d;
}
