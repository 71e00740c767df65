#include "trade_engine.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>

TradeEngine::TradeEngine(std::shared_ptr<SignalQueue> queue,
                         std::shared_ptr<TradeStore> store,
                         std::shared_ptr<CircuitBreaker> breaker,
                         std::shared_ptr<Executor> executor,
                         std::shared_ptr<EventSink> events,
                         int max_retries,
                         util::Clock clock)
    : queue_(queue)
    , store_(store)
    , breaker_(breaker)
    , executor_(executor)
    , events_(events)
    , max_retries_(max_retries)
    , clock_(std::move(clock))
{
}

Trade TradeEngine::admit(const Signal& signal) {
    if (!breaker_->is_trading_allowed()) {
        throw TradeError(ErrorCode::TradingHalted, "Trading halted by circuit breaker");
    }

    signal.validate();

    bool inserted = false;
    Trade trade;
    try {
        if (store_->trade_uuid_exists(signal.trade_uuid)) {
            throw TradeError(ErrorCode::DuplicateTrade, "Duplicate trade_uuid: " + signal.trade_uuid);
        }
        store_->insert_trade(Trade::from_signal(signal, clock_()));
        inserted = true;
        trade = store_->update_status(signal.trade_uuid, StatusUpdate::to(TradeStatus::Queued));
    } catch (const TradeError&) {
        throw;
    } catch (const std::exception& e) {
        spdlog::error("Store failure admitting {}: {}", signal.trade_uuid, e.what());
        TradeError error(ErrorCode::StoreUnavailable, e.what());
        if (inserted) {
            // the record must not stay PENDING
            dead_letter(signal, error.reason_code(), error.what());
        } else {
            try {
                store_->insert_dead_letter(std::nullopt, signal.to_json(), error.reason_code(), error.what());
            } catch (const std::exception& dlq_error) {
                spdlog::error("Failed to dead-letter {}: {}", signal.trade_uuid, dlq_error.what());
            }
        }
        throw error;
    }

    try {
        queue_->push(signal);
    } catch (const TradeError& e) {
        spdlog::warn("Signal {} rejected at queue: {}", signal.trade_uuid, e.what());
        dead_letter(signal, e.reason_code(), e.what());
        throw;
    }

    spdlog::info("Admitted trade_uuid={} {} {} {} {} SOL",
                 signal.trade_uuid, to_string(signal.strategy), to_string(signal.action),
                 signal.token, signal.amount.to_string());
    emit_trade_update(events_.get(), trade);
    return trade;
}

bool TradeEngine::process_next(std::chrono::milliseconds wait) {
    auto signal = queue_->pop_wait(wait);
    if (!signal) {
        return false;
    }

    try {
        process(*signal);
    } catch (const std::exception& e) {
        spdlog::error("Failed to process trade {}: {}", signal->trade_uuid, e.what());
    }
    return true;
}

void TradeEngine::run(std::atomic<bool>& running) {
    spdlog::info("Starting trade engine consumer");

    while (running) {
        process_next(std::chrono::milliseconds(500));
    }

    spdlog::info("Trade engine consumer stopped");
}

void TradeEngine::process(const Signal& signal) {
    if (!breaker_->is_trading_allowed()) {
        spdlog::warn("Trading halted, dead-lettering queued trade {}", signal.trade_uuid);
        dead_letter(signal, "CIRCUIT_BREAKER", "Trading halted while signal was queued");
        return;
    }

    update(signal.trade_uuid, StatusUpdate::to(TradeStatus::Executing));

    ExecutionResult result;
    try {
        result = executor_->execute(signal);
    } catch (const TradeError& e) {
        if (e.code() == ErrorCode::TradingHalted) {
            dead_letter(signal, "CIRCUIT_BREAKER", e.what());
            return;
        }
        handle_failure(signal, e);
        return;
    }

    update(signal.trade_uuid, StatusUpdate::opened(result.signature));

    // a sell is itself the exit; recovery confirms it landed
    if (signal.action == Action::Sell) {
        update(signal.trade_uuid, StatusUpdate::exiting(result.signature));
    }
}

void TradeEngine::handle_failure(const Signal& signal, const TradeError& error) {
    update(signal.trade_uuid, StatusUpdate::failed(error.reason_code() + ": " + error.what()));

    if (!is_retryable(error.code())) {
        spdlog::warn("Trade {} failed permanently: {}", signal.trade_uuid, error.what());
        return;
    }

    auto trade = store_->update_status(signal.trade_uuid, StatusUpdate::to(TradeStatus::Retry));
    emit_trade_update(events_.get(), trade);

    if (trade.max_retries_exceeded(max_retries_)) {
        spdlog::error("Trade {} exhausted {} retries, moving to dead letter", signal.trade_uuid, max_retries_);
        dead_letter(signal, "MAX_RETRIES", error.what());
        return;
    }

    try {
        queue_->push(signal);
        spdlog::info("Trade {} requeued (retry {}/{})", signal.trade_uuid, trade.retry_count, max_retries_);
    } catch (const TradeError& e) {
        dead_letter(signal, e.reason_code(), e.what());
    }
}

void TradeEngine::dead_letter(const Signal& signal, const std::string& reason, const std::string& details) {
    try {
        update(signal.trade_uuid, StatusUpdate::dead_letter(reason + ": " + details));
    } catch (const std::exception& e) {
        spdlog::error("Failed to move {} to DEAD_LETTER: {}", signal.trade_uuid, e.what());
    }

    try {
        store_->insert_dead_letter(signal.trade_uuid, signal.to_json(), reason, details);
    } catch (const std::exception& e) {
        spdlog::error("Failed to write dead letter for {}: {}", signal.trade_uuid, e.what());
    }
}

void TradeEngine::update(const std::string& trade_uuid, const StatusUpdate& change) {
    auto trade = store_->update_status(trade_uuid, change);
    spdlog::debug("Trade {} -> {}", trade_uuid, to_string(trade.status));
    emit_trade_update(events_.get(), trade);
}
