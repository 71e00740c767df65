#pragma once

#include "signal.hpp"
#include "util.hpp"
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

enum class TradeStatus {
    Pending,
    Queued,
    Executing,
    Active,
    Exiting,
    Closed,
    Failed,
    Retry,
    DeadLetter
};

constexpr int MAX_RETRY_ATTEMPTS = 3;

std::string to_string(TradeStatus status);
TradeStatus parse_trade_status(const std::string& text);

bool can_transition(TradeStatus from, TradeStatus to);
bool is_terminal(TradeStatus status);
bool is_active_position(TradeStatus status);

// Throws TradeError(InvalidTransition) naming both states
void validate_transition(TradeStatus from, TradeStatus to);

// A status change together with the context written in the same step
struct StatusUpdate {
    TradeStatus status;
    std::optional<std::string> tx_signature;
    std::optional<std::string> exit_tx_signature;
    std::optional<std::string> error_message;
    std::optional<double> pnl_usd;

    static StatusUpdate to(TradeStatus status);
    static StatusUpdate failed(const std::string& error);
    static StatusUpdate opened(const std::string& signature);
    static StatusUpdate exiting(const std::string& exit_signature);
    static StatusUpdate closed(std::optional<double> pnl_usd = std::nullopt);
    static StatusUpdate reverted_to_active();
    static StatusUpdate dead_letter(const std::string& reason);
};

struct Trade {
    std::string trade_uuid;
    Strategy strategy = Strategy::Conservative;
    Action action = Action::Buy;
    std::string token;
    std::string token_address;
    std::string wallet_address;
    SolAmount amount;

    TradeStatus status = TradeStatus::Pending;
    int retry_count = 0;
    std::optional<std::string> tx_signature;
    std::optional<std::string> exit_tx_signature;
    std::optional<std::string> error_message;
    std::optional<double> pnl_usd;

    util::TimePoint created_at;
    util::TimePoint updated_at;

    static Trade from_signal(const Signal& signal, util::TimePoint now);

    // Validates the edge and required context, then applies everything at once.
    // Entering Retry counts an attempt.
    void apply(const StatusUpdate& update, util::TimePoint now);

    bool max_retries_exceeded(int max_retries = MAX_RETRY_ATTEMPTS) const {
        return retry_count > max_retries;
    }

    nlohmann::json to_json() const;
};
