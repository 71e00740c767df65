#include "trade.hpp"
#include "errors.hpp"

std::string to_string(TradeStatus status) {
    switch (status) {
        case TradeStatus::Pending: return "PENDING";
        case TradeStatus::Queued: return "QUEUED";
        case TradeStatus::Executing: return "EXECUTING";
        case TradeStatus::Active: return "ACTIVE";
        case TradeStatus::Exiting: return "EXITING";
        case TradeStatus::Closed: return "CLOSED";
        case TradeStatus::Failed: return "FAILED";
        case TradeStatus::Retry: return "RETRY";
        case TradeStatus::DeadLetter: return "DEAD_LETTER";
    }
    return "UNKNOWN";
}

TradeStatus parse_trade_status(const std::string& text) {
    auto upper = util::to_upper(text);
    if (upper == "PENDING") return TradeStatus::Pending;
    if (upper == "QUEUED") return TradeStatus::Queued;
    if (upper == "EXECUTING") return TradeStatus::Executing;
    if (upper == "ACTIVE") return TradeStatus::Active;
    if (upper == "EXITING") return TradeStatus::Exiting;
    if (upper == "CLOSED") return TradeStatus::Closed;
    if (upper == "FAILED") return TradeStatus::Failed;
    if (upper == "RETRY") return TradeStatus::Retry;
    if (upper == "DEAD_LETTER") return TradeStatus::DeadLetter;
    throw TradeError(ErrorCode::ValidationFailed, "Unknown trade status: " + text);
}

bool can_transition(TradeStatus from, TradeStatus to) {
    using S = TradeStatus;
    switch (from) {
        case S::Pending:
            return to == S::Queued || to == S::DeadLetter;
        case S::Queued:
            return to == S::Executing || to == S::DeadLetter;
        case S::Executing:
            return to == S::Active || to == S::Failed || to == S::DeadLetter;
        case S::Active:
            return to == S::Exiting;
        case S::Exiting:
            return to == S::Closed || to == S::Active;
        case S::Failed:
            return to == S::Retry;
        case S::Retry:
            return to == S::Executing || to == S::DeadLetter;
        case S::Closed:
        case S::DeadLetter:
            return false;
    }
    return false;
}

bool is_terminal(TradeStatus status) {
    return status == TradeStatus::Closed || status == TradeStatus::DeadLetter;
}

bool is_active_position(TradeStatus status) {
    return status == TradeStatus::Active || status == TradeStatus::Exiting;
}

void validate_transition(TradeStatus from, TradeStatus to) {
    if (!can_transition(from, to)) {
        throw TradeError(ErrorCode::InvalidTransition,
                         "Invalid state transition from " + to_string(from) + " to " + to_string(to));
    }
}

StatusUpdate StatusUpdate::to(TradeStatus status) {
    StatusUpdate u;
    u.status = status;
    return u;
}

StatusUpdate StatusUpdate::failed(const std::string& error) {
    auto u = to(TradeStatus::Failed);
    u.error_message = error;
    return u;
}

StatusUpdate StatusUpdate::opened(const std::string& signature) {
    auto u = to(TradeStatus::Active);
    u.tx_signature = signature;
    return u;
}

StatusUpdate StatusUpdate::exiting(const std::string& exit_signature) {
    auto u = to(TradeStatus::Exiting);
    u.exit_tx_signature = exit_signature;
    return u;
}

StatusUpdate StatusUpdate::closed(std::optional<double> pnl_usd) {
    auto u = to(TradeStatus::Closed);
    u.pnl_usd = pnl_usd;
    return u;
}

StatusUpdate StatusUpdate::reverted_to_active() {
    return to(TradeStatus::Active);
}

StatusUpdate StatusUpdate::dead_letter(const std::string& reason) {
    auto u = to(TradeStatus::DeadLetter);
    u.error_message = reason;
    return u;
}

Trade Trade::from_signal(const Signal& signal, util::TimePoint now) {
    Trade t;
    t.trade_uuid = signal.trade_uuid;
    t.strategy = signal.strategy;
    t.action = signal.action;
    t.token = signal.token;
    t.token_address = signal.token_address;
    t.wallet_address = signal.wallet_address;
    t.amount = signal.amount;
    t.status = TradeStatus::Pending;
    t.created_at = now;
    t.updated_at = now;
    return t;
}

void Trade::apply(const StatusUpdate& update, util::TimePoint now) {
    validate_transition(status, update.status);

    auto missing = [&](const char* field) {
        return TradeError(ErrorCode::ValidationFailed,
                          std::string("Transition to ") + to_string(update.status) +
                          " requires " + field);
    };

    if (update.status == TradeStatus::Failed && !update.error_message) {
        throw missing("error_message");
    }
    if (status == TradeStatus::Executing && update.status == TradeStatus::Active && !update.tx_signature) {
        throw missing("tx_signature");
    }
    if (update.status == TradeStatus::Exiting && !update.exit_tx_signature) {
        throw missing("exit_tx_signature");
    }

    if (status == TradeStatus::Exiting && update.status == TradeStatus::Active) {
        exit_tx_signature.reset();
    }
    if (update.status == TradeStatus::Retry) {
        retry_count++;
    }
    if (update.status == TradeStatus::Active && status == TradeStatus::Executing) {
        error_message.reset();
    }

    if (update.tx_signature) tx_signature = update.tx_signature;
    if (update.exit_tx_signature) exit_tx_signature = update.exit_tx_signature;
    if (update.error_message) error_message = update.error_message;
    if (update.pnl_usd) pnl_usd = update.pnl_usd;

    status = update.status;
    updated_at = now;
}

nlohmann::json Trade::to_json() const {
    nlohmann::json j = {
        {"trade_uuid", trade_uuid},
        {"strategy", to_string(strategy)},
        {"action", to_string(action)},
        {"token", token},
        {"amount_sol", amount.to_string()},
        {"status", to_string(status)},
        {"retry_count", retry_count},
        {"updated_at", util::to_iso8601(updated_at)}
    };
    j["tx_signature"] = tx_signature ? nlohmann::json(*tx_signature) : nlohmann::json(nullptr);
    j["exit_tx_signature"] = exit_tx_signature ? nlohmann::json(*exit_tx_signature) : nlohmann::json(nullptr);
    j["error_message"] = error_message ? nlohmann::json(*error_message) : nlohmann::json(nullptr);
    if (pnl_usd) j["pnl_usd"] = *pnl_usd;
    return j;
}
