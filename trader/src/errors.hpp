#pragma once

#include <stdexcept>
#include <string>

enum class ErrorCode {
    // Admission
    QueueFull,
    LoadShed,
    DuplicateTrade,
    ValidationFailed,
    // Safety
    TradingHalted,
    // Lifecycle
    InvalidTransition,
    TradeNotFound,
    StoreUnavailable,
    // Execution
    StrategyDisabled,
    AmountTooSmall,
    AmountTooLarge,
    RpcUnavailable,
    BuildFailed,
    SubmitFailed,
    Timeout
};

std::string error_code_string(ErrorCode code);

// Execution errors worth another attempt through the retry lane
bool is_retryable(ErrorCode code);

bool is_execution_error(ErrorCode code);

class TradeError : public std::runtime_error {
public:
    TradeError(ErrorCode code, const std::string& message);

    ErrorCode code() const { return code_; }
    std::string reason_code() const { return error_code_string(code_); }

private:
    ErrorCode code_;
};
