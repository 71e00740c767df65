#include "errors.hpp"

std::string error_code_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::QueueFull: return "QUEUE_FULL";
        case ErrorCode::LoadShed: return "LOAD_SHED";
        case ErrorCode::DuplicateTrade: return "DUPLICATE_TRADE";
        case ErrorCode::ValidationFailed: return "VALIDATION_FAILED";
        case ErrorCode::TradingHalted: return "TRADING_HALTED";
        case ErrorCode::InvalidTransition: return "INVALID_TRANSITION";
        case ErrorCode::TradeNotFound: return "TRADE_NOT_FOUND";
        case ErrorCode::StoreUnavailable: return "STORE_UNAVAILABLE";
        case ErrorCode::StrategyDisabled: return "STRATEGY_DISABLED";
        case ErrorCode::AmountTooSmall: return "AMOUNT_TOO_SMALL";
        case ErrorCode::AmountTooLarge: return "AMOUNT_TOO_LARGE";
        case ErrorCode::RpcUnavailable: return "RPC_UNAVAILABLE";
        case ErrorCode::BuildFailed: return "BUILD_FAILED";
        case ErrorCode::SubmitFailed: return "SUBMIT_FAILED";
        case ErrorCode::Timeout: return "TIMEOUT";
    }
    return "UNKNOWN";
}

bool is_retryable(ErrorCode code) {
    switch (code) {
        case ErrorCode::RpcUnavailable:
        case ErrorCode::BuildFailed:
        case ErrorCode::SubmitFailed:
        case ErrorCode::Timeout:
            return true;
        default:
            return false;
    }
}

bool is_execution_error(ErrorCode code) {
    switch (code) {
        case ErrorCode::StrategyDisabled:
        case ErrorCode::AmountTooSmall:
        case ErrorCode::AmountTooLarge:
        case ErrorCode::RpcUnavailable:
        case ErrorCode::BuildFailed:
        case ErrorCode::SubmitFailed:
        case ErrorCode::Timeout:
            return true;
        default:
            return false;
    }
}

TradeError::TradeError(ErrorCode code, const std::string& message)
    : std::runtime_error(message)
    , code_(code)
{
}
