#include "signal.hpp"
#include "errors.hpp"
#include "util.hpp"

std::string to_string(Strategy strategy) {
    switch (strategy) {
        case Strategy::Exit: return "EXIT";
        case Strategy::Conservative: return "CONSERVATIVE";
        case Strategy::Aggressive: return "AGGRESSIVE";
    }
    return "UNKNOWN";
}

std::string to_string(Action action) {
    return action == Action::Buy ? "BUY" : "SELL";
}

Strategy parse_strategy(const std::string& text) {
    auto upper = util::to_upper(text);
    if (upper == "EXIT") return Strategy::Exit;
    if (upper == "CONSERVATIVE" || upper == "SHIELD") return Strategy::Conservative;
    if (upper == "AGGRESSIVE" || upper == "SPEAR") return Strategy::Aggressive;
    throw TradeError(ErrorCode::ValidationFailed, "Unknown strategy: " + text);
}

Action parse_action(const std::string& text) {
    auto upper = util::to_upper(text);
    if (upper == "BUY") return Action::Buy;
    if (upper == "SELL") return Action::Sell;
    throw TradeError(ErrorCode::ValidationFailed, "Unknown action: " + text);
}

void Signal::validate() const {
    if (token.empty()) {
        throw TradeError(ErrorCode::ValidationFailed, "Token cannot be empty");
    }
    if (!util::is_valid_solana_address(wallet_address)) {
        throw TradeError(ErrorCode::ValidationFailed, "Invalid wallet address: " + wallet_address);
    }
    if (!amount.is_positive()) {
        throw TradeError(ErrorCode::ValidationFailed, "Amount must be positive");
    }
    if (amount.lamports() > MAX_SIGNAL_LAMPORTS) {
        throw TradeError(ErrorCode::ValidationFailed, "Amount exceeds maximum (100 SOL)");
    }
    if (strategy == Strategy::Exit && action != Action::Sell) {
        throw TradeError(ErrorCode::ValidationFailed, "EXIT strategy requires SELL action");
    }
    if (trade_uuid.empty()) {
        throw TradeError(ErrorCode::ValidationFailed, "trade_uuid is required");
    }
}

nlohmann::json Signal::to_json() const {
    return {
        {"trade_uuid", trade_uuid},
        {"strategy", to_string(strategy)},
        {"action", to_string(action)},
        {"token", token},
        {"token_address", token_address},
        {"amount_sol", amount.to_string()},
        {"wallet_address", wallet_address},
        {"timestamp", timestamp}
    };
}

Signal Signal::from_json(const nlohmann::json& j) {
    Signal s;
    try {
        s.strategy = parse_strategy(j.at("strategy").get<std::string>());
        s.action = parse_action(j.at("action").get<std::string>());
        s.token = j.at("token").get<std::string>();
        s.token_address = j.value("token_address", "");
        s.wallet_address = j.at("wallet_address").get<std::string>();
        s.timestamp = j.value("timestamp", util::current_unix_seconds());

        const auto& amount = j.at("amount_sol");
        s.amount = SolAmount::parse(amount.is_string() ? amount.get<std::string>() : amount.dump());

        s.trade_uuid = j.value("trade_uuid", "");
    } catch (const nlohmann::json::exception& e) {
        throw TradeError(ErrorCode::ValidationFailed, std::string("Malformed signal: ") + e.what());
    }

    if (s.trade_uuid.empty()) {
        s.trade_uuid = make_trade_uuid(s.timestamp, s.token, s.action, s.amount, s.wallet_address);
    }
    return s;
}

std::string Signal::make_trade_uuid(int64_t timestamp,
                                    const std::string& token,
                                    Action action,
                                    const SolAmount& amount,
                                    const std::string& wallet_address) {
    std::string material;
    for (int shift = 56; shift >= 0; shift -= 8) {
        material.push_back(static_cast<char>((static_cast<uint64_t>(timestamp) >> shift) & 0xff));
    }
    material += token;
    material += to_string(action);
    material += amount.to_string();
    material += wallet_address;

    return util::sha256_hex(material, 16);
}
