#pragma once

#include "sol_amount.hpp"
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

// Priority class; declaration order is lane order
enum class Strategy {
    Exit,
    Conservative,
    Aggressive
};

enum class Action {
    Buy,
    Sell
};

std::string to_string(Strategy strategy);
std::string to_string(Action action);

// Accepts SHIELD / SPEAR as wire aliases of CONSERVATIVE / AGGRESSIVE
Strategy parse_strategy(const std::string& text);
Action parse_action(const std::string& text);

struct Signal {
    std::string trade_uuid;
    Strategy strategy = Strategy::Conservative;
    Action action = Action::Buy;
    std::string token;
    std::string token_address;
    SolAmount amount;
    std::string wallet_address;
    int64_t timestamp = 0;

    // Mint used for swaps; the symbol doubles as mint when none was given
    const std::string& mint() const {
        return token_address.empty() ? token : token_address;
    }

    void validate() const;
    nlohmann::json to_json() const;

    static Signal from_json(const nlohmann::json& j);

    static std::string make_trade_uuid(int64_t timestamp,
                                       const std::string& token,
                                       Action action,
                                       const SolAmount& amount,
                                       const std::string& wallet_address);
};

constexpr int64_t MAX_SIGNAL_LAMPORTS = 100 * SolAmount::LAMPORTS_PER_SOL;
