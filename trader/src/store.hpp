#pragma once

#include "trade.hpp"
#include "sol_amount.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct ReconciliationEntry {
    std::string trade_uuid;
    std::string expected_state;
    std::string actual_on_chain;
    std::string discrepancy;
    std::optional<std::string> tx_signature;
    std::string action_taken;
};

struct TipRecord {
    std::string trade_uuid;
    SolAmount tip;
    std::string route;
    std::string bundle_id;
};

class AuditLog {
public:
    virtual ~AuditLog() = default;

    virtual void log_config_change(const std::string& key,
                                   const std::string& old_value,
                                   const std::string& new_value,
                                   const std::string& changed_by,
                                   const std::string& reason) = 0;
};

// Durable trade records; every status write is a validated transition
class TradeStore : public AuditLog {
public:
    // Checks both trades and the dead-letter queue
    virtual bool trade_uuid_exists(const std::string& trade_uuid) = 0;

    // Throws TradeError(DuplicateTrade) when the uuid is already taken
    virtual void insert_trade(const Trade& trade) = 0;

    virtual std::optional<Trade> get_trade(const std::string& trade_uuid) = 0;

    // Load, validate and write in one step; throws InvalidTransition / TradeNotFound
    virtual Trade update_status(const std::string& trade_uuid, const StatusUpdate& update) = 0;

    virtual std::vector<Trade> find_stuck_exiting(std::chrono::seconds threshold) = 0;

    virtual void insert_dead_letter(const std::optional<std::string>& trade_uuid,
                                    const nlohmann::json& payload,
                                    const std::string& reason,
                                    const std::string& error_details) = 0;

    virtual void log_reconciliation(const ReconciliationEntry& entry) = 0;

    virtual void record_tip(const TipRecord& record) = 0;
};

// Aggregates the circuit breaker reads; all computed by the store
class TradingMetrics {
public:
    virtual ~TradingMetrics() = default;

    virtual double pnl_24h_usd() = 0;
    virtual int consecutive_losses() = 0;
    virtual double max_drawdown_percent() = 0;
};
