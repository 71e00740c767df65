#pragma once

#include "store.hpp"
#include <string>
#include <vector>
#include <pqxx/pqxx>

class PostgresStore : public TradeStore, public TradingMetrics {
public:
    explicit PostgresStore(const std::string& dsn);

    void init_schema();

    // TradeStore
    bool trade_uuid_exists(const std::string& trade_uuid) override;
    void insert_trade(const Trade& trade) override;
    std::optional<Trade> get_trade(const std::string& trade_uuid) override;
    Trade update_status(const std::string& trade_uuid, const StatusUpdate& update) override;
    std::vector<Trade> find_stuck_exiting(std::chrono::seconds threshold) override;
    void insert_dead_letter(const std::optional<std::string>& trade_uuid,
                            const nlohmann::json& payload,
                            const std::string& reason,
                            const std::string& error_details) override;
    void log_reconciliation(const ReconciliationEntry& entry) override;
    void record_tip(const TipRecord& record) override;

    // AuditLog
    void log_config_change(const std::string& key,
                           const std::string& old_value,
                           const std::string& new_value,
                           const std::string& changed_by,
                           const std::string& reason) override;

    // TradingMetrics
    double pnl_24h_usd() override;
    int consecutive_losses() override;
    double max_drawdown_percent() override;

    bool ping();

private:
    std::string dsn_;

    pqxx::connection make_connection();
    static Trade row_to_trade(const pqxx::row& row);
};
