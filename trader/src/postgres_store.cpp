#include "postgres_store.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

namespace {

const char* TRADE_COLUMNS =
    "trade_uuid, strategy, action, token, token_address, wallet_address, amount_sol::text, "
    "status, retry_count, tx_signature, exit_tx_signature, error_message, pnl_usd::float8, "
    "EXTRACT(EPOCH FROM created_at)::bigint, EXTRACT(EPOCH FROM updated_at)::bigint";

std::optional<std::string> optional_text(const pqxx::field& field) {
    if (field.is_null()) return std::nullopt;
    return field.as<std::string>();
}

util::TimePoint from_epoch(int64_t seconds) {
    return util::TimePoint(std::chrono::seconds(seconds));
}

}

PostgresStore::PostgresStore(const std::string& dsn) : dsn_(dsn) {
    spdlog::info("PostgresStore initialized: {}", util::redact_dsn(dsn));
}

pqxx::connection PostgresStore::make_connection() {
    return pqxx::connection(dsn_);
}

void PostgresStore::init_schema() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS trades (
                id BIGSERIAL PRIMARY KEY,
                trade_uuid TEXT UNIQUE NOT NULL,
                strategy TEXT NOT NULL CHECK (strategy IN ('EXIT','CONSERVATIVE','AGGRESSIVE')),
                action TEXT NOT NULL CHECK (action IN ('BUY','SELL')),
                token TEXT NOT NULL,
                token_address TEXT,
                wallet_address TEXT NOT NULL,
                amount_sol NUMERIC(20,9) NOT NULL,
                status TEXT NOT NULL CHECK (status IN ('PENDING','QUEUED','EXECUTING','ACTIVE',
                    'EXITING','CLOSED','FAILED','RETRY','DEAD_LETTER')),
                retry_count INT NOT NULL DEFAULT 0,
                tx_signature TEXT,
                exit_tx_signature TEXT,
                error_message TEXT,
                pnl_usd NUMERIC(20,6),
                created_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
            )
        )");

        txn.exec(R"(
            CREATE INDEX IF NOT EXISTS idx_trades_status_updated ON trades (status, updated_at)
        )");

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS dead_letter_queue (
                id BIGSERIAL PRIMARY KEY,
                trade_uuid TEXT,
                payload JSONB NOT NULL,
                reason TEXT NOT NULL,
                error_details TEXT,
                created_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
            )
        )");

        txn.exec(R"(
            CREATE INDEX IF NOT EXISTS idx_dlq_trade_uuid ON dead_letter_queue (trade_uuid)
        )");

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS config_audit (
                id BIGSERIAL PRIMARY KEY,
                key TEXT NOT NULL,
                old_value TEXT,
                new_value TEXT NOT NULL,
                changed_by TEXT NOT NULL,
                change_reason TEXT,
                created_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
            )
        )");

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS reconciliation_log (
                id BIGSERIAL PRIMARY KEY,
                trade_uuid TEXT NOT NULL,
                expected_state TEXT NOT NULL,
                actual_on_chain TEXT NOT NULL,
                discrepancy TEXT NOT NULL,
                tx_signature TEXT,
                action_taken TEXT NOT NULL,
                created_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
            )
        )");

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS jito_tip_history (
                id BIGSERIAL PRIMARY KEY,
                trade_uuid TEXT NOT NULL,
                tip_sol NUMERIC(20,9) NOT NULL,
                route TEXT NOT NULL,
                bundle_id TEXT,
                created_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
            )
        )");

        txn.commit();
        spdlog::info("Database schema initialized");

    } catch (const std::exception& e) {
        spdlog::error("Failed to initialize schema: {}", e.what());
        throw;
    }
}

Trade PostgresStore::row_to_trade(const pqxx::row& row) {
    Trade t;
    t.trade_uuid = row[0].as<std::string>();
    t.strategy = parse_strategy(row[1].as<std::string>());
    t.action = parse_action(row[2].as<std::string>());
    t.token = row[3].as<std::string>();
    t.token_address = row[4].is_null() ? "" : row[4].as<std::string>();
    t.wallet_address = row[5].as<std::string>();
    t.amount = SolAmount::parse(row[6].as<std::string>());
    t.status = parse_trade_status(row[7].as<std::string>());
    t.retry_count = row[8].as<int>();
    t.tx_signature = optional_text(row[9]);
    t.exit_tx_signature = optional_text(row[10]);
    t.error_message = optional_text(row[11]);
    if (!row[12].is_null()) t.pnl_usd = row[12].as<double>();
    t.created_at = from_epoch(row[13].as<int64_t>());
    t.updated_at = from_epoch(row[14].as<int64_t>());
    return t;
}

bool PostgresStore::trade_uuid_exists(const std::string& trade_uuid) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        auto result = txn.exec_params(
            "SELECT EXISTS(SELECT 1 FROM trades WHERE trade_uuid = $1) "
            "OR EXISTS(SELECT 1 FROM dead_letter_queue WHERE trade_uuid = $1)",
            trade_uuid
        );

        txn.commit();
        return result[0][0].as<bool>();

    } catch (const std::exception& e) {
        spdlog::error("Failed to check trade_uuid {}: {}", trade_uuid, e.what());
        throw;
    }
}

void PostgresStore::insert_trade(const Trade& trade) {
    pqxx::result result;
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        result = txn.exec_params(
            "INSERT INTO trades (trade_uuid, strategy, action, token, token_address, wallet_address, "
            "amount_sol, status) VALUES ($1, $2, $3, $4, $5, $6, $7::numeric, $8) "
            "ON CONFLICT (trade_uuid) DO NOTHING",
            trade.trade_uuid,
            to_string(trade.strategy),
            to_string(trade.action),
            trade.token,
            trade.token_address,
            trade.wallet_address,
            trade.amount.to_string(),
            to_string(trade.status)
        );

        txn.commit();

    } catch (const std::exception& e) {
        spdlog::error("Failed to insert trade {}: {}", trade.trade_uuid, e.what());
        throw;
    }

    if (result.affected_rows() == 0) {
        throw TradeError(ErrorCode::DuplicateTrade, "Duplicate trade_uuid: " + trade.trade_uuid);
    }
}

std::optional<Trade> PostgresStore::get_trade(const std::string& trade_uuid) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        auto result = txn.exec_params(
            std::string("SELECT ") + TRADE_COLUMNS + " FROM trades WHERE trade_uuid = $1",
            trade_uuid
        );

        txn.commit();
        if (result.empty()) {
            return std::nullopt;
        }
        return row_to_trade(result[0]);

    } catch (const std::exception& e) {
        spdlog::error("Failed to load trade {}: {}", trade_uuid, e.what());
        throw;
    }
}

Trade PostgresStore::update_status(const std::string& trade_uuid, const StatusUpdate& update) {
    auto conn = make_connection();
    pqxx::work txn(conn);

    // row lock makes load-validate-write a single transition
    auto rows = txn.exec_params(
        std::string("SELECT ") + TRADE_COLUMNS + " FROM trades WHERE trade_uuid = $1 FOR UPDATE",
        trade_uuid
    );
    if (rows.empty()) {
        throw TradeError(ErrorCode::TradeNotFound, "Trade not found: " + trade_uuid);
    }

    auto trade = row_to_trade(rows[0]);
    trade.apply(update, util::system_now());

    try {
        txn.exec_params(
            "UPDATE trades SET status = $2, retry_count = $3, tx_signature = $4, "
            "exit_tx_signature = $5, error_message = $6, pnl_usd = $7, updated_at = NOW() "
            "WHERE trade_uuid = $1",
            trade_uuid,
            to_string(trade.status),
            trade.retry_count,
            trade.tx_signature,
            trade.exit_tx_signature,
            trade.error_message,
            trade.pnl_usd
        );

        txn.commit();

    } catch (const std::exception& e) {
        spdlog::error("Failed to write status {} for {}: {}", to_string(trade.status), trade_uuid, e.what());
        throw;
    }

    return trade;
}

std::vector<Trade> PostgresStore::find_stuck_exiting(std::chrono::seconds threshold) {
    std::vector<Trade> trades;

    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        auto result = txn.exec_params(
            std::string("SELECT ") + TRADE_COLUMNS + " FROM trades "
            "WHERE status = 'EXITING' AND updated_at < NOW() - make_interval(secs => $1) "
            "ORDER BY updated_at",
            static_cast<double>(threshold.count())
        );

        for (const auto& row : result) {
            trades.push_back(row_to_trade(row));
        }

        txn.commit();

    } catch (const std::exception& e) {
        spdlog::error("Failed to query stuck trades: {}", e.what());
        throw;
    }

    return trades;
}

void PostgresStore::insert_dead_letter(const std::optional<std::string>& trade_uuid,
                                       const nlohmann::json& payload,
                                       const std::string& reason,
                                       const std::string& error_details) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        txn.exec_params(
            "INSERT INTO dead_letter_queue (trade_uuid, payload, reason, error_details) "
            "VALUES ($1, $2::jsonb, $3, $4)",
            trade_uuid,
            payload.dump(),
            reason,
            error_details
        );

        txn.commit();
        spdlog::warn("Dead-lettered {} ({})", trade_uuid.value_or("<no uuid>"), reason);

    } catch (const std::exception& e) {
        spdlog::error("Failed to insert dead letter: {}", e.what());
        throw;
    }
}

void PostgresStore::log_config_change(const std::string& key,
                                      const std::string& old_value,
                                      const std::string& new_value,
                                      const std::string& changed_by,
                                      const std::string& reason) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        txn.exec_params(
            "INSERT INTO config_audit (key, old_value, new_value, changed_by, change_reason) "
            "VALUES ($1, $2, $3, $4, $5)",
            key, old_value, new_value, changed_by, reason
        );

        txn.commit();

    } catch (const std::exception& e) {
        spdlog::error("Failed to write config audit for {}: {}", key, e.what());
        throw;
    }
}

void PostgresStore::log_reconciliation(const ReconciliationEntry& entry) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        txn.exec_params(
            "INSERT INTO reconciliation_log (trade_uuid, expected_state, actual_on_chain, "
            "discrepancy, tx_signature, action_taken) VALUES ($1, $2, $3, $4, $5, $6)",
            entry.trade_uuid,
            entry.expected_state,
            entry.actual_on_chain,
            entry.discrepancy,
            entry.tx_signature,
            entry.action_taken
        );

        txn.commit();

    } catch (const std::exception& e) {
        spdlog::error("Failed to write reconciliation for {}: {}", entry.trade_uuid, e.what());
        throw;
    }
}

void PostgresStore::record_tip(const TipRecord& record) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        txn.exec_params(
            "INSERT INTO jito_tip_history (trade_uuid, tip_sol, route, bundle_id) "
            "VALUES ($1, $2::numeric, $3, $4)",
            record.trade_uuid,
            record.tip.to_string(),
            record.route,
            record.bundle_id
        );

        txn.commit();

    } catch (const std::exception& e) {
        spdlog::error("Failed to record tip for {}: {}", record.trade_uuid, e.what());
        throw;
    }
}

double PostgresStore::pnl_24h_usd() {
    auto conn = make_connection();
    pqxx::work txn(conn);

    auto result = txn.exec(
        "SELECT COALESCE(SUM(pnl_usd), 0)::float8 FROM trades "
        "WHERE status = 'CLOSED' AND updated_at > NOW() - INTERVAL '24 hours'"
    );

    txn.commit();
    return result[0][0].as<double>();
}

int PostgresStore::consecutive_losses() {
    auto conn = make_connection();
    pqxx::work txn(conn);

    auto result = txn.exec(
        "SELECT pnl_usd::float8 FROM trades "
        "WHERE status = 'CLOSED' AND pnl_usd IS NOT NULL "
        "ORDER BY updated_at DESC LIMIT 20"
    );

    txn.commit();

    int streak = 0;
    for (const auto& row : result) {
        if (row[0].as<double>() >= 0) {
            break;
        }
        streak++;
    }
    return streak;
}

double PostgresStore::max_drawdown_percent() {
    auto conn = make_connection();
    pqxx::work txn(conn);

    // current decline from the running peak of cumulative realized PnL
    auto result = txn.exec(R"(
        WITH equity AS (
            SELECT updated_at,
                   SUM(pnl_usd) OVER (ORDER BY updated_at ROWS UNBOUNDED PRECEDING) AS cumulative
            FROM trades
            WHERE status = 'CLOSED' AND pnl_usd IS NOT NULL
        ),
        peaks AS (
            SELECT updated_at, cumulative,
                   MAX(cumulative) OVER (ORDER BY updated_at ROWS UNBOUNDED PRECEDING) AS peak
            FROM equity
        )
        SELECT CASE WHEN peak > 0 THEN ((peak - cumulative) / peak * 100)::float8 ELSE 0 END
        FROM peaks
        ORDER BY updated_at DESC
        LIMIT 1
    )");

    txn.commit();
    if (result.empty() || result[0][0].is_null()) {
        return 0.0;
    }
    return result[0][0].as<double>();
}

bool PostgresStore::ping() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        txn.exec("SELECT 1");
        txn.commit();
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Postgres ping failed: {}", e.what());
        return false;
    }
}
