#include "config.hpp"
#include "sol_amount.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

double Config::get_env_double(const char* name, double default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stod(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid number for {}, using default {}", name, default_val);
        return default_val;
    }
}

bool Config::get_env_bool(const char* name, bool default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    auto upper = util::to_upper(val);
    return upper == "1" || upper == "TRUE" || upper == "YES" || upper == "ON";
}

Config Config::from_env() {
    Config cfg;

    cfg.redis_url = get_env("REDIS_URL", "redis://localhost:6379");
    cfg.stream_signals = get_env("STREAM_SIGNALS", "solrelay.signals");
    cfg.stream_notifications = get_env("STREAM_NOTIFICATIONS", "solrelay.notifications");
    cfg.stream_trade_updates = get_env("STREAM_TRADE_UPDATES", "solrelay.trade.updates");
    cfg.stream_rejections = get_env("STREAM_REJECTIONS", "solrelay.signals.rejected");
    cfg.consumer_group = get_env("CONSUMER_GROUP", "trader");
    cfg.consumer_name = get_env("CONSUMER_NAME", "trader-1");

    cfg.pg_dsn = get_env("PG_DSN");

    cfg.primary_rpc_url = get_env("PRIMARY_RPC_URL", "https://api.mainnet-beta.solana.com");
    cfg.fallback_rpc_url = get_env("FALLBACK_RPC_URL", cfg.primary_rpc_url);
    cfg.jito_url = get_env("JITO_URL", "https://mainnet.block-engine.jito.wtf");
    cfg.secondary_relay_url = get_env("SECONDARY_RELAY_URL");
    cfg.secondary_relay_name = get_env("SECONDARY_RELAY_NAME", "secondary");
    cfg.jupiter_base = get_env("JUPITER_BASE", "https://quote-api.jup.ag/v6");
    cfg.keypair_path = get_env("KEYPAIR_PATH");
    cfg.rpc_timeout_ms = get_env_int("RPC_TIMEOUT_MS", 2000);
    cfg.slippage_bps = get_env_int("SLIPPAGE_BPS", 100);

    cfg.min_position_sol = get_env("MIN_POSITION_SOL", "0.01");
    cfg.max_position_sol = get_env("MAX_POSITION_SOL", "1.0");

    cfg.tip_floor_sol = get_env("TIP_FLOOR_SOL", "0.001");
    cfg.tip_ceiling_sol = get_env("TIP_CEILING_SOL", "0.01");
    cfg.tip_percentile = get_env_int("TIP_PERCENTILE", 50);
    cfg.tip_percent_max_bps = get_env_int("TIP_PERCENT_MAX_BPS", 1000);

    cfg.queue_capacity = get_env_int("QUEUE_CAPACITY", 1000);
    cfg.load_shed_threshold_percent = get_env_int("LOAD_SHED_THRESHOLD_PERCENT", 80);

    cfg.cb_max_loss_24h_usd = get_env_double("CB_MAX_LOSS_24H_USD", 500.0);
    cfg.cb_max_consecutive_losses = get_env_int("CB_MAX_CONSECUTIVE_LOSSES", 5);
    cfg.cb_max_drawdown_percent = get_env_double("CB_MAX_DRAWDOWN_PERCENT", 15.0);
    cfg.cb_cooldown_minutes = get_env_int("CB_COOLDOWN_MINUTES", 30);
    cfg.cb_check_interval_secs = get_env_int("CB_CHECK_INTERVAL_SECS", 30);
    cfg.cb_auto_cooldown = get_env_bool("CB_AUTO_COOLDOWN", true);

    cfg.max_consecutive_failures = get_env_int("MAX_CONSECUTIVE_FAILURES", 3);
    cfg.rpc_recovery_interval_secs = get_env_int("RPC_RECOVERY_INTERVAL_SECS", 60);
    cfg.recovery_interval_secs = get_env_int("RECOVERY_INTERVAL_SECS", 30);
    cfg.stuck_threshold_secs = get_env_int("STUCK_THRESHOLD_SECS", 60);
    cfg.max_retries = get_env_int("MAX_RETRIES", 3);

    cfg.listen_addr = get_env("LISTEN_ADDR", "0.0.0.0");
    cfg.listen_port = get_env_int("LISTEN_PORT", 8085);
    cfg.admin_api_key = get_env("ADMIN_API_KEY");

    cfg.service_name = get_env("SERVICE_NAME", "trader");
    cfg.log_level = get_env("LOG_LEVEL", "info");

    return cfg;
}

void Config::validate() const {
    if (pg_dsn.empty()) {
        throw std::runtime_error("PG_DSN is required");
    }
    if (keypair_path.empty()) {
        throw std::runtime_error("KEYPAIR_PATH is required");
    }

    auto tip_floor = SolAmount::parse(tip_floor_sol);
    auto tip_ceiling = SolAmount::parse(tip_ceiling_sol);
    if (!tip_floor.is_positive() || tip_floor > tip_ceiling) {
        throw std::runtime_error("TIP_FLOOR_SOL must be positive and not above TIP_CEILING_SOL");
    }
    if (SolAmount::parse(min_position_sol) >= SolAmount::parse(max_position_sol)) {
        throw std::runtime_error("MIN_POSITION_SOL must be below MAX_POSITION_SOL");
    }
    if (queue_capacity <= 0) {
        throw std::runtime_error("QUEUE_CAPACITY must be positive");
    }
    if (load_shed_threshold_percent <= 0 || load_shed_threshold_percent > 100) {
        throw std::runtime_error("LOAD_SHED_THRESHOLD_PERCENT must be in 1..100");
    }
    if (tip_percentile < 0 || tip_percentile > 100) {
        throw std::runtime_error("TIP_PERCENTILE must be in 0..100");
    }
    if (max_consecutive_failures <= 0) {
        throw std::runtime_error("MAX_CONSECUTIVE_FAILURES must be positive");
    }
    if (admin_api_key.empty()) {
        spdlog::warn("ADMIN_API_KEY not set, admin endpoints are disabled");
    }

    spdlog::info("Configuration validated successfully");
    spdlog::info("  RPC: primary={}, fallback={}, timeout={}ms", primary_rpc_url, fallback_rpc_url, rpc_timeout_ms);
    spdlog::info("  Positions: {}..{} SOL, tips {}..{} SOL", min_position_sol, max_position_sol,
                 tip_floor_sol, tip_ceiling_sol);
    spdlog::info("  Queue: capacity={}, load shed at {}%", queue_capacity, load_shed_threshold_percent);
    spdlog::info("  Circuit breaker: loss=${}, losses={}, drawdown={}%, cooldown={}min",
                 cb_max_loss_24h_usd, cb_max_consecutive_losses, cb_max_drawdown_percent, cb_cooldown_minutes);
}
