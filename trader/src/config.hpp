#pragma once

#include <string>
#include <vector>
#include <cstdlib>

struct Config {
    // Redis
    std::string redis_url;
    std::string stream_signals;
    std::string stream_notifications;
    std::string stream_trade_updates;
    std::string stream_rejections;
    std::string consumer_group;
    std::string consumer_name;

    // Postgres
    std::string pg_dsn;

    // Solana
    std::string primary_rpc_url;
    std::string fallback_rpc_url;
    std::string jito_url;
    std::string secondary_relay_url;
    std::string secondary_relay_name;
    std::string jupiter_base;
    std::string keypair_path;
    int rpc_timeout_ms;
    int slippage_bps;

    // Position limits (decimal SOL strings)
    std::string min_position_sol;
    std::string max_position_sol;

    // Tips
    std::string tip_floor_sol;
    std::string tip_ceiling_sol;
    int tip_percentile;
    int tip_percent_max_bps;

    // Admission queue
    int queue_capacity;
    int load_shed_threshold_percent;

    // Circuit breaker
    double cb_max_loss_24h_usd;
    int cb_max_consecutive_losses;
    double cb_max_drawdown_percent;
    int cb_cooldown_minutes;
    int cb_check_interval_secs;
    bool cb_auto_cooldown;

    // Failover and recovery
    int max_consecutive_failures;
    int rpc_recovery_interval_secs;
    int recovery_interval_secs;
    int stuck_threshold_secs;
    int max_retries;

    // HTTP
    std::string listen_addr;
    int listen_port;
    std::string admin_api_key;

    // Service
    std::string service_name;
    std::string log_level;

    static Config from_env();
    void validate() const;

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
    static double get_env_double(const char* name, double default_val);
    static bool get_env_bool(const char* name, bool default_val);
};
