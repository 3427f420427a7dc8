#pragma once
#include <cstdint>
#include <string>

class Config {
public:
    // Service info
    std::string service_name = "detector";
    std::string log_level = "info";
    std::string log_file;

    // Storage
    std::string db_path = "perpscout.db";

    // Exchange endpoints
    std::string rest_base_url = "https://fapi.binance.com";
    std::string ws_host = "fstream.binance.com";
    std::string ws_port = "443";
    int http_timeout_ms = 10000;

    // Bars and windowing
    std::string bar_interval = "15m";
    int window_size = 16;

    // Detection thresholds
    double price_z_threshold = 2.5;
    double volume_z_threshold = 2.0;
    double volatility_z_threshold = 2.0;
    double min_abs_return = 0.005;

    // Composite score weights
    double weight_price = 0.4;
    double weight_volume = 0.3;
    double weight_volatility = 0.3;

    // Persist every scored bar instead of anomalies only
    bool record_all_bars = false;

    // Universe selection
    int universe_top_n = 150;
    double universe_min_quote_volume = 5000.0;
    std::string universe_symbol_suffix = "USDT";
    int universe_refresh_seconds = 600;

    // Scoring
    int scoring_pass_seconds = 60;
    int scoring_pass_budget_ms = 20000;

    // Retention
    int retention_sweep_seconds = 3600;
    int max_age_hours = 24;
    int64_t max_rows_per_instrument = 10000;
    int64_t max_total_rows = 0;
    int64_t max_db_size_mb = 100;
    int retention_batch_size = 500;
    int64_t vacuum_min_deleted = 100;

    // Backfill and reconnects
    int backfill_max_attempts = 3;
    double base_backoff_seconds = 1.0;
    double max_backoff_seconds = 60.0;
    int feed_queue_capacity = 256;
    int feed_idle_timeout_seconds = 120;

    // Redis (empty host disables anomaly publishing)
    std::string redis_host;
    int redis_port = 6379;
    std::string redis_password;
    std::string redis_stream = "perpscout.anomalies";

    // Health check (port 0 disables the server)
    std::string health_host = "0.0.0.0";
    int health_port = 8085;

    static Config from_env();
    void validate() const;

    int64_t interval_ms() const;
    int64_t max_age_ms() const;
    int64_t max_db_size_bytes() const;
};
