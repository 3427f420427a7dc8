#include "config.hpp"
#include "util.hpp"
#include <stdexcept>
#include <spdlog/spdlog.h>

using util::get_env_var;

namespace {

int env_int(const std::string& name, int default_value) {
    auto value = get_env_var(name);
    if (value.empty()) return default_value;
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid integer value for " + name + ": " + value);
    }
}

int64_t env_int64(const std::string& name, int64_t default_value) {
    auto value = get_env_var(name);
    if (value.empty()) return default_value;
    try {
        return std::stoll(value);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid integer value for " + name + ": " + value);
    }
}

double env_double(const std::string& name, double default_value) {
    auto value = get_env_var(name);
    if (value.empty()) return default_value;
    try {
        return std::stod(value);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid numeric value for " + name + ": " + value);
    }
}

bool env_bool(const std::string& name, bool default_value) {
    auto value = util::to_lower(util::trim(get_env_var(name)));
    if (value.empty()) return default_value;
    if (value == "1" || value == "true" || value == "yes" || value == "on") return true;
    if (value == "0" || value == "false" || value == "no" || value == "off") return false;
    throw std::runtime_error("Invalid boolean value for " + name + ": " + value);
}

} // namespace

Config Config::from_env() {
    Config config;

    // Service
    config.service_name = get_env_var("SERVICE_NAME", config.service_name);
    config.log_level = get_env_var("LOG_LEVEL", config.log_level);
    config.log_file = get_env_var("LOG_FILE", config.log_file);

    // Storage
    config.db_path = get_env_var("DB_PATH", config.db_path);

    // Exchange
    config.rest_base_url = get_env_var("REST_BASE_URL", config.rest_base_url);
    config.ws_host = get_env_var("WS_HOST", config.ws_host);
    config.ws_port = get_env_var("WS_PORT", config.ws_port);
    config.http_timeout_ms = env_int("HTTP_TIMEOUT_MS", config.http_timeout_ms);

    // Windowing and detection
    config.bar_interval = get_env_var("BAR_INTERVAL", config.bar_interval);
    config.window_size = env_int("WINDOW_SIZE", config.window_size);
    config.price_z_threshold = env_double("PRICE_Z_THRESHOLD", config.price_z_threshold);
    config.volume_z_threshold = env_double("VOLUME_Z_THRESHOLD", config.volume_z_threshold);
    config.volatility_z_threshold = env_double("VOLATILITY_Z_THRESHOLD", config.volatility_z_threshold);
    config.min_abs_return = env_double("MIN_ABS_RETURN", config.min_abs_return);
    config.weight_price = env_double("WEIGHT_PRICE", config.weight_price);
    config.weight_volume = env_double("WEIGHT_VOLUME", config.weight_volume);
    config.weight_volatility = env_double("WEIGHT_VOLATILITY", config.weight_volatility);
    config.record_all_bars = env_bool("RECORD_ALL_BARS", config.record_all_bars);

    // Universe
    config.universe_top_n = env_int("UNIVERSE_TOP_N", config.universe_top_n);
    config.universe_min_quote_volume = env_double("UNIVERSE_MIN_QUOTE_VOLUME", config.universe_min_quote_volume);
    config.universe_symbol_suffix = get_env_var("UNIVERSE_SYMBOL_SUFFIX", config.universe_symbol_suffix);
    config.universe_refresh_seconds = env_int("UNIVERSE_REFRESH_SECONDS", config.universe_refresh_seconds);

    // Scoring
    config.scoring_pass_seconds = env_int("SCORING_PASS_SECONDS", config.scoring_pass_seconds);
    config.scoring_pass_budget_ms = env_int("SCORING_PASS_BUDGET_MS", config.scoring_pass_budget_ms);

    // Retention
    config.retention_sweep_seconds = env_int("RETENTION_SWEEP_SECONDS", config.retention_sweep_seconds);
    config.max_age_hours = env_int("MAX_AGE_HOURS", config.max_age_hours);
    config.max_rows_per_instrument = env_int64("MAX_ROWS_PER_INSTRUMENT", config.max_rows_per_instrument);
    config.max_total_rows = env_int64("MAX_TOTAL_ROWS", config.max_total_rows);
    config.max_db_size_mb = env_int64("MAX_DB_SIZE_MB", config.max_db_size_mb);
    config.retention_batch_size = env_int("RETENTION_BATCH_SIZE", config.retention_batch_size);
    config.vacuum_min_deleted = env_int64("VACUUM_MIN_DELETED", config.vacuum_min_deleted);

    // Backfill and reconnects
    config.backfill_max_attempts = env_int("BACKFILL_MAX_ATTEMPTS", config.backfill_max_attempts);
    config.base_backoff_seconds = env_double("BASE_BACKOFF_SECONDS", config.base_backoff_seconds);
    config.max_backoff_seconds = env_double("MAX_BACKOFF_SECONDS", config.max_backoff_seconds);
    config.feed_queue_capacity = env_int("FEED_QUEUE_CAPACITY", config.feed_queue_capacity);
    config.feed_idle_timeout_seconds = env_int("FEED_IDLE_TIMEOUT_SECONDS", config.feed_idle_timeout_seconds);

    // Redis
    config.redis_host = get_env_var("REDIS_HOST", config.redis_host);
    config.redis_port = env_int("REDIS_PORT", config.redis_port);
    config.redis_password = get_env_var("REDIS_PASSWORD", config.redis_password);
    config.redis_stream = get_env_var("REDIS_STREAM", config.redis_stream);

    // Health
    config.health_host = get_env_var("HEALTH_HOST", config.health_host);
    config.health_port = env_int("HEALTH_PORT", config.health_port);

    return config;
}

void Config::validate() const {
    if (db_path.empty()) {
        throw std::runtime_error("DB_PATH is required");
    }

    if (rest_base_url.empty() || ws_host.empty()) {
        throw std::runtime_error("REST_BASE_URL and WS_HOST are required");
    }

    if (http_timeout_ms < 100 || http_timeout_ms > 120000) {
        throw std::runtime_error("HTTP timeout must be between 100 and 120000 ms");
    }

    if (util::interval_to_ms(bar_interval) <= 0) {
        throw std::runtime_error("Unsupported bar interval: " + bar_interval);
    }

    if (window_size < 3 || window_size > 500) {
        throw std::runtime_error("Window size must be between 3 and 500");
    }

    if (price_z_threshold <= 0.0 || volume_z_threshold <= 0.0 || volatility_z_threshold <= 0.0) {
        throw std::runtime_error("Z-score thresholds must be positive");
    }

    if (min_abs_return < 0.0 || min_abs_return > 1.0) {
        throw std::runtime_error("Minimum absolute return must be between 0 and 1");
    }

    if (weight_price < 0.0 || weight_volume < 0.0 || weight_volatility < 0.0) {
        throw std::runtime_error("Score weights must be non-negative");
    }
    if (weight_price + weight_volume + weight_volatility <= 0.0) {
        throw std::runtime_error("At least one score weight must be positive");
    }
    if (weight_price < weight_volume || weight_price < weight_volatility) {
        throw std::runtime_error("Price weight must not be lower than volume or volatility weight");
    }

    if (universe_top_n < 1 || universe_top_n > 1000) {
        throw std::runtime_error("Universe size must be between 1 and 1000");
    }
    if (universe_min_quote_volume < 0.0) {
        throw std::runtime_error("Universe minimum quote volume must be non-negative");
    }
    if (universe_refresh_seconds < 10) {
        throw std::runtime_error("Universe refresh interval must be at least 10 seconds");
    }

    if (scoring_pass_seconds < 1 || scoring_pass_budget_ms < 100) {
        throw std::runtime_error("Scoring pass interval must be >= 1s and budget >= 100ms");
    }

    if (retention_sweep_seconds < 1) {
        throw std::runtime_error("Retention sweep interval must be at least 1 second");
    }
    if (max_age_hours < 1) {
        throw std::runtime_error("MAX_AGE_HOURS must be at least 1");
    }
    // Retention must never starve an active window
    if (max_age_ms() <= static_cast<int64_t>(window_size) * interval_ms()) {
        throw std::runtime_error("MAX_AGE_HOURS must exceed WINDOW_SIZE x BAR_INTERVAL");
    }
    if (max_rows_per_instrument < 0 || max_total_rows < 0 || max_db_size_mb < 0) {
        throw std::runtime_error("Retention caps must be non-negative");
    }
    if (max_rows_per_instrument > 0 && max_rows_per_instrument <= window_size) {
        throw std::runtime_error("MAX_ROWS_PER_INSTRUMENT must exceed WINDOW_SIZE");
    }
    if (retention_batch_size < 1 || vacuum_min_deleted < 0) {
        throw std::runtime_error("Retention batch size must be positive");
    }

    if (backfill_max_attempts < 1 || backfill_max_attempts > 10) {
        throw std::runtime_error("Backfill attempts must be between 1 and 10");
    }
    if (base_backoff_seconds <= 0.0 || max_backoff_seconds < base_backoff_seconds) {
        throw std::runtime_error("Backoff must satisfy 0 < base <= max");
    }
    if (feed_queue_capacity < 1) {
        throw std::runtime_error("Feed queue capacity must be positive");
    }
    if (feed_idle_timeout_seconds < 5) {
        throw std::runtime_error("Feed idle timeout must be at least 5 seconds");
    }

    if (health_port < 0 || health_port > 65535 || redis_port < 1 || redis_port > 65535) {
        throw std::runtime_error("Port numbers must be within 1..65535");
    }

    spdlog::info("Configuration validated successfully");
}

int64_t Config::interval_ms() const {
    return util::interval_to_ms(bar_interval);
}

int64_t Config::max_age_ms() const {
    return static_cast<int64_t>(max_age_hours) * 3600 * 1000;
}

int64_t Config::max_db_size_bytes() const {
    return max_db_size_mb * 1024 * 1024;
}
