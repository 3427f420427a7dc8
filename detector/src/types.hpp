#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Identity of a bar: one row per (instrument, interval, open_time)
struct BarKey {
    std::string instrument;
    std::string interval;
    int64_t open_time_ms = 0;

    bool operator==(const BarKey& other) const {
        return open_time_ms == other.open_time_ms &&
               instrument == other.instrument &&
               interval == other.interval;
    }
    bool operator<(const BarKey& other) const {
        if (instrument != other.instrument) return instrument < other.instrument;
        if (interval != other.interval) return interval < other.interval;
        return open_time_ms < other.open_time_ms;
    }
};

// One OHLCV observation, as delivered by the feed or the batch endpoint
struct Bar {
    std::string instrument;
    std::string interval;
    int64_t open_time_ms = 0;
    int64_t close_time_ms = 0;
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    double volume = 0.0;
    double quote_volume = 0.0;
    int64_t trade_count = 0;
    bool is_final = false;

    BarKey key() const { return BarKey{instrument, interval, open_time_ms}; }
};

// Feed payloads and stored rows share the same shape
using BarUpdate = Bar;

// Entry of the market-wide 24h snapshot
struct MarketTicker {
    std::string instrument;
    double quote_volume_24h = 0.0;
};

// Rolling statistics over the W closed bars preceding a bar
struct WindowSummary {
    std::string instrument;
    std::string interval;
    std::vector<Bar> bars;        // oldest first, size W
    std::vector<double> returns;  // W, or W-1 when no earlier close exists

    double return_mean = 0.0;
    double return_stddev = 0.0;
    double volume_mean = 0.0;
    double volume_stddev = 0.0;
    double volatility_mean = 0.0;
    double volatility_stddev = 0.0;

    const Bar& last_bar() const { return bars.back(); }
};

struct AnomalyRecord {
    std::string instrument;
    int64_t timestamp = 0;  // bar open time, epoch seconds
    std::string interval_type;

    double cur_return = 0.0;
    double cur_abs_return = 0.0;
    double close_price = 0.0;
    double cur_volume = 0.0;
    double cur_volatility = 0.0;

    double price_zscore = 0.0;
    double price_percentile = 0.0;
    double volume_zscore = 0.0;
    double volatility_zscore = 0.0;

    double anomaly_score = 0.0;
    double price_score = 0.0;
    double volume_score = 0.0;
    double volatility_score = 0.0;

    std::vector<std::string> reasons;
    double quote_volume_24h = 0.0;
    bool is_anomaly = false;
    int64_t created_at = 0;  // epoch seconds
};

struct AnomalyQuery {
    std::optional<std::string> instrument;
    std::optional<double> min_score;
    bool anomaly_only = false;
    std::optional<std::string> interval_type;
    std::optional<int64_t> since_timestamp;
    bool order_by_score = false;
    int limit = 100;
};

struct HealthSnapshot {
    int64_t stored_row_count = 0;
    int64_t anomaly_row_count = 0;
    int64_t database_bytes = 0;
    std::optional<std::chrono::seconds> oldest_bar_age;
    size_t active_universe_size = 0;
    size_t degraded_instruments = 0;
    size_t active_subscriptions = 0;
    std::optional<std::chrono::system_clock::time_point> last_scoring_pass;
    std::optional<std::chrono::system_clock::time_point> last_retention_sweep;
    int retention_consecutive_failures = 0;
    bool database_ok = true;
    std::optional<bool> publisher_ok; // unset when publishing is disabled
};
