#pragma once

// Shared fixtures for the detector tests: synthetic bars, an in-memory
// database, and in-process fakes of the market-data client and live feed.

#include "bar_feed.hpp"
#include "config.hpp"
#include "market_data_client.hpp"
#include "types.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace test_helpers {

constexpr int64_t MS_PER_MIN = 60 * 1000;
constexpr int64_t MS_PER_HOUR = 60 * MS_PER_MIN;
constexpr int64_t BAR_MS = 15 * MS_PER_MIN;
constexpr int64_t T0 = 1699999200000LL;  // 2023-11-14 22:00 UTC, 15m aligned

// Config suited to fast tests: tiny backoff, small window, no servers
inline Config test_config(int window_size = 16) {
    Config config;
    config.db_path = ":memory:";
    config.bar_interval = "15m";
    config.window_size = window_size;
    config.base_backoff_seconds = 0.01;
    config.max_backoff_seconds = 0.05;
    config.backfill_max_attempts = 3;
    config.feed_queue_capacity = 8;
    config.health_port = 0;
    return config;
}

// Closed bar with range = close * range_fraction centred on close
inline Bar make_bar(const std::string& instrument, int64_t open_time_ms, double close,
                    double quote_volume = 1000.0, double range_fraction = 0.004,
                    bool is_final = true) {
    Bar bar;
    bar.instrument = instrument;
    bar.interval = "15m";
    bar.open_time_ms = open_time_ms;
    bar.close_time_ms = open_time_ms + BAR_MS - 1;
    bar.open = close;
    bar.close = close;
    bar.high = close * (1.0 + range_fraction / 2.0);
    bar.low = close * (1.0 - range_fraction / 2.0);
    bar.volume = quote_volume / close;
    bar.quote_volume = quote_volume;
    bar.trade_count = 100;
    bar.is_final = is_final;
    return bar;
}

// Quiet history: returns alternate +step/-step, quote volume alternates
// 900/1100 and the high-low range alternates 0.4%/0.6% of close.
inline std::vector<Bar> make_quiet_series(const std::string& instrument, int64_t start_ms,
                                          int count, double start_close = 100.0,
                                          double step = 0.001) {
    std::vector<Bar> bars;
    bars.reserve(count);
    double close = start_close;
    for (int i = 0; i < count; ++i) {
        if (i > 0) {
            close *= (i % 2 == 1) ? (1.0 + step) : (1.0 - step);
        }
        double volume = (i % 2 == 0) ? 900.0 : 1100.0;
        double range = (i % 2 == 0) ? 0.004 : 0.006;
        bars.push_back(make_bar(instrument, start_ms + i * BAR_MS, close, volume, range));
    }
    return bars;
}

// Market-data client returning scripted data; failures are consumed first
class FakeMarketDataClient : public MarketDataClient {
public:
    std::vector<MarketTicker> fetch_market_snapshot() override {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot_calls++;
        if (snapshot_failures > 0) {
            snapshot_failures--;
            throw MarketDataUnavailable("scripted snapshot failure");
        }
        return snapshot;
    }

    std::vector<Bar> fetch_recent_bars(const std::string& instrument,
                                       const std::string& interval,
                                       int limit) override {
        int delay_ms;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            delay_ms = bar_delay_ms;
        }
        if (delay_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
        }

        std::lock_guard<std::mutex> lock(mutex_);
        bar_calls++;
        last_limit = limit;
        if (bar_failures > 0) {
            bar_failures--;
            throw MarketDataUnavailable("scripted klines failure");
        }

        std::vector<Bar> result;
        for (const auto& bar : recent_bars) {
            if (bar.instrument == instrument && bar.interval == interval) {
                result.push_back(bar);
            }
        }
        if (static_cast<int>(result.size()) > limit) {
            result.erase(result.begin(), result.end() - limit);
        }
        return result;
    }

    // Thread-safe view of bar_calls while pipeline threads are running
    int bar_call_count() {
        std::lock_guard<std::mutex> lock(mutex_);
        return bar_calls;
    }

    void set_bar_delay(int delay_ms) {
        std::lock_guard<std::mutex> lock(mutex_);
        bar_delay_ms = delay_ms;
    }

    std::vector<MarketTicker> snapshot;
    std::vector<Bar> recent_bars;
    int snapshot_failures = 0;
    int bar_failures = 0;
    int snapshot_calls = 0;
    int bar_calls = 0;
    int last_limit = 0;
    int bar_delay_ms = 0;  // each klines fetch stalls this long

private:
    std::mutex mutex_;
};

// Feed that drops its first `failures` connections, then delivers the
// scripted updates and idles until released
class ScriptedFeed : public BarFeed {
public:
    ScriptedFeed(std::vector<BarUpdate> updates, std::shared_ptr<std::atomic<int>> connects, int failures)
        : updates_(std::move(updates)), connects_(std::move(connects)), failures_(failures) {}

    void run(const std::string&, const std::string&, const UpdateHandler& on_update,
             const std::atomic<bool>& running) override {
        int attempt = ++(*connects_);
        if (attempt <= failures_) {
            throw FeedDisconnected("scripted disconnect");
        }
        for (const auto& update : updates_) {
            if (!on_update(update)) return;
        }
        while (running.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }

private:
    std::vector<BarUpdate> updates_;
    std::shared_ptr<std::atomic<int>> connects_;
    int failures_;
};

// Poll until `condition` holds or the timeout expires
inline bool wait_for(const std::function<bool()>& condition,
                     std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return condition();
}

}  // namespace test_helpers
