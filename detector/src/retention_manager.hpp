#pragma once
#include "anomaly_sink.hpp"
#include "bar_store.hpp"
#include "config.hpp"
#include "sqlite_db.hpp"
#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <thread>

struct RetentionPolicy {
    int64_t max_age_ms = 24LL * 3600 * 1000;
    int64_t max_rows_per_instrument = 0; // 0 = unlimited
    int64_t max_total_rows = 0;
    int64_t max_bytes = 0;
    int batch_size = 500;
    int64_t vacuum_min_deleted = 100;

    static RetentionPolicy from_config(const Config& config);
};

struct SweepReport {
    int64_t bars_expired = 0;
    int64_t bars_over_instrument_cap = 0;
    int64_t bars_evicted = 0;
    int64_t anomalies_expired = 0;
    int64_t anomalies_evicted = 0;
    int64_t pages_reclaimed = 0;
    bool vacuumed = false; // incremental vacuum ran

    int64_t total_deleted() const {
        return bars_expired + bars_over_instrument_cap + bars_evicted + anomalies_expired + anomalies_evicted;
    }
};

// Background sweeper enforcing age and size caps on both tables
class RetentionManager {
public:
    RetentionManager(const Config& config, SqliteDatabase& db, BarStore& store, AnomalySink& sink);
    RetentionManager(const RetentionPolicy& policy, std::chrono::seconds interval,
                     SqliteDatabase& db, BarStore& store, AnomalySink& sink);
    ~RetentionManager();

    // One full sweep; throws StoreError
    SweepReport sweep(int64_t now_ms);

    // Sweep and record success or failure for health reporting
    bool run_once();

    // True when a cap is already exceeded before the next scheduled sweep
    bool over_capacity();

    void start();
    void stop();

    int consecutive_failures() const { return consecutive_failures_; }
    std::optional<std::chrono::system_clock::time_point> last_sweep_time() const;

private:
    void run_loop();
    int64_t enforce_row_cap();
    void enforce_byte_cap(SweepReport& report);
    int64_t reclaim_free_pages();

    RetentionPolicy policy_;
    std::chrono::seconds interval_;
    SqliteDatabase& db_;
    BarStore& store_;
    AnomalySink& sink_;

    std::atomic<int> consecutive_failures_{0};
    mutable std::mutex sweep_mutex_;
    std::optional<std::chrono::system_clock::time_point> last_sweep_;

    std::atomic<bool> running_{false};
    std::thread worker_;
};
