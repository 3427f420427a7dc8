#include "retention_manager.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <limits>

namespace {

// Between sweeps the caps are checked this often
constexpr auto kCapacityCheckInterval = std::chrono::seconds(60);

// Pages released per locked vacuum step
constexpr int kVacuumPagesPerStep = 128;

constexpr int64_t kNoBound = std::numeric_limits<int64_t>::max();

} // namespace

RetentionPolicy RetentionPolicy::from_config(const Config& config) {
    RetentionPolicy policy;
    policy.max_age_ms = config.max_age_ms();
    policy.max_rows_per_instrument = config.max_rows_per_instrument;
    policy.max_total_rows = config.max_total_rows;
    policy.max_bytes = config.max_db_size_bytes();
    policy.batch_size = config.retention_batch_size;
    policy.vacuum_min_deleted = config.vacuum_min_deleted;
    return policy;
}

RetentionManager::RetentionManager(const Config& config, SqliteDatabase& db, BarStore& store, AnomalySink& sink)
    : RetentionManager(RetentionPolicy::from_config(config),
                       std::chrono::seconds(config.retention_sweep_seconds),
                       db, store, sink) {
}

RetentionManager::RetentionManager(const RetentionPolicy& policy, std::chrono::seconds interval,
                                   SqliteDatabase& db, BarStore& store, AnomalySink& sink)
    : policy_(policy), interval_(interval), db_(db), store_(store), sink_(sink) {
}

RetentionManager::~RetentionManager() {
    stop();
}

std::optional<std::chrono::system_clock::time_point> RetentionManager::last_sweep_time() const {
    std::lock_guard<std::mutex> lock(sweep_mutex_);
    return last_sweep_;
}

SweepReport RetentionManager::sweep(int64_t now_ms) {
    SweepReport report;
    int64_t cutoff_ms = now_ms - policy_.max_age_ms;

    // Age first, then caps, oldest rows first
    report.bars_expired = store_.delete_older_than(cutoff_ms, policy_.batch_size);
    report.anomalies_expired = sink_.delete_older_than(cutoff_ms / 1000, policy_.batch_size);

    report.bars_over_instrument_cap =
        store_.delete_excess_per_instrument(policy_.max_rows_per_instrument, policy_.batch_size);
    report.bars_evicted = enforce_row_cap();
    enforce_byte_cap(report);

    if (report.total_deleted() > policy_.vacuum_min_deleted) {
        report.pages_reclaimed = reclaim_free_pages();
        report.vacuumed = true;
    }

    return report;
}

int64_t RetentionManager::enforce_row_cap() {
    if (policy_.max_total_rows <= 0) {
        return 0;
    }

    int64_t total = 0;
    while (true) {
        int64_t excess = store_.row_count() - policy_.max_total_rows;
        if (excess <= 0) break;

        int64_t deleted = store_.delete_oldest(kNoBound, std::min<int64_t>(excess, policy_.batch_size));
        if (deleted == 0) break;
        total += deleted;
    }

    if (total > 0) {
        spdlog::info("Evicted {} oldest bars to meet the row cap of {}", total, policy_.max_total_rows);
    }
    return total;
}

void RetentionManager::enforce_byte_cap(SweepReport& report) {
    if (policy_.max_bytes <= 0) {
        return;
    }

    int64_t bars = 0;
    int64_t anomalies = 0;
    while (true) {
        {
            std::lock_guard<std::mutex> lock(db_.mutex());
            if (db_.used_bytes() <= policy_.max_bytes) break;
        }

        auto oldest_bar = store_.oldest_open_time();
        auto oldest_anomaly = sink_.oldest_timestamp();
        if (!oldest_bar && !oldest_anomaly) break;

        // Each batch comes from the table holding the older row (compared in
        // epoch seconds) and stops at the other table's oldest row
        int64_t deleted;
        if (oldest_bar && (!oldest_anomaly || *oldest_bar / 1000 <= *oldest_anomaly)) {
            int64_t bound = oldest_anomaly ? (*oldest_anomaly + 1) * 1000 : kNoBound;
            deleted = store_.delete_oldest(bound, policy_.batch_size);
            bars += deleted;
        } else {
            int64_t bound = oldest_bar ? *oldest_bar / 1000 + 1 : kNoBound;
            deleted = sink_.delete_oldest(bound, policy_.batch_size);
            anomalies += deleted;
        }
        if (deleted == 0) break;
    }

    if (bars + anomalies > 0) {
        spdlog::info("Evicted {} bars and {} anomaly records to meet the size cap of {} bytes",
                     bars, anomalies, policy_.max_bytes);
    }
    report.bars_evicted += bars;
    report.anomalies_evicted += anomalies;
}

int64_t RetentionManager::reclaim_free_pages() {
    int64_t reclaimed = 0;
    while (true) {
        // Writers get the lock back between steps
        std::lock_guard<std::mutex> lock(db_.mutex());
        int64_t released = db_.incremental_vacuum(kVacuumPagesPerStep);
        if (released <= 0) break;
        reclaimed += released;
    }
    return reclaimed;
}

bool RetentionManager::run_once() {
    auto start = std::chrono::steady_clock::now();
    try {
        auto report = sweep(util::now_ms());
        consecutive_failures_ = 0;
        {
            std::lock_guard<std::mutex> lock(sweep_mutex_);
            last_sweep_ = std::chrono::system_clock::now();
        }

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        if (report.total_deleted() > 0) {
            spdlog::info("Retention sweep: bars={} (+{} over instrument cap, +{} evicted), "
                         "anomalies={} (+{} evicted), {} pages reclaimed in {} ms",
                         report.bars_expired, report.bars_over_instrument_cap, report.bars_evicted,
                         report.anomalies_expired, report.anomalies_evicted,
                         report.pages_reclaimed, elapsed);
        } else {
            spdlog::debug("Retention sweep found nothing to delete ({} ms)", elapsed);
        }
        return true;
    } catch (const StoreError& e) {
        int failures = ++consecutive_failures_;
        spdlog::error("Retention sweep failed ({} in a row): {}", failures, e.what());
        return false;
    }
}

bool RetentionManager::over_capacity() {
    try {
        if (policy_.max_bytes > 0) {
            std::lock_guard<std::mutex> lock(db_.mutex());
            if (db_.used_bytes() > policy_.max_bytes) return true;
        }
        if (policy_.max_total_rows > 0 && store_.row_count() > policy_.max_total_rows) {
            return true;
        }
    } catch (const StoreError& e) {
        spdlog::warn("Capacity check failed: {}", e.what());
    }
    return false;
}

void RetentionManager::start() {
    if (running_.exchange(true)) {
        return;
    }
    worker_ = std::thread([this]() { run_loop(); });
    spdlog::info("Retention manager started. Sweep every {} seconds.", interval_.count());
}

void RetentionManager::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    if (worker_.joinable()) {
        worker_.join();
    }
    spdlog::info("Retention manager stopped");
}

void RetentionManager::run_loop() {
    auto next_sweep = std::chrono::steady_clock::now() + interval_;
    auto next_check = std::chrono::steady_clock::now() + kCapacityCheckInterval;

    while (running_) {
        auto now = std::chrono::steady_clock::now();

        bool due = now >= next_sweep;
        if (!due && now >= next_check) {
            next_check = now + kCapacityCheckInterval;
            if (over_capacity()) {
                spdlog::warn("Storage cap exceeded, sweeping early");
                due = true;
            }
        }

        if (due) {
            run_once();
            next_sweep = std::chrono::steady_clock::now() + interval_;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
}
