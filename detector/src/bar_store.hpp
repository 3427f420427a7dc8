#pragma once
#include "sqlite_db.hpp"
#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

enum class UpsertResult {
    Inserted,
    Updated,
    RejectedFinal,   // stored row is already final
    SkippedExisting, // insert_if_absent found the key
    Failed           // storage error, logged
};

const char* to_string(UpsertResult result);

// Time-series storage of bars keyed by (instrument, interval, open_time).
// Write methods report storage errors through UpsertResult; read and delete
// methods throw StoreError so the caller decides how to recover.
class BarStore {
public:
    explicit BarStore(SqliteDatabase& db);

    // Insert, or replace a still-open bar; finalized rows are never modified
    UpsertResult upsert(const Bar& bar);

    // Backfill path: write only when the key is absent
    UpsertResult insert_if_absent(const Bar& bar);

    std::optional<Bar> get(const BarKey& key);

    // Most recent closed bars ordered oldest to newest, optionally strictly before a bar
    std::vector<Bar> query_window(const std::string& instrument,
                                  const std::string& interval,
                                  size_t limit,
                                  std::optional<int64_t> before_open_time = std::nullopt);

    int64_t count_closed(const std::string& instrument, const std::string& interval);
    std::optional<Bar> latest_closed(const std::string& instrument, const std::string& interval);

    // Bulk eviction; each batch runs in its own transaction. Return rows deleted.
    int64_t delete_older_than(int64_t cutoff_open_time_ms, int batch_size);
    int64_t delete_excess_per_instrument(int64_t max_rows_per_instrument, int batch_size);

    // One batch: up to `limit` of the oldest bars opened before the bound
    int64_t delete_oldest(int64_t before_open_time_ms, int64_t limit);

    int64_t row_count();
    std::optional<int64_t> oldest_open_time();

private:
    void create_schema();

    SqliteDatabase& db_;
};
