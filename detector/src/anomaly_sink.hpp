#pragma once
#include "sqlite_db.hpp"
#include "types.hpp"
#include <optional>
#include <vector>

enum class SinkResult {
    Inserted,
    Duplicate, // identity key already recorded
    Failed
};

// Idempotent store of scoring results keyed by (instrument, timestamp, interval_type)
class AnomalySink {
public:
    explicit AnomalySink(SqliteDatabase& db);

    SinkResult upsert(const AnomalyRecord& record);

    // Throws StoreError
    std::vector<AnomalyRecord> query(const AnomalyQuery& filters);

    // Retention; each batch in its own transaction. Timestamps are epoch seconds.
    int64_t delete_older_than(int64_t cutoff_timestamp, int batch_size);
    int64_t delete_oldest(int64_t before_timestamp, int64_t limit);

    int64_t row_count();
    std::optional<int64_t> oldest_timestamp();

private:
    void create_schema();

    SqliteDatabase& db_;
};
