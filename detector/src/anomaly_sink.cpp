#include "anomaly_sink.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <string>

namespace {

const char* kRecordColumns =
    "instrument, timestamp, interval_type, cur_return, cur_abs_return, close_price, cur_volume, "
    "cur_volatility, price_zscore, price_percentile, volume_zscore, volatility_zscore, "
    "anomaly_score, price_score, volume_score, volatility_score, anomaly_reasons, "
    "quote_volume_24h, is_anomaly, created_at";

const char* kDeleteOldestSql =
    "DELETE FROM anomalies WHERE rowid IN "
    "(SELECT rowid FROM anomalies WHERE timestamp < ?1 ORDER BY timestamp, instrument LIMIT ?2)";

AnomalyRecord read_record(const Statement& stmt) {
    AnomalyRecord record;
    record.instrument = stmt.column_text(0);
    record.timestamp = stmt.column_int64(1);
    record.interval_type = stmt.column_text(2);
    record.cur_return = stmt.column_double(3);
    record.cur_abs_return = stmt.column_double(4);
    record.close_price = stmt.column_double(5);
    record.cur_volume = stmt.column_double(6);
    record.cur_volatility = stmt.column_double(7);
    record.price_zscore = stmt.column_double(8);
    record.price_percentile = stmt.column_double(9);
    record.volume_zscore = stmt.column_double(10);
    record.volatility_zscore = stmt.column_double(11);
    record.anomaly_score = stmt.column_double(12);
    record.price_score = stmt.column_double(13);
    record.volume_score = stmt.column_double(14);
    record.volatility_score = stmt.column_double(15);
    record.reasons = util::split_string(stmt.column_text(16), ',');
    record.quote_volume_24h = stmt.column_double(17);
    record.is_anomaly = stmt.column_int64(18) != 0;
    record.created_at = stmt.column_int64(19);
    return record;
}

} // namespace

AnomalySink::AnomalySink(SqliteDatabase& db) : db_(db) {
    create_schema();
}

void AnomalySink::create_schema() {
    std::lock_guard<std::mutex> lock(db_.mutex());
    db_.exec(R"(
        CREATE TABLE IF NOT EXISTS anomalies (
            instrument TEXT NOT NULL,
            timestamp INTEGER NOT NULL,
            interval_type TEXT NOT NULL,
            cur_return REAL NOT NULL,
            cur_abs_return REAL NOT NULL,
            close_price REAL NOT NULL,
            cur_volume REAL NOT NULL,
            cur_volatility REAL NOT NULL,
            price_zscore REAL NOT NULL,
            price_percentile REAL NOT NULL,
            volume_zscore REAL NOT NULL,
            volatility_zscore REAL NOT NULL,
            anomaly_score REAL NOT NULL,
            price_score REAL NOT NULL,
            volume_score REAL NOT NULL,
            volatility_score REAL NOT NULL,
            anomaly_reasons TEXT NOT NULL,
            quote_volume_24h REAL NOT NULL,
            is_anomaly INTEGER NOT NULL,
            created_at INTEGER NOT NULL,
            UNIQUE(instrument, timestamp, interval_type)
        );
        CREATE INDEX IF NOT EXISTS idx_anomalies_timestamp_score ON anomalies(timestamp DESC, anomaly_score DESC);
        CREATE INDEX IF NOT EXISTS idx_anomalies_instrument_timestamp ON anomalies(instrument, timestamp DESC);
    )");
}

SinkResult AnomalySink::upsert(const AnomalyRecord& record) {
    std::lock_guard<std::mutex> lock(db_.mutex());

    try {
        Statement stmt(db_, R"(
            INSERT OR IGNORE INTO anomalies (
                instrument, timestamp, interval_type, cur_return, cur_abs_return, close_price,
                cur_volume, cur_volatility, price_zscore, price_percentile, volume_zscore,
                volatility_zscore, anomaly_score, price_score, volume_score, volatility_score,
                anomaly_reasons, quote_volume_24h, is_anomaly, created_at)
            VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
        )");
        stmt.bind_text(1, record.instrument)
            .bind_int64(2, record.timestamp)
            .bind_text(3, record.interval_type)
            .bind_double(4, record.cur_return)
            .bind_double(5, record.cur_abs_return)
            .bind_double(6, record.close_price)
            .bind_double(7, record.cur_volume)
            .bind_double(8, record.cur_volatility)
            .bind_double(9, record.price_zscore)
            .bind_double(10, record.price_percentile)
            .bind_double(11, record.volume_zscore)
            .bind_double(12, record.volatility_zscore)
            .bind_double(13, record.anomaly_score)
            .bind_double(14, record.price_score)
            .bind_double(15, record.volume_score)
            .bind_double(16, record.volatility_score)
            .bind_text(17, util::join_strings(record.reasons, ","))
            .bind_double(18, record.quote_volume_24h)
            .bind_int64(19, record.is_anomaly ? 1 : 0)
            .bind_int64(20, record.created_at > 0 ? record.created_at : util::now_seconds());
        stmt.step();

        return db_.changes() > 0 ? SinkResult::Inserted : SinkResult::Duplicate;
    } catch (const StoreError& e) {
        spdlog::error("Anomaly insert failed for {} {} {}: {}",
                      record.instrument, record.interval_type, record.timestamp, e.what());
        return SinkResult::Failed;
    }
}

std::vector<AnomalyRecord> AnomalySink::query(const AnomalyQuery& filters) {
    std::string sql = std::string("SELECT ") + kRecordColumns + " FROM anomalies WHERE 1 = 1";

    // Unset filters bind NULL and drop out of the predicate
    sql += " AND (?1 IS NULL OR instrument = ?1)";
    sql += " AND (?2 IS NULL OR anomaly_score >= ?2)";
    sql += " AND (?3 = 0 OR is_anomaly = 1)";
    sql += " AND (?4 IS NULL OR interval_type = ?4)";
    sql += " AND (?5 IS NULL OR timestamp >= ?5)";
    sql += filters.order_by_score
        ? " ORDER BY anomaly_score DESC, timestamp DESC"
        : " ORDER BY timestamp DESC, anomaly_score DESC";
    sql += " LIMIT ?6";

    std::lock_guard<std::mutex> lock(db_.mutex());

    Statement stmt(db_, sql.c_str());
    if (filters.instrument) stmt.bind_text(1, *filters.instrument); else stmt.bind_null(1);
    if (filters.min_score) stmt.bind_double(2, *filters.min_score); else stmt.bind_null(2);
    stmt.bind_int64(3, filters.anomaly_only ? 1 : 0);
    if (filters.interval_type) stmt.bind_text(4, *filters.interval_type); else stmt.bind_null(4);
    if (filters.since_timestamp) stmt.bind_int64(5, *filters.since_timestamp); else stmt.bind_null(5);
    stmt.bind_int64(6, std::max(filters.limit, 0));

    std::vector<AnomalyRecord> records;
    while (stmt.step()) {
        records.push_back(read_record(stmt));
    }
    return records;
}

int64_t AnomalySink::delete_oldest(int64_t before_timestamp, int64_t limit) {
    return db_.delete_batch(kDeleteOldestSql, before_timestamp, limit);
}

int64_t AnomalySink::delete_older_than(int64_t cutoff_timestamp, int batch_size) {
    int64_t total = db_.delete_in_batches(kDeleteOldestSql, cutoff_timestamp, batch_size);
    if (total > 0) {
        spdlog::info("Deleted {} anomaly records older than {}", total,
                     util::format_epoch_ms(cutoff_timestamp * 1000));
    }
    return total;
}

int64_t AnomalySink::row_count() {
    std::lock_guard<std::mutex> lock(db_.mutex());

    Statement stmt(db_, "SELECT COUNT(*) FROM anomalies");
    return stmt.step() ? stmt.column_int64(0) : 0;
}

std::optional<int64_t> AnomalySink::oldest_timestamp() {
    std::lock_guard<std::mutex> lock(db_.mutex());

    Statement stmt(db_, "SELECT MIN(timestamp) FROM anomalies");
    if (!stmt.step() || stmt.column_is_null(0)) {
        return std::nullopt;
    }
    return stmt.column_int64(0);
}
