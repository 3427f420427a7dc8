#include "bar_store.hpp"
#include "util.hpp"
#include <algorithm>
#include <limits>
#include <spdlog/spdlog.h>

namespace {

const char* kBarColumns =
    "instrument, bar_interval, open_time, close_time, open, high, low, close, "
    "volume, quote_volume, trade_count, is_final";

Bar read_bar(const Statement& stmt) {
    Bar bar;
    bar.instrument = stmt.column_text(0);
    bar.interval = stmt.column_text(1);
    bar.open_time_ms = stmt.column_int64(2);
    bar.close_time_ms = stmt.column_int64(3);
    bar.open = stmt.column_double(4);
    bar.high = stmt.column_double(5);
    bar.low = stmt.column_double(6);
    bar.close = stmt.column_double(7);
    bar.volume = stmt.column_double(8);
    bar.quote_volume = stmt.column_double(9);
    bar.trade_count = stmt.column_int64(10);
    bar.is_final = stmt.column_int64(11) != 0;
    return bar;
}

void bind_bar_values(Statement& stmt, const Bar& bar) {
    stmt.bind_text(1, bar.instrument)
        .bind_text(2, bar.interval)
        .bind_int64(3, bar.open_time_ms)
        .bind_int64(4, bar.close_time_ms)
        .bind_double(5, bar.open)
        .bind_double(6, bar.high)
        .bind_double(7, bar.low)
        .bind_double(8, bar.close)
        .bind_double(9, bar.volume)
        .bind_double(10, bar.quote_volume)
        .bind_int64(11, bar.trade_count)
        .bind_int64(12, bar.is_final ? 1 : 0);
}

const char* kDeleteOldestSql =
    "DELETE FROM bars WHERE rowid IN "
    "(SELECT rowid FROM bars WHERE open_time < ?1 ORDER BY open_time, instrument LIMIT ?2)";

std::string select_sql(const std::string& tail) {
    return std::string("SELECT ") + kBarColumns + " FROM bars " + tail;
}

} // namespace

const char* to_string(UpsertResult result) {
    switch (result) {
        case UpsertResult::Inserted: return "inserted";
        case UpsertResult::Updated: return "updated";
        case UpsertResult::RejectedFinal: return "rejected_final";
        case UpsertResult::SkippedExisting: return "skipped_existing";
        case UpsertResult::Failed: return "failed";
    }
    return "unknown";
}

BarStore::BarStore(SqliteDatabase& db) : db_(db) {
    create_schema();
}

void BarStore::create_schema() {
    std::lock_guard<std::mutex> lock(db_.mutex());
    db_.exec(R"(
        CREATE TABLE IF NOT EXISTS bars (
            instrument TEXT NOT NULL,
            bar_interval TEXT NOT NULL,
            open_time INTEGER NOT NULL,
            close_time INTEGER NOT NULL,
            open REAL NOT NULL,
            high REAL NOT NULL,
            low REAL NOT NULL,
            close REAL NOT NULL,
            volume REAL NOT NULL,
            quote_volume REAL NOT NULL,
            trade_count INTEGER NOT NULL,
            is_final INTEGER NOT NULL DEFAULT 0,
            created_at INTEGER NOT NULL,
            UNIQUE(instrument, bar_interval, open_time)
        );
        CREATE INDEX IF NOT EXISTS idx_bars_open_time ON bars(open_time);
    )");
}

UpsertResult BarStore::upsert(const Bar& bar) {
    std::lock_guard<std::mutex> lock(db_.mutex());

    try {
        Transaction txn(db_);

        Statement existing(db_,
            "SELECT is_final FROM bars WHERE instrument = ? AND bar_interval = ? AND open_time = ?");
        existing.bind_text(1, bar.instrument)
            .bind_text(2, bar.interval)
            .bind_int64(3, bar.open_time_ms);

        bool found = existing.step();
        bool stored_final = found && existing.column_int64(0) != 0;
        existing.reset();

        if (stored_final) {
            return UpsertResult::RejectedFinal;
        }

        UpsertResult result;
        if (found) {

            Statement update(db_, R"(
                UPDATE bars SET close_time = ?4, open = ?5, high = ?6, low = ?7, close = ?8,
                    volume = ?9, quote_volume = ?10, trade_count = ?11, is_final = ?12
                WHERE instrument = ?1 AND bar_interval = ?2 AND open_time = ?3 AND is_final = 0
            )");
            bind_bar_values(update, bar);
            update.step();
            result = UpsertResult::Updated;
        } else {
            Statement insert(db_, R"(
                INSERT INTO bars (instrument, bar_interval, open_time, close_time, open, high, low,
                    close, volume, quote_volume, trade_count, is_final, created_at)
                VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12, ?13)
            )");
            bind_bar_values(insert, bar);
            insert.bind_int64(13, util::now_ms());
            insert.step();
            result = UpsertResult::Inserted;
        }

        txn.commit();
        return result;
    } catch (const StoreError& e) {
        spdlog::error("Bar upsert failed for {} {} {}: {}",
                      bar.instrument, bar.interval, bar.open_time_ms, e.what());
        return UpsertResult::Failed;
    }
}

UpsertResult BarStore::insert_if_absent(const Bar& bar) {
    std::lock_guard<std::mutex> lock(db_.mutex());

    try {
        Statement insert(db_, R"(
            INSERT OR IGNORE INTO bars (instrument, bar_interval, open_time, close_time, open, high,
                low, close, volume, quote_volume, trade_count, is_final, created_at)
            VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12, ?13)
        )");
        bind_bar_values(insert, bar);
        insert.bind_int64(13, util::now_ms());
        insert.step();

        return db_.changes() > 0 ? UpsertResult::Inserted : UpsertResult::SkippedExisting;
    } catch (const StoreError& e) {
        spdlog::error("Backfill insert failed for {} {} {}: {}",
                      bar.instrument, bar.interval, bar.open_time_ms, e.what());
        return UpsertResult::Failed;
    }
}

std::optional<Bar> BarStore::get(const BarKey& key) {
    std::lock_guard<std::mutex> lock(db_.mutex());

    Statement stmt(db_, select_sql(
        "WHERE instrument = ? AND bar_interval = ? AND open_time = ?").c_str());
    stmt.bind_text(1, key.instrument)
        .bind_text(2, key.interval)
        .bind_int64(3, key.open_time_ms);

    if (!stmt.step()) {
        return std::nullopt;
    }
    return read_bar(stmt);
}

std::vector<Bar> BarStore::query_window(const std::string& instrument,
                                        const std::string& interval,
                                        size_t limit,
                                        std::optional<int64_t> before_open_time) {
    std::lock_guard<std::mutex> lock(db_.mutex());
    std::vector<Bar> bars;
    if (limit == 0) {
        return bars;
    }

    Statement stmt(db_, select_sql(
        "WHERE instrument = ? AND bar_interval = ? AND is_final = 1 AND open_time < ? "
        "ORDER BY open_time DESC LIMIT ?").c_str());
    stmt.bind_text(1, instrument)
        .bind_text(2, interval)
        .bind_int64(3, before_open_time.value_or(std::numeric_limits<int64_t>::max()))
        .bind_int64(4, static_cast<int64_t>(limit));

    while (stmt.step()) {
        bars.push_back(read_bar(stmt));
    }

    std::reverse(bars.begin(), bars.end());
    return bars;
}

int64_t BarStore::count_closed(const std::string& instrument, const std::string& interval) {
    std::lock_guard<std::mutex> lock(db_.mutex());

    Statement stmt(db_,
        "SELECT COUNT(*) FROM bars WHERE instrument = ? AND bar_interval = ? AND is_final = 1");
    stmt.bind_text(1, instrument).bind_text(2, interval);
    return stmt.step() ? stmt.column_int64(0) : 0;
}

std::optional<Bar> BarStore::latest_closed(const std::string& instrument, const std::string& interval) {
    auto bars = query_window(instrument, interval, 1);
    if (bars.empty()) {
        return std::nullopt;
    }
    return bars.back();
}

int64_t BarStore::delete_oldest(int64_t before_open_time_ms, int64_t limit) {
    return db_.delete_batch(kDeleteOldestSql, before_open_time_ms, limit);
}

int64_t BarStore::delete_older_than(int64_t cutoff_open_time_ms, int batch_size) {
    int64_t total = db_.delete_in_batches(kDeleteOldestSql, cutoff_open_time_ms, batch_size);
    if (total > 0) {
        spdlog::info("Deleted {} bars opened before {}", total, util::format_epoch_ms(cutoff_open_time_ms));
    }
    return total;
}

int64_t BarStore::delete_excess_per_instrument(int64_t max_rows_per_instrument, int batch_size) {
    if (max_rows_per_instrument <= 0) {
        return 0;
    }

    const char* sql = R"(
        DELETE FROM bars WHERE rowid IN (
            SELECT rid FROM (
                SELECT rowid AS rid, ROW_NUMBER() OVER (
                    PARTITION BY instrument, bar_interval ORDER BY open_time DESC
                ) AS rn
                FROM bars
            )
            WHERE rn > ?1
            LIMIT ?2
        )
    )";

    int64_t total = db_.delete_in_batches(sql, max_rows_per_instrument, batch_size);
    if (total > 0) {
        spdlog::info("Deleted {} bars above the per-instrument cap of {}", total, max_rows_per_instrument);
    }
    return total;
}

int64_t BarStore::row_count() {
    std::lock_guard<std::mutex> lock(db_.mutex());

    Statement stmt(db_, "SELECT COUNT(*) FROM bars");
    return stmt.step() ? stmt.column_int64(0) : 0;
}

std::optional<int64_t> BarStore::oldest_open_time() {
    std::lock_guard<std::mutex> lock(db_.mutex());

    Statement stmt(db_, "SELECT MIN(open_time) FROM bars");
    if (!stmt.step() || stmt.column_is_null(0)) {
        return std::nullopt;
    }
    return stmt.column_int64(0);
}
