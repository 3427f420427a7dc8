#include "sqlite_db.hpp"
#include <spdlog/spdlog.h>
#include <sqlite3.h>

namespace {

constexpr int64_t kAutoVacuumIncremental = 2;

} // namespace

SqliteDatabase::SqliteDatabase(const std::string& path) : path_(path) {
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw StoreError("Cannot open database " + path + ": " + message);
    }

    sqlite3_busy_timeout(db_, 5000);
    enable_incremental_vacuum();
    if (path != ":memory:") {
        exec("PRAGMA journal_mode=WAL");
        exec("PRAGMA synchronous=NORMAL");
    }

    spdlog::info("Database opened at: {}", path);
}

SqliteDatabase::~SqliteDatabase() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void SqliteDatabase::exec(const std::string& sql) {
    char* err_msg = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg) != SQLITE_OK) {
        std::string message = err_msg ? err_msg : sqlite3_errmsg(db_);
        sqlite3_free(err_msg);
        throw StoreError(message);
    }
}

int64_t SqliteDatabase::changes() const {
    return sqlite3_changes(db_);
}

std::string SqliteDatabase::last_error() const {
    return sqlite3_errmsg(db_);
}

int64_t SqliteDatabase::pragma_int(const char* pragma) {
    Statement stmt(*this, pragma);
    return stmt.step() ? stmt.column_int64(0) : 0;
}

int64_t SqliteDatabase::used_bytes() {
    int64_t page_count = pragma_int("PRAGMA page_count");
    int64_t freelist_count = pragma_int("PRAGMA freelist_count");
    int64_t page_size = pragma_int("PRAGMA page_size");
    return (page_count - freelist_count) * page_size;
}

int64_t SqliteDatabase::free_pages() {
    return pragma_int("PRAGMA freelist_count");
}

void SqliteDatabase::enable_incremental_vacuum() {
    if (pragma_int("PRAGMA auto_vacuum") == kAutoVacuumIncremental) {
        return;
    }
    exec("PRAGMA auto_vacuum=INCREMENTAL");

    // Only empty databases switch mode in place; older files need one rebuild
    if (pragma_int("PRAGMA auto_vacuum") != kAutoVacuumIncremental) {
        spdlog::info("Rebuilding {} for incremental auto-vacuum", path_);
        exec("VACUUM");
    }
}

int64_t SqliteDatabase::incremental_vacuum(int max_pages) {
    int64_t before = free_pages();
    if (before == 0) {
        return 0;
    }
    exec("PRAGMA incremental_vacuum(" + std::to_string(max_pages) + ")");
    return before - free_pages();
}

int64_t SqliteDatabase::delete_batch(const char* sql, int64_t param, int64_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);

    Transaction txn(*this);
    Statement stmt(*this, sql);
    stmt.bind_int64(1, param).bind_int64(2, limit);
    stmt.step();
    int64_t deleted = changes();
    txn.commit();
    return deleted;
}

int64_t SqliteDatabase::delete_in_batches(const char* sql, int64_t param, int batch_size) {
    int64_t total = 0;
    while (true) {
        int64_t deleted = delete_batch(sql, param, batch_size);
        total += deleted;
        if (deleted < batch_size) break;
    }
    return total;
}

bool SqliteDatabase::is_healthy() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return false;
    }

    try {
        Statement stmt(*this, "SELECT name FROM sqlite_master WHERE type='table' LIMIT 1");
        stmt.step();
        return true;
    } catch (const StoreError& e) {
        spdlog::warn("Database health probe failed: {}", e.what());
        return false;
    }
}

Statement::Statement(SqliteDatabase& db, const char* sql) : db_(db) {
    if (sqlite3_prepare_v2(db_.handle(), sql, -1, &stmt_, nullptr) != SQLITE_OK) {
        throw StoreError(std::string("Failed to prepare statement: ") + db_.last_error());
    }
}

Statement::~Statement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

Statement& Statement::bind_int64(int index, int64_t value) {
    sqlite3_bind_int64(stmt_, index, value);
    return *this;
}

Statement& Statement::bind_double(int index, double value) {
    sqlite3_bind_double(stmt_, index, value);
    return *this;
}

Statement& Statement::bind_text(int index, const std::string& value) {
    sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
    return *this;
}

Statement& Statement::bind_null(int index) {
    sqlite3_bind_null(stmt_, index);
    return *this;
}

bool Statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw StoreError(std::string("Statement failed: ") + db_.last_error());
}

void Statement::reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

int64_t Statement::column_int64(int index) const {
    return sqlite3_column_int64(stmt_, index);
}

double Statement::column_double(int index) const {
    return sqlite3_column_double(stmt_, index);
}

std::string Statement::column_text(int index) const {
    const unsigned char* text = sqlite3_column_text(stmt_, index);
    return text ? std::string(reinterpret_cast<const char*>(text)) : std::string();
}

bool Statement::column_is_null(int index) const {
    return sqlite3_column_type(stmt_, index) == SQLITE_NULL;
}

Transaction::Transaction(SqliteDatabase& db) : db_(db) {
    db_.exec("BEGIN IMMEDIATE");
}

Transaction::~Transaction() {
    if (finished_) {
        return;
    }
    char* err_msg = nullptr;
    if (sqlite3_exec(db_.handle(), "ROLLBACK", nullptr, nullptr, &err_msg) != SQLITE_OK) {
        spdlog::error("Rollback failed: {}", err_msg ? err_msg : "unknown error");
        sqlite3_free(err_msg);
    }
}

void Transaction::commit() {
    db_.exec("COMMIT");
    finished_ = true;
}
