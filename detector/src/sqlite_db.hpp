#pragma once
#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

// Raised by the SQLite wrapper; public store methods translate it into result codes
class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Single shared connection. Callers hold mutex() for the duration of each
// logical operation, so one statement or one transaction runs at a time.
class SqliteDatabase {
public:
    explicit SqliteDatabase(const std::string& path);
    ~SqliteDatabase();

    SqliteDatabase(const SqliteDatabase&) = delete;
    SqliteDatabase& operator=(const SqliteDatabase&) = delete;

    std::mutex& mutex() { return mutex_; }
    sqlite3* handle() const { return db_; }
    const std::string& path() const { return path_; }

    // Execute one or more statements without results; throws StoreError
    void exec(const std::string& sql);

    int64_t changes() const;
    std::string last_error() const;

    // (page_count - freelist_count) * page_size
    int64_t used_bytes();
    int64_t free_pages();

    // Return at most max_pages free pages to the filesystem; returns pages released.
    // Caller holds mutex().
    int64_t incremental_vacuum(int max_pages);

    // Run a "DELETE ... ?1 ... LIMIT ?2" statement once in its own transaction
    // under mutex(). Returns rows deleted.
    int64_t delete_batch(const char* sql, int64_t param, int64_t limit);

    // Repeat delete_batch until a batch comes back short
    int64_t delete_in_batches(const char* sql, int64_t param, int batch_size);

    // Lock-taking probe for health reporting
    bool is_healthy();

private:
    int64_t pragma_int(const char* pragma);
    void enable_incremental_vacuum();

    std::string path_;
    sqlite3* db_ = nullptr;
    std::mutex mutex_;
};

class Statement {
public:
    Statement(SqliteDatabase& db, const char* sql);
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement& bind_int64(int index, int64_t value);
    Statement& bind_double(int index, double value);
    Statement& bind_text(int index, const std::string& value);
    Statement& bind_null(int index);

    // true when a row is available, false when done; throws StoreError otherwise
    bool step();
    void reset();

    int64_t column_int64(int index) const;
    double column_double(int index) const;
    std::string column_text(int index) const;
    bool column_is_null(int index) const;

private:
    SqliteDatabase& db_;
    sqlite3_stmt* stmt_ = nullptr;
};

// BEGIN IMMEDIATE on construction, ROLLBACK on destruction unless committed
class Transaction {
public:
    explicit Transaction(SqliteDatabase& db);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();

private:
    SqliteDatabase& db_;
    bool finished_ = false;
};
