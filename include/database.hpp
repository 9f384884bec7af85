#pragma once
#include <cstdint>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <variant>
#include <vector>
#include "errors.hpp"

struct sqlite3;
struct sqlite3_stmt;

namespace itemstore {

// A bound parameter or a result cell
using Value = std::variant<std::nullptr_t, std::int64_t, double, std::string>;
using Row = std::vector<Value>;

struct ExecResult {
    std::int64_t rows_affected = 0;
    std::int64_t last_insert_id = 0;
};

// Owns the single SQLite connection of the process. Every statement runs under
// one exclusive lock held from prepare to finalize, so at most one statement is
// ever in flight regardless of whether it reads or writes.
class Database {
public:
    // Opens (creating if needed) the database file. Throws StartupError.
    explicit Database(const std::string& path);
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    // Runs a statement that returns no rows. Throws StoreError.
    ExecResult execute(const std::string& sql, const std::vector<Value>& params = {});

    // Runs a statement and collects every row. Throws StoreError.
    std::vector<Row> query(const std::string& sql, const std::vector<Value>& params = {});

    // Forces a read of the database file so an unreadable or foreign file fails here
    void ping();

    const std::string& path() const { return path_; }

private:
    struct StatementDeleter {
        void operator()(sqlite3_stmt* stmt) const;
    };
    using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

    Statement prepare(const std::string& sql, const std::vector<Value>& params);
    void step_all(sqlite3_stmt* stmt, std::vector<Row>* rows);
    [[noreturn]] void fail(const std::string& what, int rc) const;

    std::string path_;
    sqlite3* db_ = nullptr;
    std::mutex mutex_;
};

} // namespace itemstore
