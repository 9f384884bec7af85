#include "database.hpp"
#include "logging.hpp"
#include <sqlite3.h>
#include <fmt/format.h>

namespace itemstore {

bool StoreError::is_constraint_violation() const {
    return (code_ & 0xff) == SQLITE_CONSTRAINT;
}

void Database::StatementDeleter::operator()(sqlite3_stmt* stmt) const {
    sqlite3_finalize(stmt);
}

Database::Database(const std::string& path) : path_(path) {
    int rc = sqlite3_open_v2(path_.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string message = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        // sqlite3_open_v2 hands back a handle even on failure
        sqlite3_close(db_);
        db_ = nullptr;
        throw StartupError(fmt::format("Failed to open database {}: {}", path_, message));
    }
    sqlite3_extended_result_codes(db_, 1);
}

Database::~Database() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_ && sqlite3_close(db_) != SQLITE_OK) {
        Logger::get().error("Error closing database {}: {}", path_, sqlite3_errmsg(db_));
    }
}

void Database::fail(const std::string& what, int rc) const {
    int code = sqlite3_extended_errcode(db_);
    if (code == SQLITE_OK) {
        code = rc;
    }
    throw StoreError(fmt::format("{}: {}", what, sqlite3_errmsg(db_)), code);
}

Database::Statement Database::prepare(const std::string& sql, const std::vector<Value>& params) {
    sqlite3_stmt* raw = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()), &raw, nullptr);
    Statement stmt(raw);
    if (rc != SQLITE_OK) {
        fail("prepare failed", rc);
    }

    for (size_t i = 0; i < params.size(); ++i) {
        int index = static_cast<int>(i) + 1;
        const Value& param = params[i];
        if (std::holds_alternative<std::int64_t>(param)) {
            rc = sqlite3_bind_int64(stmt.get(), index, std::get<std::int64_t>(param));
        } else if (std::holds_alternative<double>(param)) {
            rc = sqlite3_bind_double(stmt.get(), index, std::get<double>(param));
        } else if (std::holds_alternative<std::string>(param)) {
            const auto& text = std::get<std::string>(param);
            rc = sqlite3_bind_text(stmt.get(), index, text.data(), static_cast<int>(text.size()),
                                   SQLITE_TRANSIENT);
        } else {
            rc = sqlite3_bind_null(stmt.get(), index);
        }
        if (rc != SQLITE_OK) {
            fail(fmt::format("bind of parameter {} failed", index), rc);
        }
    }
    return stmt;
}

void Database::step_all(sqlite3_stmt* stmt, std::vector<Row>* rows) {
    while (true) {
        int rc = sqlite3_step(stmt);
        if (rc == SQLITE_DONE) {
            return;
        }
        if (rc != SQLITE_ROW) {
            fail("step failed", rc);
        }
        if (!rows) {
            continue;
        }

        int columns = sqlite3_column_count(stmt);
        Row row;
        row.reserve(columns);
        for (int col = 0; col < columns; ++col) {
            switch (sqlite3_column_type(stmt, col)) {
                case SQLITE_INTEGER:
                    row.emplace_back(static_cast<std::int64_t>(sqlite3_column_int64(stmt, col)));
                    break;
                case SQLITE_FLOAT:
                    row.emplace_back(sqlite3_column_double(stmt, col));
                    break;
                case SQLITE_TEXT:
                case SQLITE_BLOB: {
                    const auto* data = static_cast<const char*>(sqlite3_column_blob(stmt, col));
                    int size = sqlite3_column_bytes(stmt, col);
                    row.emplace_back(data ? std::string(data, size) : std::string());
                    break;
                }
                default:
                    row.emplace_back(nullptr);
                    break;
            }
        }
        rows->push_back(std::move(row));
    }
}

ExecResult Database::execute(const std::string& sql, const std::vector<Value>& params) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt = prepare(sql, params);
    step_all(stmt.get(), nullptr);

    ExecResult result;
    result.rows_affected = sqlite3_changes(db_);
    result.last_insert_id = sqlite3_last_insert_rowid(db_);
    return result;
}

std::vector<Row> Database::query(const std::string& sql, const std::vector<Value>& params) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt = prepare(sql, params);
    std::vector<Row> rows;
    step_all(stmt.get(), &rows);
    return rows;
}

void Database::ping() {
    query("SELECT count(*) FROM sqlite_master");
}

} // namespace itemstore
