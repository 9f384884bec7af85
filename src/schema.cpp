#include "schema.hpp"
#include "logging.hpp"
#include <fmt/format.h>

namespace itemstore {

namespace {

constexpr const char* CREATE_ITEMS_TABLE = R"(
    CREATE TABLE IF NOT EXISTS items (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        name TEXT NOT NULL UNIQUE
    ))";

} // namespace

void ensure_schema(Database& db) {
    db.execute(CREATE_ITEMS_TABLE);
}

std::shared_ptr<Database> open_item_database(const std::string& path) {
    auto db = std::make_shared<Database>(path);

    try {
        db->ping();
    } catch (const StoreError& e) {
        throw StartupError(fmt::format("Failed to connect to database {}: {}", path, e.what()));
    }
    Logger::get().info("Connected to SQLite database: {}", path);

    try {
        ensure_schema(*db);
    } catch (const StoreError& e) {
        throw StartupError(fmt::format("Failed to create table: {}", e.what()));
    }
    Logger::get().info("Table 'items' ensured to exist.");

    return db;
}

} // namespace itemstore
