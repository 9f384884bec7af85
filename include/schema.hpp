#pragma once
#include <memory>
#include <string>
#include "database.hpp"

namespace itemstore {

// Creates the items table if it does not exist. Safe to run repeatedly.
void ensure_schema(Database& db);

// Opens the database at path, verifies it can be read and ensures the schema.
// Any failure is reported as StartupError; the caller decides whether to exit.
std::shared_ptr<Database> open_item_database(const std::string& path);

} // namespace itemstore
