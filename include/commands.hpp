#pragma once

#include <memory>
#include <string>
#include "config.hpp"
#include "item_store.hpp"

namespace itemstore {

// Server command
bool serve_command(const Config& config);

// Item management commands, run directly against the configured database
bool item_list_command(const Config& config);
bool item_get_command(const std::string& id, const Config& config);
bool item_add_command(const std::string& name, const Config& config);
bool item_rename_command(const std::string& id, const std::string& name, const Config& config);
bool item_remove_command(const std::string& id, const Config& config);

// Print the effective configuration
bool config_show_command(const Config& config);

// Helper functions
std::string database_path(const Config& config);
std::unique_ptr<ItemStore> open_item_store(const Config& config);

} // namespace itemstore
