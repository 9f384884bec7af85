#include <cstdlib>
#include <iostream>
#include <string>
#include <filesystem>
#include <CLI/CLI.hpp>
#include "config.hpp"
#include "commands.hpp"
#include "logging.hpp"

namespace fs = std::filesystem;

// Try to find and load configuration file
void find_and_load_config(itemstore::Config& config) {
    // First check environment variable
    const char* env_config_path = std::getenv("ITEMSTORE_CONFIG");
    if (env_config_path && fs::exists(env_config_path)) {
        config.load_from_toml(env_config_path);
        return;
    }

    // Search for itemstore.toml in current and parent directories
    fs::path current_path = fs::current_path();
    fs::path config_file = itemstore::CONFIG_FILE_NAME;

    while (true) {
        fs::path full_path = current_path / config_file;
        if (fs::exists(full_path)) {
            config.load_from_toml(full_path.string());
            return;
        }

        // Stop if we reached the root directory
        if (current_path == current_path.parent_path()) {
            break;
        }

        current_path = current_path.parent_path();
    }
}

int main(int argc, char* argv[]) {
    itemstore::Config config;

    // Config file first (lowest priority), then environment variables
    find_and_load_config(config);
    config.load_from_env();

    CLI::App app{"Item CRUD service backed by SQLite"};
    app.require_subcommand(1);

    std::string config_file;
    std::string database;
    app.add_option("--config", config_file, "Configuration file (default: itemstore.toml)");
    app.add_option("--database", database, "SQLite database file (default: api.db)");

    // serve subcommand
    auto serve = app.add_subcommand("serve", "Start the HTTP server");
    std::string address, log_file;
    int port = -1;
    int threads = -1;
    bool debug_mode = false;
    serve->add_flag("--debug", debug_mode, "Enable debug logging");
    serve->add_option("--address", address, "Address to bind to (default: 0.0.0.0)");
    serve->add_option("--port", port, "Port to listen on (default: 8080)");
    serve->add_option("--threads", threads, "Worker threads (default: hardware concurrency)");
    serve->add_option("--log-file", log_file, "Also write the log to this file");

    // item subcommand group
    auto item = app.add_subcommand("item", "Item management commands");
    item->require_subcommand(1);

    auto item_list = item->add_subcommand("list", "List all items");

    auto item_get = item->add_subcommand("get", "Show one item as JSON");
    std::string item_get_id;
    item_get->add_option("id", item_get_id, "Item ID")->required();

    auto item_add = item->add_subcommand("add", "Create a new item");
    std::string item_add_name;
    item_add->add_option("name", item_add_name, "Item name")->required();

    auto item_rename = item->add_subcommand("rename", "Replace the name of an item");
    std::string item_rename_id, item_rename_name;
    item_rename->add_option("id", item_rename_id, "Item ID")->required();
    item_rename->add_option("name", item_rename_name, "New item name")->required();

    auto item_remove = item->add_subcommand("remove", "Delete an item");
    std::string item_remove_id;
    item_remove->add_option("id", item_remove_id, "Item ID")->required();

    // config subcommand
    auto config_show = app.add_subcommand("config", "Print the effective configuration");

    try {
        app.parse(argc, argv);

        // An explicit config file overrides what was found on disk
        if (!config_file.empty()) {
            if (!config.load_from_toml(config_file)) {
                std::cerr << "Error: Could not load configuration file: " << config_file << std::endl;
                return 1;
            }
            config.load_from_env();
        }

        // Command-line options take the highest priority
        if (!database.empty()) config.set("database.path", database);
        if (debug_mode) config.set("debug", debug_mode);
        if (!address.empty()) config.set("server.address", address);
        if (port >= 0) config.set("server.port", port);
        if (threads >= 0) config.set("server.threads", threads);
        if (!log_file.empty()) config.set("log.file", log_file);

        if (*serve) {
            return itemstore::serve_command(config) ? 0 : 1;
        }

        // Keep the connection chatter out of command output
        itemstore::Logger::init("warn");

        if (*item_list) {
            return itemstore::item_list_command(config) ? 0 : 1;
        }
        else if (*item_get) {
            return itemstore::item_get_command(item_get_id, config) ? 0 : 1;
        }
        else if (*item_add) {
            return itemstore::item_add_command(item_add_name, config) ? 0 : 1;
        }
        else if (*item_rename) {
            return itemstore::item_rename_command(item_rename_id, item_rename_name, config) ? 0 : 1;
        }
        else if (*item_remove) {
            return itemstore::item_remove_command(item_remove_id, config) ? 0 : 1;
        }
        else if (*config_show) {
            return itemstore::config_show_command(config) ? 0 : 1;
        }

    } catch (const CLI::ParseError &e) {
        return app.exit(e);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
