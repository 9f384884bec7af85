#include "commands.hpp"
#include <iostream>
#include <iomanip>
#include <string>
#include <boost/system/system_error.hpp>
#include <nlohmann/json.hpp>
#include "errors.hpp"
#include "item_handlers.hpp"
#include "logging.hpp"
#include "schema.hpp"
#include "server.hpp"

namespace itemstore {

std::string database_path(const Config& config) {
    return config.get<std::string>("database.path", DEFAULT_DATABASE_PATH);
}

std::unique_ptr<ItemStore> open_item_store(const Config& config) {
    return std::make_unique<SqliteItemStore>(open_item_database(database_path(config)));
}

namespace {

bool parse_id_argument(const std::string& text, std::int64_t& id) {
    auto parsed = parse_item_id(text);
    if (!parsed) {
        std::cerr << "Error: Invalid item ID: " << text << std::endl;
        return false;
    }
    id = *parsed;
    return true;
}

} // namespace

bool item_list_command(const Config& config) {
    try {
        auto store = open_item_store(config);
        auto items = store->list();

        if (items.empty()) {
            std::cout << "No items found." << std::endl;
            return true;
        }

        std::cout << std::left << std::setw(12) << "ID"
                  << std::left << "Name" << std::endl;
        std::cout << std::string(60, '-') << std::endl;
        for (const auto& item : items) {
            std::cout << std::left << std::setw(12) << item.id
                      << item.name << std::endl;
        }
        std::cout << std::string(60, '-') << std::endl;
        std::cout << "Total items: " << items.size() << std::endl;
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return false;
    }
}

bool item_get_command(const std::string& id_text, const Config& config) {
    std::int64_t id = 0;
    if (!parse_id_argument(id_text, id)) {
        return false;
    }

    try {
        auto store = open_item_store(config);
        auto item = store->get(id);
        if (!item) {
            std::cerr << "Error: Could not find item: " << id << std::endl;
            return false;
        }
        std::cout << nlohmann::json(*item).dump(2) << std::endl;
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return false;
    }
}

bool item_add_command(const std::string& name, const Config& config) {
    try {
        auto store = open_item_store(config);
        auto item = store->create(name);
        std::cout << nlohmann::json(item).dump(2) << std::endl;
        return true;
    } catch (const StoreError& e) {
        std::cerr << "Error: Failed to create item: " << e.what() << std::endl;
        return false;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return false;
    }
}

bool item_rename_command(const std::string& id_text, const std::string& name, const Config& config) {
    std::int64_t id = 0;
    if (!parse_id_argument(id_text, id)) {
        return false;
    }

    try {
        auto store = open_item_store(config);
        if (!store->update(Item{id, name})) {
            std::cerr << "Error: Could not find item: " << id << std::endl;
            return false;
        }
        std::cout << nlohmann::json(Item{id, name}).dump(2) << std::endl;
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return false;
    }
}

bool item_remove_command(const std::string& id_text, const Config& config) {
    std::int64_t id = 0;
    if (!parse_id_argument(id_text, id)) {
        return false;
    }

    try {
        auto store = open_item_store(config);
        if (!store->remove(id)) {
            std::cerr << "Error: Could not find item: " << id << std::endl;
            return false;
        }
        std::cout << "Removed item " << id << std::endl;
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return false;
    }
}

bool config_show_command(const Config& config) {
    std::cout << config.to_json().dump(2) << std::endl;
    return true;
}

bool serve_command(const Config& config) {
    std::string address = config.get<std::string>("server.address", DEFAULT_ADDRESS);
    int port = config.get<int>("server.port", DEFAULT_PORT);
    int threads = config.get<int>("server.threads", 0);
    std::string db_path = database_path(config);
    bool debug_mode = config.get<bool>("debug", false);
    std::string log_level = config.get<std::string>("log.level", "info");
    std::string log_file = config.get<std::string>("log.file", "");

    Logger::init(debug_mode ? "debug" : log_level, log_file);

    if (port < 0 || port > 65535) {
        Logger::get().error("Invalid port: {}", port);
        return false;
    }
    if (threads < 0) {
        Logger::get().error("Invalid thread count: {}", threads);
        return false;
    }

    // The store must be reachable before anything listens
    std::shared_ptr<Database> db;
    try {
        db = open_item_database(db_path);
    } catch (const StartupError& e) {
        Logger::get().critical("{}", e.what());
        return false;
    }

    try {
        auto store = std::make_shared<SqliteItemStore>(db);
        auto handler = make_item_router(store).build();

        Server server{address, static_cast<unsigned short>(port), handler, static_cast<unsigned int>(threads)};
        Logger::get().info("Server starting on {}:{}", address, server.local_port());
        if (debug_mode) {
            Logger::get().debug("Debug logging enabled");
        }
        server.run();
        Logger::get().info("Server stopped");
        return true;
    } catch (const boost::system::system_error& e) {
        Logger::get().critical("Failed to listen on {}:{}: {}", address, port, e.what());
        return false;
    } catch (const std::exception& e) {
        Logger::get().error("Server terminated with error: {}", e.what());
        return false;
    }
}

} // namespace itemstore
