#pragma once
#include <string>
#include <map>
#include <vector>
#include <variant>
#include <optional>
#include <nlohmann/json.hpp>
// Disable warning about redundant moves in toml11
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wredundant-move"
#include <toml.hpp>
#pragma GCC diagnostic pop

namespace itemstore {

// Version information
constexpr const char* VERSION = "0.1.0";
constexpr const char* SERVER_NAME = "itemstore";

// Defaults for the service
constexpr const char* DEFAULT_ADDRESS = "0.0.0.0";
constexpr int DEFAULT_PORT = 8080;
constexpr const char* DEFAULT_DATABASE_PATH = "api.db";
constexpr const char* CONFIG_FILE_NAME = "itemstore.toml";
constexpr const char* ENV_PREFIX = "ITEMSTORE_";

class Config {
public:
    using ConfigValue = std::variant<std::string, int, bool>;

    Config() = default;

    // Load configuration from different sources
    void load_from_env();
    bool load_from_toml(const std::string& file_path = CONFIG_FILE_NAME);

    // Values are converted on read: environment values arrive as strings and
    // are parsed here when an int or bool is requested. A value that cannot be
    // converted is reported and treated as unset.
    template<typename T>
    std::optional<T> get(const std::string& key) const;

    template<typename T>
    T get(const std::string& key, const T& default_value) const;

    template<typename T>
    void set(const std::string& key, const T& value);

    // Dump configuration as JSON, nesting dotted keys
    nlohmann::json to_json() const;

private:
    std::map<std::string, ConfigValue> config_values_;

    std::vector<std::string> split_key(const std::string& key) const;
    void load_nested_toml(const toml::value& toml_value, const std::string& prefix = "");

    template<typename T>
    std::optional<T> get_value(const std::string& key) const;
};

} // namespace itemstore
