#include "config.hpp"
#include "logging.hpp"
#include <sstream>
#include <cstdlib>
#include <filesystem>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>
#include <type_traits>

// Declaration for environ
extern char** environ;

namespace fs = std::filesystem;
namespace itemstore {

void Config::load_from_env() {
    const std::string prefix = ENV_PREFIX;
    for (char** env = environ; *env; ++env) {
        std::string env_var = *env;
        size_t equals_pos = env_var.find('=');
        if (equals_pos == std::string::npos) {
            continue;
        }

        std::string key = env_var.substr(0, equals_pos);
        if (key.rfind(prefix, 0) != 0 || key == "ITEMSTORE_CONFIG") {
            continue;
        }

        // ITEMSTORE_DATABASE_PATH -> database.path
        std::string normalized_key = key.substr(prefix.size());
        std::transform(normalized_key.begin(), normalized_key.end(), normalized_key.begin(),
                       [](unsigned char c) { return c == '_' ? '.' : static_cast<char>(std::tolower(c)); });
        if (normalized_key.empty()) {
            continue;
        }

        set<std::string>(normalized_key, env_var.substr(equals_pos + 1));
    }
}

bool Config::load_from_toml(const std::string& file_path) {
    try {
        if (fs::exists(file_path)) {
            auto data = toml::parse(file_path);
            load_nested_toml(data);
            return true;
        }
    } catch (const std::exception& e) {
        Logger::get().error("Error loading TOML configuration {}: {}", file_path, e.what());
    }
    return false;
}

void Config::load_nested_toml(const toml::value& toml_value, const std::string& prefix) {
    if (!toml_value.is_table()) {
        return;
    }

    for (const auto& [key, value] : toml_value.as_table()) {
        std::string full_key = prefix.empty() ? key : prefix + "." + key;

        if (value.is_table()) {
            load_nested_toml(value, full_key);
        } else if (value.is_string()) {
            set<std::string>(full_key, value.as_string());
        } else if (value.is_integer()) {
            auto integer = value.as_integer();
            if (integer < std::numeric_limits<int>::min() || integer > std::numeric_limits<int>::max()) {
                Logger::get().error("Configuration value for {} is out of range: {}", full_key, integer);
                continue;
            }
            set<int>(full_key, static_cast<int>(integer));
        } else if (value.is_boolean()) {
            set<bool>(full_key, value.as_boolean());
        } else {
            Logger::get().warn("Ignoring configuration key {}: unsupported value type", full_key);
        }
    }
}

std::vector<std::string> Config::split_key(const std::string& key) const {
    std::vector<std::string> parts;
    std::stringstream ss(key);
    std::string part;

    while (std::getline(ss, part, '.')) {
        parts.push_back(part);
    }

    return parts;
}

namespace {

std::optional<int> to_int(const Config::ConfigValue& value) {
    if (const int* number = std::get_if<int>(&value)) {
        return *number;
    }
    if (const std::string* text = std::get_if<std::string>(&value)) {
        int number = 0;
        const char* end = text->data() + text->size();
        auto [ptr, ec] = std::from_chars(text->data(), end, number);
        if (ec == std::errc() && ptr == end && !text->empty()) {
            return number;
        }
    }
    return std::nullopt;
}

std::optional<bool> to_bool(const Config::ConfigValue& value) {
    if (const bool* flag = std::get_if<bool>(&value)) {
        return *flag;
    }
    if (const std::string* text = std::get_if<std::string>(&value)) {
        if (*text == "true") return true;
        if (*text == "false") return false;
    }
    return std::nullopt;
}

std::optional<std::string> as_text(const Config::ConfigValue& value) {
    return std::visit([](const auto& v) -> std::string {
        using V = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<V, std::string>) {
            return v;
        } else if constexpr (std::is_same_v<V, bool>) {
            return v ? "true" : "false";
        } else {
            return std::to_string(v);
        }
    }, value);
}

} // namespace

template<typename T>
std::optional<T> Config::get_value(const std::string& key) const {
    auto it = config_values_.find(key);
    if (it == config_values_.end()) {
        return std::nullopt;
    }

    std::optional<T> converted;
    if constexpr (std::is_same_v<T, int>) {
        converted = to_int(it->second);
    } else if constexpr (std::is_same_v<T, bool>) {
        converted = to_bool(it->second);
    } else {
        converted = as_text(it->second);
    }
    if (!converted) {
        Logger::get().warn("Ignoring configuration value for {}: {}", key, *as_text(it->second));
    }
    return converted;
}

template<typename T>
std::optional<T> Config::get(const std::string& key) const {
    return get_value<T>(key);
}

template<typename T>
T Config::get(const std::string& key, const T& default_value) const {
    return get<T>(key).value_or(default_value);
}

template<typename T>
void Config::set(const std::string& key, const T& value) {
    config_values_[key] = value;
}

nlohmann::json Config::to_json() const {
    nlohmann::json result = nlohmann::json::object();

    for (const auto& [key, value] : config_values_) {
        std::vector<std::string> parts = split_key(key);
        if (parts.empty()) {
            continue;
        }

        nlohmann::json* current = &result;
        for (size_t i = 0; i < parts.size() - 1; ++i) {
            if (!current->contains(parts[i]) || !(*current)[parts[i]].is_object()) {
                (*current)[parts[i]] = nlohmann::json::object();
            }
            current = &(*current)[parts[i]];
        }

        std::visit([&](const auto& v) {
            (*current)[parts.back()] = v;
        }, value);
    }

    return result;
}

// Template instantiations for common types
template std::optional<std::string> Config::get<std::string>(const std::string&) const;
template std::optional<int> Config::get<int>(const std::string&) const;
template std::optional<bool> Config::get<bool>(const std::string&) const;
template std::string Config::get<std::string>(const std::string&, const std::string&) const;
template int Config::get<int>(const std::string&, const int&) const;
template bool Config::get<bool>(const std::string&, const bool&) const;
template void Config::set<std::string>(const std::string&, const std::string&);
template void Config::set<int>(const std::string&, const int&);
template void Config::set<bool>(const std::string&, const bool&);

} // namespace itemstore
