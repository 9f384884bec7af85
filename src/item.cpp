#include "item.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace itemstore {

namespace {

bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

// Exact member name first, then a case-insensitive match
nlohmann::json::const_iterator find_member(const nlohmann::json& object, const std::string& name) {
    auto exact = object.find(name);
    if (exact != object.end()) {
        return exact;
    }
    for (auto it = object.begin(); it != object.end(); ++it) {
        if (iequals(it.key(), name)) {
            return it;
        }
    }
    return object.end();
}

} // namespace

void to_json(nlohmann::json& j, const Item& item) {
    j = nlohmann::json{{"id", item.id}, {"name", item.name}};
}

Item parse_item(const std::string& body) {
    // Only the first JSON value is decoded, anything after it is ignored
    nlohmann::json data;
    try {
        std::istringstream in(body);
        in >> data;
    } catch (const nlohmann::json::parse_error& e) {
        throw ValidationError(std::string("malformed JSON: ") + e.what());
    }

    Item item;
    if (data.is_null()) {
        return item;
    }
    if (!data.is_object()) {
        throw ValidationError("request body must be a JSON object");
    }

    auto name = find_member(data, "name");
    if (name != data.end() && !name->is_null()) {
        if (!name->is_string()) {
            throw ValidationError("'name' must be a string");
        }
        item.name = name->get<std::string>();
    }

    auto id = find_member(data, "id");
    if (id != data.end() && !id->is_null()) {
        if (!id->is_number_integer()) {
            throw ValidationError("'id' must be an integer");
        }
        item.id = id->get<std::int64_t>();
    }

    return item;
}

} // namespace itemstore
