#pragma once
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace itemstore {

struct Item {
    std::int64_t id = 0;
    std::string name;

    bool operator==(const Item& other) const {
        return id == other.id && name == other.name;
    }
    bool operator!=(const Item& other) const { return !(*this == other); }
};

// {"id": integer, "name": string}
void to_json(nlohmann::json& j, const Item& item);

// Decodes a request body. Only type coercion is checked: the body must be an
// object (or null), "name" a string or null, "id" an integer or null.
// Member names match case-insensitively when there is no exact match. Unknown
// members and anything after the first JSON value are ignored. Throws
// ValidationError.
Item parse_item(const std::string& body);

} // namespace itemstore
