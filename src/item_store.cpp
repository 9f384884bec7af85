#include "item_store.hpp"
#include "errors.hpp"

namespace itemstore {

Item SqliteItemStore::to_item(const Row& row) {
    if (row.size() != 2 ||
        !std::holds_alternative<std::int64_t>(row[0]) ||
        !std::holds_alternative<std::string>(row[1])) {
        throw StoreError("unexpected row shape in items table");
    }
    return Item{std::get<std::int64_t>(row[0]), std::get<std::string>(row[1])};
}

std::vector<Item> SqliteItemStore::list() {
    std::vector<Item> items;
    for (const auto& row : db_->query("SELECT id, name FROM items")) {
        items.push_back(to_item(row));
    }
    return items;
}

std::optional<Item> SqliteItemStore::get(std::int64_t id) {
    auto rows = db_->query("SELECT id, name FROM items WHERE id = ?", {id});
    if (rows.empty()) {
        return std::nullopt;
    }
    return to_item(rows.front());
}

Item SqliteItemStore::create(const std::string& name) {
    auto result = db_->execute("INSERT INTO items (name) VALUES (?)", {name});
    return Item{result.last_insert_id, name};
}

bool SqliteItemStore::update(const Item& item) {
    auto result = db_->execute("UPDATE items SET name = ? WHERE id = ?", {item.name, item.id});
    return result.rows_affected > 0;
}

bool SqliteItemStore::remove(std::int64_t id) {
    auto result = db_->execute("DELETE FROM items WHERE id = ?", {id});
    return result.rows_affected > 0;
}

} // namespace itemstore
