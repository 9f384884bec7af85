#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "database.hpp"
#include "item.hpp"

namespace itemstore {

class ItemStore {
public:
    virtual ~ItemStore() = default;

    // All items in store-defined order
    virtual std::vector<Item> list() = 0;
    virtual std::optional<Item> get(std::int64_t id) = 0;
    // Inserts name and returns the item with its assigned id
    virtual Item create(const std::string& name) = 0;
    // Replaces the name of item.id; false if no such item
    virtual bool update(const Item& item) = 0;
    // false if no such item
    virtual bool remove(std::int64_t id) = 0;
};

// ItemStore over the items table. Each operation is a single statement on the
// shared Database, so it inherits the database's serialization.
class SqliteItemStore : public ItemStore {
public:
    explicit SqliteItemStore(std::shared_ptr<Database> db)
        : db_(std::move(db)) {}
    ~SqliteItemStore() override = default;

    std::vector<Item> list() override;
    std::optional<Item> get(std::int64_t id) override;
    Item create(const std::string& name) override;
    bool update(const Item& item) override;
    bool remove(std::int64_t id) override;

    const std::shared_ptr<Database>& database() const { return db_; }

private:
    static Item to_item(const Row& row);
    std::shared_ptr<Database> db_;
};

} // namespace itemstore
