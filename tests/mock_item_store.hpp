#pragma once

#include <gmock/gmock.h>
#include "item_store.hpp"

namespace itemstore {
namespace test {

class MockItemStore : public ItemStore {
public:
    MOCK_METHOD(std::vector<Item>, list, (), (override));
    MOCK_METHOD(std::optional<Item>, get, (std::int64_t id), (override));
    MOCK_METHOD(Item, create, (const std::string& name), (override));
    MOCK_METHOD(bool, update, (const Item& item), (override));
    MOCK_METHOD(bool, remove, (std::int64_t id), (override));
};

} // namespace test
} // namespace itemstore
