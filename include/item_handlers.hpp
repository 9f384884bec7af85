#ifndef ITEMSTORE_ITEM_HANDLERS_HPP
#define ITEMSTORE_ITEM_HANDLERS_HPP
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include "item_store.hpp"
#include "router.hpp"

namespace itemstore {

// Decimal 64-bit integer with an optional sign; nothing else is accepted
std::optional<std::int64_t> parse_item_id(std::string_view text);

// Base for the /items handlers. Maps errors at the handler boundary:
// ValidationError -> 400, NotFoundError -> 404, anything else -> 500 with a
// generic message while the detail goes to the log.
class ItemHandler : public RouteHandler {
public:
    ItemHandler(http::verb method, std::string pattern,
                std::shared_ptr<ItemStore> store, std::string failure_message)
        : RouteHandler(method, std::move(pattern))
        , store_(std::move(store))
        , failure_message_(std::move(failure_message)) {}

protected:
    Response handle_route(const Request& req, const PathParams& params) final;

    virtual Response handle_item_request(const Request& req, const PathParams& params) = 0;

    // The {id} path parameter; throws ValidationError
    static std::int64_t item_id(const PathParams& params);
    // The decoded request body; throws ValidationError
    static Item item_body(const Request& req);

    std::shared_ptr<ItemStore> store_;

private:
    std::string failure_message_;
};

// GET /items
class ListItemsHandler final : public ItemHandler {
public:
    explicit ListItemsHandler(std::shared_ptr<ItemStore> store)
        : ItemHandler(http::verb::get, "/items", std::move(store), "Failed to retrieve items") {}

protected:
    Response handle_item_request(const Request& req, const PathParams& params) override;
};

// GET /items/{id}
class GetItemHandler final : public ItemHandler {
public:
    explicit GetItemHandler(std::shared_ptr<ItemStore> store)
        : ItemHandler(http::verb::get, "/items/{id}", std::move(store), "Failed to retrieve item") {}

protected:
    Response handle_item_request(const Request& req, const PathParams& params) override;
};

// POST /items
class CreateItemHandler final : public ItemHandler {
public:
    explicit CreateItemHandler(std::shared_ptr<ItemStore> store)
        : ItemHandler(http::verb::post, "/items", std::move(store), "Failed to create item") {}

protected:
    Response handle_item_request(const Request& req, const PathParams& params) override;
};

// PUT /items/{id}
class UpdateItemHandler final : public ItemHandler {
public:
    explicit UpdateItemHandler(std::shared_ptr<ItemStore> store)
        : ItemHandler(http::verb::put, "/items/{id}", std::move(store), "Failed to update item") {}

protected:
    Response handle_item_request(const Request& req, const PathParams& params) override;
};

// DELETE /items/{id}
class DeleteItemHandler final : public ItemHandler {
public:
    explicit DeleteItemHandler(std::shared_ptr<ItemStore> store)
        : ItemHandler(http::verb::delete_, "/items/{id}", std::move(store), "Failed to delete item") {}

protected:
    Response handle_item_request(const Request& req, const PathParams& params) override;
};

// Registers the five /items routes against one store
Router make_item_router(const std::shared_ptr<ItemStore>& store);

} // namespace itemstore
#endif // ITEMSTORE_ITEM_HANDLERS_HPP
