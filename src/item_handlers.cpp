#include "item_handlers.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <charconv>
#include <nlohmann/json.hpp>

namespace itemstore {

std::optional<std::int64_t> parse_item_id(std::string_view text) {
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
        if (!text.empty() && text.front() == '-') {
            return std::nullopt;
        }
    }
    if (text.empty()) {
        return std::nullopt;
    }

    std::int64_t value = 0;
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc() || ptr != end) {
        return std::nullopt;
    }
    return value;
}

std::int64_t ItemHandler::item_id(const PathParams& params) {
    auto it = params.find("id");
    if (it == params.end()) {
        throw ValidationError("Invalid item ID");
    }
    auto id = parse_item_id(it->second);
    if (!id) {
        throw ValidationError("Invalid item ID");
    }
    return *id;
}

Item ItemHandler::item_body(const Request& req) {
    try {
        return parse_item(req.body());
    } catch (const ValidationError& e) {
        Logger::get().debug("Rejected request body: {}", e.what());
        throw ValidationError("Invalid request body");
    }
}

Response ItemHandler::handle_route(const Request& req, const PathParams& params) {
    Logger::get().debug("Received request: {} {}", std::string(req.method_string()), std::string(req.target()));

    try {
        return handle_item_request(req, params);
    } catch (const ValidationError& e) {
        return text_response(req, http::status::bad_request, e.what());
    } catch (const NotFoundError& e) {
        return text_response(req, http::status::not_found, e.what());
    } catch (const std::exception& e) {
        Logger::get().error("{}: {}", failure_message_, e.what());
        return text_response(req, http::status::internal_server_error, failure_message_);
    }
}

Response ListItemsHandler::handle_item_request(const Request& req, const PathParams& /*params*/) {
    nlohmann::json items = nlohmann::json::array();
    for (const auto& item : store_->list()) {
        items.push_back(nlohmann::json(item));
    }
    return json_response(req, http::status::ok, items.dump());
}

Response GetItemHandler::handle_item_request(const Request& req, const PathParams& params) {
    auto id = item_id(params);
    auto item = store_->get(id);
    if (!item) {
        throw NotFoundError("Item not found");
    }
    return json_response(req, http::status::ok, nlohmann::json(*item).dump());
}

Response CreateItemHandler::handle_item_request(const Request& req, const PathParams& /*params*/) {
    auto item = item_body(req);
    // The id in the body is never trusted; the store assigns it
    auto created = store_->create(item.name);
    Logger::get().debug("Created item {} ({})", created.id, created.name);
    return json_response(req, http::status::created, nlohmann::json(created).dump());
}

Response UpdateItemHandler::handle_item_request(const Request& req, const PathParams& params) {
    auto id = item_id(params);
    auto item = item_body(req);
    item.id = id;
    if (!store_->update(item)) {
        throw NotFoundError("Item not found or no changes made");
    }
    return json_response(req, http::status::ok, nlohmann::json(item).dump());
}

Response DeleteItemHandler::handle_item_request(const Request& req, const PathParams& params) {
    auto id = item_id(params);
    if (!store_->remove(id)) {
        throw NotFoundError("Item not found");
    }
    Response res{http::status::no_content, req.version()};
    res.keep_alive(req.keep_alive());
    res.prepare_payload();
    return res;
}

Router make_item_router(const std::shared_ptr<ItemStore>& store) {
    Router router;
    router.add(std::make_shared<ListItemsHandler>(store))
          .add(std::make_shared<CreateItemHandler>(store))
          .add(std::make_shared<GetItemHandler>(store))
          .add(std::make_shared<UpdateItemHandler>(store))
          .add(std::make_shared<DeleteItemHandler>(store));
    return router;
}

} // namespace itemstore
