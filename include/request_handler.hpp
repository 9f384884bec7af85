#pragma once
#include <boost/beast/http.hpp>
#include <memory>
#include <string>
#include <string_view>

namespace itemstore {
namespace http = boost::beast::http;

using Request = http::request<http::string_body>;
using Response = http::response<http::string_body>;

inline std::string_view as_string_view(boost::beast::string_view sv) {
    return std::string_view(sv.data(), sv.size());
}

class RequestHandler {
public:
    virtual ~RequestHandler() = default;

    // Set the next handler in the chain
    void set_successor(std::shared_ptr<RequestHandler> successor) {
        successor_ = std::move(successor);
    }

    const std::shared_ptr<RequestHandler>& successor() const { return successor_; }

    // Handle the request by checking if this handler can process it,
    // and if not, pass it to the next handler
    Response handle_request(const Request& req) {
        if (!this->can_handle(req)) {
            if (successor_) {
                return successor_->handle_request(req);
            }
            return text_response(req, http::status::not_found, "404 page not found");
        }
        return handle_request_impl(req);
    }

    // Check if this handler can process the request
    virtual bool can_handle(const Request& req) const = 0;

    // Plain text response, used for every error reply
    static Response text_response(const Request& req, http::status status, const std::string& body);

    // Response with a serialized JSON body
    static Response json_response(const Request& req, http::status status, const std::string& body);

protected:
    // The actual request handling implementation
    virtual Response handle_request_impl(const Request& req) = 0;

    // The next handler in the chain
    std::shared_ptr<RequestHandler> successor_;
};

} // namespace itemstore
