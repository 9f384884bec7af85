#pragma once
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "request_handler.hpp"

namespace itemstore {

// Values captured by {name} segments of a route pattern
using PathParams = std::map<std::string, std::string>;

// A path pattern such as "/items/{id}". Literal segments must match exactly,
// a {name} segment matches one non-empty segment.
class RoutePattern {
public:
    explicit RoutePattern(std::string pattern);

    // Matches a request target (the query string is ignored). Captured values
    // are percent-decoded.
    std::optional<PathParams> match(std::string_view target) const;

    const std::string& str() const { return pattern_; }

private:
    std::string pattern_;
    std::vector<std::string> segments_;
};

// Strips the query string from a request target
std::string_view request_path(std::string_view target);

// Decodes %XX escapes; malformed escapes are kept verbatim
std::string percent_decode(std::string_view text);

// A handler bound to exactly one (method, pattern) route
class RouteHandler : public RequestHandler {
public:
    RouteHandler(http::verb method, std::string pattern)
        : method_(method), pattern_(std::move(pattern)) {}

    bool can_handle(const Request& req) const override;

    // HEAD is served by GET routes
    bool accepts(http::verb method) const;

    http::verb method() const { return method_; }
    const RoutePattern& pattern() const { return pattern_; }

protected:
    Response handle_request_impl(const Request& req) final;

    virtual Response handle_route(const Request& req, const PathParams& params) = 0;

private:
    http::verb method_;
    RoutePattern pattern_;
};

// Terminates a route chain: answers 405 with an Allow header when the path
// matches a known route under a different method. Anything else falls through
// to the default 404. Only the (method, pattern) pairs are kept so the chain
// does not own itself.
class MethodNotAllowedHandler final : public RequestHandler {
public:
    using Route = std::pair<http::verb, RoutePattern>;

    explicit MethodNotAllowedHandler(std::vector<Route> routes)
        : routes_(std::move(routes)) {}

    bool can_handle(const Request& req) const override;

protected:
    Response handle_request_impl(const Request& req) override;

private:
    std::string allowed_methods(std::string_view target) const;
    std::vector<Route> routes_;
};

// Chains route handlers in registration order
class Router {
public:
    Router& add(std::shared_ptr<RouteHandler> handler);

    // Links the registered routes and returns the head of the chain
    std::shared_ptr<RequestHandler> build() const;

    const std::vector<std::shared_ptr<RouteHandler>>& routes() const { return routes_; }

private:
    std::vector<std::shared_ptr<RouteHandler>> routes_;
};

} // namespace itemstore
