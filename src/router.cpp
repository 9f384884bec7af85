#include "router.hpp"
#include "logging.hpp"
#include <cctype>
#include <set>

namespace itemstore {

namespace {

std::vector<std::string_view> split_path(std::string_view path) {
    std::vector<std::string_view> segments;
    if (path.empty() || path.front() != '/') {
        return segments;
    }
    path.remove_prefix(1);
    while (true) {
        size_t slash = path.find('/');
        segments.push_back(path.substr(0, slash));
        if (slash == std::string_view::npos) {
            break;
        }
        path.remove_prefix(slash + 1);
    }
    return segments;
}

bool is_capture(std::string_view segment) {
    return segment.size() > 2 && segment.front() == '{' && segment.back() == '}';
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

} // namespace

std::string_view request_path(std::string_view target) {
    return target.substr(0, target.find('?'));
}

std::string percent_decode(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            int hi = hex_value(text[i + 1]);
            int lo = hex_value(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>(hi * 16 + lo);
                i += 2;
                continue;
            }
        }
        out += text[i];
    }
    return out;
}

RoutePattern::RoutePattern(std::string pattern) : pattern_(std::move(pattern)) {
    for (auto segment : split_path(pattern_)) {
        segments_.emplace_back(segment);
    }
}

std::optional<PathParams> RoutePattern::match(std::string_view target) const {
    auto segments = split_path(request_path(target));
    if (segments.size() != segments_.size()) {
        return std::nullopt;
    }

    PathParams params;
    for (size_t i = 0; i < segments.size(); ++i) {
        const std::string& expected = segments_[i];
        if (is_capture(expected)) {
            if (segments[i].empty()) {
                return std::nullopt;
            }
            params[expected.substr(1, expected.size() - 2)] = percent_decode(segments[i]);
        } else if (segments[i] != expected) {
            return std::nullopt;
        }
    }
    return params;
}

bool RouteHandler::accepts(http::verb method) const {
    return method == method_ || (method == http::verb::head && method_ == http::verb::get);
}

bool RouteHandler::can_handle(const Request& req) const {
    return accepts(req.method()) && pattern_.match(as_string_view(req.target())).has_value();
}

Response RouteHandler::handle_request_impl(const Request& req) {
    auto params = pattern_.match(as_string_view(req.target()));
    auto res = handle_route(req, params ? *params : PathParams{});
    if (req.method() == http::verb::head) {
        // Headers as for GET, Content-Length included, but no body
        auto length = res.payload_size();
        res.body().clear();
        if (length) {
            res.content_length(*length);
        }
    }
    return res;
}

std::string MethodNotAllowedHandler::allowed_methods(std::string_view target) const {
    std::set<std::string> methods;
    for (const auto& [method, pattern] : routes_) {
        if (pattern.match(target)) {
            methods.insert(std::string(http::to_string(method)));
            if (method == http::verb::get) {
                methods.insert("HEAD");
            }
        }
    }

    std::string allowed;
    for (const auto& method : methods) {
        if (!allowed.empty()) allowed += ", ";
        allowed += method;
    }
    return allowed;
}

bool MethodNotAllowedHandler::can_handle(const Request& req) const {
    return !allowed_methods(as_string_view(req.target())).empty();
}

Response MethodNotAllowedHandler::handle_request_impl(const Request& req) {
    Logger::get().debug("Method {} not allowed for {}",
                        std::string(req.method_string()), std::string(req.target()));
    auto res = text_response(req, http::status::method_not_allowed, "Method Not Allowed");
    res.set(http::field::allow, allowed_methods(as_string_view(req.target())));
    return res;
}

Router& Router::add(std::shared_ptr<RouteHandler> handler) {
    routes_.push_back(std::move(handler));
    return *this;
}

std::shared_ptr<RequestHandler> Router::build() const {
    std::vector<MethodNotAllowedHandler::Route> known;
    for (const auto& route : routes_) {
        known.emplace_back(route->method(), route->pattern());
    }

    std::shared_ptr<RequestHandler> next = std::make_shared<MethodNotAllowedHandler>(std::move(known));
    for (auto it = routes_.rbegin(); it != routes_.rend(); ++it) {
        (*it)->set_successor(next);
        next = *it;
    }
    return next;
}

} // namespace itemstore
