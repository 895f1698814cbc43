#pragma once

#include "rolodex/core/http.hpp"
#include "rolodex/core/router.hpp"

#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace rolodex::test_support {

// Runs raw HTTP request text through the real parser and a handler, without
// spinning up a reactor_pool or opening sockets.
class HttpHandlerHarness {
public:
    using Handler = std::function<http::response(const http::request&)>;

    explicit HttpHandlerHarness(Handler handler) : handler_(std::move(handler)) {}

    explicit HttpHandlerHarness(const http::router& r)
        : handler_([&r](const http::request& req) { return r.handle(req); }) {}

    // Parse raw HTTP request text, run handler, and return response.
    http::response run_raw(const std::string& raw_request) const {
        http::parser parser;
        auto result = parser.parse(raw_request);
        if (!result.has_value() || *result != http::parser::state::complete) {
            throw std::runtime_error("Failed to parse HTTP request in harness");
        }
        return handler_(parser.get_request());
    }

    http::response run(const http::request& req) const { return handler_(req); }

    // Builds a request with a JSON body (when given) and runs it.
    http::response send(std::string_view method,
                        std::string_view uri,
                        std::string_view body = {}) const {
        std::string raw;
        raw.append(method).append(" ").append(uri).append(" HTTP/1.1\r\n");
        raw.append("Host: localhost\r\n");
        if (!body.empty()) {
            raw.append("Content-Type: application/json\r\n");
        }
        raw.append("Content-Length: ").append(std::to_string(body.size())).append("\r\n\r\n");
        raw.append(body);
        return run_raw(raw);
    }

private:
    Handler handler_;
};

} // namespace rolodex::test_support
