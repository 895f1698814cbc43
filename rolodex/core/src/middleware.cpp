#include "rolodex/core/middleware.hpp"

#include <exception>
#include <iostream>

namespace rolodex::http {

namespace {

constexpr std::string_view ALLOWED_METHODS = "GET,HEAD,PUT,PATCH,POST,DELETE";

} // namespace

middleware_fn cors() {
    return [](const request& req, request_context&, next_fn next) -> result<response> {
        if (req.http_method == method::options) {
            auto res = response::no_content();
            res.set_header("Access-Control-Allow-Origin", "*");
            res.set_header("Access-Control-Allow-Methods", ALLOWED_METHODS);
            // Reflect whatever the preflight asked for.
            if (auto requested = req.header("Access-Control-Request-Headers")) {
                res.set_header("Access-Control-Allow-Headers", *requested);
                res.set_header("Vary", "Access-Control-Request-Headers");
            }
            return res;
        }

        auto res = next();
        if (res) {
            res->set_header("Access-Control-Allow-Origin", "*");
        }
        return res;
    };
}

middleware_fn recover() {
    return [](const request& req, request_context&, next_fn next) -> result<response> {
        try {
            return next();
        } catch (const std::exception& e) {
            std::cerr << "[server] Unhandled exception in " << method_to_string(req.http_method)
                      << " " << req.uri << ": " << e.what() << "\n";
            return response::error(error_body::internal_server_error());
        }
    };
}

} // namespace rolodex::http
