#include "rolodex/core/error_body.hpp"

namespace rolodex {

json::value error_body::to_value() const {
    auto out = json::value::make_object();
    out.set("error", error);
    if (details) {
        out.set("details", *details);
    }
    if (received) {
        out.set("received", *received);
    }
    return out;
}

std::string error_body::to_json() const {
    return json::dump(to_value());
}

error_body error_body::bad_request(std::string_view message, std::string_view details) {
    error_body e;
    e.status = 400;
    e.error = std::string(message);
    if (!details.empty()) {
        e.details = std::string(details);
    }
    return e;
}

error_body error_body::not_found(std::string_view message) {
    error_body e;
    e.status = 404;
    e.error = std::string(message);
    return e;
}

error_body error_body::internal_server_error(std::string_view message) {
    error_body e;
    e.status = 500;
    e.error = std::string(message);
    return e;
}

} // namespace rolodex
