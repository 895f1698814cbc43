#pragma once

#include "json.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace rolodex {

/// JSON error payload: {"error": "...", "details": "...", "received": {...}}.
struct error_body {
    int status = 500;
    std::string error;
    std::optional<std::string> details;
    std::optional<json::value> received;

    error_body() = default;
    error_body(error_body&&) noexcept = default;
    error_body& operator=(error_body&&) noexcept = default;
    error_body(const error_body&) = default;
    error_body& operator=(const error_body&) = default;

    [[nodiscard]] json::value to_value() const;
    [[nodiscard]] std::string to_json() const;

    static error_body bad_request(std::string_view message, std::string_view details = "");
    static error_body not_found(std::string_view message = "Route not found");
    static error_body internal_server_error(std::string_view message = "Something went wrong!");
};

} // namespace rolodex
