#pragma once

#include "rolodex/core/json.hpp"

#include <stdexcept>
#include <string>
#include <string_view>

namespace rolodex::test_support {

/// A complete, valid contact body. Tests mutate a copy to probe one rule at a time.
inline constexpr std::string_view VALID_CONTACT_JSON = R"({
    "fullName": "Ada Lovelace",
    "address": {
        "street": {"number": 12, "name": "St James's Square"},
        "city": "London",
        "country": "United Kingdom"
    },
    "email": "ada@example.com",
    "phone": "020 7946 0000",
    "cell": "07700 900000",
    "registeredDate": "2023-01-15T10:30:00.000Z",
    "age": 36,
    "picture": {
        "large": "https://img.example.com/large/ada.jpg",
        "medium": "https://img.example.com/med/ada.jpg",
        "thumbnail": "https://img.example.com/thumb/ada.jpg"
    }
})";

inline json::value parse_or_throw(std::string_view text) {
    auto parsed = json::parse(text);
    if (!parsed) {
        throw std::runtime_error("fixture is not valid JSON: " + parsed.error().message());
    }
    return std::move(*parsed);
}

inline json::value valid_contact() {
    return parse_or_throw(VALID_CONTACT_JSON);
}

/// Valid contact with a different name and email.
inline json::value named_contact(std::string_view full_name) {
    auto body = valid_contact();
    body.set("fullName", full_name);
    body.set("email", std::string(full_name) + "@example.com");
    return body;
}

} // namespace rolodex::test_support
