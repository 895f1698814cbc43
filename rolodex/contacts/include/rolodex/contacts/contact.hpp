#pragma once

#include "rolodex/core/timestamp.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace rolodex::contacts {

/// registeredDate as it arrives: an instant, or text still to be validated.
using registered_date = std::variant<timestamp, std::string>;

struct street_address {
    int64_t number = 0;
    std::string name;

    bool operator==(const street_address&) const = default;
};

struct postal_address {
    street_address street;
    std::optional<std::string> city;
    std::optional<std::string> country;

    bool operator==(const postal_address&) const = default;
};

struct picture_urls {
    std::string large;
    std::string medium;
    std::string thumbnail;

    bool operator==(const picture_urls&) const = default;
};

/// Nested document form used on the wire.
struct contact {
    std::optional<std::string> id;
    std::string full_name;
    postal_address address;
    std::string email;
    std::optional<std::string> phone;
    std::optional<std::string> cell;
    registered_date registered;
    std::optional<int64_t> age;
    picture_urls picture;

    bool operator==(const contact&) const = default;
};

/// Flat form matching the columns of the contacts table.
struct contact_row {
    int64_t id = 0;
    std::string full_name;
    std::string email;
    std::optional<std::string> phone;
    std::optional<std::string> cell;
    std::string registered_date;
    std::optional<int64_t> age;
    int64_t street_number = 0;
    std::string street_name;
    std::optional<std::string> city;
    std::optional<std::string> country;
    std::string picture_large;
    std::string picture_medium;
    std::string picture_thumbnail;
    std::string created_at;
    std::string updated_at;

    bool operator==(const contact_row&) const = default;
};

} // namespace rolodex::contacts
