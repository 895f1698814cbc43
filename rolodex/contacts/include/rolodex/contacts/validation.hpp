#pragma once

#include "rolodex/core/json.hpp"

#include <cstdint>
#include <expected>
#include <string>

namespace rolodex::contacts {

enum class validation_error_code : uint8_t {
    missing_required_fields,
    invalid_address,
    invalid_picture,
    missing_registered_date,
    invalid_registered_date,
    unsupported_registered_date,
    invalid_field_type,
};

struct validation_error {
    validation_error_code code;
    std::string message;
};

template <typename T> using validation_result = std::expected<T, validation_error>;

/// Presence checks run on the raw request body before any mapping.
/// The first failing rule wins:
///   1. fullName, email, address, picture present and truthy
///   2. address.street.number and address.street.name truthy
///   3. picture.large, picture.medium, picture.thumbnail truthy
///   4. registeredDate truthy
validation_result<void> check_required_fields(const json::value& body);

} // namespace rolodex::contacts
