#include "rolodex/contacts/validation.hpp"

#include <initializer_list>
#include <string_view>

namespace rolodex::contacts {

namespace {

bool all_truthy(const json::value& body,
                std::initializer_list<std::initializer_list<std::string_view>> paths) {
    for (auto path : paths) {
        const json::value* field = body.at(path);
        if (!field || !field->truthy()) {
            return false;
        }
    }
    return true;
}

std::unexpected<validation_error> fail(validation_error_code code, std::string message) {
    return std::unexpected(validation_error{code, std::move(message)});
}

} // namespace

validation_result<void> check_required_fields(const json::value& body) {
    if (!all_truthy(body, {{"fullName"}, {"email"}, {"address"}, {"picture"}})) {
        return fail(validation_error_code::missing_required_fields,
                    "Missing required fields: fullName, email, address, picture");
    }
    if (!all_truthy(body, {{"address", "street", "number"}, {"address", "street", "name"}})) {
        return fail(validation_error_code::invalid_address,
                    "Invalid address structure. Required: address.street.number and "
                    "address.street.name");
    }
    if (!all_truthy(body,
                    {{"picture", "large"}, {"picture", "medium"}, {"picture", "thumbnail"}})) {
        return fail(validation_error_code::invalid_picture,
                    "Invalid picture structure. Required: picture.large, picture.medium, "
                    "picture.thumbnail");
    }
    if (!all_truthy(body, {{"registeredDate"}})) {
        return fail(validation_error_code::missing_registered_date, "registeredDate is required");
    }
    return {};
}

} // namespace rolodex::contacts
