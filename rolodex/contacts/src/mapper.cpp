#include "rolodex/contacts/mapper.hpp"

#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>

namespace rolodex::contacts {

namespace {

std::unexpected<validation_error> type_error(std::string_view field, std::string_view expected) {
    return std::unexpected(validation_error{validation_error_code::invalid_field_type,
                                            std::string(field) + " must be " +
                                                std::string(expected)});
}

bool is_missing(const json::value* v) noexcept {
    return v == nullptr || v->is_null();
}

validation_result<std::string> read_string(const json::value& body,
                                           std::initializer_list<std::string_view> path,
                                           std::string_view field) {
    const json::value* v = body.at(path);
    if (v == nullptr || !v->is_string()) {
        return type_error(field, "a string");
    }
    return *v->as_string();
}

validation_result<std::optional<std::string>>
read_optional_string(const json::value& body,
                     std::initializer_list<std::string_view> path,
                     std::string_view field) {
    const json::value* v = body.at(path);
    if (is_missing(v)) {
        return std::optional<std::string>{};
    }
    if (!v->is_string()) {
        return type_error(field, "a string");
    }
    return std::optional<std::string>{*v->as_string()};
}

validation_result<int64_t> read_integer(const json::value& body,
                                        std::initializer_list<std::string_view> path,
                                        std::string_view field) {
    const json::value* v = body.at(path);
    auto number = v ? v->as_integer() : std::nullopt;
    if (!number) {
        return type_error(field, "an integer");
    }
    return *number;
}

validation_result<std::optional<int64_t>>
read_optional_integer(const json::value& body,
                      std::initializer_list<std::string_view> path,
                      std::string_view field) {
    const json::value* v = body.at(path);
    if (is_missing(v)) {
        return std::optional<int64_t>{};
    }
    auto number = v->as_integer();
    if (!number) {
        return type_error(field, "an integer");
    }
    return std::optional<int64_t>{*number};
}

json::value optional_to_json(const std::optional<std::string>& v) {
    return v ? json::value(*v) : json::value(nullptr);
}

json::value optional_to_json(const std::optional<int64_t>& v) {
    return v ? json::value(*v) : json::value(nullptr);
}

} // namespace

validation_result<contact> contact_from_json(const json::value& body) {
    contact c;

    // Keeps the first failure; later fields are not assigned once one failed.
    std::optional<validation_error> error;
    auto take = [&error](auto read_result, auto& target) {
        if (error) {
            return;
        }
        if (!read_result) {
            error = std::move(read_result.error());
            return;
        }
        target = std::move(*read_result);
    };

    take(read_string(body, {"fullName"}, "fullName"), c.full_name);
    take(read_string(body, {"email"}, "email"), c.email);
    take(read_optional_string(body, {"phone"}, "phone"), c.phone);
    take(read_optional_string(body, {"cell"}, "cell"), c.cell);
    take(read_optional_integer(body, {"age"}, "age"), c.age);
    take(read_integer(body, {"address", "street", "number"}, "address.street.number"),
         c.address.street.number);
    take(read_string(body, {"address", "street", "name"}, "address.street.name"),
         c.address.street.name);
    take(read_optional_string(body, {"address", "city"}, "address.city"), c.address.city);
    take(read_optional_string(body, {"address", "country"}, "address.country"),
         c.address.country);
    take(read_string(body, {"picture", "large"}, "picture.large"), c.picture.large);
    take(read_string(body, {"picture", "medium"}, "picture.medium"), c.picture.medium);
    take(read_string(body, {"picture", "thumbnail"}, "picture.thumbnail"), c.picture.thumbnail);

    if (error) {
        return std::unexpected(std::move(*error));
    }

    const json::value* date = body.find("registeredDate");
    if (date == nullptr || !date->is_string()) {
        return std::unexpected(validation_error{
            validation_error_code::unsupported_registered_date,
            "registeredDate must be a Date object or ISO date string"});
    }
    c.registered = *date->as_string();

    return c;
}

validation_result<contact_row> to_row(const contact& c) {
    contact_row row;

    if (const auto* ts = std::get_if<timestamp>(&c.registered)) {
        row.registered_date = format_iso8601(*ts);
    } else {
        auto parsed = parse_iso8601(std::get<std::string>(c.registered));
        if (!parsed) {
            return std::unexpected(validation_error{
                validation_error_code::invalid_registered_date,
                "Invalid registeredDate format. Use ISO string format: YYYY-MM-DDTHH:mm:ss.sssZ"});
        }
        row.registered_date = format_iso8601(*parsed);
    }

    row.full_name = c.full_name;
    row.email = c.email;
    row.phone = c.phone;
    row.cell = c.cell;
    row.age = c.age;
    row.street_number = c.address.street.number;
    row.street_name = c.address.street.name;
    row.city = c.address.city;
    row.country = c.address.country;
    row.picture_large = c.picture.large;
    row.picture_medium = c.picture.medium;
    row.picture_thumbnail = c.picture.thumbnail;
    return row;
}

contact to_document(const contact_row& row) {
    contact c;
    c.id = std::to_string(row.id);
    c.full_name = row.full_name;
    c.address.street.number = row.street_number;
    c.address.street.name = row.street_name;
    c.address.city = row.city;
    c.address.country = row.country;
    c.email = row.email;
    c.phone = row.phone;
    c.cell = row.cell;

    if (auto parsed = parse_iso8601(row.registered_date)) {
        c.registered = *parsed;
    } else {
        c.registered = row.registered_date;
    }

    c.age = row.age;
    c.picture.large = row.picture_large;
    c.picture.medium = row.picture_medium;
    c.picture.thumbnail = row.picture_thumbnail;
    return c;
}

std::string registered_date_text(const registered_date& date) {
    if (const auto* ts = std::get_if<timestamp>(&date)) {
        return format_iso8601(*ts);
    }
    return std::get<std::string>(date);
}

json::value to_json(const contact& c) {
    auto street = json::value::make_object();
    street.set("number", c.address.street.number);
    street.set("name", c.address.street.name);

    auto address = json::value::make_object();
    address.set("street", std::move(street));
    address.set("city", optional_to_json(c.address.city));
    address.set("country", optional_to_json(c.address.country));

    auto picture = json::value::make_object();
    picture.set("large", c.picture.large);
    picture.set("medium", c.picture.medium);
    picture.set("thumbnail", c.picture.thumbnail);

    auto out = json::value::make_object();
    out.set("id", optional_to_json(c.id));
    out.set("fullName", c.full_name);
    out.set("address", std::move(address));
    out.set("email", c.email);
    out.set("phone", optional_to_json(c.phone));
    out.set("cell", optional_to_json(c.cell));
    out.set("registeredDate", registered_date_text(c.registered));
    out.set("age", optional_to_json(c.age));
    out.set("picture", std::move(picture));
    return out;
}

} // namespace rolodex::contacts
