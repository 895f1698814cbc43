#include "rolodex/contacts/handlers.hpp"
#include "rolodex/contacts/mapper.hpp"
#include "rolodex/contacts/validation.hpp"

#include "rolodex/core/timestamp.hpp"

#include <charconv>
#include <iostream>
#include <optional>

namespace rolodex::contacts {

namespace {

constexpr std::string_view CONTACT_NOT_FOUND = "Contact not found";

std::optional<int64_t> parse_id(const http::request_context& ctx) {
    auto raw = ctx.params.get("id");
    if (!raw || raw->empty()) {
        return std::nullopt;
    }
    int64_t id = 0;
    auto [ptr, ec] = std::from_chars(raw->data(), raw->data() + raw->size(), id);
    if (ec != std::errc() || ptr != raw->data() + raw->size()) {
        return std::nullopt;
    }
    return id;
}

std::expected<json::value, http::response> parse_body(const http::request& req) {
    if (req.body.empty()) {
        return json::value::make_object();
    }
    auto parsed = json::parse(req.body);
    if (!parsed) {
        return std::unexpected(http::response::error(
            error_body::bad_request("Invalid JSON body", parsed.error().message())));
    }
    return std::move(*parsed);
}

http::response database_failure(const storage::database_error& err) {
    std::cerr << "[contacts] Database error (" << err.code << "): " << err.message << "\n";
    return http::response::error(error_body::internal_server_error(err.message));
}

http::response not_found() {
    return http::response::error(error_body::not_found(CONTACT_NOT_FOUND));
}

json::value envelope(json::value data, std::string_view message = {}) {
    auto out = json::value::make_object();
    out.set("success", true);
    out.set("data", std::move(data));
    if (!message.empty()) {
        out.set("message", message);
    }
    return out;
}

/// Presence checks followed by mapping; failures are ready-made 400 responses.
std::expected<contact_row, http::response> validated_row(const json::value& body,
                                                         bool echo_received) {
    if (auto checked = check_required_fields(body); !checked) {
        auto err = error_body::bad_request(checked.error().message);
        if (echo_received &&
            checked.error().code == validation_error_code::missing_required_fields) {
            err.received = body;
        }
        return std::unexpected(http::response::error(err));
    }

    auto row = contact_from_json(body).and_then(to_row);
    if (!row) {
        std::cerr << "[contacts] Invalid request data: " << row.error().message << "\n";
        return std::unexpected(http::response::error(
            error_body::bad_request("Invalid request data", row.error().message)));
    }
    return std::move(*row);
}

} // namespace

result<http::response> contact_handlers::list(const http::request&, http::request_context&) {
    auto rows = store_.list_all();
    if (!rows) {
        return database_failure(rows.error());
    }

    json::array data;
    data.reserve(rows->size());
    for (const auto& row : *rows) {
        data.push_back(to_json(to_document(row)));
    }
    const auto count = static_cast<int64_t>(data.size());

    auto out = json::value::make_object();
    out.set("success", true);
    out.set("data", std::move(data));
    out.set("count", count);
    return http::response::json(out);
}

result<http::response> contact_handlers::get(const http::request&, http::request_context& ctx) {
    auto id = parse_id(ctx);
    if (!id) {
        return not_found();
    }

    auto row = store_.find_by_id(*id);
    if (!row) {
        return database_failure(row.error());
    }
    if (!*row) {
        return not_found();
    }
    return http::response::json(envelope(to_json(to_document(**row))));
}

result<http::response> contact_handlers::create(const http::request& req, http::request_context&) {
    auto body = parse_body(req);
    if (!body) {
        return std::move(body.error());
    }
    std::cout << "[contacts] Received request body: " << json::dump(*body) << "\n";

    auto row = validated_row(*body, true);
    if (!row) {
        return std::move(row.error());
    }

    auto id = store_.insert(*row);
    if (!id) {
        return database_failure(id.error());
    }

    auto created = store_.find_by_id(*id);
    if (!created) {
        return database_failure(created.error());
    }
    if (!*created) {
        // Deleted by a concurrent request between the two statements.
        return not_found();
    }
    return http::response::json(
        envelope(to_json(to_document(**created)), "Contact created successfully"), 201);
}

result<http::response> contact_handlers::update(const http::request& req,
                                                http::request_context& ctx) {
    auto body = parse_body(req);
    if (!body) {
        return std::move(body.error());
    }

    auto row = validated_row(*body, false);
    if (!row) {
        return std::move(row.error());
    }

    auto id = parse_id(ctx);
    if (!id) {
        return not_found();
    }

    auto updated = store_.update(*id, *row);
    if (!updated) {
        return database_failure(updated.error());
    }
    if (!*updated) {
        return not_found();
    }

    auto stored = store_.find_by_id(*id);
    if (!stored) {
        return database_failure(stored.error());
    }
    if (!*stored) {
        return not_found();
    }
    return http::response::json(
        envelope(to_json(to_document(**stored)), "Contact updated successfully"));
}

result<http::response> contact_handlers::remove(const http::request&, http::request_context& ctx) {
    auto id = parse_id(ctx);
    if (!id) {
        return not_found();
    }

    auto removed = store_.remove(*id);
    if (!removed) {
        return database_failure(removed.error());
    }
    if (!*removed) {
        return not_found();
    }

    auto out = json::value::make_object();
    out.set("success", true);
    out.set("message", "Contact deleted successfully");
    return http::response::json(out);
}

result<http::response> contact_handlers::health(const http::request&, http::request_context&) {
    auto out = json::value::make_object();
    out.set("success", true);
    out.set("message", "API is running");
    out.set("timestamp", format_iso8601(now_utc()));
    return http::response::json(out);
}

} // namespace rolodex::contacts
