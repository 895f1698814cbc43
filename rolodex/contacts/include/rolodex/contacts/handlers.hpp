#pragma once

#include "contact_store.hpp"

#include "rolodex/core/router.hpp"

namespace rolodex::contacts {

/// Request handlers for /api/contacts and /api/health.
class contact_handlers {
public:
    explicit contact_handlers(contact_store& store) : store_(store) {}

    result<http::response> list(const http::request& req, http::request_context& ctx);
    result<http::response> get(const http::request& req, http::request_context& ctx);
    result<http::response> create(const http::request& req, http::request_context& ctx);
    result<http::response> update(const http::request& req, http::request_context& ctx);
    result<http::response> remove(const http::request& req, http::request_context& ctx);
    result<http::response> health(const http::request& req, http::request_context& ctx);

private:
    contact_store& store_;
};

} // namespace rolodex::contacts
