#pragma once

#include "contact_store.hpp"
#include "handlers.hpp"

#include "rolodex/core/router.hpp"

#include <array>

namespace rolodex::contacts {

/// Route table of the contacts service with its global middleware.
///
///   GET    /api/contacts
///   GET    /api/contacts/{id}
///   POST   /api/contacts
///   PUT    /api/contacts/{id}
///   DELETE /api/contacts/{id}
///   GET    /api/health
///
/// Holds references into itself; not copyable or movable.
class contact_api {
public:
    explicit contact_api(contact_store& store);

    contact_api(const contact_api&) = delete;
    contact_api& operator=(const contact_api&) = delete;

    [[nodiscard]] const http::router& api_router() const noexcept { return router_; }

private:
    static constexpr size_t ROUTE_COUNT = 6;

    contact_handlers handlers_;
    std::array<http::middleware_fn, 2> middleware_;
    std::array<http::route_entry, ROUTE_COUNT> routes_;
    http::router router_;
};

} // namespace rolodex::contacts
