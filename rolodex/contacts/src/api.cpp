#include "rolodex/contacts/api.hpp"

#include "rolodex/core/middleware.hpp"

namespace rolodex::contacts {

namespace {

using http::path_pattern;
using http::request;
using http::request_context;

template <auto Member> http::handler_fn bind_handler(contact_handlers& handlers) {
    return [&handlers](const request& req, request_context& ctx) {
        return (handlers.*Member)(req, ctx);
    };
}

} // namespace

contact_api::contact_api(contact_store& store)
    : handlers_(store),
      // CORS sits outside recovery so that 500 answers carry its headers too.
      middleware_{http::cors(), http::recover()},
      routes_{{
          {http::method::get,
           path_pattern::from_literal<"/api/contacts">(),
           bind_handler<&contact_handlers::list>(handlers_)},
          {http::method::get,
           path_pattern::from_literal<"/api/contacts/{id}">(),
           bind_handler<&contact_handlers::get>(handlers_)},
          {http::method::post,
           path_pattern::from_literal<"/api/contacts">(),
           bind_handler<&contact_handlers::create>(handlers_)},
          {http::method::put,
           path_pattern::from_literal<"/api/contacts/{id}">(),
           bind_handler<&contact_handlers::update>(handlers_)},
          {http::method::del,
           path_pattern::from_literal<"/api/contacts/{id}">(),
           bind_handler<&contact_handlers::remove>(handlers_)},
          {http::method::get,
           path_pattern::from_literal<"/api/health">(),
           bind_handler<&contact_handlers::health>(handlers_)},
      }},
      router_(routes_, http::make_middleware_chain(middleware_)) {}

} // namespace rolodex::contacts
