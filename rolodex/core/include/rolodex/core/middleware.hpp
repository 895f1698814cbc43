#pragma once

#include "router.hpp"

namespace rolodex::http {

/// Permissive CORS: Access-Control-Allow-Origin: * on every response and a
/// 204 answer to any OPTIONS preflight.
middleware_fn cors();

/// Turns a std::exception escaping the rest of the chain into
/// 500 {"error":"Something went wrong!"} and logs it.
middleware_fn recover();

} // namespace rolodex::http
