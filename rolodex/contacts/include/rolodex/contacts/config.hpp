#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace rolodex::contacts {

struct server_config {
    uint16_t port = 8000;
    std::string database_path = "contacts.db";
    uint16_t workers = 1;
    std::chrono::milliseconds shutdown_timeout{5000};
};

using env_lookup = std::function<const char*(const char*)>;

uint16_t read_port(const env_lookup& env, const char* env_name, uint16_t fallback);
uint16_t worker_count(const env_lookup& env);

/// Reads PORT, ROLODEX_DB_PATH, ROLODEX_WORKERS and ROLODEX_SHUTDOWN_TIMEOUT_MS.
/// A port given on the command line wins over PORT.
server_config load_config(const env_lookup& env, std::optional<std::string_view> port_arg = {});

/// load_config() against the process environment and argv[1].
server_config load_config(int argc, char** argv);

} // namespace rolodex::contacts
