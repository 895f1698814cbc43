#include "rolodex/contacts/config.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <thread>

namespace rolodex::contacts {

namespace {

constexpr uint32_t MAX_WORKERS = 64;

std::optional<int64_t> parse_integer(std::string_view text) {
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc() || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

std::optional<uint16_t> parse_port(std::string_view text) {
    auto parsed = parse_integer(text);
    if (parsed && *parsed > 0 && *parsed < 65536) {
        return static_cast<uint16_t>(*parsed);
    }
    return std::nullopt;
}

} // namespace

uint16_t read_port(const env_lookup& env, const char* env_name, uint16_t fallback) {
    if (const char* value = env(env_name)) {
        if (auto port = parse_port(value)) {
            return *port;
        }
    }
    return fallback;
}

uint16_t worker_count(const env_lookup& env) {
    if (const char* value = env("ROLODEX_WORKERS")) {
        auto parsed = parse_integer(value);
        if (parsed && *parsed > 0) {
            return static_cast<uint16_t>(std::min<int64_t>(*parsed, MAX_WORKERS));
        }
    }
    const uint32_t hw = std::max(1u, std::thread::hardware_concurrency());
    return static_cast<uint16_t>(std::min<uint32_t>(hw, MAX_WORKERS));
}

server_config load_config(const env_lookup& env, std::optional<std::string_view> port_arg) {
    server_config config;
    config.port = read_port(env, "PORT", config.port);
    if (port_arg) {
        if (auto port = parse_port(*port_arg)) {
            config.port = *port;
        }
    }

    if (const char* path = env("ROLODEX_DB_PATH"); path && *path) {
        config.database_path = path;
    }

    config.workers = worker_count(env);

    if (const char* timeout = env("ROLODEX_SHUTDOWN_TIMEOUT_MS")) {
        if (auto parsed = parse_integer(timeout); parsed && *parsed >= 0) {
            config.shutdown_timeout = std::chrono::milliseconds(*parsed);
        }
    }
    return config;
}

server_config load_config(int argc, char** argv) {
    std::optional<std::string_view> port_arg;
    if (argc > 1) {
        port_arg = argv[1];
    }
    return load_config([](const char* name) { return std::getenv(name); }, port_arg);
}

} // namespace rolodex::contacts
