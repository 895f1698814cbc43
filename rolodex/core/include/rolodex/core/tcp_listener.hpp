#pragma once

#include "result.hpp"
#include "tcp_socket.hpp"

#include <cstdint>

namespace rolodex {

struct listener_options {
    bool reuseport = true;
    int32_t backlog = 1024;
};

/// Listening IPv4 socket bound to all interfaces.
///
/// Throws std::system_error when the socket cannot be created, bound or put
/// into listening state.
class tcp_listener {
public:
    tcp_listener() = default;
    explicit tcp_listener(uint16_t port, const listener_options& options = {});

    tcp_listener(tcp_listener&&) noexcept = default;
    tcp_listener& operator=(tcp_listener&&) noexcept = default;
    tcp_listener(const tcp_listener&) = delete;
    tcp_listener& operator=(const tcp_listener&) = delete;

    /// Returns an invalid socket when no connection is pending.
    result<tcp_socket> accept();

    /// Port actually bound; differs from the requested one when it was 0.
    [[nodiscard]] uint16_t local_port() const noexcept;

    [[nodiscard]] int32_t native_handle() const noexcept { return socket_.native_handle(); }
    [[nodiscard]] explicit operator bool() const noexcept { return static_cast<bool>(socket_); }

private:
    result<void> create_and_bind(uint16_t port, const listener_options& options);

    tcp_socket socket_;
};

} // namespace rolodex
