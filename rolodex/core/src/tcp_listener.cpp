#include "rolodex/core/tcp_listener.hpp"

#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <system_error>

namespace rolodex {

namespace {

std::unexpected<std::error_code> last_error() {
    return std::unexpected(std::error_code(errno, std::system_category()));
}

} // namespace

tcp_listener::tcp_listener(uint16_t port, const listener_options& options) {
    auto res = create_and_bind(port, options);
    if (!res) {
        socket_ = tcp_socket{};
        throw std::system_error(res.error(), "failed to create and bind listener");
    }

    if (::listen(socket_.native_handle(), options.backlog) < 0) {
        auto err = errno;
        socket_ = tcp_socket{};
        throw std::system_error(err, std::system_category(), "listen failed");
    }
}

result<void> tcp_listener::create_and_bind(uint16_t port, const listener_options& options) {
    int32_t fd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return last_error();
    }
    socket_ = tcp_socket(fd);

    int opt = 1;
    if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        return last_error();
    }
    // Must precede bind() so that every worker can bind the same port.
    if (options.reuseport && ::setsockopt(fd, SOL_SOCKET, SO_REUSEPORT, &opt, sizeof(opt)) < 0) {
        return last_error();
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(port);

    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        return last_error();
    }
    return {};
}

result<tcp_socket> tcp_listener::accept() {
    int32_t fd;
    do {
        fd = ::accept4(socket_.native_handle(), nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
    } while (fd < 0 && errno == EINTR);

    if (fd < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return tcp_socket{};
        }
        return last_error();
    }
    return tcp_socket(fd);
}

uint16_t tcp_listener::local_port() const noexcept {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(socket_.native_handle(), reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
        return 0;
    }
    return ntohs(addr.sin_port);
}

} // namespace rolodex
