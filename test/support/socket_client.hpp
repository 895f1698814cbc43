#pragma once

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace rolodex::test_support {

// Blocking loopback client for driving real listeners from tests.
class SocketClient {
public:
    SocketClient() = default;
    ~SocketClient() { close(); }

    SocketClient(SocketClient&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
    SocketClient(const SocketClient&) = delete;
    SocketClient& operator=(const SocketClient&) = delete;
    SocketClient& operator=(SocketClient&&) = delete;

    bool connect(uint16_t port) {
        close();
        fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (fd_ < 0) {
            return false;
        }
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        return ::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0;
    }

    bool send_all(std::string_view data) {
        while (!data.empty()) {
            ssize_t n = ::send(fd_, data.data(), data.size(), MSG_NOSIGNAL);
            if (n <= 0) {
                return false;
            }
            data.remove_prefix(static_cast<size_t>(n));
        }
        return true;
    }

    // Reads until the peer closes or the timeout passes.
    std::string read_until_close(std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::string out;
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (read_some(out, deadline)) {
        }
        return out;
    }

    // Reads until `count` complete responses with Content-Length framing arrived.
    std::string read_responses(size_t count,
                               std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::string out;
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (complete_responses(out) < count && read_some(out, deadline)) {
        }
        return out;
    }

    void shutdown_write() { ::shutdown(fd_, SHUT_WR); }

    void close() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

    [[nodiscard]] int fd() const noexcept { return fd_; }

    static size_t complete_responses(std::string_view data) {
        size_t count = 0;
        while (true) {
            size_t header_end = data.find("\r\n\r\n");
            if (header_end == std::string_view::npos) {
                return count;
            }
            size_t length = 0;
            auto head = data.substr(0, header_end);
            size_t pos = head.find("Content-Length: ");
            if (pos != std::string_view::npos) {
                length = std::stoul(std::string(head.substr(pos + 16)));
            }
            size_t total = header_end + 4 + length;
            if (data.size() < total) {
                return count;
            }
            ++count;
            data.remove_prefix(total);
        }
    }

private:
    bool read_some(std::string& out, std::chrono::steady_clock::time_point deadline) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            return false;
        }
        pollfd pfd{fd_, POLLIN, 0};
        if (::poll(&pfd, 1, static_cast<int>(remaining.count())) <= 0) {
            return false;
        }
        char buf[4096];
        ssize_t n = ::recv(fd_, buf, sizeof(buf), 0);
        if (n <= 0) {
            return false;
        }
        out.append(buf, static_cast<size_t>(n));
        return true;
    }

    int fd_{-1};
};

} // namespace rolodex::test_support
