#include "rolodex/core/shutdown.hpp"

#include <poll.h>
#include <sys/eventfd.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <cstdint>
#include <system_error>

namespace rolodex {

namespace {

extern "C" void on_termination_signal(int) {
    shutdown_manager::instance().request_shutdown();
}

void drain(int fd) noexcept {
    uint64_t val = 0;
    ssize_t ret = read(fd, &val, sizeof(val));
    (void)ret;
}

std::unexpected<std::error_code> last_error() {
    return std::unexpected(std::error_code(errno, std::system_category()));
}

} // namespace

shutdown_manager::shutdown_manager() = default;

shutdown_manager::~shutdown_manager() {
    int fd = event_fd_.exchange(-1);
    if (fd >= 0) {
        close(fd);
    }
}

void shutdown_manager::request_shutdown() noexcept {
    shutdown_requested_.store(true, std::memory_order_release);
    int fd = event_fd_.load(std::memory_order_acquire);
    if (fd >= 0) {
        uint64_t val = 1;
        ssize_t ret = write(fd, &val, sizeof(val));
        (void)ret;
    }
}

result<void> shutdown_manager::ensure_event_fd() {
    if (event_fd_.load(std::memory_order_acquire) >= 0) {
        return {};
    }
    int fd = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (fd < 0) {
        return last_error();
    }
    int expected = -1;
    if (!event_fd_.compare_exchange_strong(expected, fd)) {
        close(fd);
    }
    return {};
}

result<void> shutdown_manager::setup_signal_handlers() {
    if (auto res = ensure_event_fd(); !res) {
        return res;
    }

    struct sigaction sa{};
    sa.sa_handler = on_termination_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;

    if (sigaction(SIGINT, &sa, nullptr) < 0 || sigaction(SIGTERM, &sa, nullptr) < 0) {
        return last_error();
    }

    struct sigaction ignore{};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    if (sigaction(SIGPIPE, &ignore, nullptr) < 0) {
        return last_error();
    }
    return {};
}

result<void> shutdown_manager::wait() {
    if (auto res = ensure_event_fd(); !res) {
        return res;
    }

    int fd = event_fd_.load(std::memory_order_acquire);
    while (!is_shutdown_requested()) {
        pollfd pfd{fd, POLLIN, 0};
        if (poll(&pfd, 1, -1) < 0 && errno != EINTR) {
            return last_error();
        }
        drain(fd);
    }

    trigger_shutdown();
    return {};
}

void shutdown_manager::reset() noexcept {
    shutdown_requested_.store(false, std::memory_order_release);
    shutdown_time_ = time_point{};
    int fd = event_fd_.load(std::memory_order_acquire);
    if (fd >= 0) {
        drain(fd);
    }
}

void shutdown_manager::trigger_shutdown() {
    shutdown_time_ = clock::now();
    if (callback_) {
        callback_();
    }
}

} // namespace rolodex
