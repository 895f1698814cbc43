#include "rolodex/core/epoll_reactor.hpp"

#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <unistd.h>

#include <cerrno>
#include <iostream>
#include <system_error>
#include <utility>

namespace rolodex {

namespace {

constexpr uint32_t to_epoll_events(event_type events) noexcept {
    uint32_t result = 0;
    if (has_flag(events, event_type::readable)) {
        result |= EPOLLIN | EPOLLRDHUP;
    }
    if (has_flag(events, event_type::writable)) {
        result |= EPOLLOUT;
    }
    return result;
}

constexpr event_type from_epoll_events(uint32_t events) noexcept {
    event_type result = event_type::none;
    if (events & EPOLLIN) {
        result = result | event_type::readable;
    }
    if (events & EPOLLOUT) {
        result = result | event_type::writable;
    }
    if (events & EPOLLERR) {
        result = result | event_type::error;
    }
    if (events & (EPOLLHUP | EPOLLRDHUP)) {
        result = result | event_type::hup;
    }
    return result;
}

void log_exception(const exception_context& ctx) {
    std::cerr << "[reactor] Exception in " << ctx.location;
    if (ctx.fd >= 0) {
        std::cerr << " (fd=" << ctx.fd << ")";
    }
    std::cerr << ": ";
    try {
        if (ctx.exception) {
            std::rethrow_exception(ctx.exception);
        }
    } catch (const std::exception& e) {
        std::cerr << e.what();
    } catch (...) {
        std::cerr << "unknown exception";
    }
    std::cerr << "\n";
}

} // namespace

epoll_reactor::epoll_reactor(int32_t max_events)
    : max_events_(max_events), exception_handler_(log_exception) {
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        throw std::system_error(errno, std::system_category(), "epoll_create1 failed");
    }

    wakeup_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wakeup_fd_ < 0) {
        auto err = errno;
        close(epoll_fd_);
        throw std::system_error(err, std::system_category(), "eventfd failed");
    }

    epoll_event ev{};
    ev.events = EPOLLIN;
    ev.data.fd = wakeup_fd_;
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, wakeup_fd_, &ev) < 0) {
        auto err = errno;
        close(wakeup_fd_);
        close(epoll_fd_);
        throw std::system_error(err, std::system_category(), "failed to add wakeup fd to epoll");
    }

    events_buffer_.resize(static_cast<size_t>(max_events_));
}

epoll_reactor::~epoll_reactor() {
    if (wakeup_fd_ >= 0) {
        close(wakeup_fd_);
    }
    if (epoll_fd_ >= 0) {
        close(epoll_fd_);
    }
}

result<void> epoll_reactor::run() {
    if (running_.exchange(true)) {
        return std::unexpected(make_error_code(error_code::reactor_stopped));
    }

    while (running_.load(std::memory_order_acquire)) {
        process_tasks();
        process_deferred();

        if (graceful_shutdown_) {
            if (active_fds_ == 0) {
                break;
            }
            if (std::chrono::steady_clock::now() >= graceful_shutdown_deadline_) {
                force_close_remaining();
                break;
            }
        }

        auto res = process_events(graceful_shutdown_ ? 10 : -1);
        if (!res) {
            running_.store(false, std::memory_order_release);
            return res;
        }
        process_deferred();
    }

    process_deferred();
    running_.store(false, std::memory_order_release);
    return {};
}

void epoll_reactor::stop() {
    running_.store(false, std::memory_order_release);
    // A stop issued before run() starts is replayed on the loop thread.
    schedule([this]() { running_.store(false, std::memory_order_release); });
}

void epoll_reactor::graceful_stop(std::chrono::milliseconds timeout) {
    schedule([this, timeout]() {
        graceful_shutdown_ = true;
        graceful_shutdown_deadline_ = std::chrono::steady_clock::now() + timeout;
    });
}

result<void> epoll_reactor::register_fd(int32_t fd, event_type events, event_callback callback) {
    if (fd < 0 || static_cast<size_t>(fd) >= MAX_FDS || !callback) {
        return std::unexpected(make_error_code(error_code::invalid_fd));
    }

    epoll_event ev{};
    ev.events = to_epoll_events(events);
    ev.data.fd = fd;

    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) < 0) {
        return std::unexpected(std::error_code(errno, std::system_category()));
    }

    if (static_cast<size_t>(fd) >= fd_states_.size()) {
        fd_states_.resize(static_cast<size_t>(fd) + 1);
    }
    fd_states_[static_cast<size_t>(fd)] = fd_state{std::move(callback), events};
    ++active_fds_;
    return {};
}

result<void> epoll_reactor::modify_fd(int32_t fd, event_type events) {
    if (fd < 0 || static_cast<size_t>(fd) >= fd_states_.size() ||
        !fd_states_[static_cast<size_t>(fd)].callback) {
        return std::unexpected(make_error_code(error_code::invalid_fd));
    }

    auto& state = fd_states_[static_cast<size_t>(fd)];
    if (state.events == events) {
        return {};
    }

    epoll_event ev{};
    ev.events = to_epoll_events(events);
    ev.data.fd = fd;

    if (epoll_ctl(epoll_fd_, EPOLL_CTL_MOD, fd, &ev) < 0) {
        return std::unexpected(std::error_code(errno, std::system_category()));
    }

    state.events = events;
    return {};
}

result<void> epoll_reactor::unregister_fd(int32_t fd) {
    if (fd < 0 || static_cast<size_t>(fd) >= fd_states_.size() ||
        !fd_states_[static_cast<size_t>(fd)].callback) {
        return std::unexpected(make_error_code(error_code::invalid_fd));
    }

    fd_states_[static_cast<size_t>(fd)] = fd_state{};
    --active_fds_;

    if (epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr) < 0) {
        return std::unexpected(std::error_code(errno, std::system_category()));
    }
    return {};
}

bool epoll_reactor::schedule(task_fn task) {
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        pending_tasks_.push_back(std::move(task));
    }
    wakeup();
    return true;
}

void epoll_reactor::defer(task_fn task) {
    deferred_tasks_.push_back(std::move(task));
}

void epoll_reactor::set_exception_handler(exception_handler handler) {
    exception_handler_ = std::move(handler);
}

void epoll_reactor::wakeup() noexcept {
    uint64_t val = 1;
    ssize_t ret = write(wakeup_fd_, &val, sizeof(val));
    (void)ret;
}

result<void> epoll_reactor::process_events(int32_t timeout_ms) {
    int32_t nfds = epoll_wait(epoll_fd_, events_buffer_.data(), max_events_, timeout_ms);

    if (nfds < 0) {
        if (errno == EINTR) {
            return {};
        }
        return std::unexpected(std::error_code(errno, std::system_category()));
    }

    for (int32_t i = 0; i < nfds; ++i) {
        const auto& event = events_buffer_[static_cast<size_t>(i)];
        int32_t fd = event.data.fd;

        if (fd == wakeup_fd_) {
            uint64_t val;
            ssize_t ret = read(wakeup_fd_, &val, sizeof(val));
            (void)ret;
            continue;
        }

        if (fd < 0 || static_cast<size_t>(fd) >= fd_states_.size() ||
            !fd_states_[static_cast<size_t>(fd)].callback) {
            continue;
        }

        try {
            fd_states_[static_cast<size_t>(fd)].callback(from_epoll_events(event.events));
        } catch (...) {
            handle_exception("fd_callback", std::current_exception(), fd);
        }
    }

    return {};
}

void epoll_reactor::process_tasks() {
    std::vector<task_fn> tasks;
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        tasks.swap(pending_tasks_);
    }

    for (auto& task : tasks) {
        try {
            task();
        } catch (...) {
            handle_exception("scheduled_task", std::current_exception());
        }
    }
}

void epoll_reactor::process_deferred() {
    while (!deferred_tasks_.empty()) {
        std::vector<task_fn> tasks;
        tasks.swap(deferred_tasks_);
        for (auto& task : tasks) {
            try {
                task();
            } catch (...) {
                handle_exception("deferred_task", std::current_exception());
            }
        }
    }
}

void epoll_reactor::force_close_remaining() {
    for (size_t fd = 0; fd < fd_states_.size(); ++fd) {
        if (!fd_states_[fd].callback) {
            continue;
        }
        auto callback = fd_states_[fd].callback;
        try {
            callback(event_type::error);
        } catch (...) {
            handle_exception("forced_shutdown_callback",
                             std::current_exception(),
                             static_cast<int32_t>(fd));
        }
    }
    process_deferred();

    // Owners that ignored the error event lose their registration anyway.
    for (size_t fd = 0; fd < fd_states_.size(); ++fd) {
        if (fd_states_[fd].callback) {
            epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, static_cast<int32_t>(fd), nullptr);
            fd_states_[fd] = fd_state{};
            --active_fds_;
        }
    }
}

void epoll_reactor::handle_exception(std::string_view location,
                                     std::exception_ptr ex,
                                     int32_t fd) noexcept {
    if (exception_handler_) {
        try {
            exception_handler_(exception_context{location, ex, fd});
        } catch (...) {
            std::cerr << "[reactor] Exception handler threw an exception!\n";
        }
    }
}

} // namespace rolodex
