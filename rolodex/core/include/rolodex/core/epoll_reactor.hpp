#pragma once

#include "fd_event.hpp"
#include "result.hpp"

#include <sys/epoll.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <string_view>
#include <vector>

namespace rolodex {

using task_fn = std::function<void()>;

struct exception_context {
    std::string_view location;
    std::exception_ptr exception;
    int32_t fd = -1;
};

using exception_handler = std::function<void(const exception_context&)>;

/// Single-threaded, level-triggered epoll event loop.
///
/// All descriptor callbacks run on the thread that called run(). schedule()
/// is the only member that may be called from other threads; it wakes the
/// loop through an eventfd.
class epoll_reactor {
public:
    static constexpr size_t MAX_FDS = 65536;

    explicit epoll_reactor(int32_t max_events = 128);
    ~epoll_reactor();

    epoll_reactor(const epoll_reactor&) = delete;
    epoll_reactor& operator=(const epoll_reactor&) = delete;

    result<void> run();
    void stop();

    /// Keeps running until every descriptor is unregistered or the timeout
    /// expires; remaining descriptors then receive an error event.
    void graceful_stop(std::chrono::milliseconds timeout);

    result<void> register_fd(int32_t fd, event_type events, event_callback callback);
    result<void> modify_fd(int32_t fd, event_type events);
    result<void> unregister_fd(int32_t fd);

    /// Thread-safe: queues a task for the loop thread.
    bool schedule(task_fn task);

    /// Loop thread only: runs the task after the current event batch.
    void defer(task_fn task);

    void set_exception_handler(exception_handler handler);

    [[nodiscard]] size_t active_fd_count() const noexcept { return active_fds_; }
    [[nodiscard]] bool is_running() const noexcept {
        return running_.load(std::memory_order_acquire);
    }

private:
    struct fd_state {
        event_callback callback;
        event_type events = event_type::none;
    };

    result<void> process_events(int32_t timeout_ms);
    void process_tasks();
    void process_deferred();
    void force_close_remaining();
    void wakeup() noexcept;
    void handle_exception(std::string_view location,
                          std::exception_ptr ex,
                          int32_t fd = -1) noexcept;

    int32_t epoll_fd_{-1};
    int32_t wakeup_fd_{-1};
    int32_t max_events_;
    std::atomic<bool> running_{false};
    bool graceful_shutdown_{false};
    std::chrono::steady_clock::time_point graceful_shutdown_deadline_;

    std::vector<fd_state> fd_states_;
    size_t active_fds_{0};

    std::mutex tasks_mutex_;
    std::vector<task_fn> pending_tasks_;
    std::vector<task_fn> deferred_tasks_;

    exception_handler exception_handler_;
    std::vector<epoll_event> events_buffer_;
};

} // namespace rolodex
