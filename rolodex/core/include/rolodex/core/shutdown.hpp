#pragma once

#include "result.hpp"

#include <atomic>
#include <chrono>
#include <functional>

namespace rolodex {

/// Process-wide shutdown coordination.
///
/// SIGINT and SIGTERM only set a flag and poke an eventfd; the shutdown
/// callback runs later on whichever thread is blocked in wait().
class shutdown_manager {
public:
    using shutdown_callback = std::function<void()>;
    using clock = std::chrono::steady_clock;
    using time_point = clock::time_point;

    static shutdown_manager& instance() {
        static shutdown_manager mgr;
        return mgr;
    }

    shutdown_manager(const shutdown_manager&) = delete;
    shutdown_manager& operator=(const shutdown_manager&) = delete;

    /// Async-signal-safe.
    void request_shutdown() noexcept;

    [[nodiscard]] bool is_shutdown_requested() const noexcept {
        return shutdown_requested_.load(std::memory_order_acquire);
    }

    [[nodiscard]] time_point shutdown_time() const noexcept { return shutdown_time_; }

    void set_shutdown_callback(shutdown_callback cb) { callback_ = std::move(cb); }

    /// Installs SIGINT/SIGTERM handlers and ignores SIGPIPE.
    result<void> setup_signal_handlers();

    /// Blocks until request_shutdown() is called, then runs the callback once.
    result<void> wait();

    /// Clears a previous request so the manager can be reused.
    void reset() noexcept;

private:
    shutdown_manager();
    ~shutdown_manager();

    result<void> ensure_event_fd();
    void trigger_shutdown();

    std::atomic<bool> shutdown_requested_{false};
    std::atomic<int> event_fd_{-1};
    time_point shutdown_time_;
    shutdown_callback callback_;
};

} // namespace rolodex
