#pragma once

#include "epoll_reactor.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <thread>
#include <vector>

namespace rolodex {

struct reactor_pool_config {
    uint32_t reactor_count = 0;
    int32_t max_events_per_reactor = 128;
};

/// Owns one epoll_reactor per worker thread.
class reactor_pool {
public:
    using error_callback = std::function<void(size_t index, std::error_code)>;

    explicit reactor_pool(const reactor_pool_config& config = {});
    ~reactor_pool();

    reactor_pool(const reactor_pool&) = delete;
    reactor_pool& operator=(const reactor_pool&) = delete;

    void start();
    void stop();
    void graceful_stop(std::chrono::milliseconds timeout = std::chrono::milliseconds(30000));
    void wait();

    /// Invoked on the worker thread when its reactor exits with an error.
    void on_error(error_callback cb) { on_error_ = std::move(cb); }

    epoll_reactor& get_reactor(size_t index);
    epoll_reactor& operator[](size_t index) { return get_reactor(index); }
    [[nodiscard]] size_t size() const noexcept { return reactors_.size(); }

    [[nodiscard]] bool has_failed() const noexcept {
        return failed_.load(std::memory_order_acquire);
    }

private:
    struct reactor_context {
        std::unique_ptr<epoll_reactor> reactor;
        std::thread thread;
        size_t index{0};
    };

    void worker_thread(reactor_context* ctx);

    std::vector<std::unique_ptr<reactor_context>> reactors_;
    reactor_pool_config config_;
    error_callback on_error_;
    std::atomic<bool> failed_{false};
};

} // namespace rolodex
