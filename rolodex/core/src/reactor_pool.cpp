#include "rolodex/core/reactor_pool.hpp"

#include <algorithm>
#include <iostream>

namespace rolodex {

reactor_pool::reactor_pool(const reactor_pool_config& config) : config_(config) {
    if (config_.reactor_count == 0) {
        config_.reactor_count = std::max(1u, std::thread::hardware_concurrency());
    }

    reactors_.reserve(config_.reactor_count);
    for (uint32_t i = 0; i < config_.reactor_count; ++i) {
        auto ctx = std::make_unique<reactor_context>();
        ctx->reactor = std::make_unique<epoll_reactor>(config_.max_events_per_reactor);
        ctx->index = i;
        reactors_.push_back(std::move(ctx));
    }
}

reactor_pool::~reactor_pool() {
    stop();
    wait();
}

void reactor_pool::start() {
    for (auto& ctx : reactors_) {
        ctx->thread = std::thread(&reactor_pool::worker_thread, this, ctx.get());
    }
}

void reactor_pool::stop() {
    for (auto& ctx : reactors_) {
        ctx->reactor->stop();
    }
}

void reactor_pool::graceful_stop(std::chrono::milliseconds timeout) {
    for (auto& ctx : reactors_) {
        ctx->reactor->graceful_stop(timeout);
    }
}

void reactor_pool::wait() {
    for (auto& ctx : reactors_) {
        if (ctx->thread.joinable()) {
            ctx->thread.join();
        }
    }
}

epoll_reactor& reactor_pool::get_reactor(size_t index) {
    return *reactors_[index % reactors_.size()]->reactor;
}

void reactor_pool::worker_thread(reactor_context* ctx) {
    auto result = ctx->reactor->run();
    if (!result) {
        std::cerr << "[reactor_pool] Reactor " << ctx->index
                  << " error: " << result.error().message() << "\n";
        failed_.store(true, std::memory_order_release);
        if (on_error_) {
            on_error_(ctx->index, result.error());
        }
    }
}

} // namespace rolodex
