#pragma once

#include "rolodex/core/epoll_reactor.hpp"
#include "rolodex/core/fd_watch.hpp"
#include "rolodex/core/http.hpp"
#include "rolodex/core/io_buffer.hpp"
#include "rolodex/core/router.hpp"
#include "rolodex/core/tcp_listener.hpp"
#include "rolodex/core/tcp_socket.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>

namespace rolodex {
namespace http {

/// HTTP/1.1 server on top of a reactor pool.
///
/// Every worker thread owns an epoll reactor and its own SO_REUSEPORT
/// listener, so a connection lives on one thread from accept to close.
///
/// Example:
/// @code
///   router api_router(routes, global_middleware);
///   http::server(api_router)
///       .listen(8000)
///       .workers(4)
///       .graceful_shutdown(std::chrono::seconds(5))
///       .run();
/// @endcode
class server {
public:
    using request_callback =
        std::function<void(const request&, const response&, std::chrono::microseconds)>;

    explicit server(const router& rt) : router_(rt) {}

    server& listen(uint16_t port) {
        port_ = port;
        return *this;
    }

    /// Number of worker threads (reactor pool size)
    server& workers(size_t count) {
        worker_count_ = count == 0 ? 1 : count;
        return *this;
    }

    server& backlog(int32_t size) {
        backlog_ = size;
        return *this;
    }

    /// Time granted to in-flight requests after a shutdown signal
    server& graceful_shutdown(std::chrono::milliseconds timeout) {
        shutdown_timeout_ = timeout;
        return *this;
    }

    /// Called once every listener is bound, before workers start
    server& on_start(std::function<void()> callback) {
        on_start_callback_ = std::move(callback);
        return *this;
    }

    /// Called when shutdown begins
    server& on_stop(std::function<void()> callback) {
        on_stop_callback_ = std::move(callback);
        return *this;
    }

    /// Called on the worker thread after each response is produced
    server& on_request(request_callback callback) {
        on_request_callback_ = std::move(callback);
        return *this;
    }

    /// Blocks until SIGINT/SIGTERM and drains connections.
    /// Returns 0 on clean shutdown, non-zero on startup or reactor failure.
    int run();

private:
    struct connection_state {
        tcp_socket socket;
        parser http_parser;
        io_buffer write_buffer{8192};
        bool closing = false;
        bool closed = false;
        std::unique_ptr<fd_watch> watch;

        explicit connection_state(tcp_socket sock) : socket(std::move(sock)) {}
    };

    struct worker {
        epoll_reactor& reactor;
        tcp_listener listener;
        std::unique_ptr<fd_watch> accept_watch;
        std::unordered_map<int32_t, std::unique_ptr<connection_state>> connections;
        bool stopping = false;

        worker(epoll_reactor& r, tcp_listener l) : reactor(r), listener(std::move(l)) {}
    };

    void accept_connections(worker& w);
    void handle_connection(worker& w, connection_state& state, event_type events);
    void process_input(worker& w, connection_state& state, std::string_view data);
    void respond(worker& w, connection_state& state, const request& req);
    void reject(connection_state& state, std::error_code ec);
    bool flush(connection_state& state);
    void close_connection(worker& w, connection_state& state);
    void begin_shutdown(worker& w);

    const router& router_;
    uint16_t port_ = 8000;
    size_t worker_count_ = 1;
    int32_t backlog_ = 1024;
    std::chrono::milliseconds shutdown_timeout_{5000};
    std::function<void()> on_start_callback_;
    std::function<void()> on_stop_callback_;
    request_callback on_request_callback_;
};

} // namespace http
} // namespace rolodex
