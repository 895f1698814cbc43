#include "rolodex/core/http_server.hpp"
#include "rolodex/core/reactor_pool.hpp"
#include "rolodex/core/shutdown.hpp"

#include <array>
#include <iostream>
#include <system_error>
#include <vector>

namespace rolodex {
namespace http {

namespace {

constexpr size_t READ_CHUNK_SIZE = 16384;

error_body error_for_parse_failure(std::error_code ec) {
    error_body body;
    switch (static_cast<error_code>(ec.value())) {
    case error_code::header_too_large:
        body.status = 431;
        break;
    case error_code::uri_too_long:
        body.status = 414;
        break;
    case error_code::body_too_large:
        body.status = 413;
        break;
    case error_code::unsupported_encoding:
        body.status = 501;
        break;
    default:
        return error_body::bad_request("Invalid HTTP request", ec.message());
    }
    body.error = std::string(reason_phrase(body.status));
    body.details = ec.message();
    return body;
}

} // namespace

void server::accept_connections(worker& w) {
    while (true) {
        auto accepted = w.listener.accept();
        if (!accepted) {
            std::cerr << "[server] accept failed: " << accepted.error().message() << "\n";
            return;
        }
        if (!*accepted) {
            return;
        }

        auto state = std::make_unique<connection_state>(std::move(*accepted));
        int32_t fd = state->socket.native_handle();
        auto* state_ptr = state.get();
        state->watch = std::make_unique<fd_watch>(
            w.reactor, fd, event_type::readable, [this, &w, state_ptr](event_type events) {
                handle_connection(w, *state_ptr, events);
            });

        if (!state->watch->is_registered()) {
            std::cerr << "[server] failed to register connection fd=" << fd << "\n";
            continue;
        }
        w.connections.emplace(fd, std::move(state));
    }
}

void server::handle_connection(worker& w, connection_state& state, event_type events) {
    if (state.closed) {
        return;
    }

    if (has_flag(events, event_type::error) && !has_flag(events, event_type::readable)) {
        close_connection(w, state);
        return;
    }

    if (has_flag(events, event_type::writable) && !flush(state)) {
        close_connection(w, state);
        return;
    }

    if (has_flag(events, event_type::readable) || has_flag(events, event_type::hup)) {
        std::array<uint8_t, READ_CHUNK_SIZE> buf;
        while (!state.closing) {
            auto read_result = state.socket.read(buf);
            if (!read_result) {
                // End of stream or socket error: answer what was parsed, then close.
                state.closing = true;
                break;
            }
            if (read_result->empty()) {
                break;
            }
            process_input(w,
                          state,
                          std::string_view(reinterpret_cast<const char*>(read_result->data()),
                                           read_result->size()));
        }
    }

    if (!flush(state)) {
        close_connection(w, state);
        return;
    }

    if (state.write_buffer.empty()) {
        if (state.closing) {
            close_connection(w, state);
            return;
        }
        if (!state.watch->modify(event_type::readable)) {
            close_connection(w, state);
        }
        return;
    }

    auto interest = state.closing ? event_type::writable
                                  : event_type::readable | event_type::writable;
    if (!state.watch->modify(interest)) {
        close_connection(w, state);
    }
}

void server::process_input(worker& w, connection_state& state, std::string_view data) {
    auto parsed = state.http_parser.parse(data);
    while (true) {
        if (!parsed) {
            reject(state, parsed.error());
            return;
        }
        if (!state.http_parser.is_complete()) {
            return;
        }

        request req = state.http_parser.take_request();
        state.http_parser.reset();
        respond(w, state, req);
        if (state.closing) {
            return;
        }
        // Pipelined requests may already be buffered.
        parsed = state.http_parser.parse({});
    }
}

void server::respond(worker& w, connection_state& state, const request& req) {
    auto started = std::chrono::steady_clock::now();
    response res = router_.handle(req);

    const bool keep_alive = req.keep_alive && !w.stopping;
    res.set_header("Connection", keep_alive ? "keep-alive" : "close");

    if (on_request_callback_) {
        on_request_callback_(req,
                             res,
                             std::chrono::duration_cast<std::chrono::microseconds>(
                                 std::chrono::steady_clock::now() - started));
    }

    state.write_buffer.append(res.serialize());
    if (!keep_alive) {
        state.closing = true;
    }
}

void server::reject(connection_state& state, std::error_code ec) {
    auto res = response::error(error_for_parse_failure(ec));
    res.set_header("Connection", "close");
    state.write_buffer.append(res.serialize());
    state.closing = true;
}

bool server::flush(connection_state& state) {
    while (!state.write_buffer.empty()) {
        auto written = state.socket.write(state.write_buffer.readable_span());
        if (!written) {
            return false;
        }
        if (*written == 0) {
            break;
        }
        state.write_buffer.consume(*written);
    }
    return true;
}

void server::close_connection(worker& w, connection_state& state) {
    if (state.closed) {
        return;
    }
    state.closed = true;

    // The callback being executed belongs to this connection's registration,
    // so the state is released only after the current event batch.
    int32_t fd = state.socket.native_handle();
    w.reactor.defer([&w, fd]() { w.connections.erase(fd); });
}

void server::begin_shutdown(worker& w) {
    w.stopping = true;
    w.accept_watch.reset();
    w.listener = tcp_listener{};

    for (auto& [fd, state] : w.connections) {
        if (state->write_buffer.empty() && state->http_parser.is_idle()) {
            close_connection(w, *state);
        } else {
            state->closing = true;
        }
    }
}

int server::run() {
    std::unique_ptr<reactor_pool> pool;
    try {
        reactor_pool_config config;
        config.reactor_count = static_cast<uint32_t>(worker_count_);
        pool = std::make_unique<reactor_pool>(config);
    } catch (const std::system_error& e) {
        std::cerr << "[server] Failed to create reactors: " << e.what() << "\n";
        return 1;
    }

    std::vector<std::unique_ptr<worker>> workers;
    workers.reserve(pool->size());
    for (size_t i = 0; i < pool->size(); ++i) {
        try {
            tcp_listener listener(port_, listener_options{true, backlog_});
            workers.push_back(std::make_unique<worker>(pool->get_reactor(i), std::move(listener)));
        } catch (const std::system_error& e) {
            std::cerr << "[server] Failed to listen on port " << port_ << ": " << e.what() << "\n";
            return 1;
        }

        auto* w = workers.back().get();
        w->accept_watch = std::make_unique<fd_watch>(
            w->reactor, w->listener.native_handle(), event_type::readable, [this, w](event_type) {
                accept_connections(*w);
            });
        if (!w->accept_watch->is_registered()) {
            std::cerr << "[server] Failed to register listener\n";
            return 1;
        }
    }

    auto& shutdown = shutdown_manager::instance();
    if (auto res = shutdown.setup_signal_handlers(); !res) {
        std::cerr << "[server] Failed to install signal handlers: " << res.error().message()
                  << "\n";
        return 1;
    }

    shutdown.set_shutdown_callback([this, &pool, &workers]() {
        if (on_stop_callback_) {
            on_stop_callback_();
        }
        for (auto& w : workers) {
            auto* wp = w.get();
            wp->reactor.schedule([this, wp]() { begin_shutdown(*wp); });
        }
        pool->graceful_stop(shutdown_timeout_);
    });
    pool->on_error([](size_t, std::error_code) {
        shutdown_manager::instance().request_shutdown();
    });

    if (on_start_callback_) {
        on_start_callback_();
    } else {
        std::cout << "[server] Listening on port " << port_ << " with " << pool->size()
                  << " workers\n";
    }

    pool->start();
    auto waited = shutdown.wait();
    if (!waited) {
        std::cerr << "[server] Waiting for shutdown failed: " << waited.error().message() << "\n";
        pool->stop();
    }
    pool->wait();
    shutdown.set_shutdown_callback(nullptr);

    // Connections reference the reactors; release them first.
    workers.clear();
    return (waited && !pool->has_failed()) ? 0 : 1;
}

} // namespace http
} // namespace rolodex
