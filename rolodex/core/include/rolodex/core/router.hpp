#pragma once

#include "error_body.hpp"
#include "http.hpp"
#include "result.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string_view>
#include <utility>

namespace rolodex::http {

constexpr size_t MAX_ROUTE_SEGMENTS = 16;
constexpr size_t MAX_PATH_PARAMS = 8;

template <size_t N> struct fixed_string {
    constexpr fixed_string(const char (&str)[N]) { std::copy_n(str, N, value); }
    constexpr operator std::string_view() const { return std::string_view{value, N - 1}; }
    char value[N];
};

enum class segment_kind : uint8_t { literal, parameter };

struct path_segment {
    segment_kind kind{segment_kind::literal};
    std::string_view value{};
};

/// Captured `{name}` segments. Values view into the request URI.
struct path_params {
    using param_entry = std::pair<std::string_view, std::string_view>;

    void add(std::string_view name, std::string_view value) noexcept {
        if (size_ < MAX_PATH_PARAMS) {
            entries_[size_] = param_entry{name, value};
            ++size_;
        }
    }

    [[nodiscard]] std::optional<std::string_view> get(std::string_view name) const noexcept {
        for (size_t i = 0; i < size_; ++i) {
            if (entries_[i].first == name) {
                return entries_[i].second;
            }
        }
        return std::nullopt;
    }

    [[nodiscard]] size_t size() const noexcept { return size_; }

private:
    std::array<param_entry, MAX_PATH_PARAMS> entries_{};
    size_t size_{0};
};

struct request_context {
    path_params params{};
};

struct path_pattern {
    std::array<path_segment, MAX_ROUTE_SEGMENTS> segments{};
    std::array<std::string_view, MAX_PATH_PARAMS> param_names{};
    size_t segment_count{0};
    size_t param_count{0};
    size_t literal_count{0};

    template <fixed_string Str> static consteval path_pattern from_literal() {
        path_pattern pattern{};
        constexpr auto raw = std::string_view(Str);

        if (raw.empty()) {
            throw "route path cannot be empty";
        }
        if (raw.front() != '/') {
            throw "route path must start with '/'";
        }

        size_t pos = 1;
        size_t segment_index = 0;

        while (pos < raw.size()) {
            size_t next_slash = raw.size();
            for (size_t i = pos; i < raw.size(); ++i) {
                if (raw[i] == '/') {
                    next_slash = i;
                    break;
                }
            }

            const size_t len = next_slash - pos;
            if (len == 0) {
                throw "empty path segment is not allowed";
            }
            if (segment_index >= MAX_ROUTE_SEGMENTS) {
                throw "too many path segments";
            }

            std::string_view segment = raw.substr(pos, len);
            if (segment.front() == '{') {
                if (segment.back() != '}' || segment.size() <= 2) {
                    throw "malformed parameter segment";
                }
                if (pattern.param_count >= MAX_PATH_PARAMS) {
                    throw "too many path parameters";
                }
                auto name = segment.substr(1, segment.size() - 2);
                pattern.segments[segment_index] = path_segment{segment_kind::parameter, name};
                pattern.param_names[pattern.param_count++] = name;
            } else {
                pattern.segments[segment_index] = path_segment{segment_kind::literal, segment};
                ++pattern.literal_count;
            }

            ++segment_index;
            pos = next_slash + 1;
        }

        pattern.segment_count = segment_index;
        return pattern;
    }

    struct split_result {
        std::array<std::string_view, MAX_ROUTE_SEGMENTS> parts{};
        size_t count{0};
        bool overflow{false};
    };

    [[nodiscard]] static split_result split_path(std::string_view path) noexcept {
        split_result out{};
        size_t pos = 0;
        while (pos < path.size()) {
            if (path[pos] == '/') {
                ++pos;
                continue;
            }
            size_t next = path.find('/', pos);
            if (next == std::string_view::npos) {
                next = path.size();
            }
            if (out.count >= MAX_ROUTE_SEGMENTS) {
                out.overflow = true;
                return out;
            }
            out.parts[out.count++] = path.substr(pos, next - pos);
            pos = next;
        }
        return out;
    }

    [[nodiscard]] bool match_segments(std::span<const std::string_view> parts,
                                      path_params& out) const noexcept {
        if (parts.size() != segment_count) {
            return false;
        }

        size_t param_index = 0;
        for (size_t i = 0; i < segment_count; ++i) {
            const auto& segment = segments[i];
            if (segment.kind == segment_kind::literal) {
                if (segment.value != parts[i]) {
                    return false;
                }
            } else {
                out.add(param_names[param_index++], parts[i]);
            }
        }
        return true;
    }

    [[nodiscard]] bool match(std::string_view path, path_params& out) const noexcept {
        auto split = split_path(path);
        if (split.overflow) {
            return false;
        }
        return match_segments(std::span<const std::string_view>(split.parts.data(), split.count),
                              out);
    }

    [[nodiscard]] int specificity_score() const noexcept {
        return static_cast<int>(literal_count * 16 + (MAX_ROUTE_SEGMENTS - param_count));
    }
};

using handler_fn = std::function<result<response>(const request&, request_context&)>;
using next_fn = std::function<result<response>()>;
using middleware_fn = std::function<result<response>(const request&, request_context&, next_fn)>;

struct middleware_chain {
    const middleware_fn* ptr{nullptr};
    size_t size{0};

    [[nodiscard]] bool empty() const noexcept { return size == 0 || ptr == nullptr; }

    result<response>
    run(const request& req, request_context& ctx, const handler_fn& handler) const {
        if (empty()) {
            return handler(req, ctx);
        }

        struct invoker {
            const middleware_fn* ptr;
            size_t size;
            const handler_fn& terminal;
            const request& req;
            request_context& ctx;

            result<response> call(size_t index) const {
                if (index >= size) {
                    return terminal(req, ctx);
                }
                return ptr[index](req, ctx, [this, index]() { return call(index + 1); });
            }
        };

        invoker inv{ptr, size, handler, req, ctx};
        return inv.call(0);
    }
};

template <size_t N>
constexpr middleware_chain make_middleware_chain(const std::array<middleware_fn, N>& middlewares) {
    return middleware_chain{middlewares.data(), N};
}

struct route_entry {
    http::method method;
    path_pattern pattern;
    handler_fn handler;
    middleware_chain middleware{};
};

/// Method + path dispatcher.
///
/// Global middleware wraps every request, including ones that match no route,
/// so cross-cutting headers and error recovery apply to 404 responses too.
/// A known path requested with an unregistered method counts as unmatched.
class router {
public:
    explicit router(std::span<const route_entry> routes, middleware_chain global = {})
        : routes_(routes), global_(global) {}

    [[nodiscard]] result<response> dispatch(const request& req, request_context& ctx) const {
        auto split = path_pattern::split_path(req.path());
        if (split.overflow) {
            return std::unexpected(make_error_code(error_code::not_found));
        }
        std::span<const std::string_view> parts(split.parts.data(), split.count);

        const route_entry* best_route = nullptr;
        path_params best_params;
        int best_score = -1;

        for (const auto& entry : routes_) {
            if (entry.method != req.http_method) {
                continue;
            }
            path_params candidate{};
            if (!entry.pattern.match_segments(parts, candidate)) {
                continue;
            }
            int score = entry.pattern.specificity_score();
            if (!best_route || score > best_score) {
                best_route = &entry;
                best_score = score;
                best_params = candidate;
            }
        }

        if (!best_route) {
            return std::unexpected(make_error_code(error_code::not_found));
        }

        ctx.params = best_params;
        return best_route->middleware.run(req, ctx, best_route->handler);
    }

    /// Dispatch with global middleware; routing failures become JSON error bodies.
    [[nodiscard]] response handle(const request& req) const {
        request_context ctx{};
        handler_fn terminal = [this](const request& r, request_context& c) -> result<response> {
            return map_dispatch_error(dispatch(r, c));
        };
        auto res = global_.run(req, ctx, terminal);
        if (!res) {
            return map_dispatch_error(std::move(res));
        }
        return std::move(*res);
    }

    static response map_dispatch_error(result<response> res) {
        if (res) {
            return std::move(*res);
        }
        if (res.error() == make_error_code(error_code::not_found)) {
            return response::error(error_body::not_found());
        }
        return response::error(error_body::internal_server_error());
    }

private:
    std::span<const route_entry> routes_;
    middleware_chain global_;
};

} // namespace rolodex::http
