#pragma once

#include "error_body.hpp"
#include "result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rolodex::http {

// Security limits for HTTP parsing
constexpr size_t MAX_HEADER_SIZE = 8192UL;
constexpr size_t MAX_BODY_SIZE = 1UL * 1024UL * 1024UL;
constexpr size_t MAX_URI_LENGTH = 2048UL;
constexpr size_t MAX_HEADER_COUNT = 100;

enum class method : uint8_t { get, post, put, del, patch, head, options, unknown };

/// Ordered header list with case-insensitive lookup.
class headers_map {
public:
    using entry = std::pair<std::string, std::string>;

    [[nodiscard]] std::optional<std::string_view> get(std::string_view name) const noexcept;
    void set(std::string_view name, std::string_view value);
    void add(std::string_view name, std::string_view value);
    bool remove(std::string_view name);

    [[nodiscard]] bool contains(std::string_view name) const noexcept {
        return get(name).has_value();
    }
    [[nodiscard]] size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    [[nodiscard]] auto begin() const noexcept { return entries_.begin(); }
    [[nodiscard]] auto end() const noexcept { return entries_.end(); }

    void clear() noexcept { entries_.clear(); }

private:
    std::vector<entry> entries_;
};

bool iequals(std::string_view a, std::string_view b) noexcept;

struct request {
    method http_method = method::unknown;
    std::string uri;
    headers_map headers;
    std::string body;
    bool keep_alive = true;

    [[nodiscard]] std::optional<std::string_view> header(std::string_view name) const {
        return headers.get(name);
    }

    /// Path component of the URI without query string or fragment.
    [[nodiscard]] std::string_view path() const noexcept;
};

struct response {
    int32_t status = 200;
    std::string reason = "OK";
    headers_map headers;
    std::string body;

    void set_header(std::string_view name, std::string_view value) { headers.set(name, value); }

    void serialize_into(std::string& out) const;
    [[nodiscard]] std::string serialize() const;

    static response ok(std::string body = "", std::string_view content_type = "text/plain");
    static response json(const json::value& body, int32_t status = 200);
    static response error(const error_body& body);
    static response no_content();
};

std::string_view reason_phrase(int32_t status) noexcept;

/// Incremental HTTP/1.1 request parser.
///
/// Bytes are fed with parse(); once is_complete() the request can be taken and
/// reset() prepares the parser for the next pipelined request, keeping any
/// bytes already received past the end of the current one.
class parser {
public:
    enum class state : uint8_t {
        request_line,
        headers,
        body,
        chunk_size,
        chunk_data,
        chunk_trailer,
        complete
    };

    [[nodiscard]] result<state> parse(std::string_view data);

    [[nodiscard]] bool is_complete() const noexcept { return state_ == state::complete; }
    [[nodiscard]] const request& get_request() const noexcept { return request_; }
    request take_request() { return std::move(request_); }
    [[nodiscard]] bool has_buffered_data() const noexcept { return parse_pos_ < buffer_.size(); }
    /// True between requests with nothing received yet.
    [[nodiscard]] bool is_idle() const noexcept {
        return state_ == state::request_line && !has_buffered_data();
    }
    void reset();

private:
    result<state> advance();
    result<state> parse_request_line_state();
    result<state> parse_headers_state();
    result<state> parse_body_state();
    result<state> parse_chunk_size_state();
    result<state> parse_chunk_data_state();
    result<state> parse_chunk_trailer_state();

    result<void> process_request_line(std::string_view line);
    result<void> process_header_line(std::string_view line);
    std::optional<std::string_view> next_line() noexcept;

    state state_ = state::request_line;
    request request_;
    std::string buffer_;
    size_t parse_pos_ = 0;
    size_t header_bytes_ = 0;
    size_t header_count_ = 0;
    size_t content_length_ = 0;
    size_t current_chunk_size_ = 0;
    bool is_chunked_ = false;
};

method parse_method(std::string_view str);
std::string_view method_to_string(method m);

} // namespace rolodex::http
