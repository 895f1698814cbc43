#include "rolodex/core/http.hpp"

#include <algorithm>
#include <charconv>
#include <cctype>

namespace rolodex::http {

namespace {

constexpr std::string_view HTTP_VERSION_PREFIX = "HTTP/1.1 ";
constexpr std::string_view HEADER_SEPARATOR = ": ";
constexpr std::string_view CRLF = "\r\n";

bool is_token_char(unsigned char c) noexcept {
    if (std::isalnum(c)) {
        return true;
    }
    switch (c) {
    case '!':
    case '#':
    case '$':
    case '%':
    case '&':
    case '\'':
    case '*':
    case '+':
    case '-':
    case '.':
    case '^':
    case '_':
    case '`':
    case '|':
    case '~':
        return true;
    default:
        return false;
    }
}

constexpr bool is_ctl(unsigned char c) noexcept {
    return c < 0x20 || c == 0x7f;
}

std::string_view trim_ows(std::string_view value) noexcept {
    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == ' ' || value.back() == '\t')) {
        value.remove_suffix(1);
    }
    return value;
}

bool contains_invalid_header_value(std::string_view value) noexcept {
    return std::any_of(value.begin(), value.end(), [](char ch) {
        auto c = static_cast<unsigned char>(ch);
        return c != '\t' && is_ctl(c);
    });
}

bool contains_invalid_uri_char(std::string_view uri) noexcept {
    return std::any_of(uri.begin(), uri.end(), [](char ch) {
        auto c = static_cast<unsigned char>(ch);
        return c == ' ' || is_ctl(c) || c >= 0x80;
    });
}

std::unexpected<std::error_code> fail(error_code ec) {
    return std::unexpected(make_error_code(ec));
}

} // namespace

bool iequals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::optional<std::string_view> headers_map::get(std::string_view name) const noexcept {
    for (const auto& [key, value] : entries_) {
        if (iequals(key, name)) {
            return std::string_view(value);
        }
    }
    return std::nullopt;
}

void headers_map::set(std::string_view name, std::string_view value) {
    for (auto& [key, existing] : entries_) {
        if (iequals(key, name)) {
            existing.assign(value);
            return;
        }
    }
    add(name, value);
}

void headers_map::add(std::string_view name, std::string_view value) {
    entries_.emplace_back(std::string(name), std::string(value));
}

bool headers_map::remove(std::string_view name) {
    auto it = std::remove_if(entries_.begin(), entries_.end(), [name](const entry& e) {
        return iequals(e.first, name);
    });
    bool removed = it != entries_.end();
    entries_.erase(it, entries_.end());
    return removed;
}

std::string_view request::path() const noexcept {
    std::string_view view(uri);
    size_t pos = view.find_first_of("?#");
    if (pos == std::string_view::npos) {
        return view;
    }
    return view.substr(0, pos);
}

method parse_method(std::string_view str) {
    if (str == "GET") return method::get;
    if (str == "POST") return method::post;
    if (str == "PUT") return method::put;
    if (str == "DELETE") return method::del;
    if (str == "PATCH") return method::patch;
    if (str == "HEAD") return method::head;
    if (str == "OPTIONS") return method::options;
    return method::unknown;
}

std::string_view method_to_string(method m) {
    switch (m) {
        case method::get: return "GET";
        case method::post: return "POST";
        case method::put: return "PUT";
        case method::del: return "DELETE";
        case method::patch: return "PATCH";
        case method::head: return "HEAD";
        case method::options: return "OPTIONS";
        default: return "UNKNOWN";
    }
}

std::string_view reason_phrase(int32_t status) noexcept {
    switch (status) {
        case 200: return "OK";
        case 201: return "Created";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 414: return "URI Too Long";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 503: return "Service Unavailable";
        default: return "Unknown";
    }
}

void response::serialize_into(std::string& out) const {
    size_t headers_size = 0;
    for (const auto& [name, value] : headers) {
        headers_size += name.size() + HEADER_SEPARATOR.size() + value.size() + CRLF.size();
    }
    out.reserve(out.size() + 64 + reason.size() + headers_size + body.size());

    char status_buf[16];
    auto [ptr, ec] = std::to_chars(status_buf, status_buf + sizeof(status_buf), status);

    out.append(HTTP_VERSION_PREFIX);
    out.append(status_buf, static_cast<size_t>(ptr - status_buf));
    out.push_back(' ');
    out.append(reason);
    out.append(CRLF);

    for (const auto& [name, value] : headers) {
        out.append(name);
        out.append(HEADER_SEPARATOR);
        out.append(value);
        out.append(CRLF);
    }

    const bool bodyless = status == 204 || status == 304 || (status >= 100 && status < 200);
    if (!bodyless && !headers.contains("Content-Length")) {
        out.append("Content-Length");
        out.append(HEADER_SEPARATOR);
        out.append(std::to_string(body.size()));
        out.append(CRLF);
    }

    out.append(CRLF);
    if (!bodyless) {
        out.append(body);
    }
}

std::string response::serialize() const {
    std::string out;
    serialize_into(out);
    return out;
}

response response::ok(std::string body, std::string_view content_type) {
    response res;
    res.status = 200;
    res.reason = "OK";
    res.body = std::move(body);
    res.set_header("Content-Type", content_type);
    return res;
}

response response::json(const json::value& body, int32_t status) {
    response res;
    res.status = status;
    res.reason = std::string(reason_phrase(status));
    res.body = json::dump(body);
    res.set_header("Content-Type", "application/json");
    return res;
}

response response::error(const error_body& body) {
    return json(body.to_value(), body.status);
}

response response::no_content() {
    response res;
    res.status = 204;
    res.reason = "No Content";
    return res;
}

result<parser::state> parser::parse(std::string_view data) {
    if (buffer_.size() + data.size() > MAX_HEADER_SIZE + MAX_BODY_SIZE * 2) [[unlikely]] {
        return fail(error_code::body_too_large);
    }
    buffer_.append(data);

    while (state_ != state::complete) {
        const size_t old_pos = parse_pos_;
        const state old_state = state_;

        auto next = advance();
        if (!next) {
            return std::unexpected(next.error());
        }
        state_ = *next;

        if (parse_pos_ == old_pos && state_ == old_state) {
            break;
        }
    }

    return state_;
}

void parser::reset() {
    buffer_.erase(0, parse_pos_);
    parse_pos_ = 0;
    state_ = state::request_line;
    request_ = request{};
    header_bytes_ = 0;
    header_count_ = 0;
    content_length_ = 0;
    current_chunk_size_ = 0;
    is_chunked_ = false;
}

result<parser::state> parser::advance() {
    switch (state_) {
        case state::request_line:
            return parse_request_line_state();
        case state::headers:
            return parse_headers_state();
        case state::body:
            return parse_body_state();
        case state::chunk_size:
            return parse_chunk_size_state();
        case state::chunk_data:
            return parse_chunk_data_state();
        case state::chunk_trailer:
            return parse_chunk_trailer_state();
        default:
            return state_;
    }
}

std::optional<std::string_view> parser::next_line() noexcept {
    size_t pos = buffer_.find(CRLF, parse_pos_);
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    std::string_view line(buffer_.data() + parse_pos_, pos - parse_pos_);
    parse_pos_ = pos + CRLF.size();
    return line;
}

result<parser::state> parser::parse_request_line_state() {
    while (true) {
        auto line = next_line();
        if (!line) {
            if (buffer_.size() - parse_pos_ > MAX_URI_LENGTH + 64) {
                return fail(error_code::uri_too_long);
            }
            return state::request_line;
        }
        // Tolerate empty lines between pipelined requests.
        if (line->empty()) {
            continue;
        }
        auto res = process_request_line(*line);
        if (!res) {
            return std::unexpected(res.error());
        }
        header_bytes_ = line->size() + CRLF.size();
        return state::headers;
    }
}

result<parser::state> parser::parse_headers_state() {
    while (true) {
        auto line = next_line();
        if (!line) {
            if (header_bytes_ + (buffer_.size() - parse_pos_) > MAX_HEADER_SIZE) {
                return fail(error_code::header_too_large);
            }
            return state::headers;
        }

        header_bytes_ += line->size() + CRLF.size();
        if (header_bytes_ > MAX_HEADER_SIZE) {
            return fail(error_code::header_too_large);
        }

        if (line->empty()) {
            if (is_chunked_) {
                if (request_.headers.contains("Content-Length")) {
                    return fail(error_code::malformed_request);
                }
                return state::chunk_size;
            }
            return content_length_ > 0 ? state::body : state::complete;
        }

        if (++header_count_ > MAX_HEADER_COUNT) {
            return fail(error_code::header_too_large);
        }
        auto res = process_header_line(*line);
        if (!res) {
            return std::unexpected(res.error());
        }
    }
}

result<parser::state> parser::parse_body_state() {
    if (buffer_.size() - parse_pos_ < content_length_) {
        return state::body;
    }
    request_.body.assign(buffer_, parse_pos_, content_length_);
    parse_pos_ += content_length_;
    return state::complete;
}

result<parser::state> parser::parse_chunk_size_state() {
    auto line = next_line();
    if (!line) {
        if (buffer_.size() - parse_pos_ > 64) {
            return fail(error_code::malformed_request);
        }
        return state::chunk_size;
    }

    auto size_text = line->substr(0, line->find(';'));
    size_text = trim_ows(size_text);
    size_t size = 0;
    const char* end = size_text.data() + size_text.size();
    auto [ptr, ec] = std::from_chars(size_text.data(), end, size, 16);
    if (size_text.empty() || ec != std::errc() || ptr != end) {
        return fail(error_code::malformed_request);
    }
    if (size == 0) {
        return state::chunk_trailer;
    }
    if (size > MAX_BODY_SIZE || request_.body.size() + size > MAX_BODY_SIZE) {
        return fail(error_code::body_too_large);
    }
    current_chunk_size_ = size;
    return state::chunk_data;
}

result<parser::state> parser::parse_chunk_data_state() {
    if (buffer_.size() - parse_pos_ < current_chunk_size_ + CRLF.size()) {
        return state::chunk_data;
    }
    if (std::string_view(buffer_).substr(parse_pos_ + current_chunk_size_, CRLF.size()) != CRLF) {
        return fail(error_code::malformed_request);
    }
    request_.body.append(buffer_, parse_pos_, current_chunk_size_);
    parse_pos_ += current_chunk_size_ + CRLF.size();
    current_chunk_size_ = 0;
    return state::chunk_size;
}

result<parser::state> parser::parse_chunk_trailer_state() {
    while (true) {
        auto line = next_line();
        if (!line) {
            return state::chunk_trailer;
        }
        if (line->empty()) {
            return state::complete;
        }
    }
}

result<void> parser::process_request_line(std::string_view line) {
    size_t first_space = line.find(' ');
    if (first_space == std::string_view::npos || first_space == 0) {
        return fail(error_code::malformed_request);
    }
    size_t second_space = line.find(' ', first_space + 1);
    if (second_space == std::string_view::npos || second_space == first_space + 1) {
        return fail(error_code::malformed_request);
    }

    auto method_text = line.substr(0, first_space);
    auto uri = line.substr(first_space + 1, second_space - first_space - 1);
    auto version = line.substr(second_space + 1);

    for (char c : method_text) {
        if (!is_token_char(static_cast<unsigned char>(c))) {
            return fail(error_code::malformed_request);
        }
    }
    if (uri.size() > MAX_URI_LENGTH) {
        return fail(error_code::uri_too_long);
    }
    if (contains_invalid_uri_char(uri)) {
        return fail(error_code::malformed_request);
    }
    if (version == "HTTP/1.1") {
        request_.keep_alive = true;
    } else if (version == "HTTP/1.0") {
        request_.keep_alive = false;
    } else {
        return fail(error_code::malformed_request);
    }

    request_.http_method = parse_method(method_text);
    request_.uri.assign(uri);
    return {};
}

result<void> parser::process_header_line(std::string_view line) {
    // Obsolete line folding is rejected.
    if (line.front() == ' ' || line.front() == '\t') {
        return fail(error_code::malformed_request);
    }

    size_t colon = line.find(':');
    if (colon == std::string_view::npos || colon == 0) {
        return fail(error_code::malformed_request);
    }
    auto name = line.substr(0, colon);
    for (char c : name) {
        if (!is_token_char(static_cast<unsigned char>(c))) {
            return fail(error_code::malformed_request);
        }
    }
    auto value = trim_ows(line.substr(colon + 1));
    if (contains_invalid_header_value(value)) {
        return fail(error_code::malformed_request);
    }

    if (iequals(name, "Content-Length")) {
        size_t length = 0;
        auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), length);
        if (value.empty() || ec != std::errc() || ptr != value.data() + value.size()) {
            return fail(error_code::malformed_request);
        }
        if (request_.headers.contains("Content-Length") && length != content_length_) {
            return fail(error_code::malformed_request);
        }
        if (length > MAX_BODY_SIZE) {
            return fail(error_code::body_too_large);
        }
        content_length_ = length;
    } else if (iequals(name, "Transfer-Encoding")) {
        if (!iequals(value, "chunked")) {
            return fail(error_code::unsupported_encoding);
        }
        is_chunked_ = true;
    } else if (iequals(name, "Connection")) {
        if (iequals(value, "close")) {
            request_.keep_alive = false;
        } else if (iequals(value, "keep-alive")) {
            request_.keep_alive = true;
        }
    }

    request_.headers.add(name, value);
    return {};
}

} // namespace rolodex::http
