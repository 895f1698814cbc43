#pragma once

#include <expected>
#include <string>
#include <system_error>

namespace rolodex {

template <typename T> using result = std::expected<T, std::error_code>;

enum class error_code : int {
    ok = 0,
    epoll_create_failed = 1,
    epoll_ctl_failed = 2,
    epoll_wait_failed = 3,
    invalid_fd = 4,
    reactor_stopped = 5,
    connection_closed = 6,
    malformed_request = 7,
    header_too_large = 8,
    uri_too_long = 9,
    body_too_large = 10,
    unsupported_encoding = 11,
    invalid_json = 12,
    json_too_deep = 13,
    not_found = 14,
};

class error_category : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "rolodex"; }

    [[nodiscard]] std::string message(int ev) const override {
        using ec = error_code;
        switch (static_cast<ec>(ev)) {
        case ec::ok:
            return "success";
        case ec::epoll_create_failed:
            return "epoll_create failed";
        case ec::epoll_ctl_failed:
            return "epoll_ctl failed";
        case ec::epoll_wait_failed:
            return "epoll_wait failed";
        case ec::invalid_fd:
            return "invalid file descriptor";
        case ec::reactor_stopped:
            return "reactor is stopped";
        case ec::connection_closed:
            return "connection closed by peer";
        case ec::malformed_request:
            return "malformed HTTP request";
        case ec::header_too_large:
            return "request header section too large";
        case ec::uri_too_long:
            return "request URI too long";
        case ec::body_too_large:
            return "request body too large";
        case ec::unsupported_encoding:
            return "unsupported transfer encoding";
        case ec::invalid_json:
            return "invalid JSON document";
        case ec::json_too_deep:
            return "JSON document nested too deeply";
        case ec::not_found:
            return "no matching route";
        default:
            return "unknown error";
        }
    }
};

inline const error_category& get_error_category() {
    static error_category const instance;
    return instance;
}

inline std::error_code make_error_code(error_code e) {
    return {static_cast<int>(e), get_error_category()};
}

} // namespace rolodex

namespace std {
template <> struct is_error_code_enum<rolodex::error_code> : true_type {};
} // namespace std
