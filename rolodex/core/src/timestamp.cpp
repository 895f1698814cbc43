#include "rolodex/core/timestamp.hpp"

#include <cstdio>

namespace rolodex {

namespace {

struct scanner {
    std::string_view text;
    size_t pos = 0;

    [[nodiscard]] bool done() const noexcept { return pos >= text.size(); }
    [[nodiscard]] char peek() const noexcept { return done() ? '\0' : text[pos]; }

    bool consume(char c) noexcept {
        if (peek() == c) {
            ++pos;
            return true;
        }
        return false;
    }

    std::optional<int> digits(size_t count) noexcept {
        if (text.size() - pos < count) {
            return std::nullopt;
        }
        int value = 0;
        for (size_t i = 0; i < count; ++i) {
            char c = text[pos + i];
            if (c < '0' || c > '9') {
                return std::nullopt;
            }
            value = value * 10 + (c - '0');
        }
        pos += count;
        return value;
    }
};

std::optional<std::chrono::minutes> parse_offset(scanner& s) {
    if (s.consume('Z') || s.consume('z')) {
        return std::chrono::minutes{0};
    }
    int sign = 0;
    if (s.consume('+')) {
        sign = 1;
    } else if (s.consume('-')) {
        sign = -1;
    } else {
        return std::nullopt;
    }
    auto hours = s.digits(2);
    s.consume(':');
    auto minutes = s.digits(2);
    if (!hours || !minutes || *hours > 23 || *minutes > 59) {
        return std::nullopt;
    }
    return std::chrono::minutes{sign * (*hours * 60 + *minutes)};
}

} // namespace

timestamp now_utc() noexcept {
    return std::chrono::time_point_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
}

std::string format_iso8601(timestamp ts) {
    using namespace std::chrono;

    auto day = floor<days>(ts);
    year_month_day ymd{day};
    hh_mm_ss<milliseconds> tod{ts - day};

    char buf[40];
    int n = std::snprintf(buf,
                          sizeof(buf),
                          "%04d-%02u-%02uT%02ld:%02ld:%02ld.%03ldZ",
                          static_cast<int>(ymd.year()),
                          static_cast<unsigned>(ymd.month()),
                          static_cast<unsigned>(ymd.day()),
                          static_cast<long>(tod.hours().count()),
                          static_cast<long>(tod.minutes().count()),
                          static_cast<long>(tod.seconds().count()),
                          static_cast<long>(tod.subseconds().count()));
    return std::string(buf, n > 0 ? static_cast<size_t>(n) : 0);
}

std::optional<timestamp> parse_iso8601(std::string_view text) {
    using namespace std::chrono;

    scanner s{text};
    auto y = s.digits(4);
    if (!y || !s.consume('-')) {
        return std::nullopt;
    }
    auto m = s.digits(2);
    if (!m || !s.consume('-')) {
        return std::nullopt;
    }
    auto d = s.digits(2);
    if (!d) {
        return std::nullopt;
    }

    year_month_day ymd{year{*y}, month{static_cast<unsigned>(*m)}, day{static_cast<unsigned>(*d)}};
    if (!ymd.ok()) {
        return std::nullopt;
    }

    milliseconds time_of_day{0};
    minutes offset{0};

    if (!s.done()) {
        if (!s.consume('T') && !s.consume('t') && !s.consume(' ')) {
            return std::nullopt;
        }
        auto hh = s.digits(2);
        if (!hh || !s.consume(':')) {
            return std::nullopt;
        }
        auto mm = s.digits(2);
        if (!mm || *hh > 23 || *mm > 59) {
            return std::nullopt;
        }
        int ss = 0;
        int ms = 0;
        if (s.consume(':')) {
            auto sec = s.digits(2);
            if (!sec || *sec > 59) {
                return std::nullopt;
            }
            ss = *sec;
            if (s.consume('.')) {
                size_t fraction_digits = 0;
                while (!s.done() && s.peek() >= '0' && s.peek() <= '9') {
                    if (fraction_digits < 3) {
                        ms = ms * 10 + (s.peek() - '0');
                    }
                    ++fraction_digits;
                    ++s.pos;
                }
                if (fraction_digits == 0) {
                    return std::nullopt;
                }
                for (size_t i = fraction_digits; i < 3; ++i) {
                    ms *= 10;
                }
            }
        }
        time_of_day = hours{*hh} + minutes{*mm} + seconds{ss} + milliseconds{ms};

        if (!s.done()) {
            auto parsed = parse_offset(s);
            if (!parsed || !s.done()) {
                return std::nullopt;
            }
            offset = *parsed;
        }
    }

    timestamp ts{sys_days{ymd}.time_since_epoch() + time_of_day - offset};

    // The offset may carry the instant outside what format_iso8601 can write back.
    auto utc_year = static_cast<int>(year_month_day{floor<days>(ts)}.year());
    if (utc_year < 0 || utc_year > 9999) {
        return std::nullopt;
    }
    return ts;
}

} // namespace rolodex
