#include "rolodex/core/json.hpp"

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <unordered_map>

namespace rolodex::json {

namespace {

constexpr bool is_ws(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

int hex_digit(char c) noexcept {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

// Length of the well-formed UTF-8 sequence starting at p, or 0 when the bytes
// are truncated, overlong, a surrogate, or above U+10FFFF.
size_t utf8_sequence_length(const char* p, const char* end) noexcept {
    auto lead = static_cast<unsigned char>(*p);
    size_t len = 0;
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        len = 2;
    } else if (lead == 0xE0) {
        len = 3;
        lo = 0xA0;
    } else if (lead == 0xED) {
        len = 3;
        hi = 0x9F;
    } else if (lead >= 0xE1 && lead <= 0xEF) {
        len = 3;
    } else if (lead == 0xF0) {
        len = 4;
        lo = 0x90;
    } else if (lead >= 0xF1 && lead <= 0xF3) {
        len = 4;
    } else if (lead == 0xF4) {
        len = 4;
        hi = 0x8F;
    } else {
        return 0;
    }
    if (static_cast<size_t>(end - p) < len) {
        return 0;
    }
    for (size_t i = 1; i < len; ++i) {
        auto c = static_cast<unsigned char>(p[i]);
        if (c < lo || c > hi) {
            return 0;
        }
        lo = 0x80;
        hi = 0xBF;
    }
    return len;
}

struct cursor {
    const char* ptr;
    const char* end;

    [[nodiscard]] bool eof() const noexcept { return ptr >= end; }

    void skip_ws() noexcept {
        while (!eof() && is_ws(*ptr)) {
            ++ptr;
        }
    }

    bool consume(char c) noexcept {
        skip_ws();
        if (eof() || *ptr != c) {
            return false;
        }
        ++ptr;
        return true;
    }

    bool consume_literal(std::string_view lit) noexcept {
        if (static_cast<size_t>(end - ptr) < lit.size() ||
            std::string_view(ptr, lit.size()) != lit) {
            return false;
        }
        ptr += lit.size();
        return true;
    }

    std::optional<uint32_t> hex4() noexcept {
        if (end - ptr < 4) {
            return std::nullopt;
        }
        uint32_t cp = 0;
        for (int i = 0; i < 4; ++i) {
            int d = hex_digit(ptr[i]);
            if (d < 0) {
                return std::nullopt;
            }
            cp = (cp << 4) | static_cast<uint32_t>(d);
        }
        ptr += 4;
        return cp;
    }

    std::optional<std::string> string() {
        skip_ws();
        if (eof() || *ptr != '"') {
            return std::nullopt;
        }
        ++ptr;
        std::string out;
        while (!eof() && *ptr != '"') {
            auto c = static_cast<unsigned char>(*ptr);
            if (c < 0x20) {
                return std::nullopt;
            }
            if (c >= 0x80) {
                size_t len = utf8_sequence_length(ptr, end);
                if (len == 0) {
                    return std::nullopt;
                }
                out.append(ptr, len);
                ptr += len;
                continue;
            }
            if (c != '\\') {
                out.push_back(static_cast<char>(c));
                ++ptr;
                continue;
            }
            ++ptr;
            if (eof()) {
                return std::nullopt;
            }
            char esc = *ptr++;
            switch (esc) {
            case '"':
                out.push_back('"');
                break;
            case '\\':
                out.push_back('\\');
                break;
            case '/':
                out.push_back('/');
                break;
            case 'b':
                out.push_back('\b');
                break;
            case 'f':
                out.push_back('\f');
                break;
            case 'n':
                out.push_back('\n');
                break;
            case 'r':
                out.push_back('\r');
                break;
            case 't':
                out.push_back('\t');
                break;
            case 'u': {
                auto cp = hex4();
                if (!cp) {
                    return std::nullopt;
                }
                if (*cp >= 0xD800 && *cp <= 0xDBFF) {
                    if (!consume_literal("\\u")) {
                        return std::nullopt;
                    }
                    auto low = hex4();
                    if (!low || *low < 0xDC00 || *low > 0xDFFF) {
                        return std::nullopt;
                    }
                    *cp = 0x10000 + ((*cp - 0xD800) << 10) + (*low - 0xDC00);
                } else if (*cp >= 0xDC00 && *cp <= 0xDFFF) {
                    return std::nullopt;
                }
                append_utf8(out, *cp);
                break;
            }
            default:
                return std::nullopt;
            }
        }
        if (eof()) {
            return std::nullopt;
        }
        ++ptr; // closing quote
        return out;
    }

    std::optional<value> number() {
        const char* start = ptr;
        const char* p = ptr;
        if (p < end && *p == '-') {
            ++p;
        }
        if (p >= end || !(*p >= '0' && *p <= '9')) {
            return std::nullopt;
        }
        if (*p == '0') {
            ++p;
        } else {
            while (p < end && *p >= '0' && *p <= '9') {
                ++p;
            }
        }
        bool integral = true;
        if (p < end && *p == '.') {
            integral = false;
            ++p;
            const char* digits = p;
            while (p < end && *p >= '0' && *p <= '9') {
                ++p;
            }
            if (p == digits) {
                return std::nullopt;
            }
        }
        if (p < end && (*p == 'e' || *p == 'E')) {
            integral = false;
            ++p;
            if (p < end && (*p == '+' || *p == '-')) {
                ++p;
            }
            const char* digits = p;
            while (p < end && *p >= '0' && *p <= '9') {
                ++p;
            }
            if (p == digits) {
                return std::nullopt;
            }
        }

        if (integral) {
            int64_t iv = 0;
            auto [last, ec] = std::from_chars(start, p, iv);
            if (ec == std::errc() && last == p) {
                ptr = p;
                return value(iv);
            }
        }

        double dv = 0.0;
        auto [last, ec] = std::from_chars(start, p, dv);
        if (ec != std::errc() || last != p) {
            return std::nullopt;
        }
        ptr = p;
        return value(dv);
    }
};

result<value> parse_value(cursor& cur, size_t depth);

result<value> parse_array(cursor& cur, size_t depth) {
    value arr = value::make_array();
    if (cur.consume(']')) {
        return arr;
    }
    while (true) {
        auto item = parse_value(cur, depth + 1);
        if (!item) {
            return item;
        }
        arr.push_back(std::move(*item));
        if (cur.consume(',')) {
            continue;
        }
        if (cur.consume(']')) {
            return arr;
        }
        return std::unexpected(make_error_code(error_code::invalid_json));
    }
}

result<value> parse_object(cursor& cur, size_t depth) {
    object members;
    if (cur.consume('}')) {
        return value(std::move(members));
    }
    std::unordered_map<std::string, size_t> index;
    while (true) {
        auto key = cur.string();
        if (!key || !cur.consume(':')) {
            return std::unexpected(make_error_code(error_code::invalid_json));
        }
        auto member = parse_value(cur, depth + 1);
        if (!member) {
            return member;
        }
        // Duplicate keys: last one wins, at the position of the first.
        auto [slot, inserted] = index.try_emplace(*key, members.size());
        if (inserted) {
            members.emplace_back(std::move(*key), std::move(*member));
        } else {
            members[slot->second].second = std::move(*member);
        }
        if (cur.consume(',')) {
            continue;
        }
        if (cur.consume('}')) {
            return value(std::move(members));
        }
        return std::unexpected(make_error_code(error_code::invalid_json));
    }
}

result<value> parse_value(cursor& cur, size_t depth) {
    if (depth > MAX_DEPTH) {
        return std::unexpected(make_error_code(error_code::json_too_deep));
    }
    cur.skip_ws();
    if (cur.eof()) {
        return std::unexpected(make_error_code(error_code::invalid_json));
    }

    switch (*cur.ptr) {
    case '{':
        ++cur.ptr;
        return parse_object(cur, depth);
    case '[':
        ++cur.ptr;
        return parse_array(cur, depth);
    case '"': {
        auto s = cur.string();
        if (!s) {
            return std::unexpected(make_error_code(error_code::invalid_json));
        }
        return value(std::move(*s));
    }
    case 't':
        if (cur.consume_literal("true")) {
            return value(true);
        }
        break;
    case 'f':
        if (cur.consume_literal("false")) {
            return value(false);
        }
        break;
    case 'n':
        if (cur.consume_literal("null")) {
            return value(nullptr);
        }
        break;
    default:
        if (auto n = cur.number()) {
            return std::move(*n);
        }
        break;
    }
    return std::unexpected(make_error_code(error_code::invalid_json));
}

void dump_number(double d, std::string& out) {
    if (!std::isfinite(d)) {
        out.append("null");
        return;
    }
    char buf[32];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), d);
    out.append(buf, static_cast<size_t>(ptr - buf));
}

} // namespace

std::optional<bool> value::as_bool() const noexcept {
    if (const auto* b = std::get_if<bool>(&data_)) {
        return *b;
    }
    return std::nullopt;
}

std::optional<int64_t> value::as_integer() const noexcept {
    if (const auto* i = std::get_if<int64_t>(&data_)) {
        return *i;
    }
    if (const auto* d = std::get_if<double>(&data_)) {
        if (std::isfinite(*d) && std::trunc(*d) == *d && *d >= -9.2e18 && *d <= 9.2e18) {
            return static_cast<int64_t>(*d);
        }
    }
    return std::nullopt;
}

std::optional<double> value::as_double() const noexcept {
    if (const auto* d = std::get_if<double>(&data_)) {
        return *d;
    }
    if (const auto* i = std::get_if<int64_t>(&data_)) {
        return static_cast<double>(*i);
    }
    return std::nullopt;
}

const std::string* value::as_string() const noexcept {
    return std::get_if<std::string>(&data_);
}

const array& value::items() const {
    if (const auto* a = std::get_if<array>(&data_)) {
        return *a;
    }
    throw std::logic_error("json value is not an array");
}

const object& value::members() const {
    if (const auto* o = std::get_if<object>(&data_)) {
        return *o;
    }
    throw std::logic_error("json value is not an object");
}

bool value::truthy() const noexcept {
    switch (type()) {
    case kind::null:
        return false;
    case kind::boolean:
        return std::get<bool>(data_);
    case kind::integer:
        return std::get<int64_t>(data_) != 0;
    case kind::number: {
        double d = std::get<double>(data_);
        return d != 0.0 && !std::isnan(d);
    }
    case kind::string:
        return !std::get<std::string>(data_).empty();
    case kind::array:
    case kind::object:
        return true;
    }
    return false;
}

const value* value::find(std::string_view key) const noexcept {
    const auto* o = std::get_if<object>(&data_);
    if (!o) {
        return nullptr;
    }
    for (const auto& [name, member] : *o) {
        if (name == key) {
            return &member;
        }
    }
    return nullptr;
}

const value* value::at(std::initializer_list<std::string_view> path) const noexcept {
    const value* current = this;
    for (auto key : path) {
        current = current->find(key);
        if (!current) {
            return nullptr;
        }
    }
    return current;
}

value& value::set(std::string key, value v) {
    if (is_null()) {
        data_ = object{};
    }
    auto* o = std::get_if<object>(&data_);
    if (!o) {
        throw std::logic_error("json value is not an object");
    }
    for (auto& [name, member] : *o) {
        if (name == key) {
            member = std::move(v);
            return member;
        }
    }
    o->emplace_back(std::move(key), std::move(v));
    return o->back().second;
}

void value::push_back(value v) {
    if (is_null()) {
        data_ = array{};
    }
    auto* a = std::get_if<array>(&data_);
    if (!a) {
        throw std::logic_error("json value is not an array");
    }
    a->push_back(std::move(v));
}

size_t value::size() const noexcept {
    if (const auto* a = std::get_if<array>(&data_)) {
        return a->size();
    }
    if (const auto* o = std::get_if<object>(&data_)) {
        return o->size();
    }
    return 0;
}

bool operator==(const value& lhs, const value& rhs) {
    return lhs.data_ == rhs.data_;
}

result<value> parse(std::string_view text) {
    cursor cur{text.data(), text.data() + text.size()};
    auto root = parse_value(cur, 0);
    if (!root) {
        return root;
    }
    cur.skip_ws();
    if (!cur.eof()) {
        return std::unexpected(make_error_code(error_code::invalid_json));
    }
    return root;
}

std::string escape_string(std::string_view sv) {
    static constexpr char HEX[] = "0123456789abcdef";
    std::string out;
    out.reserve(sv.size() + 8);
    for (char c : sv) {
        switch (c) {
        case '\\':
            out += "\\\\";
            break;
        case '"':
            out += "\\\"";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        case '\b':
            out += "\\b";
            break;
        case '\f':
            out += "\\f";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                out += "\\u00";
                out.push_back(HEX[(c >> 4) & 0x0F]);
                out.push_back(HEX[c & 0x0F]);
            } else {
                out.push_back(c);
            }
            break;
        }
    }
    return out;
}

void dump_into(const value& v, std::string& out) {
    switch (v.type()) {
    case kind::null:
        out.append("null");
        break;
    case kind::boolean:
        out.append(*v.as_bool() ? "true" : "false");
        break;
    case kind::integer: {
        char buf[24];
        auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), *v.as_integer());
        out.append(buf, static_cast<size_t>(ptr - buf));
        break;
    }
    case kind::number:
        dump_number(*v.as_double(), out);
        break;
    case kind::string:
        out.push_back('"');
        out.append(escape_string(*v.as_string()));
        out.push_back('"');
        break;
    case kind::array: {
        out.push_back('[');
        bool first = true;
        for (const auto& item : v.items()) {
            if (!first) {
                out.push_back(',');
            }
            dump_into(item, out);
            first = false;
        }
        out.push_back(']');
        break;
    }
    case kind::object: {
        out.push_back('{');
        bool first = true;
        for (const auto& [name, member] : v.members()) {
            if (!first) {
                out.push_back(',');
            }
            out.push_back('"');
            out.append(escape_string(name));
            out.append("\":");
            dump_into(member, out);
            first = false;
        }
        out.push_back('}');
        break;
    }
    }
}

std::string dump(const value& v) {
    std::string out;
    dump_into(v, out);
    return out;
}

} // namespace rolodex::json
