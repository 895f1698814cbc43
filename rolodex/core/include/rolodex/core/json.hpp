#pragma once

#include "result.hpp"

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace rolodex::json {

constexpr size_t MAX_DEPTH = 64;

enum class kind : uint8_t { null, boolean, integer, number, string, array, object };

class value;

using array = std::vector<value>;
// Members keep insertion order so serialized documents have a stable layout.
using object = std::vector<std::pair<std::string, value>>;

/// Tagged JSON value.
///
/// Integers that fit into int64_t are kept apart from floating point numbers,
/// so identifiers and counters round-trip without precision loss.
class value {
public:
    value() noexcept = default;
    value(std::nullptr_t) noexcept {}
    value(bool b) : data_(b) {}
    value(int v) : data_(static_cast<int64_t>(v)) {}
    value(int64_t v) : data_(v) {}
    value(double v) : data_(v) {}
    value(const char* s) : data_(std::string(s)) {}
    value(std::string s) : data_(std::move(s)) {}
    value(std::string_view s) : data_(std::string(s)) {}
    value(array a) : data_(std::move(a)) {}
    value(object o) : data_(std::move(o)) {}

    static value make_object() { return value(object{}); }
    static value make_array() { return value(array{}); }

    [[nodiscard]] kind type() const noexcept { return static_cast<kind>(data_.index()); }

    [[nodiscard]] bool is_null() const noexcept { return type() == kind::null; }
    [[nodiscard]] bool is_bool() const noexcept { return type() == kind::boolean; }
    [[nodiscard]] bool is_number() const noexcept {
        return type() == kind::integer || type() == kind::number;
    }
    [[nodiscard]] bool is_string() const noexcept { return type() == kind::string; }
    [[nodiscard]] bool is_array() const noexcept { return type() == kind::array; }
    [[nodiscard]] bool is_object() const noexcept { return type() == kind::object; }

    [[nodiscard]] std::optional<bool> as_bool() const noexcept;
    /// Integer view; floating point values qualify only when they are integral.
    [[nodiscard]] std::optional<int64_t> as_integer() const noexcept;
    [[nodiscard]] std::optional<double> as_double() const noexcept;
    [[nodiscard]] const std::string* as_string() const noexcept;

    [[nodiscard]] const array& items() const;
    [[nodiscard]] const object& members() const;

    /// JavaScript truthiness: null, false, 0, NaN and "" are falsy.
    [[nodiscard]] bool truthy() const noexcept;

    /// Object member lookup. Returns nullptr for missing keys and non-objects.
    [[nodiscard]] const value* find(std::string_view key) const noexcept;

    /// Walks nested objects, e.g. at({"address", "street", "number"}).
    [[nodiscard]] const value* at(std::initializer_list<std::string_view> path) const noexcept;

    /// Sets an object member, replacing an existing key in place.
    value& set(std::string key, value v);
    void push_back(value v);

    [[nodiscard]] size_t size() const noexcept;

    friend bool operator==(const value& lhs, const value& rhs);

private:
    std::variant<std::nullptr_t, bool, int64_t, double, std::string, array, object> data_{};
};

[[nodiscard]] result<value> parse(std::string_view text);

void dump_into(const value& v, std::string& out);
[[nodiscard]] std::string dump(const value& v);

std::string escape_string(std::string_view sv);

} // namespace rolodex::json
