#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace rolodex {

using timestamp = std::chrono::sys_time<std::chrono::milliseconds>;

[[nodiscard]] timestamp now_utc() noexcept;

/// Formats as YYYY-MM-DDTHH:MM:SS.mmmZ.
[[nodiscard]] std::string format_iso8601(timestamp ts);

/// Accepts YYYY-MM-DD, optionally followed by 'T' or ' ' and HH:MM[:SS[.fff]],
/// optionally followed by 'Z' or a +HH:MM / -HH:MM offset. Values without an
/// offset are taken as UTC. Fractions beyond milliseconds are truncated.
/// Instants whose UTC year falls outside 0000..9999 are rejected.
[[nodiscard]] std::optional<timestamp> parse_iso8601(std::string_view text);

} // namespace rolodex
