#pragma once
/// @file duration.hpp
/// @brief Human-readable durations such as "1m30s", "250ms" or "1.5h".

#include <chrono>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>

namespace loadgen {

/// @brief Parse a duration string.
///
/// Accepts an optional sign followed by one or more decimal numbers, each
/// with an optional fraction and a unit suffix: ns, us, µs, ms, s, m, h.
/// A bare "0" is allowed without a unit.
/// @return Nanoseconds, or errc::invalid_duration on bad syntax or overflow.
[[nodiscard]] auto parse_duration(std::string_view text)
    -> std::expected<std::chrono::nanoseconds, std::error_code>;

/// @brief Format @p d in the same notation, e.g. "1.234ms" or "2m5s".
[[nodiscard]] auto format_duration(std::chrono::nanoseconds d) -> std::string;

} // namespace loadgen
