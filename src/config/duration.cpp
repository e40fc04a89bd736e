/// @file duration.cpp
/// @brief Duration parsing and formatting.

#include "config/duration.hpp"

#include "common/error.hpp"

#include <array>
#include <cstdint>
#include <limits>

namespace loadgen {

namespace {

struct Unit {
  std::string_view name;
  std::uint64_t nanos;
};

constexpr std::array<Unit, 8> kUnits = {{
    {"ns", 1},
    {"us", 1'000},
    {"\xC2\xB5s", 1'000}, // U+00B5 micro sign
    {"\xCE\xBCs", 1'000}, // U+03BC greek mu
    {"ms", 1'000'000},
    {"s", 1'000'000'000},
    {"m", 60'000'000'000},
    {"h", 3'600'000'000'000},
}};

constexpr auto kMaxNanos =
    static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());

auto is_digit(char c) -> bool { return c >= '0' && c <= '9'; }

auto invalid() -> std::unexpected<std::error_code> {
  return std::unexpected(make_error_code(errc::invalid_duration));
}

// "<v / 10^prec>[.<fraction without trailing zeros>]"
auto fixed_point(std::uint64_t v, int prec) -> std::string {
  std::uint64_t pow = 1;
  for (int i = 0; i < prec; ++i) {
    pow *= 10;
  }
  auto out = std::to_string(v / pow);
  auto rem = v % pow;
  if (rem == 0) {
    return out;
  }

  std::string digits(static_cast<std::size_t>(prec), '0');
  for (int i = prec - 1; i >= 0; --i) {
    digits[static_cast<std::size_t>(i)] = static_cast<char>('0' + rem % 10);
    rem /= 10;
  }
  digits.erase(digits.find_last_not_of('0') + 1);
  return out + "." + digits;
}

} // namespace

auto parse_duration(std::string_view text)
    -> std::expected<std::chrono::nanoseconds, std::error_code> {
  auto s = text;
  bool negative = false;
  if (!s.empty() && (s.front() == '-' || s.front() == '+')) {
    negative = s.front() == '-';
    s.remove_prefix(1);
  }
  if (s == "0") {
    return std::chrono::nanoseconds{0};
  }
  if (s.empty()) {
    return invalid();
  }

  std::uint64_t total = 0;
  while (!s.empty()) {
    std::size_t i = 0;
    bool any_digit = false;

    std::uint64_t whole = 0;
    for (; i < s.size() && is_digit(s[i]); ++i) {
      const auto digit = static_cast<std::uint64_t>(s[i] - '0');
      if (whole > (kMaxNanos - digit) / 10) {
        return invalid();
      }
      whole = whole * 10 + digit;
      any_digit = true;
    }

    std::uint64_t frac = 0;
    std::uint64_t scale = 1;
    if (i < s.size() && s[i] == '.') {
      for (++i; i < s.size() && is_digit(s[i]); ++i) {
        // Digits past 1e-18 cannot change a nanosecond count.
        if (scale < 1'000'000'000'000'000'000ULL) {
          frac = frac * 10 + static_cast<std::uint64_t>(s[i] - '0');
          scale *= 10;
        }
        any_digit = true;
      }
    }
    if (!any_digit) {
      return invalid();
    }

    auto unit_end = i;
    while (unit_end < s.size() && !is_digit(s[unit_end]) &&
           s[unit_end] != '.') {
      ++unit_end;
    }
    const auto name = s.substr(i, unit_end - i);
    const Unit *unit = nullptr;
    for (const auto &u : kUnits) {
      if (u.name == name) {
        unit = &u;
        break;
      }
    }
    if (unit == nullptr) {
      return invalid();
    }

    if (whole > kMaxNanos / unit->nanos) {
      return invalid();
    }
    auto value = whole * unit->nanos;
    value += static_cast<std::uint64_t>(static_cast<long double>(frac) *
                                        static_cast<long double>(unit->nanos) /
                                        static_cast<long double>(scale));
    if (value > kMaxNanos || total > kMaxNanos - value) {
      return invalid();
    }
    total += value;
    s.remove_prefix(unit_end);
  }

  const auto signed_total = static_cast<std::int64_t>(total);
  return std::chrono::nanoseconds{negative ? -signed_total : signed_total};
}

auto format_duration(std::chrono::nanoseconds d) -> std::string {
  if (d.count() == 0) {
    return "0s";
  }

  const bool negative = d.count() < 0;
  // Magnitude of INT64_MIN does not fit in int64, but does in uint64.
  auto u = negative ? 0 - static_cast<std::uint64_t>(d.count())
                    : static_cast<std::uint64_t>(d.count());

  std::string out;
  if (u < 1'000) {
    out = std::to_string(u) + "ns";
  } else if (u < 1'000'000) {
    out = fixed_point(u, 3) + "\xC2\xB5s";
  } else if (u < 1'000'000'000) {
    out = fixed_point(u, 6) + "ms";
  } else {
    constexpr std::uint64_t kMinute = 60'000'000'000;
    out = fixed_point(u % kMinute, 9) + "s";
    u /= kMinute;
    if (u > 0) {
      out = std::to_string(u % 60) + "m" + out;
      u /= 60;
      if (u > 0) {
        out = std::to_string(u) + "h" + out;
      }
    }
  }
  return negative ? "-" + out : out;
}

} // namespace loadgen
