/// @file target.cpp
/// @brief URL splitting for request targets.

#include "http/target.hpp"

#include "common/error.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>

namespace loadgen {

namespace {

auto iequals(std::string_view a, std::string_view b) -> bool {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::tolower(static_cast<unsigned char>(x)) ==
                  std::tolower(static_cast<unsigned char>(y));
         });
}

auto valid_port(std::string_view port) -> bool {
  std::uint32_t value = 0;
  const auto *end = port.data() + port.size();
  auto [ptr, ec] = std::from_chars(port.data(), end, value);
  return ec == std::errc{} && ptr == end && value > 0 && value <= 65535;
}

} // namespace

auto parse_target(std::string_view url)
    -> std::expected<Target, std::error_code> {
  const auto scheme_end = url.find("://");
  if (scheme_end == std::string_view::npos || scheme_end == 0) {
    return std::unexpected(make_error_code(errc::malformed_target));
  }
  if (!iequals(url.substr(0, scheme_end), "http")) {
    return std::unexpected(make_error_code(errc::unsupported_scheme));
  }

  auto rest = url.substr(scheme_end + 3);
  if (const auto fragment = rest.find('#');
      fragment != std::string_view::npos) {
    rest = rest.substr(0, fragment);
  }

  const auto authority_end = rest.find_first_of("/?");
  auto authority = rest.substr(0, authority_end);
  auto path = authority_end == std::string_view::npos
                  ? std::string_view{}
                  : rest.substr(authority_end);

  if (const auto at = authority.rfind('@'); at != std::string_view::npos) {
    authority = authority.substr(at + 1);
  }

  Target target;
  target.host_header = std::string(authority);
  target.port = "80";

  std::string_view port;
  if (!authority.empty() && authority.front() == '[') {
    const auto close = authority.find(']');
    if (close == std::string_view::npos) {
      return std::unexpected(make_error_code(errc::malformed_target));
    }
    target.host = std::string(authority.substr(1, close - 1));
    const auto tail = authority.substr(close + 1);
    if (!tail.empty()) {
      if (tail.front() != ':') {
        return std::unexpected(make_error_code(errc::malformed_target));
      }
      port = tail.substr(1);
    }
  } else {
    const auto colon = authority.rfind(':');
    target.host = std::string(authority.substr(0, colon));
    if (colon != std::string_view::npos) {
      port = authority.substr(colon + 1);
    }
  }

  if (target.host.empty()) {
    return std::unexpected(make_error_code(errc::malformed_target));
  }
  if (!port.empty()) {
    if (!valid_port(port)) {
      return std::unexpected(make_error_code(errc::malformed_target));
    }
    target.port = std::string(port);
  }

  if (path.empty() || path.front() == '?') {
    target.path = "/" + std::string(path);
  } else {
    target.path = std::string(path);
  }
  return target;
}

} // namespace loadgen
