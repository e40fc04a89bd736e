#pragma once
/// @file target.hpp
/// @brief Splits an `http://` URL into the pieces a request needs.

#include <expected>
#include <string>
#include <string_view>
#include <system_error>

namespace loadgen {

/// @brief A parsed request target.
struct Target {
  std::string host;        ///< Host name or address, IPv6 without brackets.
  std::string port;        ///< Numeric service, "80" when omitted.
  std::string path;        ///< Origin-form request target, never empty.
  std::string host_header; ///< Authority as written, for the Host field.
};

/// @brief Parse @p url.
/// @return The target, errc::unsupported_scheme for any scheme other than
///         http, or errc::malformed_target when the URL cannot be split.
[[nodiscard]] auto parse_target(std::string_view url)
    -> std::expected<Target, std::error_code>;

} // namespace loadgen
