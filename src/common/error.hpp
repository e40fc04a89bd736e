#pragma once
/// @file error.hpp
/// @brief Error codes for configuration, request building, and run control.
///
/// Every fallible factory in loadgen returns
/// `std::expected<T, std::error_code>`; the codes below live in their own
/// category so they print a meaningful message through `ec.message()`.

#include <system_error>
#include <type_traits>

namespace loadgen {

enum class errc : int {
  invalid_qps = 1,
  invalid_worker_count,
  invalid_duration,
  invalid_method,
  unsupported_scheme,
  malformed_target,
  unknown_flag,
  missing_flag_value,
  invalid_flag_value,
  missing_target,
  invalid_output_format,
  already_started,
  invalid_timeout,
};

/// @brief The `std::error_category` backing loadgen::errc.
[[nodiscard]] auto loadgen_category() noexcept -> const std::error_category &;

[[nodiscard]] inline auto make_error_code(errc e) noexcept -> std::error_code {
  return {static_cast<int>(e), loadgen_category()};
}

} // namespace loadgen

template <> struct std::is_error_code_enum<loadgen::errc> : std::true_type {};
