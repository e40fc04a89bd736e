#pragma once
/// @file result.hpp
/// @brief Outcome record for a single request attempt.

#include <chrono>
#include <cstdint>
#include <string>

namespace loadgen {

/// @brief One record per request attempt, immutable once handed to the sink.
struct Result {
  bool success = false; ///< Status in [200, 399] and no transport error.
  std::chrono::nanoseconds latency{0};        ///< Send to completion.
  std::chrono::system_clock::time_point timestamp{}; ///< Send time.
  std::uint64_t seq = 0;  ///< Send-order sequence number, from 0.
  std::string error;      ///< Empty on success.
  std::uint16_t code = 0; ///< 0 when no response was received.
};

/// @brief True for the status codes this tool counts as success.
[[nodiscard]] constexpr auto is_success_status(unsigned code) noexcept
    -> bool {
  return code >= 200 && code < 400;
}

} // namespace loadgen
