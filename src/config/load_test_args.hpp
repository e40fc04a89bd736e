#pragma once
/// @file load_test_args.hpp
/// @brief Immutable configuration for a single load-test run.

#include <chrono>
#include <cstdint>
#include <expected>
#include <string>
#include <system_error>

namespace loadgen {

/// @brief Highest accepted QPS; above it the nanosecond pacing interval
/// truncates to zero.
inline constexpr std::uint64_t kMaxQps = 1'000'000'000;

/// @brief Longest accepted request timeout; a deadline this far out still
/// fits in signed 64-bit nanoseconds.
inline constexpr std::chrono::seconds kMaxTimeout =
    std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::nanoseconds::max());

/// @brief Load-test configuration.
struct LoadTestArgs {
  std::chrono::nanoseconds duration{0}; ///< 0 = run until stopped.
  std::uint64_t qps = 100;
  std::uint64_t workers = 100;     ///< Initial worker count.
  std::uint64_t max_workers = 100; ///< Autoscale ceiling.
  bool autoscale = true;
  std::chrono::seconds timeout{30}; ///< Whole-request deadline, 0 = none.
  std::string method = "GET";
};

/// @brief Check and normalize a configuration before a run.
///
/// Rejects QPS outside [1, kMaxQps], a zero initial worker count, and a
/// timeout outside [0, kMaxTimeout]. Raises
/// max_workers to workers when it is lower and maps an empty method to GET.
/// The method's syntax is not checked here; a bad method surfaces as a
/// per-request build failure.
[[nodiscard]] auto validate(LoadTestArgs args)
    -> std::expected<LoadTestArgs, std::error_code>;

} // namespace loadgen
