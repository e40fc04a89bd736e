#pragma once
/// @file pacer.hpp
/// @brief Maps elapsed run time and sent-request count to the next wait.

#include <chrono>
#include <cstdint>
#include <expected>
#include <system_error>

namespace loadgen {

/// @brief Outcome of a single pacing decision.
struct PaceDecision {
  /// Time to wait before the next send. Zero or negative means "now".
  std::chrono::nanoseconds wait{0};
  /// True when the run must end because the schedule can no longer be
  /// represented in a signed 64-bit nanosecond count.
  bool stop = false;
};

/// @brief Constant-rate pacer.
///
/// Stateless apart from the configured rate. Request `n` (0-based) is
/// scheduled at `(n + 1) * interval` after the run began, where
/// `interval = 1s / qps` truncated to whole nanoseconds. When the run has
/// fallen behind the whole-second quota it asks for an immediate send, so a
/// stalled run catches up in a burst.
class Pacer {
public:
  /// @brief Build a pacer for @p qps requests per second.
  /// @return The pacer, or errc::invalid_qps when @p qps is 0 or above
  ///         kMaxQps.
  [[nodiscard]] static auto create(std::uint64_t qps)
      -> std::expected<Pacer, std::error_code>;

  /// @brief Decide how long to wait before sending request number @p sent.
  /// @param elapsed Time since the run began.
  /// @param sent    Requests already handed to workers.
  [[nodiscard]] auto pace(std::chrono::nanoseconds elapsed,
                          std::uint64_t sent) const noexcept -> PaceDecision;

  /// @brief Ideal spacing between two sends.
  [[nodiscard]] auto interval() const noexcept -> std::chrono::nanoseconds {
    return std::chrono::nanoseconds{static_cast<std::int64_t>(interval_ns_)};
  }

private:
  explicit Pacer(std::uint64_t qps) noexcept;

  std::uint64_t qps_;
  std::uint64_t interval_ns_;
};

} // namespace loadgen
