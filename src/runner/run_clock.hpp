#pragma once
/// @file run_clock.hpp
/// @brief Run start time plus the send-order sequence counter.

#include <chrono>
#include <cstdint>
#include <mutex>

namespace loadgen {

/// @brief Sequence number and wall-clock send time of one request.
struct SendStamp {
  std::uint64_t seq = 0;
  std::chrono::system_clock::time_point timestamp{};
  std::chrono::steady_clock::time_point sent_at{};
};

/// @brief Shared by every worker of a run.
///
/// Timestamps are the wall-clock start time advanced by steady-clock
/// elapsed time, so they never step backwards with NTP adjustments.
/// stamp() reads the clock and bumps the counter under one lock, which gives
/// all sends a total order that sequence numbers and timestamps agree on.
class RunClock {
public:
  using Clock = std::chrono::steady_clock;

  RunClock()
      : began_{Clock::now()}, began_wall_{std::chrono::system_clock::now()} {}

  [[nodiscard]] auto elapsed() const -> std::chrono::nanoseconds {
    return Clock::now() - began_;
  }

  auto stamp() -> SendStamp {
    std::lock_guard lock(seq_mutex_);
    const auto now = Clock::now();
    return SendStamp{
        .seq = next_seq_++,
        .timestamp = began_wall_ +
                     std::chrono::duration_cast<
                         std::chrono::system_clock::duration>(now - began_),
        .sent_at = now,
    };
  }

private:
  const Clock::time_point began_;
  const std::chrono::system_clock::time_point began_wall_;

  std::mutex seq_mutex_;
  std::uint64_t next_seq_ = 0;
};

} // namespace loadgen
