/// @file pacer.cpp
/// @brief Constant-rate pacing arithmetic.

#include "runner/pacer.hpp"

#include "common/error.hpp"
#include "config/load_test_args.hpp"

#include <limits>

namespace loadgen {

namespace {

constexpr std::uint64_t kNanosPerSecond = 1'000'000'000;
constexpr auto kMaxNanos =
    static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());

} // namespace

auto Pacer::create(std::uint64_t qps) -> std::expected<Pacer, std::error_code> {
  if (qps == 0 || qps > kMaxQps) {
    return std::unexpected(make_error_code(errc::invalid_qps));
  }
  return Pacer{qps};
}

Pacer::Pacer(std::uint64_t qps) noexcept
    : qps_{qps}, interval_ns_{kNanosPerSecond / qps} {}

auto Pacer::pace(std::chrono::nanoseconds elapsed,
                 std::uint64_t sent) const noexcept -> PaceDecision {
  const std::uint64_t whole_seconds =
      elapsed.count() > 0
          ? static_cast<std::uint64_t>(elapsed.count()) / kNanosPerSecond
          : 0;

  // Saturate: a quota past uint64 range means "behind", never "ahead".
  std::uint64_t expected = std::numeric_limits<std::uint64_t>::max();
  if (whole_seconds == 0 ||
      qps_ <= std::numeric_limits<std::uint64_t>::max() / whole_seconds) {
    expected = qps_ * whole_seconds;
  }
  if (sent < expected) {
    return {};
  }

  // (sent + 1) * interval must stay within int64 nanoseconds.
  if (sent >= kMaxNanos / interval_ns_) {
    return {.stop = true};
  }

  const auto target = std::chrono::nanoseconds{
      static_cast<std::int64_t>((sent + 1) * interval_ns_)};
  return {.wait = target - elapsed};
}

} // namespace loadgen
