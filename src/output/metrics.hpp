#pragma once
/// @file metrics.hpp
/// @brief Run-level metrics collector: success counts, latency percentiles,
///        and achieved throughput.

#include "runner/result.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace loadgen {

/// @brief Snapshot of aggregate run metrics.
struct RunMetrics {
  std::size_t total_requests = 0;
  std::size_t successful = 0;
  std::size_t failed = 0;
  double elapsed_seconds = 0.0;

  std::chrono::nanoseconds min_latency{0};
  std::chrono::nanoseconds max_latency{0};
  std::chrono::nanoseconds avg_latency{0};
  std::chrono::nanoseconds p50_latency{0};
  std::chrono::nanoseconds p95_latency{0};
  std::chrono::nanoseconds p99_latency{0};

  /// @brief Failed fraction in percent (0.0–100.0), 0 for an empty run.
  [[nodiscard]] auto error_rate_pct() const -> double {
    return (total_requests > 0) ? static_cast<double>(failed) /
                                      static_cast<double>(total_requests) *
                                      100.0
                                : 0.0;
  }

  /// @brief Completed requests per second.
  [[nodiscard]] auto throughput_rps() const -> double {
    return (elapsed_seconds > 0.0)
               ? static_cast<double>(total_requests) / elapsed_seconds
               : 0.0;
  }
};

/// @brief Accumulates Results as the consumer drains a run.
///
/// Not synchronized: the single thread draining the ResultStream owns it.
/// Percentiles are computed on demand from the full sample vector.
class MetricsCollector {
public:
  using Clock = std::chrono::steady_clock;

  void record(const Result &r) {
    latencies_.push_back(r.latency);
    if (r.success) {
      ++ok_;
    } else {
      ++fail_;
    }
  }

  [[nodiscard]] auto snapshot() const -> RunMetrics {
    RunMetrics m;
    m.successful = ok_;
    m.failed = fail_;
    m.total_requests = ok_ + fail_;
    m.elapsed_seconds =
        std::chrono::duration<double>(end_time_ - start_time_).count();

    if (latencies_.empty()) {
      return m;
    }

    auto sorted = latencies_;
    std::sort(sorted.begin(), sorted.end());

    m.min_latency = sorted.front();
    m.max_latency = sorted.back();

    std::chrono::nanoseconds sum{0};
    for (auto v : sorted) {
      sum += v;
    }
    m.avg_latency = sum / static_cast<std::int64_t>(sorted.size());

    auto pct = [&](double p) {
      auto idx =
          static_cast<std::size_t>(p * static_cast<double>(sorted.size() - 1));
      return sorted[idx];
    };
    m.p50_latency = pct(0.50);
    m.p95_latency = pct(0.95);
    m.p99_latency = pct(0.99);

    return m;
  }

  void start() { start_time_ = Clock::now(); }
  void stop() { end_time_ = Clock::now(); }

private:
  std::vector<std::chrono::nanoseconds> latencies_;
  std::size_t ok_ = 0;
  std::size_t fail_ = 0;
  Clock::time_point start_time_{};
  Clock::time_point end_time_{};
};

} // namespace loadgen
