/// @file summary.cpp
/// @brief End-of-run report formatting.

#include "output/summary.hpp"

#include "config/duration.hpp"

#include <ios>
#include <iomanip>
#include <string>

namespace loadgen {

void print_summary(const RunMetrics &m, std::ostream &out) {
  const auto flags = out.flags();
  const auto precision = out.precision();

  out << "Successful Requests: " << m.successful
      << ", Failed Requests: " << m.failed << '\n'
      << "Average latency: " << format_duration(m.avg_latency) << '\n'
      << std::fixed << std::setprecision(2)
      << "Error rate: " << m.error_rate_pct() << "%\n";

  if (m.total_requests > 0) {
    out << "Latency: min " << format_duration(m.min_latency) << ", p50 "
        << format_duration(m.p50_latency) << ", p95 "
        << format_duration(m.p95_latency) << ", p99 "
        << format_duration(m.p99_latency) << ", max "
        << format_duration(m.max_latency) << '\n';
  }
  out << std::setprecision(1) << "Throughput: " << m.throughput_rps()
      << " req/s over " << std::setprecision(3) << m.elapsed_seconds << " s\n";

  out.flags(flags);
  out.precision(precision);
}

} // namespace loadgen
