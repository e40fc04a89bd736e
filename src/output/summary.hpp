#pragma once
/// @file summary.hpp
/// @brief End-of-run report.

#include "output/metrics.hpp"

#include <ostream>

namespace loadgen {

/// @brief Print counts, average latency, error rate, percentiles and
/// throughput for a finished run.
void print_summary(const RunMetrics &m, std::ostream &out);

} // namespace loadgen
