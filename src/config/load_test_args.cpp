/// @file load_test_args.cpp
/// @brief LoadTestArgs validation.

#include "config/load_test_args.hpp"

#include "common/error.hpp"

#include <algorithm>

namespace loadgen {

auto validate(LoadTestArgs args)
    -> std::expected<LoadTestArgs, std::error_code> {
  if (args.qps == 0 || args.qps > kMaxQps) {
    return std::unexpected(make_error_code(errc::invalid_qps));
  }
  if (args.workers == 0) {
    return std::unexpected(make_error_code(errc::invalid_worker_count));
  }
  if (args.duration.count() < 0) {
    return std::unexpected(make_error_code(errc::invalid_duration));
  }
  if (args.timeout.count() < 0 || args.timeout > kMaxTimeout) {
    return std::unexpected(make_error_code(errc::invalid_timeout));
  }

  args.max_workers = std::max(args.max_workers, args.workers);
  if (args.method.empty()) {
    args.method = "GET";
  }
  return args;
}

} // namespace loadgen
