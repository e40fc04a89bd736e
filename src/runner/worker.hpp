#pragma once
/// @file worker.hpp
/// @brief A pool member: one tick in, one request out, one Result back.

#include "config/load_test_args.hpp"
#include "http/http_client.hpp"
#include "runner/channel.hpp"
#include "runner/result.hpp"
#include "runner/run_clock.hpp"

#include <string_view>

namespace loadgen {

/// @brief Permission to send exactly one request.
struct Tick {};

class Worker {
public:
  Worker(std::string_view target, const LoadTestArgs &args, RunClock &clock,
         Channel<Tick> &ticks, Channel<Result> &results);

  /// @brief Serve ticks until the tick channel closes.
  void run();

  /// @brief Send one request and build its Result.
  auto execute() -> Result;

private:
  HttpClient client_;
  RunClock &clock_;
  Channel<Tick> &ticks_;
  Channel<Result> &results_;
};

} // namespace loadgen
