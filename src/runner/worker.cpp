/// @file worker.cpp
/// @brief Worker loop and per-request result construction.

#include "runner/worker.hpp"

namespace loadgen {

Worker::Worker(std::string_view target, const LoadTestArgs &args,
               RunClock &clock, Channel<Tick> &ticks,
               Channel<Result> &results)
    : client_{target, args.method, args.timeout}, clock_{clock},
      ticks_{ticks}, results_{results} {}

void Worker::run() {
  while (ticks_.receive().has_value()) {
    // The dispatcher closes the sink only after joining every worker.
    if (!results_.send(execute())) {
      return;
    }
  }
}

auto Worker::execute() -> Result {
  const auto stamp = clock_.stamp();
  Result result{.timestamp = stamp.timestamp, .seq = stamp.seq};

  auto reply = client_.round_trip();
  if (!reply.has_value()) {
    result.error = reply.error().message();
  } else {
    result.code = static_cast<std::uint16_t>(reply->status);
    result.success = is_success_status(reply->status);
    if (!result.success) {
      result.error = reply->status_text();
    }
  }

  result.latency = RunClock::Clock::now() - stamp.sent_at;
  return result;
}

} // namespace loadgen
