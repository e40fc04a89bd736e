#pragma once
/// @file dispatcher.hpp
/// @brief Pacing loop, elastic worker pool, and the drain sequence.

#include "config/load_test_args.hpp"
#include "runner/channel.hpp"
#include "runner/lifecycle.hpp"
#include "runner/pacer.hpp"
#include "runner/result.hpp"
#include "runner/run_clock.hpp"
#include "runner/worker.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace loadgen {

/// @brief Issues ticks at the Pacer's cadence to a pool that only grows.
///
/// run() blocks the calling thread for the whole run. The loop ends on
/// duration expiry, pacing overflow, or the lifecycle stop signal; it then
/// closes the tick channel, joins every worker, closes the result sink and
/// finally triggers the stop signal so other waiters unblock.
///
/// Autoscaling is a heuristic: a tick that finds no idle worker spawns one,
/// and scheduling jitter can make that check fail spuriously, so the pool
/// may end up larger than strictly needed. It never exceeds max_workers.
class Dispatcher {
public:
  /// @param args    Validated configuration.
  /// @param results Sink for every Result; closed by run() on exit.
  Dispatcher(std::string target, LoadTestArgs args, Pacer pacer,
             Lifecycle &lifecycle, Channel<Result> &results);

  Dispatcher(const Dispatcher &) = delete;
  Dispatcher &operator=(const Dispatcher &) = delete;

  void run();

  /// @brief Live worker count. Monotonic within a run.
  [[nodiscard]] auto worker_count() const noexcept -> std::uint64_t {
    return worker_count_.load(std::memory_order_acquire);
  }

private:
  auto spawn_worker() -> bool;
  auto sleep_for(std::chrono::nanoseconds wait, std::stop_token stop) -> bool;
  void drain();

  std::string target_;
  LoadTestArgs args_;
  Pacer pacer_;
  Lifecycle &lifecycle_;
  Channel<Result> &results_;

  RunClock clock_;
  Channel<Tick> ticks_;

  // Touched only by the thread inside run().
  std::vector<std::thread> workers_;
  std::atomic<std::uint64_t> worker_count_{0};

  std::mutex sleep_mutex_;
  std::condition_variable_any sleep_cv_;
};

} // namespace loadgen
