/// @file dispatcher.cpp
/// @brief Implementation of the pacing loop and worker pool.

#include "runner/dispatcher.hpp"

#include <iostream>
#include <system_error>
#include <utility>

namespace loadgen {

Dispatcher::Dispatcher(std::string target, LoadTestArgs args, Pacer pacer,
                       Lifecycle &lifecycle, Channel<Result> &results)
    : target_{std::move(target)}, args_{std::move(args)}, pacer_{pacer},
      lifecycle_{lifecycle}, results_{results} {}

void Dispatcher::run() {
  for (std::uint64_t i = 0; i < args_.workers; ++i) {
    if (!spawn_worker()) {
      break;
    }
  }
  if (workers_.empty()) {
    drain();
    return;
  }

  const auto stop = lifecycle_.token();
  std::uint64_t count = 0;

  while (!stop.stop_requested()) {
    const auto elapsed = clock_.elapsed();
    if (args_.duration.count() > 0 && elapsed > args_.duration) {
      break;
    }

    const auto decision = pacer_.pace(elapsed, count);
    if (decision.stop) {
      std::cerr << "[Dispatcher] pacing overflow after " << count
                << " requests, stopping run\n";
      break;
    }

    if (!sleep_for(decision.wait, stop)) {
      break;
    }

    if (args_.autoscale && worker_count() < args_.max_workers) {
      if (ticks_.try_send(Tick{})) {
        ++count;
        continue;
      }
      // Nobody idle: grow by one, then hand the same tick over below.
      spawn_worker();
    }

    if (!ticks_.send(Tick{}, stop)) {
      break;
    }
    ++count;
  }

  drain();
}

auto Dispatcher::spawn_worker() -> bool {
  try {
    workers_.emplace_back([this] {
      Worker worker{target_, args_, clock_, ticks_, results_};
      worker.run();
    });
  } catch (const std::system_error &e) {
    std::cerr << "[Dispatcher] failed to start worker: " << e.what() << '\n';
    return false;
  }
  worker_count_.store(workers_.size(), std::memory_order_release);
  return true;
}

auto Dispatcher::sleep_for(std::chrono::nanoseconds wait, std::stop_token stop)
    -> bool {
  if (wait.count() > 0) {
    std::unique_lock lock(sleep_mutex_);
    // Only a stop request wakes this early.
    sleep_cv_.wait_for(lock, stop, wait, [] { return false; });
  }
  return !stop.stop_requested();
}

void Dispatcher::drain() {
  ticks_.close();
  for (auto &worker : workers_) {
    worker.join();
  }
  results_.close();
  lifecycle_.stop();
}

} // namespace loadgen
