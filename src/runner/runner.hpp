#pragma once
/// @file runner.hpp
/// @brief Public entry point: start a paced load test and stream its Results.
///
/// Usage:
/// @code
///   loadgen::Runner runner{"http://127.0.0.1:8080/",
///                          {.duration = 10s, .qps = 200}};
///   auto stream = runner.start_test();
///   while (auto result = stream->next()) { ... }
/// @endcode

#include "config/load_test_args.hpp"
#include "runner/channel.hpp"
#include "runner/dispatcher.hpp"
#include "runner/lifecycle.hpp"
#include "runner/result.hpp"

#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <thread>

namespace loadgen {

/// @brief Consumer side of a run's Result sink.
///
/// Finite unless the run is unbounded, and not restartable. Drain it until
/// next() returns std::nullopt; only then have all workers exited.
class ResultStream {
public:
  explicit ResultStream(std::shared_ptr<Channel<Result>> channel)
      : channel_{std::move(channel)} {}

  /// @brief Block for the next Result, std::nullopt once the run is over.
  auto next() -> std::optional<Result> { return channel_->receive(); }

private:
  std::shared_ptr<Channel<Result>> channel_;
};

/// @brief Owns one load test: its stop signal, dispatcher thread and sink.
///
/// Thread-safety: stop() may be called from any thread, including a signal
/// watcher. start_test() and destruction belong to the owning thread.
class Runner {
public:
  Runner(std::string target, LoadTestArgs args);

  /// @brief Stops the run, discards undrained Results and joins all threads.
  ~Runner();

  Runner(const Runner &) = delete;
  Runner &operator=(const Runner &) = delete;

  /// @brief Validate the configuration and start issuing requests.
  /// @return The Result stream, a configuration error, or
  ///         errc::already_started on a second call.
  [[nodiscard]] auto start_test() -> std::expected<ResultStream, std::error_code>;

  /// @brief Ask the run to stop gracefully.
  /// @return false if the run was already stopping or finished.
  auto stop() noexcept -> bool { return lifecycle_.stop(); }

  [[nodiscard]] auto stopped() const noexcept -> bool {
    return lifecycle_.stopped();
  }

  /// @brief Current pool size, 0 before start_test().
  [[nodiscard]] auto worker_count() const noexcept -> std::uint64_t;

private:
  std::string target_;
  LoadTestArgs args_;
  Lifecycle lifecycle_;

  std::shared_ptr<Channel<Result>> results_;
  std::unique_ptr<Dispatcher> dispatcher_;
  std::thread dispatch_thread_;
};

} // namespace loadgen
