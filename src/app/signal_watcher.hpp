#pragma once
/// @file signal_watcher.hpp
/// @brief Bridges SIGINT/SIGTERM to Runner::stop() on a background thread.

#include <utility>  // before Asio: Boost 1.74 awaitable.hpp uses std::exchange
#include <boost/asio.hpp>

#include <functional>
#include <thread>

namespace loadgen {

class Runner;

/// @brief Called with the signal number when an interrupt arrives after the
/// run was already stopping. Expected not to return.
using ForceExitHandler = std::function<void(int)>;

/// @brief Watches SIGINT and SIGTERM for the lifetime of the object.
///
/// The first signal asks the runner to drain gracefully. Any signal that
/// finds the runner already stopping invokes the force-exit handler.
class SignalWatcher {
public:
  SignalWatcher(Runner &runner, ForceExitHandler on_force_exit);
  ~SignalWatcher();

  SignalWatcher(const SignalWatcher &) = delete;
  SignalWatcher &operator=(const SignalWatcher &) = delete;

private:
  void arm();

  boost::asio::io_context ioc_{1};
  boost::asio::signal_set signals_;
  Runner &runner_;
  ForceExitHandler on_force_exit_;
  std::thread thread_;
};

} // namespace loadgen
