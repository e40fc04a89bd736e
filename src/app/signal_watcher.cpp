/// @file signal_watcher.cpp
/// @brief Signal handling via boost::asio::signal_set.

#include "app/signal_watcher.hpp"

#include "runner/runner.hpp"

#include <csignal>
#include <iostream>
#include <utility>

namespace loadgen {

SignalWatcher::SignalWatcher(Runner &runner, ForceExitHandler on_force_exit)
    : signals_{ioc_, SIGINT, SIGTERM}, runner_{runner},
      on_force_exit_{std::move(on_force_exit)} {
  arm();
  thread_ = std::thread([this] { ioc_.run(); });
}

SignalWatcher::~SignalWatcher() {
  ioc_.stop();
  thread_.join();
}

void SignalWatcher::arm() {
  signals_.async_wait(
      [this](const boost::system::error_code &ec, int signal_number) {
        if (ec) {
          return;
        }
        if (runner_.stop()) {
          std::cerr << "Shutting down...\n";
          arm();
          return;
        }
        std::cerr << "[loadgen] interrupted again, exiting immediately\n";
        if (on_force_exit_) {
          on_force_exit_(signal_number);
        }
        arm();
      });
}

} // namespace loadgen
