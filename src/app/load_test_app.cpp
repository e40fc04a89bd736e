/// @file load_test_app.cpp
/// @brief Drain loop: write each Result, collect metrics, print the summary.

#include "app/load_test_app.hpp"

#include "output/summary.hpp"
#include "runner/runner.hpp"

#include <iostream>
#include <utility>

namespace loadgen {

LoadTestApp::LoadTestApp(std::string target, LoadTestArgs args,
                         OutputOptions output, ForceExitHandler on_force_exit)
    : target_{std::move(target)}, args_{std::move(args)},
      output_{std::move(output)}, on_force_exit_{std::move(on_force_exit)} {}

auto LoadTestApp::run(std::ostream &report)
    -> std::expected<RunMetrics, std::error_code> {
  auto writer = ResultWriter::open(output_.file, output_.format);
  if (!writer.has_value()) {
    std::cerr << "[loadgen] error opening " << output_.file << ": "
              << writer.error().message() << '\n';
    return std::unexpected(writer.error());
  }

  Runner runner{target_, args_};
  // Installed before any request so an early interrupt still drains.
  SignalWatcher signals{runner, on_force_exit_};
  auto stream = runner.start_test();
  if (!stream.has_value()) {
    return std::unexpected(stream.error());
  }

  MetricsCollector metrics;
  metrics.start();

  std::error_code write_error;
  while (auto result = stream->next()) {
    metrics.record(*result);
    if (write_error) {
      continue;
    }
    if (auto ec = writer->write(*result)) {
      std::cerr << "[loadgen] error writing results: " << ec.message()
                << ", stopping\n";
      write_error = ec;
      runner.stop();
    }
  }
  metrics.stop();

  if (write_error) {
    return std::unexpected(write_error);
  }

  auto snapshot = metrics.snapshot();
  print_summary(snapshot, report);
  return snapshot;
}

} // namespace loadgen
