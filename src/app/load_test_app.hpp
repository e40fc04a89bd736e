#pragma once
/// @file load_test_app.hpp
/// @brief Wires a Runner to the result writer, summary and OS signals.

#include "app/signal_watcher.hpp"
#include "config/load_test_args.hpp"
#include "output/metrics.hpp"
#include "output/result_writer.hpp"

#include <expected>
#include <ostream>
#include <string>
#include <system_error>

namespace loadgen {

/// @brief Where and how Results are written.
struct OutputOptions {
  std::string file = "stdout";
  OutputFormat format = OutputFormat::Csv;
};

/// @brief One command-line invocation.
class LoadTestApp {
public:
  /// @param on_force_exit Invoked on an interrupt that arrives while the
  ///                      run is already draining.
  LoadTestApp(std::string target, LoadTestArgs args, OutputOptions output,
              ForceExitHandler on_force_exit);

  /// @brief Run the load test to completion.
  ///
  /// Opens the output before any request is sent. A write failure mid-run
  /// stops the runner, drains the remaining Results and is returned.
  /// @param report Receives the end-of-run summary.
  /// @return Final metrics, or the configuration / output error.
  auto run(std::ostream &report) -> std::expected<RunMetrics, std::error_code>;

private:
  std::string target_;
  LoadTestArgs args_;
  OutputOptions output_;
  ForceExitHandler on_force_exit_;
};

} // namespace loadgen
