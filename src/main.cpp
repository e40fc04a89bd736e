/// @file main.cpp
/// @brief Entry point: parse flags, run the load test, report.
///
/// Results stream to stdout (or -output_file) as they complete. The summary
/// goes to stdout when results go to a file, otherwise to stderr so the
/// result stream stays machine-readable.

#include "app/load_test_app.hpp"
#include "config/cli.hpp"
#include "config/duration.hpp"

#include <cstdlib>
#include <iostream>
#include <string>

int main(int argc, char *argv[]) {
  using namespace loadgen;

  auto cli = parse_cli(argc, argv, std::cerr);
  if (!cli.has_value()) {
    print_usage(std::cerr, argv[0]);
    return 1;
  }
  if (cli->show_help) {
    print_usage(std::cout, argv[0]);
    return 0;
  }
  if (cli->show_version) {
    std::cout << "Version: " << kVersion << '\n';
    return 0;
  }

  auto args = validate(cli->args);
  if (!args.has_value()) {
    std::cerr << "Error: " << args.error().message() << '\n';
    return 1;
  }

  std::cerr << "[loadgen] " << args->method << ' ' << cli->target << " at "
            << args->qps << " qps "
            << (args->duration.count() > 0
                    ? "for " + format_duration(args->duration)
                    : std::string("until interrupted"))
            << ", workers " << args->workers;
  if (args->autoscale) {
    std::cerr << " (autoscale to " << args->max_workers << ')';
  }
  std::cerr << '\n';

  LoadTestApp app{cli->target, *args,
                  OutputOptions{.file = cli->output_file,
                                .format = cli->format},
                  [](int signal_number) { std::_Exit(128 + signal_number); }};

  auto &report = cli->output_file == "stdout" ? std::cerr : std::cout;
  auto metrics = app.run(report);
  if (!metrics.has_value()) {
    std::cerr << "Error: " << metrics.error().message() << '\n';
    return 1;
  }
  return 0;
}
