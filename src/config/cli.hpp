#pragma once
/// @file cli.hpp
/// @brief Command-line parsing for the loadgen executable.

#include "config/load_test_args.hpp"
#include "output/result_writer.hpp"

#include <expected>
#include <ostream>
#include <string>
#include <string_view>
#include <system_error>

namespace loadgen {

inline constexpr std::string_view kVersion = "1.0";

/// @brief Everything main() needs from argv.
struct CliOptions {
  LoadTestArgs args;
  std::string target;
  std::string output_file = "stdout";
  OutputFormat format = OutputFormat::Csv;
  bool show_version = false;
  bool show_help = false;
};

/// @brief Parse `loadgen [flags] target`.
///
/// Flags take one or two dashes and either `-name value` or `-name=value`.
/// Boolean flags may stand alone (`-autoscale`) or take an explicit value
/// (`-autoscale=false`). Flag parsing stops at the first non-flag argument
/// or at `--`. A diagnostic naming the offending flag is written to @p err.
/// @return The options, or the parse error.
[[nodiscard]] auto parse_cli(int argc, const char *const argv[],
                             std::ostream &err)
    -> std::expected<CliOptions, std::error_code>;

void print_usage(std::ostream &out, std::string_view prog);

} // namespace loadgen
