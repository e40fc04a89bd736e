/// @file cli.cpp
/// @brief Flag parsing and usage text.

#include "config/cli.hpp"

#include "common/error.hpp"
#include "config/duration.hpp"

#include <charconv>
#include <chrono>
#include <cstdint>
#include <string>

namespace loadgen {

namespace {

auto parse_uint(std::string_view s)
    -> std::expected<std::uint64_t, std::error_code> {
  std::uint64_t value = 0;
  const auto *end = s.data() + s.size();
  auto [ptr, ec] = std::from_chars(s.data(), end, value);
  if (s.empty() || ec != std::errc{} || ptr != end) {
    return std::unexpected(make_error_code(errc::invalid_flag_value));
  }
  return value;
}

auto parse_bool(std::string_view s) -> std::expected<bool, std::error_code> {
  if (s == "1" || s == "t" || s == "T" || s == "true" || s == "TRUE" ||
      s == "True") {
    return true;
  }
  if (s == "0" || s == "f" || s == "F" || s == "false" || s == "FALSE" ||
      s == "False") {
    return false;
  }
  return std::unexpected(make_error_code(errc::invalid_flag_value));
}

auto bool_flag(CliOptions &opts, std::string_view name) -> bool * {
  if (name == "autoscale") {
    return &opts.args.autoscale;
  }
  if (name == "version") {
    return &opts.show_version;
  }
  if (name == "help" || name == "h") {
    return &opts.show_help;
  }
  return nullptr;
}

auto is_value_flag(std::string_view name) -> bool {
  return name == "duration" || name == "qps" || name == "workers" ||
         name == "max_workers" || name == "timeout" || name == "method" ||
         name == "output_file" || name == "format";
}

auto apply_value(CliOptions &opts, std::string_view name,
                 std::string_view value) -> std::error_code {
  if (name == "duration") {
    auto d = parse_duration(value);
    if (!d.has_value()) {
      return d.error();
    }
    opts.args.duration = *d;
  } else if (name == "method") {
    opts.args.method = std::string(value);
  } else if (name == "output_file") {
    opts.output_file = std::string(value);
  } else if (name == "format") {
    auto f = parse_output_format(value);
    if (!f.has_value()) {
      return f.error();
    }
    opts.format = *f;
  } else {
    auto n = parse_uint(value);
    if (!n.has_value()) {
      return n.error();
    }
    if (name == "qps") {
      opts.args.qps = *n;
    } else if (name == "workers") {
      opts.args.workers = *n;
    } else if (name == "max_workers") {
      opts.args.max_workers = *n;
    } else if (name == "timeout") {
      opts.args.timeout =
          std::chrono::seconds{static_cast<std::chrono::seconds::rep>(*n)};
    }
  }
  return {};
}

} // namespace

auto parse_cli(int argc, const char *const argv[], std::ostream &err)
    -> std::expected<CliOptions, std::error_code> {
  CliOptions opts;

  int i = 1;
  for (; i < argc; ++i) {
    std::string_view arg = argv[i];
    if (arg == "--") {
      ++i;
      break;
    }
    if (arg.size() < 2 || arg.front() != '-') {
      break;
    }
    arg.remove_prefix(arg[1] == '-' ? 2 : 1);
    if (arg.empty() || arg.front() == '-' || arg.front() == '=') {
      err << "bad flag syntax: " << argv[i] << '\n';
      return std::unexpected(make_error_code(errc::invalid_flag_value));
    }

    auto name = arg;
    std::string_view value;
    bool has_value = false;
    if (const auto eq = arg.find('='); eq != std::string_view::npos) {
      name = arg.substr(0, eq);
      value = arg.substr(eq + 1);
      has_value = true;
    }

    if (auto *flag = bool_flag(opts, name); flag != nullptr) {
      if (!has_value) {
        *flag = true;
        continue;
      }
      auto b = parse_bool(value);
      if (!b.has_value()) {
        err << "invalid boolean value \"" << value << "\" for -" << name
            << '\n';
        return std::unexpected(b.error());
      }
      *flag = *b;
      continue;
    }

    if (!is_value_flag(name)) {
      err << "flag provided but not defined: -" << name << '\n';
      return std::unexpected(make_error_code(errc::unknown_flag));
    }
    if (!has_value) {
      if (i + 1 >= argc) {
        err << "flag needs an argument: -" << name << '\n';
        return std::unexpected(make_error_code(errc::missing_flag_value));
      }
      value = argv[++i];
    }
    if (auto ec = apply_value(opts, name, value)) {
      err << "invalid value \"" << value << "\" for flag -" << name << ": "
          << ec.message() << '\n';
      return std::unexpected(ec);
    }
  }

  if (opts.show_help || opts.show_version) {
    return opts;
  }
  if (argc - i != 1) {
    err << "expected exactly one target, got " << (argc - i) << '\n';
    return std::unexpected(make_error_code(errc::missing_target));
  }
  opts.target = argv[i];
  return opts;
}

void print_usage(std::ostream &out, std::string_view prog) {
  out << "Usage: " << prog << " [flags] target\n\n"
      << "Flags:\n"
      << "  -duration <D>       Duration of the test, e.g. 30s or 1m30s "
         "(default: 0 = forever)\n"
      << "  -qps <N>            Queries per second (default: 100)\n"
      << "  -workers <N>        Number of initial workers (default: 100)\n"
      << "  -max_workers <N>    Max number of workers (default: 100)\n"
      << "  -autoscale[=bool]   Grow the worker pool when it falls behind "
         "(default: true)\n"
      << "  -timeout <N>        Per-request timeout in seconds, 0 = none "
         "(default: 30)\n"
      << "  -method <M>         HTTP method to use (default: GET)\n"
      << "  -output_file <F>    File to write results to (default: stdout)\n"
      << "  -format <csv|jsonl> Result record format (default: csv)\n"
      << "  -version            Print version and exit\n"
      << "  -help               Show this help\n";
}

} // namespace loadgen
