/// @file error.cpp
/// @brief Messages for loadgen::errc.

#include "common/error.hpp"

#include <string>

namespace loadgen {

namespace {

class LoadgenCategory final : public std::error_category {
public:
  [[nodiscard]] auto name() const noexcept -> const char * override {
    return "loadgen";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    switch (static_cast<errc>(ev)) {
    case errc::invalid_qps:
      return "qps must be between 1 and 1000000000";
    case errc::invalid_worker_count:
      return "workers must be at least 1";
    case errc::invalid_duration:
      return "invalid duration";
    case errc::invalid_method:
      return "invalid HTTP method";
    case errc::unsupported_scheme:
      return "unsupported protocol scheme";
    case errc::malformed_target:
      return "malformed target URL";
    case errc::unknown_flag:
      return "flag provided but not defined";
    case errc::missing_flag_value:
      return "flag needs an argument";
    case errc::invalid_flag_value:
      return "invalid flag value";
    case errc::missing_target:
      return "exactly one target URL is required";
    case errc::invalid_output_format:
      return "output format must be csv or jsonl";
    case errc::already_started:
      return "load test already started";
    case errc::invalid_timeout:
      return "timeout must be between 0 and 9223372036 seconds";
    }
    return "unknown loadgen error";
  }
};

} // namespace

auto loadgen_category() noexcept -> const std::error_category & {
  static const LoadgenCategory category;
  return category;
}

} // namespace loadgen
