#pragma once
/// @file json_serializer.hpp
/// @brief nlohmann/json serialization for Result records.

#include "runner/result.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>

namespace loadgen {

inline void to_json(nlohmann::json &j, const Result &r) {
  j = nlohmann::json{
      {"timestamp_ns", std::chrono::duration_cast<std::chrono::nanoseconds>(
                           r.timestamp.time_since_epoch())
                           .count()},
      {"code", r.code},
      {"latency_ns", r.latency.count()},
      {"error", r.error},
      {"seq", r.seq},
  };
}

/// @brief One JSON object on a single line, without the newline.
///
/// Invalid UTF-8 in the error text (a server may send any reason phrase) is
/// replaced rather than thrown on.
[[nodiscard]] inline auto result_to_json_line(const Result &r)
    -> std::string {
  return nlohmann::json(r).dump(-1, ' ', false,
                                nlohmann::json::error_handler_t::replace);
}

} // namespace loadgen
