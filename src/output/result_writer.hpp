#pragma once
/// @file result_writer.hpp
/// @brief Streams Result records to stdout or a file, one line each.

#include "runner/result.hpp"

#include <cstdint>
#include <expected>
#include <fstream>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <system_error>

namespace loadgen {

/// @brief On-disk record format.
enum class OutputFormat : std::uint8_t {
  Csv,       ///< timestamp_ns,code,latency_ns,error,seq
  JsonLines, ///< One JSON object per line, same fields.
};

/// @brief "csv" or "jsonl" (also "json").
[[nodiscard]] auto parse_output_format(std::string_view name)
    -> std::expected<OutputFormat, std::error_code>;

[[nodiscard]] auto to_string(OutputFormat format) -> const char *;

/// @brief Render one CSV record, quoted like RFC 4180 writers do, without
/// the trailing newline.
[[nodiscard]] auto format_csv_record(const Result &r) -> std::string;

/// @brief Writes and flushes one line per Result.
///
/// Move-only. Either borrows an existing stream or owns the file it opened.
class ResultWriter {
public:
  /// @brief Open the writer's destination.
  /// @param name "stdout", or a path to create or truncate.
  /// @return The writer, or the errno-derived error from opening the file.
  [[nodiscard]] static auto open(const std::string &name, OutputFormat format)
      -> std::expected<ResultWriter, std::error_code>;

  /// @brief Write to a caller-owned stream that must outlive the writer.
  ResultWriter(std::ostream &out, OutputFormat format) noexcept;

  ResultWriter(ResultWriter &&) noexcept = default;
  ResultWriter &operator=(ResultWriter &&) noexcept = default;
  ResultWriter(const ResultWriter &) = delete;
  ResultWriter &operator=(const ResultWriter &) = delete;

  /// @brief Append @p r and flush so partial output survives a crash.
  /// @return An empty code, or std::errc::io_error once the stream fails.
  auto write(const Result &r) -> std::error_code;

  [[nodiscard]] auto format() const noexcept -> OutputFormat {
    return format_;
  }

private:
  ResultWriter(std::unique_ptr<std::ofstream> file,
               OutputFormat format) noexcept;

  std::unique_ptr<std::ofstream> file_;
  std::ostream *out_;
  OutputFormat format_;
};

} // namespace loadgen
