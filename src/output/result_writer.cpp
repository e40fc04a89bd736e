/// @file result_writer.cpp
/// @brief CSV and JSON-lines result output.

#include "output/result_writer.hpp"

#include "common/error.hpp"
#include "output/json_serializer.hpp"

#include <cerrno>
#include <chrono>
#include <iostream>
#include <utility>

namespace loadgen {

namespace {

auto needs_quotes(std::string_view field) -> bool {
  if (field.empty()) {
    return false;
  }
  if (field == "\\.") {
    return true;
  }
  if (field.find_first_of(",\"\r\n") != std::string_view::npos) {
    return true;
  }
  const char first = field.front();
  return first == ' ' || first == '\t';
}

void append_field(std::string &out, std::string_view field) {
  if (!needs_quotes(field)) {
    out += field;
    return;
  }
  out += '"';
  for (char c : field) {
    if (c == '"') {
      out += '"';
    }
    out += c;
  }
  out += '"';
}

} // namespace

auto parse_output_format(std::string_view name)
    -> std::expected<OutputFormat, std::error_code> {
  if (name == "csv") {
    return OutputFormat::Csv;
  }
  if (name == "jsonl" || name == "json") {
    return OutputFormat::JsonLines;
  }
  return std::unexpected(make_error_code(errc::invalid_output_format));
}

auto to_string(OutputFormat format) -> const char * {
  switch (format) {
  case OutputFormat::Csv:
    return "csv";
  case OutputFormat::JsonLines:
    return "jsonl";
  }
  return "unknown";
}

auto format_csv_record(const Result &r) -> std::string {
  const auto timestamp_ns =
      std::chrono::duration_cast<std::chrono::nanoseconds>(
          r.timestamp.time_since_epoch())
          .count();

  std::string line;
  line.reserve(64 + r.error.size());
  line += std::to_string(timestamp_ns);
  line += ',';
  line += std::to_string(r.code);
  line += ',';
  line += std::to_string(r.latency.count());
  line += ',';
  append_field(line, r.error);
  line += ',';
  line += std::to_string(r.seq);
  return line;
}

// ─── ResultWriter ───────────────────────────────────────────────────────

auto ResultWriter::open(const std::string &name, OutputFormat format)
    -> std::expected<ResultWriter, std::error_code> {
  if (name == "stdout") {
    return ResultWriter{std::cout, format};
  }

  errno = 0;
  auto file = std::make_unique<std::ofstream>(
      name, std::ios::out | std::ios::trunc | std::ios::binary);
  if (!file->is_open()) {
    const int err = errno != 0 ? errno : EIO;
    return std::unexpected(std::error_code{err, std::generic_category()});
  }
  return ResultWriter{std::move(file), format};
}

ResultWriter::ResultWriter(std::ostream &out, OutputFormat format) noexcept
    : out_{&out}, format_{format} {}

ResultWriter::ResultWriter(std::unique_ptr<std::ofstream> file,
                           OutputFormat format) noexcept
    : file_{std::move(file)}, out_{file_.get()}, format_{format} {}

auto ResultWriter::write(const Result &r) -> std::error_code {
  switch (format_) {
  case OutputFormat::Csv:
    *out_ << format_csv_record(r) << '\n';
    break;
  case OutputFormat::JsonLines:
    *out_ << result_to_json_line(r) << '\n';
    break;
  }
  out_->flush();

  if (!*out_) {
    return std::make_error_code(std::errc::io_error);
  }
  return {};
}

} // namespace loadgen
