#include "output/json_serializer.hpp"
#include "output/result_writer.hpp"
#include <benchmark/benchmark.h>
#include <chrono>
#include <cstdint>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

using namespace loadgen;

namespace {

auto sample_result(std::uint64_t seq, std::string error) -> Result {
  return Result{.success = error.empty(),
                .latency = std::chrono::microseconds{1234},
                .timestamp = std::chrono::system_clock::now(),
                .seq = seq,
                .error = std::move(error),
                .code = 200};
}

} // namespace

static void BM_Serialization_CsvRecord(benchmark::State &state) {
  auto r = sample_result(12345, "");
  for (auto _ : state) {
    std::string s = format_csv_record(r);
    benchmark::DoNotOptimize(s);
  }
}

// Errors with commas take the quoting path.
static void BM_Serialization_CsvRecordQuoted(benchmark::State &state) {
  auto r = sample_result(12345, "dial tcp 127.0.0.1:80: connect, refused");
  for (auto _ : state) {
    std::string s = format_csv_record(r);
    benchmark::DoNotOptimize(s);
  }
}

static void BM_Serialization_JsonLine(benchmark::State &state) {
  auto r = sample_result(12345, "");
  for (auto _ : state) {
    std::string s = result_to_json_line(r);
    benchmark::DoNotOptimize(s);
  }
}

static void BM_Serialization_WriterBatch(benchmark::State &state) {
  const auto format = static_cast<OutputFormat>(state.range(1));
  std::vector<Result> results;
  for (std::int64_t i = 0; i < state.range(0); ++i) {
    results.push_back(
        sample_result(static_cast<std::uint64_t>(i), i % 10 ? "" : "timeout"));
  }

  for (auto _ : state) {
    std::ostringstream out;
    ResultWriter writer{out, format};
    for (const auto &r : results) {
      if (writer.write(r)) {
        state.SkipWithError("write failed");
        break;
      }
    }
    auto text = out.str();
    benchmark::DoNotOptimize(text);
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}

BENCHMARK(BM_Serialization_CsvRecord);
BENCHMARK(BM_Serialization_CsvRecordQuoted);
BENCHMARK(BM_Serialization_JsonLine);
BENCHMARK(BM_Serialization_WriterBatch)
    ->Args({100, static_cast<int>(OutputFormat::Csv)})
    ->Args({100, static_cast<int>(OutputFormat::JsonLines)})
    ->Args({1000, static_cast<int>(OutputFormat::Csv)})
    ->Args({1000, static_cast<int>(OutputFormat::JsonLines)});

BENCHMARK_MAIN();
