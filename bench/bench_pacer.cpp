#include "runner/pacer.hpp"
#include <benchmark/benchmark.h>
#include <chrono>
#include <cstdint>

using namespace loadgen;

// Cost of one pacing decision on the dispatcher's hot path.
static void BM_Pacer_Decision(benchmark::State &state) {
  auto pacer = Pacer::create(static_cast<std::uint64_t>(state.range(0))).value();
  std::chrono::nanoseconds elapsed{0};
  std::uint64_t sent = 0;
  for (auto _ : state) {
    auto d = pacer.pace(elapsed, sent);
    benchmark::DoNotOptimize(d);
    elapsed += std::chrono::microseconds{10};
    ++sent;
  }
}

BENCHMARK(BM_Pacer_Decision)->Arg(100)->Arg(10'000)->Arg(1'000'000);

BENCHMARK_MAIN();
