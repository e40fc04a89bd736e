#include "runner/channel.hpp"
#include <benchmark/benchmark.h>
#include <thread>
#include <vector>

using namespace loadgen;

// Hand-off cost between the dispatcher and N consumers, the way ticks flow.
static void BM_Channel_Rendezvous(benchmark::State &state) {
  const auto consumers = static_cast<int>(state.range(0));
  for (auto _ : state) {
    state.PauseTiming();
    Channel<int> ch;
    std::vector<std::thread> threads;
    for (int i = 0; i < consumers; ++i) {
      threads.emplace_back([&ch] {
        while (ch.receive()) {
        }
      });
    }
    state.ResumeTiming();

    for (int i = 0; i < 10'000; ++i) {
      if (!ch.send(i)) {
        state.SkipWithError("channel closed early");
        break;
      }
    }

    state.PauseTiming();
    ch.close();
    for (auto &t : threads) {
      t.join();
    }
    state.ResumeTiming();
  }
  state.SetItemsProcessed(state.iterations() * 10'000);
}

// The autoscale check when nobody is parked.
static void BM_Channel_TrySendNoReceiver(benchmark::State &state) {
  Channel<int> ch;
  for (auto _ : state) {
    bool sent = ch.try_send(1);
    benchmark::DoNotOptimize(sent);
  }
}

BENCHMARK(BM_Channel_Rendezvous)->Arg(1)->Arg(4)->Arg(16)->UseRealTime();
BENCHMARK(BM_Channel_TrySendNoReceiver);

BENCHMARK_MAIN();
