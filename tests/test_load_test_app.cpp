/// @file test_load_test_app.cpp
/// @brief LoadTestApp output handling and SignalWatcher escalation.

#include "app/load_test_app.hpp"
#include "app/signal_watcher.hpp"

#include "common/error.hpp"
#include "runner/runner.hpp"
#include "support/test_http_server.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>

#include <unistd.h>

using namespace loadgen;
using namespace std::chrono_literals;
using loadgen::testing::TestHttpServer;

namespace {

auto temp_path(const char *name) -> std::filesystem::path {
  return std::filesystem::temp_directory_path() /
         (std::string("loadgen_app_") + std::to_string(::getpid()) + "_" +
          name);
}

template <typename Pred> auto wait_until(Pred pred) -> bool {
  const auto deadline = std::chrono::steady_clock::now() + 2s;
  while (!pred()) {
    if (std::chrono::steady_clock::now() > deadline) {
      return false;
    }
    std::this_thread::sleep_for(1ms);
  }
  return true;
}

} // namespace

// ─── LoadTestApp ───────────────────────────────────────────────────────

TEST(LoadTestAppTest, WritesCsvRecordsAndSummary) {
  TestHttpServer server;
  const auto path = temp_path("run.csv");
  LoadTestApp app{server.url(),
                  {.duration = 300ms, .qps = 50, .workers = 2,
                   .autoscale = false},
                  {.file = path.string(), .format = OutputFormat::Csv},
                  nullptr};

  std::ostringstream report;
  auto metrics = app.run(report);
  ASSERT_TRUE(metrics.has_value()) << metrics.error().message();
  EXPECT_GT(metrics->total_requests, 0u);
  EXPECT_EQ(metrics->failed, 0u);

  std::ifstream in(path);
  std::string line;
  std::size_t lines = 0;
  while (std::getline(in, line)) {
    ++lines;
    // timestamp_ns,code,latency_ns,error,seq with an empty error column.
    EXPECT_NE(line.find(",200,"), std::string::npos) << line;
    EXPECT_NE(line.find(",,"), std::string::npos) << line;
  }
  EXPECT_EQ(lines, metrics->total_requests);
  EXPECT_NE(report.str().find("Successful Requests: " +
                              std::to_string(metrics->successful) +
                              ", Failed Requests: 0"),
            std::string::npos);
  std::filesystem::remove(path);
}

TEST(LoadTestAppTest, WritesJsonLines) {
  TestHttpServer server;
  const auto path = temp_path("run.jsonl");
  LoadTestApp app{server.url(),
                  {.duration = 200ms, .qps = 50, .workers = 1,
                   .autoscale = false},
                  {.file = path.string(), .format = OutputFormat::JsonLines},
                  nullptr};

  std::ostringstream report;
  auto metrics = app.run(report);
  ASSERT_TRUE(metrics.has_value());

  std::ifstream in(path);
  std::string line;
  std::size_t lines = 0;
  while (std::getline(in, line)) {
    ++lines;
    auto j = nlohmann::json::parse(line);
    EXPECT_EQ(j["code"].get<int>(), 200);
    EXPECT_TRUE(j.contains("seq"));
  }
  EXPECT_EQ(lines, metrics->total_requests);
  std::filesystem::remove(path);
}

TEST(LoadTestAppTest, UnwritableOutputFailsBeforeAnyRequest) {
  TestHttpServer server;
  LoadTestApp app{server.url(), {.duration = 200ms, .qps = 50},
                  {.file = "/nonexistent-dir/sub/out.csv"}, nullptr};

  std::ostringstream report;
  auto metrics = app.run(report);
  ASSERT_FALSE(metrics.has_value());
  EXPECT_EQ(metrics.error(), std::errc::no_such_file_or_directory);
  EXPECT_EQ(server.request_count(), 0u);
  EXPECT_TRUE(report.str().empty());
}

TEST(LoadTestAppTest, WriteFailureStopsUnboundedRunAndSkipsSummary) {
  if (!std::filesystem::exists("/dev/full")) {
    GTEST_SKIP() << "/dev/full not available";
  }
  TestHttpServer server;
  // No duration: only the write failure can end this run.
  LoadTestApp app{server.url(), {.qps = 50, .workers = 2, .autoscale = false},
                  {.file = "/dev/full"}, nullptr};

  std::ostringstream report;
  const auto start = std::chrono::steady_clock::now();
  auto metrics = app.run(report);
  const auto took = std::chrono::steady_clock::now() - start;

  ASSERT_FALSE(metrics.has_value());
  EXPECT_EQ(metrics.error(), std::errc::io_error);
  EXPECT_LT(took, 5s);
  EXPECT_GE(server.request_count(), 1u);
  EXPECT_TRUE(report.str().empty());
}

TEST(LoadTestAppTest, InvalidConfigurationIsReported) {
  const auto path = temp_path("never.csv");
  LoadTestApp app{"http://127.0.0.1:1/", {.qps = 0},
                  {.file = path.string()}, nullptr};
  std::ostringstream report;
  auto metrics = app.run(report);
  ASSERT_FALSE(metrics.has_value());
  EXPECT_EQ(metrics.error(), errc::invalid_qps);
  std::filesystem::remove(path);
}

// ─── SignalWatcher ─────────────────────────────────────────────────────

TEST(SignalWatcherTest, FirstSignalStopsSecondForcesExit) {
  Runner runner{"http://127.0.0.1:1/", {}};
  std::atomic<int> forced{0};
  SignalWatcher watcher{runner, [&forced](int sig) { forced = sig; }};

  ASSERT_EQ(std::raise(SIGINT), 0);
  ASSERT_TRUE(wait_until([&] { return runner.stopped(); }));
  EXPECT_EQ(forced.load(), 0);

  ASSERT_EQ(std::raise(SIGTERM), 0);
  ASSERT_TRUE(wait_until([&] { return forced.load() != 0; }));
  EXPECT_EQ(forced.load(), SIGTERM);
}

TEST(SignalWatcherTest, SignalStopsRunningLoadTest) {
  TestHttpServer server;
  Runner runner{server.url(), {.qps = 100, .workers = 2, .autoscale = false}};
  auto stream = runner.start_test();
  ASSERT_TRUE(stream.has_value());

  std::atomic<int> forced{0};
  SignalWatcher watcher{runner, [&forced](int sig) { forced = sig; }};

  std::thread interrupter([] {
    std::this_thread::sleep_for(200ms);
    EXPECT_EQ(std::raise(SIGINT), 0);
  });

  std::size_t count = 0;
  while (stream->next()) {
    ++count;
  }
  interrupter.join();

  EXPECT_GT(count, 0u);
  EXPECT_EQ(forced.load(), 0);
}

TEST(SignalWatcherTest, InterruptBeforeStartEndsRunWithoutRequests) {
  TestHttpServer server;
  Runner runner{server.url(), {.qps = 100, .workers = 2, .autoscale = false}};
  SignalWatcher watcher{runner, nullptr};

  ASSERT_EQ(std::raise(SIGINT), 0);
  ASSERT_TRUE(wait_until([&] { return runner.stopped(); }));

  auto stream = runner.start_test();
  ASSERT_TRUE(stream.has_value());
  std::size_t count = 0;
  while (stream->next()) {
    ++count;
  }
  EXPECT_EQ(count, 0u);
  EXPECT_EQ(server.request_count(), 0u);
}
