/// @file test_pacer.cpp
/// @brief Unit tests for the constant-rate Pacer.

#include "runner/pacer.hpp"

#include "common/error.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>

using namespace loadgen;
using namespace std::chrono_literals;

TEST(PacerTest, RejectsZeroQps) {
  auto pacer = Pacer::create(0);
  ASSERT_FALSE(pacer.has_value());
  EXPECT_EQ(pacer.error(), errc::invalid_qps);
}

TEST(PacerTest, RejectsQpsBeyondNanosecondResolution) {
  EXPECT_FALSE(Pacer::create(1'000'000'001).has_value());
  EXPECT_TRUE(Pacer::create(1'000'000'000).has_value());
}

TEST(PacerTest, IntervalIsTruncatedNanoseconds) {
  EXPECT_EQ(Pacer::create(100)->interval(), 10ms);
  EXPECT_EQ(Pacer::create(3)->interval(), 333'333'333ns);
}

TEST(PacerTest, FirstRequestWaitsOneInterval) {
  auto pacer = Pacer::create(100).value();
  auto d = pacer.pace(0ns, 0);
  EXPECT_FALSE(d.stop);
  EXPECT_EQ(d.wait, 10ms);
}

TEST(PacerTest, WaitIsMeasuredFromElapsed) {
  auto pacer = Pacer::create(100).value();
  // Request #5 is due at 60ms.
  auto d = pacer.pace(42ms, 5);
  EXPECT_FALSE(d.stop);
  EXPECT_EQ(d.wait, 18ms);
}

TEST(PacerTest, LateWithinTheSecondGivesNonPositiveWait) {
  auto pacer = Pacer::create(100).value();
  // Request #2 was due at 30ms; the caller proceeds immediately.
  auto d = pacer.pace(35ms, 2);
  EXPECT_FALSE(d.stop);
  EXPECT_LE(d.wait.count(), 0);
}

TEST(PacerTest, BehindWholeSecondQuotaSendsImmediately) {
  auto pacer = Pacer::create(100).value();
  // 2.5s in, only 150 sent: quota for 2 whole seconds is 200.
  auto d = pacer.pace(2500ms, 150);
  EXPECT_FALSE(d.stop);
  EXPECT_EQ(d.wait, 0ns);
}

TEST(PacerTest, AheadOfScheduleWaits) {
  auto pacer = Pacer::create(10).value();
  // 10 sent within the first 500ms: #10 is due at 1.1s.
  auto d = pacer.pace(500ms, 10);
  EXPECT_FALSE(d.stop);
  EXPECT_EQ(d.wait, 600ms);
}

TEST(PacerTest, CompletesExactlyQpsWithinOneSecond) {
  auto pacer = Pacer::create(100).value();
  // Simulate a perfectly obedient caller.
  std::chrono::nanoseconds now{0};
  std::uint64_t sent = 0;
  while (true) {
    auto d = pacer.pace(now, sent);
    ASSERT_FALSE(d.stop);
    if (d.wait.count() > 0) {
      now += d.wait;
    }
    if (now > 1s) {
      break;
    }
    ++sent;
  }
  EXPECT_EQ(sent, 100u);
}

TEST(PacerTest, StopsInsteadOfOverflowing) {
  auto pacer = Pacer::create(1'000'000'000).value(); // 1ns interval
  const auto max = static_cast<std::uint64_t>(
      std::numeric_limits<std::int64_t>::max());

  auto d = pacer.pace(1s, max);
  EXPECT_TRUE(d.stop);

  d = pacer.pace(1s, std::numeric_limits<std::uint64_t>::max());
  EXPECT_TRUE(d.stop);
}

TEST(PacerTest, LastRepresentableRequestStillPaces) {
  auto pacer = Pacer::create(1'000'000'000).value();
  const auto max = static_cast<std::uint64_t>(
      std::numeric_limits<std::int64_t>::max());

  auto d = pacer.pace(0ns, max - 1);
  EXPECT_FALSE(d.stop);
  EXPECT_EQ(d.wait.count(), std::numeric_limits<std::int64_t>::max());
}

TEST(PacerTest, FarBehindAtHugeElapsedSendsImmediately) {
  auto pacer = Pacer::create(1'000'000'000).value();
  // Quota near the top of the int64 range, still far ahead of sent.
  auto elapsed =
      std::chrono::nanoseconds{std::numeric_limits<std::int64_t>::max()};
  auto d = pacer.pace(elapsed, 1'000);
  EXPECT_FALSE(d.stop);
  EXPECT_EQ(d.wait, 0ns);
}
