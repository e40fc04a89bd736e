/// @file test_duration.cpp
/// @brief Unit tests for duration parsing and formatting.

#include "config/duration.hpp"

#include "common/error.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>

using namespace loadgen;
using namespace std::chrono_literals;

TEST(DurationTest, ParsesSingleUnits) {
  EXPECT_EQ(parse_duration("5ns").value(), 5ns);
  EXPECT_EQ(parse_duration("7us").value(), 7us);
  EXPECT_EQ(parse_duration("7\xC2\xB5s").value(), 7us);
  EXPECT_EQ(parse_duration("7\xCE\xBCs").value(), 7us);
  EXPECT_EQ(parse_duration("250ms").value(), 250ms);
  EXPECT_EQ(parse_duration("30s").value(), 30s);
  EXPECT_EQ(parse_duration("2m").value(), 2min);
  EXPECT_EQ(parse_duration("3h").value(), 3h);
}

TEST(DurationTest, ParsesCompoundAndFractional) {
  EXPECT_EQ(parse_duration("1m30s").value(), 90s);
  EXPECT_EQ(parse_duration("1h2m3s").value(), 1h + 2min + 3s);
  EXPECT_EQ(parse_duration("1.5s").value(), 1500ms);
  EXPECT_EQ(parse_duration(".5s").value(), 500ms);
  EXPECT_EQ(parse_duration("1.s").value(), 1s);
  EXPECT_EQ(parse_duration("0.001ms").value(), 1us);
}

TEST(DurationTest, ParsesSignsAndBareZero) {
  EXPECT_EQ(parse_duration("0").value(), 0ns);
  EXPECT_EQ(parse_duration("+0").value(), 0ns);
  EXPECT_EQ(parse_duration("-0").value(), 0ns);
  EXPECT_EQ(parse_duration("+10s").value(), 10s);
  EXPECT_EQ(parse_duration("-1.5h").value(), -90min);
}

TEST(DurationTest, RejectsBadSyntax) {
  for (const char *bad : {"", "-", "10", "s", ".s", "1x", "1.2.3s", "1 s",
                          "ms10", "1sec"}) {
    auto d = parse_duration(bad);
    ASSERT_FALSE(d.has_value()) << bad;
    EXPECT_EQ(d.error(), errc::invalid_duration) << bad;
  }
}

TEST(DurationTest, RejectsOverflow) {
  EXPECT_FALSE(parse_duration("9223372036854775808ns").has_value());
  EXPECT_FALSE(parse_duration("3000000h").has_value());
  EXPECT_FALSE(parse_duration("2562047h48m").has_value());
  EXPECT_EQ(parse_duration("9223372036854775807ns").value().count(),
            std::numeric_limits<std::int64_t>::max());
}

TEST(DurationTest, FormatsLikeItParses) {
  EXPECT_EQ(format_duration(0ns), "0s");
  EXPECT_EQ(format_duration(999ns), "999ns");
  EXPECT_EQ(format_duration(1500ns), "1.5\xC2\xB5s");
  EXPECT_EQ(format_duration(1500us), "1.5ms");
  EXPECT_EQ(format_duration(1234567ns), "1.234567ms");
  EXPECT_EQ(format_duration(30s), "30s");
  EXPECT_EQ(format_duration(90s), "1m30s");
  EXPECT_EQ(format_duration(1h), "1h0m0s");
  EXPECT_EQ(format_duration(-2500ms), "-2.5s");
}

TEST(DurationTest, FormatsExtremes) {
  EXPECT_EQ(format_duration(std::chrono::nanoseconds{
                std::numeric_limits<std::int64_t>::min()}),
            "-2562047h47m16.854775808s");
  EXPECT_EQ(format_duration(std::chrono::nanoseconds{
                std::numeric_limits<std::int64_t>::max()}),
            "2562047h47m16.854775807s");
}

TEST(DurationTest, FormattedValuesParseBack) {
  for (std::chrono::nanoseconds d :
       std::initializer_list<std::chrono::nanoseconds>{1ns, 1500ns, 42ms, 90s,
                                                       3h + 5s}) {
    EXPECT_EQ(parse_duration(format_duration(d)).value(), d);
  }
}
