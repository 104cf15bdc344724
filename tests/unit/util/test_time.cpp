#include <gtest/gtest.h>

#include "tuid/util/time.hpp"
#include "test_helpers.hpp"

using namespace tuid::util;
using namespace tuid::test;
using tuid::ErrorCode;
using namespace std::chrono_literals;

TEST(TimeTest, ToRfc3339NanoPadsFraction) {
  EXPECT_EQ(Time::toRfc3339Nano(makeTimestamp(2021, 3, 8, 5, 54, 9, 208207000)),
            "2021-03-08T05:54:09.208207000Z");
  EXPECT_EQ(Time::toRfc3339Nano(makeTimestamp(2000, 1, 1)), "2000-01-01T00:00:00.000000000Z");
  EXPECT_EQ(Time::toRfc3339Nano(makeTimestamp(2100, 1, 1, 23, 59, 59, 999999999)),
            "2100-01-01T23:59:59.999999999Z");
}

TEST(TimeTest, ToRfc3339NanoBeforeEpoch) {
  EXPECT_EQ(Time::toRfc3339Nano(tuid::Timestamp{-1ns}), "1969-12-31T23:59:59.999999999Z");
}

TEST(TimeTest, FromRfc3339) {
  auto parsed = Time::fromRfc3339("2021-03-08T05:54:09.208207Z");
  ASSERT_OK(parsed);
  EXPECT_EQ(*parsed, makeTimestamp(2021, 3, 8, 5, 54, 9, 208207000));

  auto whole_seconds = Time::fromRfc3339("2000-01-01T00:00:00Z");
  ASSERT_OK(whole_seconds);
  EXPECT_EQ(*whole_seconds, makeTimestamp(2000, 1, 1));

  auto nanos = Time::fromRfc3339("2024-02-29T12:30:00.123456789Z");
  ASSERT_OK(nanos);
  EXPECT_EQ(*nanos, makeTimestamp(2024, 2, 29, 12, 30, 0, 123456789));
}

TEST(TimeTest, FromRfc3339WithOffset) {
  auto east = Time::fromRfc3339("2021-03-08T07:54:09+02:00");
  ASSERT_OK(east);
  EXPECT_EQ(*east, makeTimestamp(2021, 3, 8, 5, 54, 9));

  auto west = Time::fromRfc3339("2021-03-07T23:24:09.5-06:30");
  ASSERT_OK(west);
  EXPECT_EQ(*west, makeTimestamp(2021, 3, 8, 5, 54, 9, 500000000));
}

TEST(TimeTest, FromRfc3339RoundTrip) {
  auto time = makeTimestamp(2033, 7, 4, 18, 1, 2, 3);
  auto parsed = Time::fromRfc3339(Time::toRfc3339Nano(time));
  ASSERT_OK(parsed);
  EXPECT_EQ(*parsed, time);
}

TEST(TimeTest, FromRfc3339Invalid) {
  EXPECT_ERROR(Time::fromRfc3339(""), ErrorCode::kParseError);
  EXPECT_ERROR(Time::fromRfc3339("yesterday"), ErrorCode::kParseError);
  EXPECT_ERROR(Time::fromRfc3339("2021-03-08 05:54:09Z"), ErrorCode::kParseError);
  EXPECT_ERROR(Time::fromRfc3339("2021-03-08T05:54:09"), ErrorCode::kParseError);
  EXPECT_ERROR(Time::fromRfc3339("2021-02-30T00:00:00Z"), ErrorCode::kParseError);
  EXPECT_ERROR(Time::fromRfc3339("2021-03-08T24:00:00Z"), ErrorCode::kParseError);
  EXPECT_ERROR(Time::fromRfc3339("2021-03-08T05:54:09.1234567890Z"), ErrorCode::kParseError);
  EXPECT_ERROR(Time::fromRfc3339("2021-03-08T05:54:09+02:75"), ErrorCode::kParseError);
}

TEST(TimeTest, FromRfc3339OutOfRange) {
  EXPECT_ERROR(Time::fromRfc3339("2600-01-01T00:00:00Z"), ErrorCode::kParseError);
  EXPECT_ERROR(Time::fromRfc3339("3000-01-01T00:00:00Z"), ErrorCode::kParseError);
  EXPECT_ERROR(Time::fromRfc3339("1600-01-01T00:00:00Z"), ErrorCode::kParseError);
  EXPECT_ERROR(Time::fromRfc3339("2262-04-11T23:47:17Z"), ErrorCode::kParseError);
  EXPECT_ERROR(Time::fromRfc3339("2262-04-11T23:47:16.854775808Z"), ErrorCode::kParseError);
  EXPECT_ERROR(Time::fromRfc3339("1677-09-21T00:12:43Z"), ErrorCode::kParseError);

  // An offset can move an in-range local time out of range
  EXPECT_ERROR(Time::fromRfc3339("2262-04-11T23:47:16-01:00"), ErrorCode::kParseError);
}

TEST(TimeTest, FromRfc3339AtRangeLimits) {
  auto latest = Time::fromRfc3339("2262-04-11T23:47:16.854775807Z");
  ASSERT_OK(latest);
  EXPECT_EQ(*latest, tuid::Timestamp::max());

  auto earliest = Time::fromRfc3339("1677-09-21T00:12:44Z");
  ASSERT_OK(earliest);
  EXPECT_EQ(earliest->time_since_epoch().count(), -9223372036000000000LL);
}

TEST(TimeTest, FormatDuration) {
  EXPECT_EQ(Time::formatDuration(0ns), "0s");
  EXPECT_EQ(Time::formatDuration(250ns), "250ns");
  EXPECT_EQ(Time::formatDuration(1500ns), "1.5\xC2\xB5s");
  EXPECT_EQ(Time::formatDuration(1500us), "1.5ms");
  EXPECT_EQ(Time::formatDuration(3s), "3s");
  EXPECT_EQ(Time::formatDuration(60s), "1m0s");
  EXPECT_EQ(Time::formatDuration(1h), "1h0m0s");
  EXPECT_EQ(Time::formatDuration(1h + 2min + 3500ms), "1h2m3.5s");
  EXPECT_EQ(Time::formatDuration(std::chrono::nanoseconds(1922322640879)), "32m2.322640879s");
}

TEST(TimeTest, FormatNegativeDuration) {
  EXPECT_EQ(Time::formatDuration(-1500ms), "-1.5s");
  EXPECT_EQ(Time::formatDuration(-42ns), "-42ns");
  EXPECT_EQ(Time::formatDuration(std::chrono::nanoseconds::min()), "-2562047h47m16.854775808s");
}
