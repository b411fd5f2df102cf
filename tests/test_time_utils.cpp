#include <gtest/gtest.h>

#include "time_utils.hpp"

TEST(TimeUtilsTest, ParsesDateOnlyAsUtcMidnight) {
    const auto ts = parseTimestamp("2021-01-01");
    ASSERT_TRUE(ts.has_value());
    EXPECT_EQ(*ts, 1609459200);
}

TEST(TimeUtilsTest, ParsesDateTime) {
    EXPECT_EQ(parseTimestamp("2021-05-01 00:05:00"), std::optional<int64_t>(1619827500));
    EXPECT_EQ(parseTimestamp("2021-05-01T00:05:00"), std::optional<int64_t>(1619827500));
}

TEST(TimeUtilsTest, RejectsMalformedDates) {
    EXPECT_FALSE(parseTimestamp("").has_value());
    EXPECT_FALSE(parseTimestamp("yesterday").has_value());
    EXPECT_FALSE(parseTimestamp("2021-01-01 garbage").has_value());
}

TEST(TimeUtilsTest, FormatsInUtc) {
    EXPECT_EQ(formatTime(1609459200), "2021-01-01");
    EXPECT_EQ(formatTime(1619827500, "%Y-%m-%d %H:%M:%S"), "2021-05-01 00:05:00");
}

TEST(TimeUtilsTest, FormatAndParseAgree) {
    const int64_t ts = 1700000000;
    EXPECT_EQ(parseTimestamp(formatTime(ts, "%Y-%m-%d %H:%M:%S")), std::optional<int64_t>(ts));
}

TEST(TimeUtilsTest, TimeframeNames) {
    EXPECT_EQ(timeframeToSeconds("1-min"), std::optional<int64_t>(60));
    EXPECT_EQ(timeframeToSeconds("5-min"), std::optional<int64_t>(300));
    EXPECT_EQ(timeframeToSeconds("4-hour"), std::optional<int64_t>(14400));
    EXPECT_EQ(timeframeToSeconds("1-day"), std::optional<int64_t>(86400));
    EXPECT_EQ(timeframeToSeconds("1-week"), std::optional<int64_t>(604800));
    EXPECT_EQ(timeframeToSeconds("1-month"), std::optional<int64_t>(2592000));
}

TEST(TimeUtilsTest, ProviderIntervals) {
    EXPECT_EQ(timeframeToSeconds("15m"), std::optional<int64_t>(900));
    EXPECT_EQ(timeframeToSeconds("1h"), std::optional<int64_t>(3600));
    EXPECT_EQ(timeframeToSeconds("1d"), std::optional<int64_t>(86400));
    EXPECT_EQ(timeframeToSeconds("1wk"), std::optional<int64_t>(604800));
    EXPECT_EQ(timeframeToSeconds("3mo"), std::optional<int64_t>(3 * 2592000));
}

TEST(TimeUtilsTest, UnknownTimeframes) {
    EXPECT_FALSE(timeframeToSeconds("").has_value());
    EXPECT_FALSE(timeframeToSeconds("min").has_value());
    EXPECT_FALSE(timeframeToSeconds("0-min").has_value());
    EXPECT_FALSE(timeframeToSeconds("5-fortnight").has_value());
}
