#include "tsync/core/time.hpp"

#include <gtest/gtest.h>

using tsync::TimeZone;

TEST(TimeTest, Iso8601InUtc) {
    const auto tp = tsync::from_unix_seconds(1714566600);  // 2024-05-01 12:30:00 UTC
    EXPECT_EQ(tsync::to_iso8601(tp, TimeZone::Utc), "2024-05-01T12:30:00Z");
    EXPECT_EQ(tsync::format_time(tp, "%Y-%m-%d %H:%M", TimeZone::Utc), "2024-05-01 12:30");
}

TEST(TimeTest, CalendarRoundTripNormalisesOverflow) {
    const auto tp = tsync::from_unix_seconds(1714566600);
    std::tm fields = tsync::to_calendar(tp, TimeZone::Utc);
    fields.tm_min += 30;  // 13:00

    const auto shifted = tsync::from_calendar(fields, TimeZone::Utc);
    ASSERT_TRUE(shifted.has_value());
    EXPECT_EQ(tsync::to_unix_seconds(*shifted), 1714566600 + 1800);
}

TEST(TimeTest, ParsesTimeZoneNames) {
    EXPECT_EQ(tsync::parse_time_zone("utc"), TimeZone::Utc);
    EXPECT_EQ(tsync::parse_time_zone("local"), TimeZone::Local);
    EXPECT_FALSE(tsync::parse_time_zone("Mars/Olympus").has_value());
}
