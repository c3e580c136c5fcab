#include <gtest/gtest.h>
#include <core/time_utils.hpp>

TEST(TimeUtils, FormatDurationEmpty) {
    EXPECT_EQ(format_duration(""), "-");
}

TEST(TimeUtils, FormatDurationBadParse) {
    EXPECT_EQ(format_duration("not-a-date"), "?");
}

TEST(TimeUtils, FormatDurationMinutes) {
    EXPECT_EQ(format_duration("2025-01-15T10:00:00", "2025-01-15T10:05:30"), "5m30s");
}

TEST(TimeUtils, FormatDurationHours) {
    EXPECT_EQ(format_duration("2025-01-15T10:00:00", "2025-01-15T12:15:00"), "2h15m");
}

TEST(TimeUtils, FormatTimestampNormal) {
    EXPECT_EQ(format_timestamp("2025-01-15T14:35:22"), "2:35pm");
}

TEST(TimeUtils, FormatTimestampMidnight) {
    EXPECT_EQ(format_timestamp("2025-01-15T00:00:00"), "12:00am");
}

// ── format_short_datetime ───────────────────────────────────

TEST(TimeUtils, ShortDatetimeEmpty) {
    EXPECT_EQ(format_short_datetime(""), "-");
}

TEST(TimeUtils, ShortDatetimeBadParse) {
    EXPECT_EQ(format_short_datetime("yesterday"), "?");
}

TEST(TimeUtils, ShortDatetimeAfternoon) {
    EXPECT_EQ(format_short_datetime("2025-01-15T14:35:22"), "1/15/25 2:35pm");
}

TEST(TimeUtils, ShortDatetimeMorning) {
    EXPECT_EQ(format_short_datetime("2024-11-03T09:05:00"), "11/3/24 9:05am");
}

// ── format_until ────────────────────────────────────────────

TEST(TimeUtils, UntilPastIsNow) {
    auto now = std::chrono::system_clock::now();
    EXPECT_EQ(format_until(now - std::chrono::seconds(5), now), "now");
    EXPECT_EQ(format_until(now, now), "now");
}

TEST(TimeUtils, UntilSeconds) {
    auto now = std::chrono::system_clock::now();
    EXPECT_EQ(format_until(now + std::chrono::seconds(45), now), "in 45s");
}

TEST(TimeUtils, UntilHours) {
    auto now = std::chrono::system_clock::now();
    EXPECT_EQ(format_until(now + std::chrono::hours(2) + std::chrono::minutes(15), now), "in 2h15m");
}

// ── ISO round trip ──────────────────────────────────────────

TEST(TimeUtils, IsoRoundTrip) {
    std::time_t t = parse_iso_time("2025-03-01T08:30:00");
    ASSERT_NE(t, 0);
    EXPECT_EQ(to_iso(std::chrono::system_clock::from_time_t(t)), "2025-03-01T08:30:00");
}

TEST(TimeUtils, IsoParseFailure) {
    EXPECT_EQ(parse_iso_time("garbage"), 0);
    EXPECT_EQ(parse_iso_time(""), 0);
}
