#include <gtest/gtest.h>
#include "parsers/ParseHelpers.hpp"
#include "parsers/ZoneClock.hpp"
#include "process/ChildProcess.hpp"
#include <algorithm>
#include <atomic>
#include <cstdint>
#include <cstdlib>
#include <thread>

using namespace std::chrono;

class ParseHelpersTest : public ::testing::Test {
protected:
    // 2025-06-15 12:00 UTC
    TimePoint now = *ParseHelpers::isoTimestamp("2025-06-15T12:00:00Z");

    static TimePoint at(const char* iso) { return *ParseHelpers::isoTimestamp(iso); }
};

TEST_F(ParseHelpersTest, TrimAndLower) {
    EXPECT_EQ(ParseHelpers::trim("  \tvalue \r\n"), "value");
    EXPECT_EQ(ParseHelpers::trim("   "), "");
    EXPECT_EQ(ParseHelpers::toLower("Current WEEK"), "current week");
    EXPECT_TRUE(ParseHelpers::containsIgnoreCase("Not Logged In", "not logged in"));
}

TEST_F(ParseHelpersTest, SplitLinesDropsCarriageReturns) {
    auto lines = ParseHelpers::splitLines("a\r\nb\nc");
    ASSERT_EQ(lines.size(), 3);
    EXPECT_EQ(lines[0], "a");
    EXPECT_EQ(lines[2], "c");
}

TEST_F(ParseHelpersTest, StripAnsi) {
    EXPECT_EQ(ParseHelpers::stripAnsi("\x1b[1;31mred\x1b[0m \x1b]0;title\x07ok"), "red ok");
}

TEST_F(ParseHelpersTest, PercentRemaining) {
    EXPECT_EQ(ParseHelpers::percentRemaining("65% left"), 65.0);
    EXPECT_EQ(ParseHelpers::percentRemaining("\xe2\x96\x88\xe2\x96\x88 25% used"), 75.0);
    EXPECT_EQ(ParseHelpers::percentRemaining("12.5 % remaining"), 12.5);
    EXPECT_FALSE(ParseHelpers::percentRemaining("no numbers here").has_value());
}

TEST_F(ParseHelpersTest, DurationSeconds) {
    EXPECT_EQ(ParseHelpers::durationSeconds("2h 15m"), 8100.0);
    EXPECT_EQ(ParseHelpers::durationSeconds("6d 23h 22m"), 6 * 86400.0 + 23 * 3600.0 + 22 * 60.0);
    EXPECT_NEAR(*ParseHelpers::durationSeconds("6m 19.7s"), 379.7, 1e-9);
    EXPECT_EQ(ParseHelpers::durationSeconds("30 minutes"), 1800.0);
    EXPECT_FALSE(ParseHelpers::durationSeconds("soon").has_value());
}

TEST_F(ParseHelpersTest, RelativeResetWithinTolerance) {
    auto reset = ParseHelpers::relativeResetTime("Resets in 2h 15m", now);
    ASSERT_TRUE(reset.has_value());
    EXPECT_LE(std::abs(duration_cast<seconds>(*reset - (now + minutes(135))).count()), 1);
}

TEST_F(ParseHelpersTest, RelativeIgnoresAbsolutePhrasing) {
    EXPECT_FALSE(ParseHelpers::relativeResetTime("Resets 4:59pm (America/New_York)", now));
}

TEST_F(ParseHelpersTest, AbsoluteTimeInNamedZone) {
    // 08:00 in New York, so 4:59pm is later the same day
    auto reset = ParseHelpers::absoluteResetTime("Resets 4:59pm (America/New_York)", now);
    ASSERT_TRUE(reset.has_value());
    EXPECT_EQ(*reset, at("2025-06-15T20:59:00Z"));
}

TEST_F(ParseHelpersTest, AbsoluteTimeAlreadyPassedRollsToTomorrow) {
    // 21:00 in Tokyo, 3pm has passed
    auto reset = ParseHelpers::absoluteResetTime("Resets 3pm (Asia/Tokyo)", now);
    ASSERT_TRUE(reset.has_value());
    EXPECT_EQ(*reset, at("2025-06-16T06:00:00Z"));
}

TEST_F(ParseHelpersTest, SameWallClockInTwoZonesDiffers) {
    auto paris = ParseHelpers::absoluteResetTime("Resets 3pm (Europe/Paris)", now);
    auto tokyo = ParseHelpers::absoluteResetTime("Resets 3pm (Asia/Tokyo)", now);
    ASSERT_TRUE(paris && tokyo);
    EXPECT_NE(*paris, *tokyo);
    EXPECT_EQ(*paris, at("2025-06-15T13:00:00Z"));
}

TEST_F(ParseHelpersTest, AbsoluteDateWithTime) {
    auto reset = ParseHelpers::absoluteResetTime("Resets Dec 25 at 4:59am (Asia/Shanghai)", now);
    ASSERT_TRUE(reset.has_value());
    EXPECT_EQ(*reset, at("2025-12-24T20:59:00Z"));
}

TEST_F(ParseHelpersTest, AbsoluteDateEarlierInYearRollsToNextYear) {
    auto reset = ParseHelpers::absoluteResetTime("Resets Jan 3 (UTC)", now);
    ASSERT_TRUE(reset.has_value());
    EXPECT_EQ(*reset, at("2026-01-03T00:00:00Z"));
}

TEST_F(ParseHelpersTest, AbsoluteDateWithYearUsesLocalZone) {
    auto reset = ParseHelpers::absoluteResetTime("Resets Jan 1, 2026", now);
    ASSERT_TRUE(reset.has_value());
    EXPECT_EQ(*reset, ZoneClock().toInstant(2026, 1, 1, 0, 0));
}

TEST_F(ParseHelpersTest, ResetTimePrefersRelative) {
    auto reset = ParseHelpers::resetTime("Resets in 30m", now);
    ASSERT_TRUE(reset.has_value());
    EXPECT_EQ(*reset, now + minutes(30));
    EXPECT_FALSE(ParseHelpers::resetTime("Resets whenever", now).has_value());
}

TEST_F(ParseHelpersTest, Money) {
    EXPECT_EQ(ParseHelpers::money("$1,234.56"), 1234.56);
    EXPECT_EQ(ParseHelpers::money("1234.56"), 1234.56);
    EXPECT_EQ(ParseHelpers::money("$0.55"), 0.55);
    EXPECT_FALSE(ParseHelpers::money("free").has_value());
}

TEST_F(ParseHelpersTest, CostLine) {
    auto cost = ParseHelpers::costLine("$5.41 / $20.00 spent \xc2\xb7 Resets Jan 1 Resets Jan 1");
    ASSERT_TRUE(cost.has_value());
    EXPECT_DOUBLE_EQ(cost->spent, 5.41);
    EXPECT_DOUBLE_EQ(*cost->budget, 20.0);
    EXPECT_EQ(cost->resetText, "Resets Jan 1");
}

TEST_F(ParseHelpersTest, CentsToDollars) {
    EXPECT_DOUBLE_EQ(ParseHelpers::centsToDollars(2672), 26.72);
    EXPECT_DOUBLE_EQ(ParseHelpers::centsToDollars(0), 0.0);
}

TEST_F(ParseHelpersTest, CollapseRepeat) {
    EXPECT_EQ(ParseHelpers::collapseRepeat("Resets 5pmResets 5pm"), "Resets 5pm");
    EXPECT_EQ(ParseHelpers::collapseRepeat("Resets 5pm  Resets 5pm"), "Resets 5pm");
    EXPECT_EQ(ParseHelpers::collapseRepeat("Resets 5pm (UTC)"), "Resets 5pm (UTC)");
}

TEST_F(ParseHelpersTest, IsoTimestamps) {
    EXPECT_EQ(at("2025-01-15T14:30:00+02:00"), at("2025-01-15T12:30:00Z"));
    EXPECT_EQ(at("2025-01-15T14:30:00.500Z") - at("2025-01-15T14:30:00Z"), milliseconds(500));
    EXPECT_EQ(ParseHelpers::fromEpochMillis(1736951400000), at("2025-01-15T14:30:00Z"));
    EXPECT_FALSE(ParseHelpers::isoTimestamp("yesterday").has_value());
}

TEST_F(ParseHelpersTest, RoundTo) {
    EXPECT_DOUBLE_EQ(ParseHelpers::roundTo(66.66666, 2), 66.67);
    EXPECT_DOUBLE_EQ(ParseHelpers::roundTo(12.5, 0), 13.0);
}

TEST_F(ParseHelpersTest, DetectCliError) {
    auto trust = ParseHelpers::detectCliError("Do you trust the files in this folder?");
    ASSERT_TRUE(trust.has_value());
    EXPECT_EQ(trust->kind(), ProbeErrorKind::FolderTrustRequired);

    auto expired = ParseHelpers::detectCliError("OAuth token_expired");
    ASSERT_TRUE(expired.has_value());
    EXPECT_EQ(expired->kind(), ProbeErrorKind::SessionExpired);
    EXPECT_STREQ(expired->what(), "Session expired. Run `claude` in terminal to log in again.");
    EXPECT_EQ(ParseHelpers::detectCliError("Not logged in. Please run /login")->kind(),
              ProbeErrorKind::AuthenticationRequired);
    EXPECT_EQ(ParseHelpers::detectCliError("/usage is only available for subscription plans")->kind(),
              ProbeErrorKind::SubscriptionRequired);
    EXPECT_FALSE(ParseHelpers::detectCliError("Current session 4% used").has_value());
}

TEST(ZoneClockTest, UnknownZoneFallsBackToLocal) {
    ZoneClock bogus("Mars/Olympus_Mons");
    EXPECT_FALSE(bogus.isKnownZone());
    EXPECT_EQ(bogus.toInstant(2025, 3, 1, 9, 0), ZoneClock().toInstant(2025, 3, 1, 9, 0));
}

TEST(ZoneClockTest, RejectsPathTraversal) {
    EXPECT_FALSE(ZoneClock::zoneExists("../../etc/passwd"));
    EXPECT_FALSE(ZoneClock::zoneExists("/etc/passwd"));
    EXPECT_TRUE(ZoneClock::zoneExists("Europe/Paris"));
}

TEST(ZoneClockTest, WallClockInZone) {
    ZoneClock tokyo("Asia/Tokyo");
    auto tm = tokyo.wallClock(*ParseHelpers::isoTimestamp("2025-06-15T12:00:00Z"));
    EXPECT_EQ(tm.tm_hour, 21);
    EXPECT_EQ(tm.tm_mday, 15);
}

TEST(ZoneClockTest, FollowsDaylightSaving) {
    ZoneClock ny("America/New_York");
    ASSERT_TRUE(ny.isKnownZone());
    EXPECT_EQ(ny.toInstant(2026, 1, 1, 12, 0), *ParseHelpers::isoTimestamp("2026-01-01T17:00:00Z"));
    EXPECT_EQ(ny.toInstant(2026, 7, 1, 12, 0), *ParseHelpers::isoTimestamp("2026-07-01T16:00:00Z"));

    auto summer = ny.wallClock(*ParseHelpers::isoTimestamp("2026-07-01T16:00:00Z"));
    EXPECT_EQ(summer.tm_hour, 12);
    EXPECT_EQ(summer.tm_isdst, 1);
}

TEST(ZoneClockTest, RuleAppliesPastListedTransitions) {
    ZoneClock ny("America/New_York");
    EXPECT_EQ(ny.toInstant(2040, 7, 1, 12, 0), *ParseHelpers::isoTimestamp("2040-07-01T16:00:00Z"));
    EXPECT_EQ(ny.toInstant(2040, 12, 1, 12, 0), *ParseHelpers::isoTimestamp("2040-12-01T17:00:00Z"));

    // Southern hemisphere: daylight time spans the new year
    ZoneClock sydney("Australia/Sydney");
    EXPECT_EQ(sydney.toInstant(2040, 1, 15, 12, 0), *ParseHelpers::isoTimestamp("2040-01-15T01:00:00Z"));
    EXPECT_EQ(sydney.toInstant(2040, 7, 15, 12, 0), *ParseHelpers::isoTimestamp("2040-07-15T02:00:00Z"));
}

TEST(ZoneClockTest, ConcurrentConversionsLeaveEnvironmentAlone) {
    const char* tzBefore = std::getenv("TZ");
    std::string expectedTz = tzBefore ? tzBefore : "";
    bool hadTz = tzBefore != nullptr;

    TimePoint nyNoon    = *ParseHelpers::isoTimestamp("2026-01-01T17:00:00Z");
    TimePoint tokyoNine = *ParseHelpers::isoTimestamp("2026-01-01T00:00:00Z");

    std::atomic<int> wrong{0};
    std::atomic<bool> done{false};
    std::thread a([&] {
        ZoneClock ny("America/New_York");
        for (int i = 0; i < 2000; ++i)
            if (ny.toInstant(2026, 1, 1, 12, 0) != nyNoon) wrong++;
    });
    std::thread b([&] {
        ZoneClock tokyo("Asia/Tokyo");
        for (int i = 0; i < 2000; ++i)
            if (tokyo.toInstant(2026, 1, 1, 9, 0) != tokyoNine) wrong++;
    });

    int envChanges = 0;
    std::thread watcher([&] {
        while (!done) {
            const char* tz = std::getenv("TZ");
            if ((tz != nullptr) != hadTz || (tz && expectedTz != tz)) envChanges++;
        }
    });

    a.join();
    b.join();
    done = true;
    watcher.join();

    EXPECT_EQ(wrong.load(), 0);
    EXPECT_EQ(envChanges, 0);
}

TEST(ZoneClockTest, ConversionsRaceChildEnvironmentBuild) {
    TimePoint nyNoon = *ParseHelpers::isoTimestamp("2026-01-01T17:00:00Z");
    ChildProcess::buildEnvironment({});   // resolve the cached shell PATH up front

    std::atomic<int> wrong{0};
    std::thread converter([&] {
        ZoneClock ny("America/New_York");
        for (int i = 0; i < 2000; ++i)
            if (ny.toInstant(2026, 1, 1, 12, 0) != nyNoon) wrong++;
    });

    size_t shortest = SIZE_MAX;
    for (int i = 0; i < 2000; ++i)
        shortest = std::min(shortest, ChildProcess::buildEnvironment({}).size());
    converter.join();

    EXPECT_EQ(wrong.load(), 0);
    EXPECT_GT(shortest, 0u);
}
