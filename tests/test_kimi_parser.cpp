#include <gtest/gtest.h>
#include "parsers/KimiParser.hpp"
#include "parsers/ParseHelpers.hpp"

namespace {

const char* kPartialUsage = R"(╭─────────────────────────────── API Usage ───────────────────────────────╮
│  Weekly limit  ━━━━━━━━━━━━━━░░░░░░  75% left  (resets in 5d 12h 30m)   │
│  5h limit      ━━━━━━━░░░░░░░░░░░░░  30% left  (resets in 2h 10m)       │
╰─────────────────────────────────────────────────────────────────────────╯
)";

const char* kUsagesBody = R"({
    "usages": [{
        "scope": "FEATURE_CODING",
        "detail": {
            "limit": "2048",
            "used": "214",
            "remaining": "1834",
            "resetTime": "2025-06-09T00:00:00.000Z"
        },
        "limits": [{
            "window": { "duration": 300, "timeUnit": "TIME_UNIT_MINUTE" },
            "detail": {
                "limit": "200",
                "used": "139",
                "remaining": "61",
                "resetTime": "2025-06-03T15:30:00.000Z"
            }
        }]
    }]
})";

} // namespace

class KimiParserTest : public ::testing::Test {
protected:
    TimePoint now = *ParseHelpers::isoTimestamp("2025-06-01T12:00:00Z");
};

TEST_F(KimiParserTest, CliPanel) {
    auto snap = KimiParser::parseCli(kPartialUsage, now);
    EXPECT_EQ(snap.providerId, "kimi");
    ASSERT_EQ(snap.quotas.size(), 2u);

    EXPECT_DOUBLE_EQ(snap.weeklyQuota()->percentRemaining(), 75);
    EXPECT_EQ(snap.weeklyQuota()->resetText(), "Resets in 5d 12h 30m");
    EXPECT_EQ(snap.weeklyQuota()->resetsAt(),
              now + std::chrono::hours(5 * 24 + 12) + std::chrono::minutes(30));

    EXPECT_DOUBLE_EQ(snap.sessionQuota()->percentRemaining(), 30);
    EXPECT_EQ(snap.sessionQuota()->resetsAt(),
              now + std::chrono::hours(2) + std::chrono::minutes(10));
}

TEST_F(KimiParserTest, CliWeeklyOnlyWithoutBar) {
    auto snap = KimiParser::parseCli(
        "│  Weekly limit                        100% left  (resets in 6d 22h 55m)  │\n", now);
    ASSERT_EQ(snap.quotas.size(), 1u);
    EXPECT_EQ(snap.sessionQuota(), nullptr);
    EXPECT_DOUBLE_EQ(snap.weeklyQuota()->percentRemaining(), 100);
}

TEST_F(KimiParserTest, CliWithoutPercentFails) {
    EXPECT_THROW(KimiParser::parseCli("│  Weekly limit  ━━━━━━━━━━━  no data  │", now), ProbeError);
}

TEST_F(KimiParserTest, UsagesWeeklyAndSessionWindow) {
    auto snap = KimiParser::parseUsages(kUsagesBody, now);
    ASSERT_EQ(snap.quotas.size(), 2u);

    auto* weekly = snap.weeklyQuota();
    EXPECT_NEAR(weekly->percentRemaining(), 1834.0 / 2048.0 * 100.0, 1e-9);
    EXPECT_EQ(weekly->resetText(), "214/2048 requests");
    EXPECT_EQ(weekly->resetsAt(), ParseHelpers::isoTimestamp("2025-06-09T00:00:00Z"));

    auto* session = snap.sessionQuota();
    EXPECT_DOUBLE_EQ(session->percentRemaining(), 30.5);
    EXPECT_EQ(session->resetText(), "139/200 requests (5h)");

    EXPECT_EQ(snap.accountTier, "Moderato");
}

TEST_F(KimiParserTest, UsedOnlyDerivesRemaining) {
    auto snap = KimiParser::parseUsages(R"({"usages": [{
        "scope": "FEATURE_CODING",
        "detail": {"limit": "1024", "used": "256"}
    }]})", now);
    EXPECT_DOUBLE_EQ(snap.weeklyQuota()->percentRemaining(), 75);
    EXPECT_EQ(snap.accountTier, "Andante");
}

TEST_F(KimiParserTest, FirstWindowWhenNoFiveHourWindow) {
    auto snap = KimiParser::parseUsages(R"({"usages": [{
        "scope": "FEATURE_CODING",
        "detail": {"limit": "7168", "remaining": "7168"},
        "limits": [{"window": {"duration": 60, "timeUnit": "TIME_UNIT_MINUTE"},
                    "detail": {"limit": "50", "remaining": "10"}}]
    }]})", now);
    EXPECT_DOUBLE_EQ(snap.sessionQuota()->percentRemaining(), 20);
    EXPECT_EQ(snap.accountTier, "Allegretto");
}

TEST_F(KimiParserTest, MissingCodingScope) {
    EXPECT_THROW(KimiParser::parseUsages(R"({"usages": [{"scope": "FEATURE_OTHER"}]})", now),
                 ProbeError);
    EXPECT_THROW(KimiParser::parseUsages("[]", now), ProbeError);
}

TEST_F(KimiParserTest, TierForLimit) {
    EXPECT_EQ(KimiParser::tierForLimit(1024), "Andante");
    EXPECT_EQ(KimiParser::tierForLimit(2048), "Moderato");
    EXPECT_EQ(KimiParser::tierForLimit(7168), "Allegretto");
    EXPECT_EQ(KimiParser::tierForLimit(5), "");
}
