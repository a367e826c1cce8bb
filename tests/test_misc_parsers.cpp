#include <gtest/gtest.h>
#include "parsers/AmpCodeParser.hpp"
#include "parsers/CopilotParser.hpp"
#include "parsers/CursorParser.hpp"
#include "parsers/KiroParser.hpp"
#include "parsers/MiniMaxParser.hpp"
#include "parsers/ParseHelpers.hpp"
#include "parsers/ZoneClock.hpp"
#include <functional>

namespace {

// header {"alg":"HS256"}, payload {"sub":"auth0|user_123","exp":1900000000}
const std::string kCursorJwt =
    "eyJhbGciOiJIUzI1NiJ9.eyJzdWIiOiJhdXRoMHx1c2VyXzEyMyIsImV4cCI6MTkwMDAwMDAwMH0.c2ln";

ProbeErrorKind errorKind(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const ProbeError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected ProbeError";
    return ProbeErrorKind::ParseFailed;
}

} // namespace

class MiscParserTest : public ::testing::Test {
protected:
    TimePoint now = *ParseHelpers::isoTimestamp("2025-06-15T12:00:00Z");
};

// ── Kiro ──────────────────────────────────────────────────────────────────

TEST_F(MiscParserTest, KiroBonusAndPlanCredits) {
    std::string text =
        "\x1b[1mBonus credits:\x1b[0m 143.31/500 credits used, expires in 12 days\n"
        "Credits (12.50 of 50 covered in plan), resets on 03/01\n";
    auto snap = KiroParser::parse(text, now);
    EXPECT_EQ(snap.providerId, "kiro");
    ASSERT_EQ(snap.quotas.size(), 2u);

    auto* bonus = snap.weeklyQuota();
    ASSERT_NE(bonus, nullptr);
    EXPECT_NEAR(bonus->percentRemaining(), (500 - 143.31) / 500 * 100, 1e-9);
    EXPECT_EQ(bonus->resetsAt(), now + std::chrono::hours(24 * 12));
    EXPECT_EQ(bonus->resetText(), "Expires in 12 days");

    auto* plan = snap.quota(QuotaType::timeLimit("Monthly"));
    ASSERT_NE(plan, nullptr);
    EXPECT_DOUBLE_EQ(plan->percentRemaining(), 75);
    EXPECT_EQ(plan->resetText(), "Resets on 03/01");
    // March 1st has passed in 2025, so it rolls over
    EXPECT_EQ(plan->resetsAt(), ZoneClock().toInstant(2026, 3, 1, 0, 0));
}

TEST_F(MiscParserTest, KiroPlanResetLaterThisYear) {
    auto snap = KiroParser::parse("Credits (0.00 of 50 covered in plan), resets on 07/01\n", now);
    EXPECT_EQ(snap.quotas.front().resetsAt(), ZoneClock().toInstant(2025, 7, 1, 0, 0));
    EXPECT_DOUBLE_EQ(snap.quotas.front().percentRemaining(), 100);
}

TEST_F(MiscParserTest, KiroWithoutCreditsFails) {
    EXPECT_EQ(errorKind([&] { KiroParser::parse("Welcome to Kiro\n", now); }),
              ProbeErrorKind::ParseFailed);
}

// ── Amp ───────────────────────────────────────────────────────────────────

TEST_F(MiscParserTest, AmpUsage) {
    std::string text =
        "Signed in as user@example.com (someone)\n"
        "Amp Free: $17.59/$20 remaining (replenishes +$0.83/hour) - https://ampcode.com/settings#amp-free\n"
        "Individual credits: $0 remaining - https://ampcode.com/settings\n";
    auto snap = AmpCodeParser::parse(text, now);

    EXPECT_EQ(snap.providerId, "ampcode");
    EXPECT_EQ(snap.accountEmail, "user@example.com");
    EXPECT_EQ(snap.accountTier, "Free");
    ASSERT_EQ(snap.quotas.size(), 1u);
    EXPECT_EQ(snap.quotas[0].quotaType(), QuotaType::modelSpecific("Amp Free"));
    EXPECT_DOUBLE_EQ(snap.quotas[0].percentRemaining(), 87.95);
    EXPECT_EQ(snap.quotas[0].resetText(), "Replenishes +$0.83/hour");
}

TEST_F(MiscParserTest, AmpWithoutCreditLinesFails) {
    EXPECT_EQ(errorKind([&] {
                  AmpCodeParser::parse("Signed in as user@example.com (someone)\n"
                                       "Individual credits: $0 remaining\n",
                                       now);
              }),
              ProbeErrorKind::ParseFailed);
}

// ── Cursor ────────────────────────────────────────────────────────────────

TEST_F(MiscParserTest, CursorUsageSummary) {
    auto snap = CursorParser::parseUsageSummary(R"({
        "billingCycleStart": "2025-06-01T00:00:00.000Z",
        "billingCycleEnd": "2025-07-01T00:00:00.000Z",
        "membershipType": "pro",
        "individualUsage": {
            "plan": {"enabled": true, "used": 120, "limit": 500},
            "onDemand": {"enabled": true, "used": 5, "limit": 20}
        }
    })", now);

    EXPECT_EQ(snap.providerId, "cursor");
    EXPECT_EQ(snap.accountTier, "PRO");
    ASSERT_EQ(snap.quotas.size(), 2u);

    auto* plan = snap.quota(QuotaType::timeLimit("Monthly"));
    ASSERT_NE(plan, nullptr);
    EXPECT_DOUBLE_EQ(plan->percentRemaining(), 76);
    EXPECT_EQ(plan->resetText(), "120/500 requests");
    EXPECT_EQ(plan->resetsAt(), ParseHelpers::isoTimestamp("2025-07-01T00:00:00Z"));

    auto* onDemand = snap.quota(QuotaType::timeLimit("On-Demand"));
    ASSERT_NE(onDemand, nullptr);
    EXPECT_DOUBLE_EQ(onDemand->percentRemaining(), 75);
}

TEST_F(MiscParserTest, CursorUnlimitedAndDisabled) {
    auto snap = CursorParser::parseUsageSummary(R"({
        "isUnlimited": true,
        "individualUsage": {"plan": {"enabled": false, "used": 1, "limit": 2}}
    })", now);
    ASSERT_EQ(snap.quotas.size(), 1u);
    EXPECT_EQ(snap.quotas[0].resetText(), "Unlimited");
    EXPECT_EQ(snap.accountTier, "UNKNOWN");
}

TEST_F(MiscParserTest, CursorErrors) {
    EXPECT_EQ(errorKind([&] { CursorParser::parseUsageSummary("<html>", now); }),
              ProbeErrorKind::ParseFailed);
    EXPECT_EQ(errorKind([&] { CursorParser::parseUsageSummary("{}", now); }),
              ProbeErrorKind::ParseFailed);
}

TEST_F(MiscParserTest, CursorJwtSubject) {
    EXPECT_EQ(CursorParser::userIdFromJwt(kCursorJwt), "auth0|user_123");
    EXPECT_EQ(CursorParser::sessionCookie(kCursorJwt),
              "WorkosCursorSessionToken=auth0|user_123%3A%3A" + kCursorJwt);
}

TEST_F(MiscParserTest, CursorJwtWithoutSubject) {
    EXPECT_THROW(CursorParser::userIdFromJwt("not-a-jwt"), ProbeError);
    // payload {"exp":1}
    EXPECT_THROW(CursorParser::userIdFromJwt("eyJhbGciOiJIUzI1NiJ9.eyJleHAiOjF9.c2ln"), ProbeError);
}

TEST_F(MiscParserTest, CursorTier) {
    EXPECT_EQ(CursorParser::tierFor("pro"), "PRO");
    EXPECT_EQ(CursorParser::tierFor("free_trial"), "FREE_TRIAL");
    EXPECT_EQ(CursorParser::tierFor(""), "");
}

// ── MiniMax ───────────────────────────────────────────────────────────────

TEST_F(MiscParserTest, MiniMaxRemainsCountIsRemaining) {
    auto snap = MiniMaxParser::parse(R"({
        "model_remains": [{
            "model_name": "MiniMax-M2",
            "start_time": 1749970800000,
            "end_time": 1749988800000,
            "current_interval_total_count": 1500,
            "current_interval_usage_count": 1200
        }],
        "base_resp": {"status_code": 0, "status_msg": "success"}
    })", "minimax", now);

    EXPECT_EQ(snap.providerId, "minimax");
    ASSERT_EQ(snap.quotas.size(), 1u);
    EXPECT_EQ(snap.quotas[0].quotaType(), QuotaType::modelSpecific("MiniMax-M2"));
    EXPECT_DOUBLE_EQ(snap.quotas[0].percentRemaining(), 80);
    EXPECT_EQ(snap.quotas[0].resetText(), "300/1500 requests");
    EXPECT_EQ(snap.quotas[0].resetsAt(), ParseHelpers::fromEpochMillis(1749988800000));
}

TEST_F(MiscParserTest, MiniMaxErrors) {
    EXPECT_EQ(errorKind([&] {
                  MiniMaxParser::parse(
                      R"({"base_resp": {"status_code": 1004, "status_msg": "login fail"}})",
                      "minimax", now);
              }),
              ProbeErrorKind::ExecutionFailed);
    EXPECT_EQ(errorKind([&] {
                  MiniMaxParser::parse(
                      R"({"model_remains": [], "base_resp": {"status_code": 0}})", "minimax", now);
              }),
              ProbeErrorKind::NoData);
    EXPECT_EQ(errorKind([&] { MiniMaxParser::parse(R"({"model_remains": []})", "minimax", now); }),
              ProbeErrorKind::ParseFailed);
}

TEST_F(MiscParserTest, MiniMaxRegions) {
    EXPECT_EQ(miniMaxRegionFromString("China"), MiniMaxRegion::China);
    EXPECT_EQ(miniMaxRegionFromString(" international "), MiniMaxRegion::International);
    EXPECT_FALSE(miniMaxRegionFromString("mars").has_value());
    EXPECT_EQ(MiniMaxEndpoints::codingPlanRemains(MiniMaxRegion::China),
              "https://api.minimaxi.com/v1/api/openplatform/coding_plan/remains");
}

// ── Copilot ───────────────────────────────────────────────────────────────

TEST_F(MiscParserTest, CopilotPremiumRequests) {
    auto snap = CopilotParser::parse(R"({
        "timePeriod": {"year": 2025, "month": 6},
        "user": "octocat",
        "usageItems": [
            {"product": "Copilot", "sku": "Copilot Premium Request", "grossQuantity": 10.0},
            {"product": "copilot", "sku": "Copilot Premium Request", "grossQuantity": 2.0},
            {"product": "Actions", "sku": "Actions Linux", "grossQuantity": 100.0}
        ]
    })", "octocat", 50, now);

    EXPECT_EQ(snap.providerId, "copilot");
    EXPECT_EQ(snap.accountEmail, "octocat");
    ASSERT_EQ(snap.quotas.size(), 1u);
    EXPECT_EQ(snap.quotas[0].quotaType(), QuotaType::timeLimit("Monthly"));
    EXPECT_DOUBLE_EQ(snap.quotas[0].percentRemaining(), 76);
    EXPECT_EQ(snap.quotas[0].resetText(), "12/50 requests");
}

TEST_F(MiscParserTest, CopilotOverLimitAndEmpty) {
    auto over = CopilotParser::parse(
        R"({"usageItems": [{"product": "Copilot", "grossQuantity": 400}]})", "u", 300, now);
    EXPECT_DOUBLE_EQ(over.quotas[0].percentRemaining(), 0);

    auto empty = CopilotParser::parse(R"({"usageItems": []})", "u", 50, now);
    EXPECT_DOUBLE_EQ(empty.quotas[0].percentRemaining(), 100);

    EXPECT_THROW(CopilotParser::parse("{}", "u", 50, now), ProbeError);
}

TEST_F(MiscParserTest, CopilotInternalPremiumInteractions) {
    auto snap = CopilotParser::parseInternal(R"({
        "copilot_plan": "business",
        "quota_reset_date": "2026-03-01",
        "quota_snapshots": {
            "chat": {"unlimited": true},
            "premium_interactions": {"entitlement": 300, "remaining": 298,
                                     "percent_remaining": 99.3, "unlimited": false}
        }
    })", now);

    EXPECT_EQ(snap.providerId, "copilot");
    EXPECT_EQ(snap.accountTier, "business");
    ASSERT_EQ(snap.quotas.size(), 1u);
    EXPECT_EQ(snap.quotas[0].quotaType(), QuotaType::timeLimit("Monthly"));
    EXPECT_DOUBLE_EQ(snap.quotas[0].percentRemaining(), 99.3);
    EXPECT_EQ(snap.quotas[0].resetText(), "2/300 requests");
    EXPECT_EQ(snap.quotas[0].resetsAt(), ParseHelpers::isoTimestamp("2026-03-01T00:00:00Z"));
}

TEST_F(MiscParserTest, CopilotInternalDerivesPercentFromCounts) {
    auto snap = CopilotParser::parseInternal(R"({
        "copilot_plan": "individual_pro",
        "quota_reset_date_utc": "2026-04-01T00:00:00.000Z",
        "quota_snapshots": {"premium_interactions": {"entitlement": 1500, "remaining": 1350}}
    })", now);
    EXPECT_DOUBLE_EQ(snap.quotas[0].percentRemaining(), 90);
    EXPECT_EQ(snap.quotas[0].resetText(), "150/1500 requests");
    EXPECT_TRUE(snap.quotas[0].resetsAt().has_value());
}

TEST_F(MiscParserTest, CopilotInternalUnlimitedAndFreePlans) {
    auto unlimited = CopilotParser::parseInternal(R"({
        "copilot_plan": "enterprise",
        "quota_snapshots": {"premium_interactions": {"unlimited": true}}
    })", now);
    EXPECT_DOUBLE_EQ(unlimited.quotas[0].percentRemaining(), 100);
    EXPECT_EQ(unlimited.quotas[0].resetText(), "Unlimited premium requests");

    auto free = CopilotParser::parseInternal(R"({"copilot_plan": "free"})", now);
    ASSERT_EQ(free.quotas.size(), 1u);
    EXPECT_DOUBLE_EQ(free.quotas[0].percentRemaining(), 100);
    EXPECT_EQ(free.quotas[0].resetText(), "No premium requests quota");
    EXPECT_EQ(free.accountTier, "free");
}

TEST_F(MiscParserTest, CopilotInternalRejectsBadBody) {
    EXPECT_EQ(errorKind([] { CopilotParser::parseInternal("not json"); }),
              ProbeErrorKind::ParseFailed);
    EXPECT_EQ(errorKind([] { CopilotParser::parseInternal("[1, 2]"); }),
              ProbeErrorKind::ParseFailed);
}
