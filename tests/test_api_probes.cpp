#include <gtest/gtest.h>
#include "FakeExecutor.hpp"
#include "FakeTransport.hpp"
#include "probe/ClaudeApiProbe.hpp"
#include "probe/CopilotProbe.hpp"
#include "probe/CursorProbe.hpp"
#include "probe/GeminiApiProbe.hpp"
#include "probe/KimiApiProbe.hpp"
#include "probe/MiniMaxProbe.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

// payload {"sub":"auth0|user_123","exp":1900000000}
const std::string kCursorJwt =
    "eyJhbGciOiJIUzI1NiJ9.eyJzdWIiOiJhdXRoMHx1c2VyXzEyMyIsImV4cCI6MTkwMDAwMDAwMH0.c2ln";

const char* kCursorSummary = R"({
    "billingCycleEnd": "2025-07-01T00:00:00.000Z",
    "membershipType": "pro",
    "individualUsage": {"plan": {"enabled": true, "used": 100, "limit": 500}}
})";

ProbeErrorKind probeErrorKind(IUsageProbe& probe) {
    try {
        probe.probe();
    } catch (const ProbeError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected ProbeError";
    return ProbeErrorKind::ParseFailed;
}

StoredCredential validCredential(std::optional<std::string> subscription = std::nullopt) {
    StoredCredential cred;
    cred.accessToken      = "access";
    cred.refreshToken     = "refresh";
    cred.expiresAt        = Clock::now() + std::chrono::hours(2);
    cred.subscriptionType = std::move(subscription);
    return cred;
}

} // namespace

// ── Claude ────────────────────────────────────────────────────────────────

class ClaudeApiProbeTest : public ::testing::Test {
protected:
    FakeTransport transport;
    OAuthRefresher refresher{transport, OAuthClientConfig::claude()};
};

TEST_F(ClaudeApiProbeTest, ReadsUsageWithTierFromCredential) {
    MemoryCredentialStore store(validCredential("claude_pro"));
    ClaudeApiProbe probe(transport, store, refresher, 4000);
    transport.reply(200, R"({"five_hour": {"utilization": 30}, "seven_day": {"utilization": 70}})");

    EXPECT_TRUE(probe.isAvailable());
    auto snap = probe.probe();
    EXPECT_EQ(snap.accountTier, AccountTier::ClaudePro);
    EXPECT_DOUBLE_EQ(snap.sessionQuota()->percentRemaining(), 70);
    EXPECT_DOUBLE_EQ(snap.weeklyQuota()->percentRemaining(), 30);

    ASSERT_EQ(transport.requests.size(), 1u);
    auto& req = transport.requests[0];
    EXPECT_EQ(req.url, ClaudeApiProbe::kUsageUrl);
    EXPECT_EQ(req.timeoutMs, 4000);
    EXPECT_EQ(req.headers.at("anthropic-beta"), "oauth-2025-04-20");
    EXPECT_EQ(req.headers.at("Authorization"), "Bearer access");
}

TEST_F(ClaudeApiProbeTest, ServerErrorIsExecutionFailure) {
    MemoryCredentialStore store(validCredential());
    ClaudeApiProbe probe(transport, store, refresher);
    transport.reply(500, "oops");
    EXPECT_EQ(probeErrorKind(probe), ProbeErrorKind::ExecutionFailed);
}

TEST_F(ClaudeApiProbeTest, NoCredential) {
    MemoryCredentialStore store;
    ClaudeApiProbe probe(transport, store, refresher);
    EXPECT_FALSE(probe.isAvailable());
    EXPECT_EQ(probeErrorKind(probe), ProbeErrorKind::AuthenticationRequired);
}

// ── Gemini ────────────────────────────────────────────────────────────────

TEST(GeminiApiProbeTest, QuotaBilledToDiscoveredProject) {
    FakeTransport transport;
    MemoryCredentialStore store(validCredential());
    GeminiApiProbe probe(transport, store);

    transport.reply(200, R"({"projects": [{"projectId": "gen-lang-client-42"}]})");
    transport.reply(200, R"({"buckets": [{"modelId": "gemini-2.5-pro", "remainingFraction": 0.25}]})");

    auto snap = probe.probe();
    EXPECT_DOUBLE_EQ(snap.quotas[0].percentRemaining(), 25);

    ASSERT_EQ(transport.requests.size(), 2u);
    EXPECT_EQ(transport.requests[0].url, GeminiApiProbe::kProjectsUrl);
    EXPECT_EQ(transport.requests[1].url, GeminiApiProbe::kQuotaUrl);
    EXPECT_EQ(transport.requests[1].method, "POST");
    EXPECT_EQ(nlohmann::json::parse(transport.requests[1].body)["project"], "gen-lang-client-42");
}

TEST(GeminiApiProbeTest, ProjectLookupFailureIsNotFatal) {
    FakeTransport transport;
    MemoryCredentialStore store(validCredential());
    GeminiApiProbe probe(transport, store);

    transport.reply(403, "{}");
    transport.reply(200, R"({"buckets": [{"modelId": "gemini-2.5-flash", "remainingFraction": 1}]})");

    auto snap = probe.probe();
    EXPECT_EQ(snap.quotas.size(), 1u);
    EXPECT_EQ(transport.requests[1].body, "{}");
}

TEST(GeminiApiProbeTest, RejectedTokenNeedsCliLogin) {
    FakeTransport transport;
    MemoryCredentialStore store(validCredential());
    GeminiApiProbe probe(transport, store);

    transport.reply(200, R"({"projects": []})");
    transport.reply(401);
    EXPECT_EQ(probeErrorKind(probe), ProbeErrorKind::AuthenticationRequired);
}

// ── Kimi ──────────────────────────────────────────────────────────────────

TEST(KimiApiProbeTest, SendsAuthCookie) {
    FakeTransport transport;
    KimiApiProbe probe(transport, fakeEnvironment({{KimiApiProbe::kEnvToken, "kimi-jwt"}}));
    transport.reply(200, R"({"usages": [{"scope": "FEATURE_CODING",
                                         "detail": {"limit": "2048", "used": "1024"}}]})");

    auto snap = probe.probe();
    EXPECT_DOUBLE_EQ(snap.weeklyQuota()->percentRemaining(), 50);
    EXPECT_EQ(snap.accountTier, "Moderato");

    auto& req = transport.requests[0];
    EXPECT_EQ(req.method, "POST");
    EXPECT_EQ(req.headers.at("Cookie"), "kimi-auth=kimi-jwt");
    EXPECT_EQ(req.body, R"({"scope":["FEATURE_CODING"]})");
}

TEST(KimiApiProbeTest, MissingTokenAndBadStatus) {
    FakeTransport transport;
    KimiApiProbe missing(transport, fakeEnvironment({}));
    EXPECT_FALSE(missing.isAvailable());
    EXPECT_EQ(probeErrorKind(missing), ProbeErrorKind::AuthenticationRequired);

    KimiApiProbe probe(transport, fakeEnvironment({{KimiApiProbe::kEnvToken, "t"}}));
    transport.reply(500, "boom");
    EXPECT_EQ(probeErrorKind(probe), ProbeErrorKind::ExecutionFailed);
}

// ── MiniMax ───────────────────────────────────────────────────────────────

TEST(MiniMaxProbeTest, RegionSelectsHost) {
    FakeTransport transport;
    MiniMaxProbe probe(transport, MiniMaxRegion::China,
                       fakeEnvironment({{MiniMaxProbe::kEnvKey, "mm-key"}}));
    transport.reply(200, R"({
        "model_remains": [{"model_name": "MiniMax-M2", "current_interval_total_count": 100,
                           "current_interval_usage_count": 40}],
        "base_resp": {"status_code": 0, "status_msg": "success"}
    })");

    auto snap = probe.probe();
    EXPECT_EQ(snap.providerId, "minimax");
    EXPECT_DOUBLE_EQ(snap.quotas[0].percentRemaining(), 40);
    EXPECT_EQ(transport.requests[0].url,
              "https://api.minimaxi.com/v1/api/openplatform/coding_plan/remains");
    EXPECT_EQ(transport.requests[0].headers.at("Authorization"), "Bearer mm-key");
}

TEST(MiniMaxProbeTest, RejectedKey) {
    FakeTransport transport;
    MiniMaxProbe probe(transport, MiniMaxRegion::International,
                       fakeEnvironment({{MiniMaxProbe::kEnvKey, "bad"}}));
    transport.reply(401);
    EXPECT_EQ(probeErrorKind(probe), ProbeErrorKind::AuthenticationRequired);
}

// ── Copilot ───────────────────────────────────────────────────────────────

TEST(CopilotProbeTest, BillingUsage) {
    FakeTransport transport;
    CopilotProbe probe(transport, "octocat", 300, fakeEnvironment({{"GITHUB_TOKEN", "ghp_x"}}));
    transport.reply(200, R"({"usageItems": [{"product": "Copilot", "grossQuantity": 75}]})");

    EXPECT_TRUE(probe.isAvailable());
    auto snap = probe.probe();
    EXPECT_DOUBLE_EQ(snap.quotas[0].percentRemaining(), 75);

    auto& req = transport.requests[0];
    EXPECT_EQ(req.url,
              "https://api.github.com/users/octocat/settings/billing/premium_request/usage");
    EXPECT_EQ(req.headers.at("Authorization"), "Bearer ghp_x");
    EXPECT_EQ(req.headers.at("X-GitHub-Api-Version"), "2022-11-28");
}

TEST(CopilotProbeTest, StatusMapping) {
    FakeTransport transport;
    CopilotProbe probe(transport, "octocat", 50, fakeEnvironment({{"GITHUB_TOKEN", "ghp_x"}}));

    transport.reply(401);
    EXPECT_EQ(probeErrorKind(probe), ProbeErrorKind::AuthenticationRequired);
    transport.reply(403);
    EXPECT_EQ(probeErrorKind(probe), ProbeErrorKind::ExecutionFailed);
    transport.fail("timeout");
    EXPECT_EQ(probeErrorKind(probe), ProbeErrorKind::ExecutionFailed);

    CopilotProbe noToken(transport, "octocat", 50, fakeEnvironment({}));
    EXPECT_FALSE(noToken.isAvailable());
    EXPECT_EQ(probeErrorKind(noToken), ProbeErrorKind::AuthenticationRequired);
}

TEST(CopilotInternalProbeTest, ReadsUserQuotaWithoutUsername) {
    FakeTransport transport;
    CopilotInternalProbe probe(transport, fakeEnvironment({{"GITHUB_TOKEN", "gho_y"}}));
    transport.reply(200, R"({
        "copilot_plan": "individual",
        "quota_snapshots": {"premium_interactions": {"entitlement": 300, "remaining": 150}}
    })");

    EXPECT_EQ(probe.id(), "copilot");
    EXPECT_TRUE(probe.isAvailable());
    auto snap = probe.probe();
    EXPECT_DOUBLE_EQ(snap.quotas[0].percentRemaining(), 50);
    EXPECT_EQ(snap.accountTier, "individual");

    auto& req = transport.requests[0];
    EXPECT_EQ(req.url, "https://api.github.com/copilot_internal/user");
    EXPECT_EQ(req.headers.at("Authorization"), "Bearer gho_y");
    EXPECT_EQ(req.headers.at("Accept"), "application/json");
}

TEST(CopilotInternalProbeTest, StatusMapping) {
    FakeTransport transport;
    CopilotInternalProbe probe(transport, fakeEnvironment({{"GITHUB_TOKEN", "ghp_x"}}));

    transport.reply(401);
    EXPECT_EQ(probeErrorKind(probe), ProbeErrorKind::AuthenticationRequired);
    transport.reply(403);
    EXPECT_EQ(probeErrorKind(probe), ProbeErrorKind::ExecutionFailed);
    transport.reply(404);
    EXPECT_EQ(probeErrorKind(probe), ProbeErrorKind::ExecutionFailed);
    transport.reply(200, "<html>");
    EXPECT_EQ(probeErrorKind(probe), ProbeErrorKind::ParseFailed);

    CopilotInternalProbe noToken(transport, fakeEnvironment({}));
    EXPECT_FALSE(noToken.isAvailable());
    EXPECT_EQ(probeErrorKind(noToken), ProbeErrorKind::AuthenticationRequired);
}

// ── Cursor ────────────────────────────────────────────────────────────────

class CursorProbeTest : public ::testing::Test {
protected:
    fs::path dir;
    fs::path db;
    FakeTransport transport;
    FakeExecutor executor;

    void SetUp() override {
        dir = fs::temp_directory_path() / ("quotabar_cursor_" + std::to_string(::getpid()));
        fs::remove_all(dir);
        fs::create_directories(dir);
        db = dir / "state.vscdb";
    }

    void TearDown() override { fs::remove_all(dir); }
};

TEST_F(CursorProbeTest, TokenFromEnvironment) {
    CursorProbe probe(transport, executor, db,
                      fakeEnvironment({{CursorProbe::kEnvToken, kCursorJwt}}));
    transport.reply(200, kCursorSummary);

    EXPECT_TRUE(probe.isAvailable());
    auto snap = probe.probe();
    EXPECT_DOUBLE_EQ(snap.quotas[0].percentRemaining(), 80);
    EXPECT_EQ(snap.accountTier, "PRO");
    EXPECT_EQ(transport.requests[0].headers.at("Cookie"),
              "WorkosCursorSessionToken=auth0|user_123%3A%3A" + kCursorJwt);
    EXPECT_TRUE(executor.calls.empty());
}

TEST_F(CursorProbeTest, TokenFromStateDatabase) {
    std::ofstream(db) << "sqlite";
    executor.output(kCursorJwt + "\n");
    CursorProbe probe(transport, executor, db, fakeEnvironment({}));
    transport.reply(200, kCursorSummary);

    EXPECT_TRUE(probe.isAvailable());
    probe.probe();
    ASSERT_EQ(executor.calls.size(), 1u);
    EXPECT_EQ(executor.calls[0].binary, "sqlite3");
    EXPECT_EQ(executor.calls[0].options.args[0], db.string());
    EXPECT_NE(executor.calls[0].options.args[1].find("cursorAuth/accessToken"), std::string::npos);
}

TEST_F(CursorProbeTest, NotLoggedIn) {
    CursorProbe noDb(transport, executor, db, fakeEnvironment({}));
    EXPECT_FALSE(noDb.isAvailable());
    EXPECT_EQ(probeErrorKind(noDb), ProbeErrorKind::AuthenticationRequired);

    std::ofstream(db) << "sqlite";
    executor.output("\n");
    CursorProbe emptyDb(transport, executor, db, fakeEnvironment({}));
    EXPECT_EQ(probeErrorKind(emptyDb), ProbeErrorKind::AuthenticationRequired);
    EXPECT_TRUE(transport.requests.empty());
}

TEST_F(CursorProbeTest, RejectedToken) {
    CursorProbe probe(transport, executor, db,
                      fakeEnvironment({{CursorProbe::kEnvToken, kCursorJwt}}));
    transport.reply(401);
    EXPECT_EQ(probeErrorKind(probe), ProbeErrorKind::SessionExpired);

    transport.reply(401);
    try {
        probe.probe();
        FAIL() << "expected SessionExpired";
    } catch (const ProbeError& e) {
        EXPECT_EQ(std::string(e.what()).find("claude"), std::string::npos);
        EXPECT_NE(e.detail().find("Cursor"), std::string::npos);
    }
}
