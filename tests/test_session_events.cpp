#include <gtest/gtest.h>
#include "session/EventChannel.hpp"
#include "session/PortDiscovery.hpp"
#include "session/SessionEventParser.hpp"
#include "session/SessionMonitor.hpp"
#include <filesystem>
#include <fstream>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

// ── Hook payload decoding ─────────────────────────────────────────────────

TEST(SessionEventParserTest, DecodesKnownHooks) {
    TimePoint at = Clock::now();
    auto ev = SessionEventParser::parse(
        R"({"session_id": "abc-123", "hook_event_name": "SubagentStart",
            "cwd": "/home/me/project", "transcript_path": "/tmp/t.jsonl"})", at);

    ASSERT_TRUE(ev.has_value());
    EXPECT_EQ(ev->sessionId, "abc-123");
    EXPECT_EQ(ev->name, SessionEventName::SubagentStart);
    EXPECT_EQ(ev->cwd, "/home/me/project");
    EXPECT_EQ(ev->receivedAt, at);
}

TEST(SessionEventParserTest, CwdIsOptional) {
    auto ev = SessionEventParser::parse(R"({"session_id": "a", "hook_event_name": "Stop"})");
    ASSERT_TRUE(ev.has_value());
    EXPECT_EQ(ev->name, SessionEventName::Stop);
    EXPECT_TRUE(ev->cwd.empty());
}

TEST(SessionEventParserTest, RejectsMalformedPayloads) {
    EXPECT_FALSE(SessionEventParser::parse("").has_value());
    EXPECT_FALSE(SessionEventParser::parse("{not json").has_value());
    EXPECT_FALSE(SessionEventParser::parse(R"(["SessionStart"])").has_value());
    EXPECT_FALSE(SessionEventParser::parse(R"({"hook_event_name": "SessionStart"})").has_value());
    EXPECT_FALSE(SessionEventParser::parse(R"({"session_id": 7, "hook_event_name": "Stop"})").has_value());
    EXPECT_FALSE(SessionEventParser::parse(
        R"({"session_id": "a", "hook_event_name": "PreToolUse"})").has_value());
}

TEST(SessionEventParserTest, NameRoundTrip) {
    for (auto n : {SessionEventName::SessionStart, SessionEventName::SessionEnd,
                   SessionEventName::TaskCompleted, SessionEventName::SubagentStart,
                   SessionEventName::SubagentStop, SessionEventName::Stop})
        EXPECT_EQ(sessionEventNameFromString(sessionEventNameString(n)), n);
    EXPECT_FALSE(sessionEventNameFromString("sessionstart").has_value());
}

// ── Channel ───────────────────────────────────────────────────────────────

namespace {

SessionEvent event(const std::string& id, SessionEventName name) {
    SessionEvent ev;
    ev.sessionId = id;
    ev.name = name;
    return ev;
}

} // namespace

TEST(EventChannelTest, FifoAndTimeout) {
    EventChannel ch;
    EXPECT_FALSE(ch.pop(10).has_value());

    ch.push(event("a", SessionEventName::SessionStart));
    ch.push(event("a", SessionEventName::Stop));
    EXPECT_EQ(ch.size(), 2u);
    EXPECT_EQ(ch.pop(10)->name, SessionEventName::SessionStart);
    EXPECT_EQ(ch.pop(10)->name, SessionEventName::Stop);
}

TEST(EventChannelTest, DropsOldestWhenFull) {
    EventChannel ch(2);
    ch.push(event("1", SessionEventName::Stop));
    ch.push(event("2", SessionEventName::Stop));
    ch.push(event("3", SessionEventName::Stop));
    EXPECT_EQ(ch.size(), 2u);
    EXPECT_EQ(ch.pop(0)->sessionId, "2");
}

TEST(EventChannelTest, CloseDrainsThenStops) {
    EventChannel ch;
    ch.push(event("a", SessionEventName::Stop));
    ch.close();
    EXPECT_TRUE(ch.closed());
    EXPECT_FALSE(ch.push(event("b", SessionEventName::Stop)));
    EXPECT_TRUE(ch.pop(1000).has_value());
    EXPECT_FALSE(ch.pop(1000).has_value());
}

TEST(EventChannelTest, MonitorConsumesUntilClosed) {
    EventChannel ch;
    SessionMonitor monitor;

    std::thread consumer([&] { monitor.run(ch, 20); });
    std::thread producer([&] {
        ch.push(event("s1", SessionEventName::SessionStart));
        ch.push(event("s1", SessionEventName::TaskCompleted));
        ch.push(event("s1", SessionEventName::TaskCompleted));
        ch.push(event("s1", SessionEventName::SessionEnd));
        ch.close();
    });
    producer.join();
    consumer.join();

    auto recent = monitor.recentSessions();
    ASSERT_EQ(recent.size(), 1u);
    EXPECT_EQ(recent[0].completedTaskCount(), 2);
}

// ── Port file ─────────────────────────────────────────────────────────────

class PortDiscoveryTest : public ::testing::Test {
protected:
    fs::path home;

    void SetUp() override {
        home = fs::temp_directory_path() / ("quotabar_port_" + std::to_string(::getpid()));
        fs::remove_all(home);
        fs::create_directories(home);
    }

    void TearDown() override { fs::remove_all(home); }
};

TEST_F(PortDiscoveryTest, WriteReadRemove) {
    PortDiscovery discovery(home);
    EXPECT_EQ(discovery.path().string(), (home / ".claude" / "quotabar-hook-port").string());
    EXPECT_FALSE(discovery.readPort().has_value());

    ASSERT_TRUE(discovery.writePort(47821));
    EXPECT_EQ(discovery.readPort(), 47821);

    EXPECT_TRUE(discovery.removePortFile());
    EXPECT_FALSE(discovery.removePortFile());
    EXPECT_FALSE(discovery.readPort().has_value());
}

TEST_F(PortDiscoveryTest, ToleratesWhitespaceRejectsGarbage) {
    PortDiscovery discovery(home);
    fs::create_directories(discovery.path().parent_path());

    std::ofstream(discovery.path()) << "  8080\n";
    EXPECT_EQ(discovery.readPort(), 8080);

    std::ofstream(discovery.path()) << "80a";
    EXPECT_FALSE(discovery.readPort().has_value());

    std::ofstream(discovery.path()) << "99999999999999999999";
    EXPECT_FALSE(discovery.readPort().has_value());
}
