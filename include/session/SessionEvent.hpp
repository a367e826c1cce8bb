#pragma once
#include "quota/UsageQuota.hpp"
#include <optional>
#include <string>

// Lifecycle hooks emitted by the Claude CLI
enum class SessionEventName {
    SessionStart,
    SessionEnd,
    TaskCompleted,
    SubagentStart,
    SubagentStop,
    Stop
};

// Hook name as sent on the wire ("SessionStart", ...)
const char* sessionEventNameString(SessionEventName n);
std::optional<SessionEventName> sessionEventNameFromString(const std::string& s);

struct SessionEvent {
    std::string      sessionId;
    SessionEventName name = SessionEventName::SessionStart;
    std::string      cwd;
    TimePoint        receivedAt = Clock::now();
};
