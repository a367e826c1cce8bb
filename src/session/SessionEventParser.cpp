#include "session/SessionEventParser.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

const char* sessionEventNameString(SessionEventName n) {
    switch (n) {
        case SessionEventName::SessionStart:  return "SessionStart";
        case SessionEventName::SessionEnd:    return "SessionEnd";
        case SessionEventName::TaskCompleted: return "TaskCompleted";
        case SessionEventName::SubagentStart: return "SubagentStart";
        case SessionEventName::SubagentStop:  return "SubagentStop";
        case SessionEventName::Stop:          return "Stop";
    }
    return "Unknown";
}

std::optional<SessionEventName> sessionEventNameFromString(const std::string& s) {
    for (auto n : {SessionEventName::SessionStart, SessionEventName::SessionEnd,
                   SessionEventName::TaskCompleted, SessionEventName::SubagentStart,
                   SessionEventName::SubagentStop, SessionEventName::Stop}) {
        if (s == sessionEventNameString(n)) return n;
    }
    return std::nullopt;
}

std::optional<SessionEvent> SessionEventParser::parse(std::string_view payload,
                                                      TimePoint receivedAt) {
    json j = json::parse(payload, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        spdlog::debug("Hook payload is not a JSON object");
        return std::nullopt;
    }

    auto id   = j.find("session_id");
    auto hook = j.find("hook_event_name");
    if (id == j.end() || !id->is_string() || hook == j.end() || !hook->is_string())
        return std::nullopt;

    auto name = sessionEventNameFromString(hook->get<std::string>());
    if (!name) {
        spdlog::debug("Ignoring unknown hook '{}'", hook->get<std::string>());
        return std::nullopt;
    }

    SessionEvent ev;
    ev.sessionId  = id->get<std::string>();
    ev.name       = *name;
    ev.receivedAt = receivedAt;
    auto cwd = j.find("cwd");
    if (cwd != j.end() && cwd->is_string())
        ev.cwd = cwd->get<std::string>();
    return ev;
}
