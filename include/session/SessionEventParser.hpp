#pragma once
#include "session/SessionEvent.hpp"
#include <optional>
#include <string_view>

// Decodes one hook payload:
//   {"session_id": "...", "hook_event_name": "SessionStart", "cwd": "/path"}
// Anything malformed or with an unknown hook name yields nullopt.
class SessionEventParser {
public:
    static std::optional<SessionEvent> parse(std::string_view payload,
                                             TimePoint receivedAt = Clock::now());
};
