#pragma once
#include "session/EventChannel.hpp"
#include "session/Session.hpp"
#include "session/SessionEvent.hpp"
#include <deque>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <vector>

// Tracks the one active Claude session and a short history of ended ones.
// Events for any session other than the active one are ignored, except
// SessionStart which always replaces it.
class SessionMonitor {
public:
    using Listener = std::function<void(const Session&)>;

    explicit SessionMonitor(size_t maxRecent = 10) : maxRecent_(maxRecent) {}

    void processEvent(const SessionEvent& ev);

    // Ends the active session (if any) and moves it to the recent list
    void endCurrentSession(TimePoint at = Clock::now());

    std::optional<Session> activeSession() const;

    // Most recently ended first
    std::vector<Session> recentSessions() const;

    void clearRecent();

    // Called after every state change with the affected session
    void setListener(Listener l);

    // Consumes events until the channel is closed and drained
    void run(EventChannel& channel, int pollMs = 250);

private:
    Session endCurrentLocked(TimePoint at);
    void notify(const Session& s) const;

    mutable std::shared_mutex mtx_;
    std::optional<Session> active_;
    std::deque<Session> recent_;
    size_t maxRecent_;
    Listener listener_;
};
