#include "session/SessionMonitor.hpp"
#include <spdlog/spdlog.h>

void SessionMonitor::processEvent(const SessionEvent& ev) {
    std::optional<Session> changed;
    {
        std::unique_lock lock(mtx_);

        if (ev.name == SessionEventName::SessionStart) {
            if (active_) {
                spdlog::info("Session {} replaced by {}", active_->id(), ev.sessionId);
                endCurrentLocked(ev.receivedAt);
            }
            active_.emplace(ev.sessionId, ev.cwd, ev.receivedAt);
            spdlog::info("Session {} started in {}", ev.sessionId,
                         ev.cwd.empty() ? "(unknown)" : ev.cwd);
            changed = active_;
        } else if (!active_ || active_->id() != ev.sessionId) {
            spdlog::debug("Ignoring {} for inactive session {}",
                          sessionEventNameString(ev.name), ev.sessionId);
            return;
        } else {
            switch (ev.name) {
                case SessionEventName::SessionEnd:
                    changed = endCurrentLocked(ev.receivedAt);
                    break;
                case SessionEventName::TaskCompleted:
                    active_->taskCompleted();
                    changed = active_;
                    break;
                case SessionEventName::SubagentStart:
                    active_->subagentStarted();
                    changed = active_;
                    break;
                case SessionEventName::SubagentStop:
                    active_->subagentStopped();
                    changed = active_;
                    break;
                case SessionEventName::Stop:
                    active_->stop();
                    changed = active_;
                    break;
                case SessionEventName::SessionStart:
                    break;
            }
        }
    }
    if (changed) notify(*changed);
}

void SessionMonitor::endCurrentSession(TimePoint at) {
    std::optional<Session> ended;
    {
        std::unique_lock lock(mtx_);
        if (!active_) return;
        ended = endCurrentLocked(at);
    }
    notify(*ended);
}

Session SessionMonitor::endCurrentLocked(TimePoint at) {
    active_->end(at);
    spdlog::info("Session {} ended after {} ({} tasks)", active_->id(),
                 active_->durationDescription(at), active_->completedTaskCount());
    // The recent list may be trimmed to nothing, so hand back a copy
    Session ended = *active_;
    recent_.push_front(std::move(*active_));
    active_.reset();
    while (recent_.size() > maxRecent_)
        recent_.pop_back();
    return ended;
}

std::optional<Session> SessionMonitor::activeSession() const {
    std::shared_lock lock(mtx_);
    return active_;
}

std::vector<Session> SessionMonitor::recentSessions() const {
    std::shared_lock lock(mtx_);
    return {recent_.begin(), recent_.end()};
}

void SessionMonitor::clearRecent() {
    std::unique_lock lock(mtx_);
    recent_.clear();
}

void SessionMonitor::setListener(Listener l) {
    std::unique_lock lock(mtx_);
    listener_ = std::move(l);
}

void SessionMonitor::notify(const Session& s) const {
    Listener l;
    {
        std::shared_lock lock(mtx_);
        l = listener_;
    }
    if (l) l(s);
}

void SessionMonitor::run(EventChannel& channel, int pollMs) {
    while (true) {
        auto ev = channel.pop(pollMs);
        if (ev) {
            processEvent(*ev);
            continue;
        }
        if (channel.closed()) break;
    }
    spdlog::debug("Session event channel closed");
}
