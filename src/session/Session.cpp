#include "session/Session.hpp"
#include <algorithm>

const char* Session::phaseLabel(Phase p) {
    switch (p) {
        case Phase::Active:           return "Active";
        case Phase::SubagentsWorking: return "Agents Working";
        case Phase::Stopped:          return "Stopped";
        case Phase::Ended:            return "Ended";
    }
    return "Unknown";
}

void Session::subagentStarted() {
    if (phase_ == Phase::Stopped || phase_ == Phase::Ended) return;
    activeSubagents_++;
    updatePhase();
}

void Session::subagentStopped() {
    if (phase_ == Phase::Stopped || phase_ == Phase::Ended) return;
    activeSubagents_ = std::max(0, activeSubagents_ - 1);
    updatePhase();
}

void Session::taskCompleted() {
    if (phase_ == Phase::Ended) return;
    completedTasks_++;
}

void Session::stop() {
    if (phase_ == Phase::Ended) return;
    phase_ = Phase::Stopped;
    activeSubagents_ = 0;
}

void Session::end(TimePoint at) {
    if (phase_ == Phase::Ended) return;
    phase_ = Phase::Ended;
    activeSubagents_ = 0;
    endedAt_ = at;
}

void Session::updatePhase() {
    phase_ = activeSubagents_ > 0 ? Phase::SubagentsWorking : Phase::Active;
}

std::chrono::seconds Session::duration(TimePoint now) const {
    TimePoint end = endedAt_.value_or(now);
    auto d = std::chrono::duration_cast<std::chrono::seconds>(end - startedAt_);
    return std::max(d, std::chrono::seconds(0));
}

std::string Session::durationDescription(TimePoint now) const {
    long total   = static_cast<long>(duration(now).count());
    long hours   = total / 3600;
    long minutes = (total % 3600) / 60;
    long seconds = total % 60;

    if (hours > 0)   return std::to_string(hours) + "h " + std::to_string(minutes) + "m";
    if (minutes > 0) return std::to_string(minutes) + "m " + std::to_string(seconds) + "s";
    return std::to_string(seconds) + "s";
}
