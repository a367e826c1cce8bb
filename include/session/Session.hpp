#pragma once
#include "quota/UsageQuota.hpp"
#include <optional>
#include <string>

// One tracked run of the Claude CLI.
//
//   Active <-> SubagentsWorking    (subagent count > 0)
//   Active | SubagentsWorking -> Stopped
//   any -> Ended                   (terminal)
class Session {
public:
    enum class Phase {
        Active,
        SubagentsWorking,
        Stopped,
        Ended
    };

    Session(std::string id, std::string cwd, TimePoint startedAt = Clock::now())
        : id_(std::move(id)), cwd_(std::move(cwd)), startedAt_(startedAt) {}

    const std::string& id() const { return id_; }
    const std::string& cwd() const { return cwd_; }
    TimePoint startedAt() const { return startedAt_; }
    const std::optional<TimePoint>& endedAt() const { return endedAt_; }
    Phase phase() const { return phase_; }
    int activeSubagentCount() const { return activeSubagents_; }
    int completedTaskCount() const { return completedTasks_; }

    bool isActive() const { return phase_ != Phase::Ended; }

    // Ignored once stopped or ended
    void subagentStarted();
    void subagentStopped();

    // Counted until the session ends, including after a stop
    void taskCompleted();

    void stop();
    void end(TimePoint at = Clock::now());

    // Until endedAt, or until now while still running
    std::chrono::seconds duration(TimePoint now = Clock::now()) const;

    // "1h 5m", "3m 20s", "42s"
    std::string durationDescription(TimePoint now = Clock::now()) const;

    // "Active", "Agents Working", "Stopped", "Ended"
    std::string phaseLabel() const { return phaseLabel(phase_); }
    static const char* phaseLabel(Phase p);

private:
    void updatePhase();

    std::string id_;
    std::string cwd_;
    TimePoint startedAt_;
    std::optional<TimePoint> endedAt_;
    Phase phase_ = Phase::Active;
    int activeSubagents_ = 0;
    int completedTasks_ = 0;
};
