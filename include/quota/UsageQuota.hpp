#pragma once
#include "QuotaType.hpp"
#include <chrono>
#include <optional>
#include <string>

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Ordered by severity: Healthy < Warning < Critical < Depleted
enum class QuotaStatus {
    Healthy,
    Warning,
    Critical,
    Depleted
};

const char* quotaStatusName(QuotaStatus s);

enum class UsagePace {
    Ahead,    // consuming faster than the window elapses
    OnPace,
    Behind,   // consuming slower than the window elapses
    Unknown   // no reset time or no known window length
};

const char* usagePaceName(UsagePace p);

// Product policy for status cut points and the pace tolerance band
struct QuotaThresholds {
    double healthyAbove     = 50.0;  // > this is healthy
    double warningAtOrAbove = 20.0;  // [this, healthyAbove] is warning
    double paceTolerance    = 5.0;   // |pace| <= this is on pace

    QuotaStatus statusFor(double percentRemaining) const;
};

// One measured limit, immutable once built by a parser.
class UsageQuota {
public:
    UsageQuota(double percentRemaining,
               QuotaType quotaType,
               std::string providerId,
               std::optional<TimePoint> resetsAt = std::nullopt,
               std::optional<std::string> resetText = std::nullopt);

    double percentRemaining() const { return percentRemaining_; }
    const QuotaType& quotaType() const { return quotaType_; }
    const std::string& providerId() const { return providerId_; }
    const std::optional<TimePoint>& resetsAt() const { return resetsAt_; }
    const std::optional<std::string>& resetText() const { return resetText_; }

    double percentUsed() const { return 100.0 - percentRemaining_; }

    QuotaStatus status(const QuotaThresholds& t = {}) const {
        return t.statusFor(percentRemaining_);
    }

    // Fraction of the reset window already elapsed, 0..100.
    // nullopt when the reset time or the window length is unknown.
    std::optional<double> percentTimeElapsed(TimePoint now = Clock::now()) const;

    // percentUsed - percentTimeElapsed; positive means ahead of pace
    std::optional<double> pacePercent(TimePoint now = Clock::now()) const;

    UsagePace pace(const QuotaThresholds& t = {},
                   TimePoint now = Clock::now()) const;

    // "12% below expected usage", "Right on track", or "" when unknown
    std::string paceInsight(const QuotaThresholds& t = {},
                            TimePoint now = Clock::now()) const;

    std::optional<std::chrono::seconds> timeUntilReset(TimePoint now = Clock::now()) const;

    // "Resets in 2d 3h", "Resets in 4h 10m", "Resets soon"; falls back
    // to resetText when no instant is known
    std::string resetDescription(TimePoint now = Clock::now()) const;

    bool operator<(const UsageQuota& o) const {
        return percentRemaining_ < o.percentRemaining_;
    }

private:
    double percentRemaining_;
    QuotaType quotaType_;
    std::string providerId_;
    std::optional<TimePoint> resetsAt_;
    std::optional<std::string> resetText_;
};
