#include "quota/UsageQuota.hpp"
#include <algorithm>
#include <cmath>

const char* quotaStatusName(QuotaStatus s) {
    switch (s) {
        case QuotaStatus::Healthy:  return "healthy";
        case QuotaStatus::Warning:  return "warning";
        case QuotaStatus::Critical: return "critical";
        case QuotaStatus::Depleted: return "depleted";
    }
    return "unknown";
}

const char* usagePaceName(UsagePace p) {
    switch (p) {
        case UsagePace::Ahead:   return "ahead";
        case UsagePace::OnPace:  return "on_pace";
        case UsagePace::Behind:  return "behind";
        case UsagePace::Unknown: return "unknown";
    }
    return "unknown";
}

QuotaStatus QuotaThresholds::statusFor(double percentRemaining) const {
    if (percentRemaining <= 0)               return QuotaStatus::Depleted;
    if (percentRemaining < warningAtOrAbove) return QuotaStatus::Critical;
    if (percentRemaining <= healthyAbove)    return QuotaStatus::Warning;
    return QuotaStatus::Healthy;
}

UsageQuota::UsageQuota(double percentRemaining,
                       QuotaType quotaType,
                       std::string providerId,
                       std::optional<TimePoint> resetsAt,
                       std::optional<std::string> resetText)
    : percentRemaining_(std::min(percentRemaining, 100.0)),
      quotaType_(std::move(quotaType)),
      providerId_(std::move(providerId)),
      resetsAt_(resetsAt),
      resetText_(std::move(resetText)) {}

std::optional<std::chrono::seconds> UsageQuota::timeUntilReset(TimePoint now) const {
    if (!resetsAt_) return std::nullopt;
    auto remaining = std::chrono::duration_cast<std::chrono::seconds>(*resetsAt_ - now);
    return std::max(remaining, std::chrono::seconds(0));
}

std::optional<double> UsageQuota::percentTimeElapsed(TimePoint now) const {
    auto total = quotaType_.duration();
    auto remaining = timeUntilReset(now);
    if (!total || !remaining) return std::nullopt;

    double totalSec = static_cast<double>(total->count());
    double elapsed  = (totalSec - static_cast<double>(remaining->count())) / totalSec * 100.0;
    return std::clamp(elapsed, 0.0, 100.0);
}

std::optional<double> UsageQuota::pacePercent(TimePoint now) const {
    auto elapsed = percentTimeElapsed(now);
    if (!elapsed) return std::nullopt;
    return percentUsed() - *elapsed;
}

UsagePace UsageQuota::pace(const QuotaThresholds& t, TimePoint now) const {
    auto p = pacePercent(now);
    if (!p) return UsagePace::Unknown;
    if (*p > t.paceTolerance)  return UsagePace::Ahead;
    if (*p < -t.paceTolerance) return UsagePace::Behind;
    return UsagePace::OnPace;
}

std::string UsageQuota::paceInsight(const QuotaThresholds& t, TimePoint now) const {
    auto p = pacePercent(now);
    if (!p) return "";
    int magnitude = static_cast<int>(std::lround(std::fabs(*p)));
    switch (pace(t, now)) {
        case UsagePace::Behind:
            return std::to_string(magnitude) + "% below expected usage";
        case UsagePace::Ahead:
            return std::to_string(magnitude) + "% above expected usage";
        case UsagePace::OnPace:
            return "Right on track";
        case UsagePace::Unknown:
            break;
    }
    return "";
}

std::string UsageQuota::resetDescription(TimePoint now) const {
    auto remaining = timeUntilReset(now);
    if (!remaining) return resetText_.value_or("");

    long total   = static_cast<long>(remaining->count());
    long days    = total / 86400;
    long hours   = (total % 86400) / 3600;
    long minutes = (total % 3600) / 60;

    if (days > 0)
        return "Resets in " + std::to_string(days) + "d " + std::to_string(hours) + "h";
    if (hours > 0)
        return "Resets in " + std::to_string(hours) + "h " + std::to_string(minutes) + "m";
    if (minutes > 0)
        return "Resets in " + std::to_string(minutes) + "m";
    return "Resets soon";
}
