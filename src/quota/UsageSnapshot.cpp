#include "quota/UsageSnapshot.hpp"
#include <algorithm>
#include <cstdio>

std::string CostUsage::formattedSpent() const {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "$%.2f", spent);
    return buf;
}

const UsageQuota* UsageSnapshot::lowestQuota() const {
    if (quotas.empty()) return nullptr;
    return &*std::min_element(quotas.begin(), quotas.end());
}

QuotaStatus UsageSnapshot::overallStatus(const QuotaThresholds& t) const {
    QuotaStatus worst = QuotaStatus::Healthy;
    for (auto& q : quotas)
        worst = std::max(worst, q.status(t));
    return worst;
}

nlohmann::json UsageSnapshot::toJson(const QuotaThresholds& t) const {
    nlohmann::json out = {
        {"provider",    providerId},
        {"captured_at", std::chrono::duration_cast<std::chrono::seconds>(
                            capturedAt.time_since_epoch()).count()},
        {"status",      quotaStatusName(overallStatus(t))},
        {"quotas",      nlohmann::json::array()}
    };

    for (auto& q : quotas) {
        nlohmann::json entry = {
            {"type",              q.quotaType().displayName()},
            {"percent_remaining", q.percentRemaining()},
            {"status",            quotaStatusName(q.status(t))},
            {"pace",              usagePaceName(q.pace(t, capturedAt))}
        };
        if (q.resetText()) entry["reset_text"] = *q.resetText();
        out["quotas"].push_back(entry);
    }

    if (accountEmail)        out["email"]        = *accountEmail;
    if (accountOrganization) out["organization"] = *accountOrganization;
    if (accountTier)         out["tier"]         = *accountTier;
    if (loginMethod)         out["login_method"] = *loginMethod;
    if (costUsage) {
        out["cost"] = {{"spent", costUsage->spent}};
        if (costUsage->budget) out["cost"]["budget"] = *costUsage->budget;
    }
    return out;
}
