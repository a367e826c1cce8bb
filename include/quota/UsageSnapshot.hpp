#pragma once
#include "UsageQuota.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

// Pay-as-you-go overage: amount spent against an optional budget (USD)
struct CostUsage {
    double                     spent = 0;
    std::optional<double>      budget;
    std::optional<std::string> resetText;
    std::optional<double>      apiDurationSeconds;   // from `/cost`

    std::string formattedSpent() const;
    std::optional<double> percentOfBudget() const {
        if (!budget || *budget <= 0) return std::nullopt;
        return spent / *budget * 100.0;
    }
};

// Account tiers reported by the Claude CLI header and API
namespace AccountTier {
    inline constexpr const char* ClaudePro = "Claude Pro";
    inline constexpr const char* ClaudeMax = "Claude Max";
    inline constexpr const char* ClaudeApi = "Claude API";
}

// Full result of one probe cycle for one provider
struct UsageSnapshot {
    std::string                providerId;
    std::vector<UsageQuota>    quotas;
    TimePoint                  capturedAt = Clock::now();
    std::optional<std::string> accountEmail;
    std::optional<std::string> accountOrganization;
    std::optional<std::string> accountTier;
    std::optional<std::string> loginMethod;
    std::optional<CostUsage>   costUsage;

    const UsageQuota* quota(const QuotaType& type) const {
        for (auto& q : quotas)
            if (q.quotaType() == type) return &q;
        return nullptr;
    }
    const UsageQuota* sessionQuota() const { return quota(QuotaType::session()); }
    const UsageQuota* weeklyQuota() const  { return quota(QuotaType::weekly()); }

    const UsageQuota* lowestQuota() const;

    // Worst status across all quotas; healthy when there are none
    QuotaStatus overallStatus(const QuotaThresholds& t = {}) const;

    nlohmann::json toJson(const QuotaThresholds& t = {}) const;
};
