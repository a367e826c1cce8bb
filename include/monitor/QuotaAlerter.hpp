#pragma once
#include "probe/ProviderRegistry.hpp"
#include "quota/UsageQuota.hpp"
#include <optional>
#include <string>

struct QuotaAlert {
    std::string providerId;
    QuotaStatus status = QuotaStatus::Warning;
    std::string title;      // "Claude Quota Alert"
    std::string body;
};

// Turns status transitions into user-facing alerts. Only degradation into
// warning, critical or depleted produces one.
class QuotaAlerter {
public:
    explicit QuotaAlerter(const ProviderRegistry& registry) : registry_(registry) {}

    std::optional<QuotaAlert> onStatusChanged(const std::string& providerId,
                                              QuotaStatus oldStatus,
                                              QuotaStatus newStatus) const;

    static bool shouldAlert(QuotaStatus status) {
        return status != QuotaStatus::Healthy;
    }

    static std::string alertBody(QuotaStatus status, const std::string& providerName);

private:
    const ProviderRegistry& registry_;
};
