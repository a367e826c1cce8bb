#include "monitor/QuotaAlerter.hpp"
#include <spdlog/spdlog.h>

std::optional<QuotaAlert> QuotaAlerter::onStatusChanged(const std::string& providerId,
                                                        QuotaStatus oldStatus,
                                                        QuotaStatus newStatus) const {
    spdlog::debug("Status change: {} {} -> {}", providerId,
                  quotaStatusName(oldStatus), quotaStatusName(newStatus));

    if (newStatus <= oldStatus || !shouldAlert(newStatus))
        return std::nullopt;

    std::string name = registry_.displayName(providerId);
    QuotaAlert alert;
    alert.providerId = providerId;
    alert.status     = newStatus;
    alert.title      = name + " Quota Alert";
    alert.body       = alertBody(newStatus, name);
    return alert;
}

std::string QuotaAlerter::alertBody(QuotaStatus status, const std::string& providerName) {
    switch (status) {
        case QuotaStatus::Warning:
            return "Your " + providerName + " quota is running low. Consider pacing your usage.";
        case QuotaStatus::Critical:
            return "Your " + providerName + " quota is critically low! Save important work.";
        case QuotaStatus::Depleted:
            return "Your " + providerName + " quota is depleted. Usage may be blocked.";
        case QuotaStatus::Healthy:
            return "Your " + providerName + " quota has recovered.";
    }
    return "";
}
