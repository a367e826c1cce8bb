#include "parsers/CopilotParser.hpp"
#include "parsers/ParseHelpers.hpp"
#include "quota/ProbeError.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

using json = nlohmann::json;

UsageSnapshot CopilotParser::parse(const std::string& body, const std::string& username,
                                   int monthlyLimit, TimePoint now) {
    json doc = json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object() || !doc.contains("usageItems") ||
        !doc["usageItems"].is_array())
        throw ProbeError::parseFailed("Failed to parse billing response");

    double used = 0;
    size_t matched = 0;
    for (auto& item : doc["usageItems"]) {
        if (!item.is_object()) continue;
        auto product = item.find("product");
        if (product == item.end() || !product->is_string()) continue;
        if (!ParseHelpers::containsIgnoreCase(product->get<std::string>(), "copilot")) continue;

        auto gross = item.find("grossQuantity");
        if (gross != item.end() && gross->is_number()) used += gross->get<double>();
        matched++;
    }
    if (doc["usageItems"].empty())
        spdlog::warn("Copilot: billing API returned no usage items (organisation-managed seat?)");
    spdlog::debug("Copilot: {} copilot items, {} premium requests", matched, used);

    double limit = monthlyLimit > 0 ? monthlyLimit : 50;
    double percent = std::max(0.0, limit - used) / limit * 100.0;

    UsageSnapshot snapshot;
    snapshot.providerId   = "copilot";
    snapshot.capturedAt   = now;
    snapshot.accountEmail = username;
    snapshot.quotas.emplace_back(percent, QuotaType::timeLimit("Monthly"), "copilot", std::nullopt,
                                 std::to_string(static_cast<long long>(used)) + "/" +
                                     std::to_string(static_cast<long long>(limit)) + " requests");
    return snapshot;
}

UsageSnapshot CopilotParser::parseInternal(const std::string& body, TimePoint now) {
    json doc = json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object())
        throw ProbeError::parseFailed("Failed to parse Copilot Internal API response");

    UsageSnapshot snapshot;
    snapshot.providerId = "copilot";
    snapshot.capturedAt = now;
    try {
        snapshot.accountTier = doc.value("copilot_plan", "unknown");

        std::optional<TimePoint> resetsAt;
        if (auto utc = doc.find("quota_reset_date_utc"); utc != doc.end() && utc->is_string())
            resetsAt = ParseHelpers::isoTimestamp(utc->get<std::string>());
        if (!resetsAt) {
            if (auto day = doc.find("quota_reset_date"); day != doc.end() && day->is_string())
                resetsAt = ParseHelpers::isoTimestamp(day->get<std::string>() + "T00:00:00Z");
        }

        const json* premium = nullptr;
        if (auto snaps = doc.find("quota_snapshots"); snaps != doc.end() && snaps->is_object()) {
            auto it = snaps->find("premium_interactions");
            if (it != snaps->end() && it->is_object()) premium = &*it;
        }

        auto monthly = QuotaType::timeLimit("Monthly");
        if (!premium) {
            spdlog::info("Copilot: plan '{}' has no premium interactions quota",
                         *snapshot.accountTier);
            snapshot.quotas.emplace_back(100.0, monthly, "copilot", resetsAt,
                                         "No premium requests quota");
            return snapshot;
        }
        if (premium->value("unlimited", false)) {
            snapshot.quotas.emplace_back(100.0, monthly, "copilot", resetsAt,
                                         "Unlimited premium requests");
            return snapshot;
        }

        long long entitlement = premium->value("entitlement", 0LL);
        long long remaining   = premium->value("remaining", 0LL);
        double percent = 100.0;
        if (auto p = premium->find("percent_remaining"); p != premium->end() && p->is_number())
            percent = p->get<double>();
        else if (entitlement > 0)
            percent = static_cast<double>(remaining) / entitlement * 100.0;

        long long used = entitlement - remaining;
        spdlog::debug("Copilot: {}/{} premium requests used", used, entitlement);
        snapshot.quotas.emplace_back(std::min(percent, 100.0), monthly, "copilot", resetsAt,
                                     std::to_string(used) + "/" + std::to_string(entitlement) +
                                         " requests");
    } catch (const json::exception& e) {
        throw ProbeError::parseFailed(std::string("Copilot Internal API: ") + e.what());
    }
    return snapshot;
}
