#include "parsers/ClaudeApiParser.hpp"
#include "parsers/ParseHelpers.hpp"
#include "quota/ProbeError.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace {

constexpr const char* kProviderId = "claude";
constexpr const char* kModelPrefix = "seven_day_";

std::optional<UsageQuota> windowQuota(const json& window, const QuotaType& type) {
    if (!window.is_object()) return std::nullopt;
    auto util = window.find("utilization");
    if (util == window.end() || !util->is_number()) return std::nullopt;

    std::optional<TimePoint> resetsAt;
    auto reset = window.find("resets_at");
    if (reset != window.end() && reset->is_string())
        resetsAt = ParseHelpers::isoTimestamp(reset->get<std::string>());

    return UsageQuota(100.0 - util->get<double>(), type, kProviderId, resetsAt);
}

std::optional<CostUsage> extraUsage(const json& doc) {
    auto it = doc.find("extra_usage");
    if (it == doc.end() || !it->is_object()) return std::nullopt;
    if (!it->value("is_enabled", false)) return std::nullopt;

    CostUsage usage;
    usage.spent = ParseHelpers::centsToDollars(it->value("used_credits", 0LL));
    auto limit = it->find("monthly_limit");
    if (limit != it->end() && limit->is_number())
        usage.budget = ParseHelpers::centsToDollars(limit->get<long long>());
    return usage;
}

} // namespace

std::optional<std::string> ClaudeApiParser::tierFor(const std::optional<std::string>& subscriptionType) {
    if (!subscriptionType) return std::nullopt;
    std::string lower = ParseHelpers::toLower(*subscriptionType);
    if (lower.find("max") != std::string::npos) return std::string(AccountTier::ClaudeMax);
    if (lower.find("pro") != std::string::npos) return std::string(AccountTier::ClaudePro);
    return std::nullopt;
}

UsageSnapshot ClaudeApiParser::parse(const std::string& body,
                                     const std::optional<std::string>& subscriptionType,
                                     TimePoint now) {
    json doc;
    try {
        doc = json::parse(body);
    } catch (const json::exception& e) {
        throw ProbeError::parseFailed(std::string("Invalid JSON: ") + e.what());
    }
    if (!doc.is_object())
        throw ProbeError::parseFailed("Usage response is not a JSON object");

    UsageSnapshot snapshot;
    snapshot.providerId  = kProviderId;
    snapshot.capturedAt  = now;
    snapshot.accountTier = tierFor(subscriptionType);

    try {
        if (auto q = windowQuota(doc.value("five_hour", json()), QuotaType::session()))
            snapshot.quotas.push_back(*q);
        if (auto q = windowQuota(doc.value("seven_day", json()), QuotaType::weekly()))
            snapshot.quotas.push_back(*q);

        const std::string prefix = kModelPrefix;
        for (auto& [key, value] : doc.items()) {
            if (key.rfind(prefix, 0) != 0 || key.size() == prefix.size()) continue;
            std::string model = key.substr(prefix.size());
            if (model == "oauth_apps") continue;
            if (auto q = windowQuota(value, QuotaType::modelSpecific(model)))
                snapshot.quotas.push_back(*q);
        }

        snapshot.costUsage = extraUsage(doc);
    } catch (const json::exception& e) {
        throw ProbeError::parseFailed(std::string("Unexpected usage shape: ") + e.what());
    }

    spdlog::debug("Claude API: {} quotas parsed", snapshot.quotas.size());
    return snapshot;
}
