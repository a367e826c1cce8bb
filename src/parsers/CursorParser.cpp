#include "parsers/CursorParser.hpp"
#include "parsers/ParseHelpers.hpp"
#include "quota/ProbeError.hpp"
#include <nlohmann/json.hpp>
#include <openssl/evp.h>
#include <algorithm>
#include <cctype>
#include <vector>

using json = nlohmann::json;

namespace {

constexpr const char* kProviderId = "cursor";

std::optional<std::string> base64UrlDecode(std::string in) {
    std::replace(in.begin(), in.end(), '-', '+');
    std::replace(in.begin(), in.end(), '_', '/');
    while (in.size() % 4 != 0) in.push_back('=');

    std::vector<unsigned char> out(in.size() / 4 * 3);
    int n = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(in.data()),
                            static_cast<int>(in.size()));
    if (n < 0) return std::nullopt;

    size_t padding = 0;
    for (auto it = in.rbegin(); it != in.rend() && *it == '='; ++it) padding++;
    return std::string(reinterpret_cast<const char*>(out.data()),
                       static_cast<size_t>(n) - padding);
}

long long intValue(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_number()) return 0;
    return static_cast<long long>(it->get<double>());
}

// {"enabled": true, "used": 120, "limit": 500}
void addAllowance(UsageSnapshot& snapshot, const json& usage, const char* key,
                  const std::string& label, const std::string& unit,
                  const std::optional<TimePoint>& resetsAt) {
    auto it = usage.find(key);
    if (it == usage.end() || !it->is_object() || !it->value("enabled", false)) return;

    long long used  = intValue(*it, "used");
    long long limit = intValue(*it, "limit");
    if (limit <= 0) return;

    double remaining = static_cast<double>(limit - used) / static_cast<double>(limit) * 100.0;
    snapshot.quotas.emplace_back(std::max(0.0, remaining), QuotaType::timeLimit(label),
                                 kProviderId, resetsAt,
                                 std::to_string(used) + "/" + std::to_string(limit) + unit);
}

} // namespace

std::string CursorParser::userIdFromJwt(const std::string& token) {
    auto first = token.find('.');
    if (first == std::string::npos)
        throw ProbeError::parseFailed("Invalid JWT format");
    auto second = token.find('.', first + 1);
    std::string payload = token.substr(first + 1, second == std::string::npos
                                                      ? std::string::npos
                                                      : second - first - 1);

    auto decoded = base64UrlDecode(payload);
    if (!decoded) throw ProbeError::parseFailed("Failed to decode JWT payload");

    json claims = json::parse(*decoded, nullptr, false);
    if (claims.is_discarded() || !claims.is_object() || !claims.contains("sub") ||
        !claims["sub"].is_string() || claims["sub"].get<std::string>().empty())
        throw ProbeError::parseFailed("JWT payload missing 'sub' claim");
    return claims["sub"].get<std::string>();
}

std::string CursorParser::sessionCookie(const std::string& token) {
    return "WorkosCursorSessionToken=" + userIdFromJwt(token) + "%3A%3A" + token;
}

std::string CursorParser::tierFor(const std::string& membershipType) {
    std::string upper = membershipType;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return upper;
}

UsageSnapshot CursorParser::parseUsageSummary(const std::string& body, TimePoint now) {
    json doc = json::parse(body, nullptr, false);
    if (doc.is_discarded())
        throw ProbeError::parseFailed("Invalid JSON in Cursor response");
    if (!doc.is_object())
        throw ProbeError::parseFailed("Response is not a JSON object");

    std::optional<TimePoint> resetsAt;
    if (auto end = doc.find("billingCycleEnd"); end != doc.end() && end->is_string())
        resetsAt = ParseHelpers::isoTimestamp(end->get<std::string>());

    UsageSnapshot snapshot;
    snapshot.providerId = kProviderId;
    snapshot.capturedAt = now;

    std::string membership = "unknown";
    try {
        if (auto individual = doc.find("individualUsage");
            individual != doc.end() && individual->is_object()) {
            addAllowance(snapshot, *individual, "plan", "Monthly", " requests", resetsAt);
            addAllowance(snapshot, *individual, "onDemand", "On-Demand", " on-demand", resetsAt);
        }

        if (doc.value("isUnlimited", false))
            snapshot.quotas.emplace_back(100.0, QuotaType::timeLimit("Monthly"), kProviderId,
                                         std::nullopt, std::string("Unlimited"));

        if (auto m = doc.find("membershipType"); m != doc.end() && m->is_string())
            membership = m->get<std::string>();
    } catch (const json::exception& e) {
        throw ProbeError::parseFailed(std::string("Unexpected Cursor response: ") + e.what());
    }

    if (snapshot.quotas.empty())
        throw ProbeError::parseFailed("No usage data found in Cursor response");

    std::string tier = tierFor(membership);
    if (!tier.empty()) snapshot.accountTier = tier;
    return snapshot;
}
