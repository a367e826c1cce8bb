#include "parsers/KimiParser.hpp"
#include "parsers/ParseHelpers.hpp"
#include "quota/ProbeError.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <regex>

using json = nlohmann::json;

namespace {

constexpr const char* kProviderId = "kimi";

struct UsageNumbers {
    long long used      = 0;
    long long limit     = 0;
    long long remaining = 0;

    double percentRemaining() const {
        if (limit <= 0) return 100.0;
        return static_cast<double>(remaining) / static_cast<double>(limit) * 100.0;
    }
};

// Counts arrive as decimal strings; either used or remaining may be absent
std::optional<long long> count(const json& detail, const char* key) {
    auto it = detail.find(key);
    if (it == detail.end()) return std::nullopt;
    if (it->is_number_integer()) return it->get<long long>();
    if (!it->is_string()) return std::nullopt;
    const std::string s = it->get<std::string>();
    if (s.empty()) return std::nullopt;
    char* end = nullptr;
    long long v = std::strtoll(s.c_str(), &end, 10);
    if (*end != '\0') return std::nullopt;
    return v;
}

UsageNumbers usageNumbers(const json& detail) {
    UsageNumbers n;
    n.limit = count(detail, "limit").value_or(0);
    auto used      = count(detail, "used");
    auto remaining = count(detail, "remaining");

    if (used && remaining) {
        n.used = *used;
        n.remaining = *remaining;
    } else if (used) {
        n.used = *used;
        n.remaining = std::max(0LL, n.limit - *used);
    } else if (remaining) {
        n.used = std::max(0LL, n.limit - *remaining);
        n.remaining = *remaining;
    } else {
        n.remaining = std::max(0LL, n.limit);
    }
    return n;
}

std::optional<TimePoint> resetTime(const json& detail) {
    auto it = detail.find("resetTime");
    if (it == detail.end() || !it->is_string()) return std::nullopt;
    return ParseHelpers::isoTimestamp(it->get<std::string>());
}

// Prefer the 300-minute window; otherwise the first one listed
const json* sessionWindow(const json& coding) {
    auto limits = coding.find("limits");
    if (limits == coding.end() || !limits->is_array()) return nullptr;

    const json* first = nullptr;
    for (auto& l : *limits) {
        if (!l.is_object() || !l.contains("detail") || !l["detail"].is_object()) continue;
        const json window = l.value("window", json::object());
        if (window.value("duration", 0) == 300 &&
            window.value("timeUnit", "") == "TIME_UNIT_MINUTE")
            return &l;
        if (!first) first = &l;
    }
    return first;
}

} // namespace

std::string KimiParser::tierForLimit(long long weeklyLimit) {
    switch (weeklyLimit) {
        case 1024: return "Andante";
        case 2048: return "Moderato";
        case 7168: return "Allegretto";
        default:   return "";
    }
}

UsageSnapshot KimiParser::parseCli(const std::string& text, TimePoint now) {
    static const std::regex percentRe(R"((\d+)%\s+left)");
    static const std::regex resetRe(R"(\(resets\s+in\s+(.+?)\))", std::regex::icase);

    UsageSnapshot snapshot;
    snapshot.providerId = kProviderId;
    snapshot.capturedAt = now;

    for (auto& line : ParseHelpers::splitLines(ParseHelpers::stripAnsi(text))) {
        std::string lower = ParseHelpers::toLower(line);
        if (lower.find("% left") == std::string::npos) continue;

        QuotaType type;
        if (lower.find("weekly") != std::string::npos)
            type = QuotaType::weekly();
        else if (lower.find("5h") != std::string::npos || lower.find("hour") != std::string::npos)
            type = QuotaType::session();
        else
            continue;

        std::smatch m;
        if (!std::regex_search(line, m, percentRe)) continue;
        double percent = std::strtod(m[1].str().c_str(), nullptr);

        std::optional<std::string> resetText;
        std::optional<TimePoint> resetsAt;
        if (std::regex_search(line, m, resetRe)) {
            std::string raw = ParseHelpers::trim(m[1].str());
            resetText = "Resets in " + raw;
            resetsAt  = ParseHelpers::relativeResetTime(*resetText, now);
        }

        snapshot.quotas.emplace_back(percent, type, kProviderId, resetsAt, resetText);
    }

    if (snapshot.quotas.empty())
        throw ProbeError::parseFailed("No quota data found in Kimi CLI output");
    return snapshot;
}

UsageSnapshot KimiParser::parseUsages(const std::string& body, TimePoint now) {
    json doc = json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object() || !doc.contains("usages") ||
        !doc["usages"].is_array())
        throw ProbeError::parseFailed("Failed to decode Kimi response");

    const json* coding = nullptr;
    for (auto& u : doc["usages"])
        if (u.is_object() && u.contains("scope") && u["scope"] == "FEATURE_CODING") {
            coding = &u;
            break;
        }
    if (!coding || !coding->contains("detail") || !(*coding)["detail"].is_object())
        throw ProbeError::parseFailed("Missing FEATURE_CODING scope in response");

    UsageSnapshot snapshot;
    snapshot.providerId = kProviderId;
    snapshot.capturedAt = now;

    try {
        const json& detail = (*coding)["detail"];
        UsageNumbers weekly = usageNumbers(detail);
        snapshot.quotas.emplace_back(weekly.percentRemaining(), QuotaType::weekly(), kProviderId,
                                     resetTime(detail),
                                     std::to_string(weekly.used) + "/" +
                                         std::to_string(weekly.limit) + " requests");

        if (const json* rate = sessionWindow(*coding)) {
            const json& rateDetail = (*rate)["detail"];
            UsageNumbers n = usageNumbers(rateDetail);
            snapshot.quotas.emplace_back(n.percentRemaining(), QuotaType::session(), kProviderId,
                                         resetTime(rateDetail),
                                         std::to_string(n.used) + "/" +
                                             std::to_string(n.limit) + " requests (5h)");
        }

        std::string tier = tierForLimit(weekly.limit);
        if (!tier.empty()) snapshot.accountTier = tier;
    } catch (const json::exception& e) {
        throw ProbeError::parseFailed(std::string("Unexpected Kimi response: ") + e.what());
    }
    return snapshot;
}
