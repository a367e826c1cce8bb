#include "parsers/KiroParser.hpp"
#include "parsers/ParseHelpers.hpp"
#include "parsers/ZoneClock.hpp"
#include "quota/ProbeError.hpp"
#include <algorithm>
#include <regex>

namespace {

constexpr const char* kProviderId = "kiro";

double remainingPercent(double used, double total) {
    if (total <= 0) return 0;
    return std::max(0.0, (total - used) / total * 100.0);
}

// "03/01" in the local zone, this year or next if already past
TimePoint nextMonthDay(int month, int day, TimePoint now) {
    ZoneClock local;
    int year = local.wallClock(now).tm_year + 1900;
    TimePoint candidate = local.toInstant(year, month, day, 0, 0);
    if (candidate <= now) candidate = local.toInstant(year + 1, month, day, 0, 0);
    return candidate;
}

} // namespace

UsageSnapshot KiroParser::parse(const std::string& text, TimePoint now) {
    static const std::regex bonusRe(R"(Bonus credits:\s*([\d.]+)/([\d.]+))");
    static const std::regex expiryRe(R"(expires in (\d+) days)");
    static const std::regex creditsRe(R"(Credits \(([\d.]+) of ([\d.]+))");
    static const std::regex resetOnRe(R"(resets on (\d{2})/(\d{2}))");

    std::string clean = ParseHelpers::stripAnsi(text);

    UsageSnapshot snapshot;
    snapshot.providerId = kProviderId;
    snapshot.capturedAt = now;

    std::smatch m;
    if (std::regex_search(clean, m, bonusRe)) {
        double used  = std::strtod(m[1].str().c_str(), nullptr);
        double total = std::strtod(m[2].str().c_str(), nullptr);

        std::optional<TimePoint> resetsAt;
        std::optional<std::string> resetText;
        std::smatch e;
        if (std::regex_search(clean, e, expiryRe)) {
            int days = std::atoi(e[1].str().c_str());
            resetsAt  = now + std::chrono::hours(24 * days);
            resetText = "Expires in " + std::to_string(days) + " days";
        }
        snapshot.quotas.emplace_back(remainingPercent(used, total), QuotaType::weekly(),
                                     kProviderId, resetsAt, resetText);
    }

    if (std::regex_search(clean, m, creditsRe)) {
        double used  = std::strtod(m[1].str().c_str(), nullptr);
        double total = std::strtod(m[2].str().c_str(), nullptr);

        std::optional<TimePoint> resetsAt;
        std::optional<std::string> resetText;
        std::smatch r;
        if (std::regex_search(clean, r, resetOnRe)) {
            int month = std::atoi(r[1].str().c_str());
            int day   = std::atoi(r[2].str().c_str());
            resetText = "Resets on " + r[1].str() + "/" + r[2].str();
            if (month >= 1 && month <= 12 && day >= 1 && day <= 31)
                resetsAt = nextMonthDay(month, day, now);
        }
        snapshot.quotas.emplace_back(remainingPercent(used, total), QuotaType::timeLimit("Monthly"),
                                     kProviderId, resetsAt, resetText);
    }

    if (snapshot.quotas.empty())
        throw ProbeError::parseFailed("No quota data found in Kiro CLI output");
    return snapshot;
}
