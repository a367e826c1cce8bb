#include "parsers/ParseHelpers.hpp"
#include "parsers/ZoneClock.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <regex>

namespace {

int monthIndex(const std::string& name) {
    static const char* months[] = {"jan", "feb", "mar", "apr", "may", "jun",
                                   "jul", "aug", "sep", "oct", "nov", "dec"};
    std::string key = name.substr(0, 3);
    for (int i = 0; i < 12; i++)
        if (key == months[i]) return i + 1;
    return 0;
}

long long daysFromCivil(int y, int m, int d) {
    y -= m <= 2;
    long long era = (y >= 0 ? y : y - 399) / 400;
    unsigned yoe = static_cast<unsigned>(y - era * 400);
    unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long long>(doe) - 719468;
}

} // namespace

std::string ParseHelpers::trim(std::string_view s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(start, end - start + 1));
}

std::string ParseHelpers::toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::vector<std::string> ParseHelpers::splitLines(std::string_view text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string_view::npos) end = text.size();
        std::string line(text.substr(start, end - start));
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(std::move(line));
        start = end + 1;
    }
    return lines;
}

bool ParseHelpers::containsIgnoreCase(std::string_view haystack, std::string_view needle) {
    return toLower(haystack).find(toLower(needle)) != std::string::npos;
}

std::string ParseHelpers::stripAnsi(std::string_view text) {
    static const std::regex ansi(R"(\x1B(\[[0-?]*[ -/]*[@-~]|\][^\x07\x1B]*(\x07|\x1B\\)|[()][A-Za-z0-9]|[@-Z\\-_]))");
    return std::regex_replace(std::string(text), ansi, "");
}

std::optional<double> ParseHelpers::percentRemaining(std::string_view line) {
    static const std::regex re(R"((\d+(?:\.\d+)?)\s*%\s*(left|used|remaining))",
                               std::regex::icase);
    std::smatch m;
    std::string s(line);
    if (!std::regex_search(s, m, re)) return std::nullopt;

    double value = std::strtod(m[1].str().c_str(), nullptr);
    if (toLower(m[2].str()) == "used") return 100.0 - value;
    return value;
}

std::optional<double> ParseHelpers::durationSeconds(std::string_view text) {
    static const std::regex re(
        R"((\d+(?:\.\d+)?)\s*(days?|hours?|hrs?|minutes?|mins?|seconds?|secs?|d|h|m|s)\b)",
        std::regex::icase);

    std::string s(text);
    double total = 0;
    bool any = false;
    for (auto it = std::sregex_iterator(s.begin(), s.end(), re);
         it != std::sregex_iterator(); ++it) {
        double value = std::strtod((*it)[1].str().c_str(), nullptr);
        char unit = static_cast<char>(std::tolower((*it)[2].str()[0]));
        switch (unit) {
            case 'd': total += value * 86400; break;
            case 'h': total += value * 3600;  break;
            case 'm': total += value * 60;    break;
            case 's': total += value;         break;
            default: continue;
        }
        any = true;
    }
    if (!any) return std::nullopt;
    return total;
}

std::optional<TimePoint> ParseHelpers::relativeResetTime(std::string_view text, TimePoint now) {
    std::string lower = toLower(text);
    std::string_view rest(lower);
    auto in = lower.find("resets in ");
    if (in != std::string::npos)
        rest = rest.substr(in + 10);
    else if (lower.find("resets") != std::string::npos)
        return std::nullopt;   // absolute phrasing

    auto seconds = durationSeconds(rest);
    if (!seconds || *seconds <= 0) return std::nullopt;
    return now + std::chrono::duration_cast<Clock::duration>(
                     std::chrono::duration<double>(*seconds));
}

std::optional<TimePoint> ParseHelpers::absoluteResetTime(std::string_view text, TimePoint now) {
    static const std::regex zoneRe(R"(\(([A-Za-z_]+(?:/[A-Za-z0-9_+\-]+)*)\))");
    static const std::regex dateRe(
        R"(\b(jan|feb|mar|apr|may|jun|jul|aug|sep|oct|nov|dec)[a-z]*\.?\s+(\d{1,2})(?:,?\s*(\d{4}))?)");
    static const std::regex timeRe(R"(\b(\d{1,2})(?::(\d{2}))?\s*(am|pm)\b)");

    std::string original(text);
    std::smatch m;

    std::string zone;
    if (std::regex_search(original, m, zoneRe)) zone = m[1].str();

    std::string lower = toLower(original);
    // Drop the zone so its letters cannot match month names
    lower = std::regex_replace(lower, std::regex(R"(\([^)]*\))"), " ");

    int month = 0, day = 0, year = 0;
    bool hasDate = false;
    if (std::regex_search(lower, m, dateRe)) {
        month = monthIndex(m[1].str());
        day   = std::atoi(m[2].str().c_str());
        if (m[3].matched) year = std::atoi(m[3].str().c_str());
        hasDate = month > 0 && day >= 1 && day <= 31;
    }

    int hour = 0, minute = 0;
    bool hasTime = false;
    if (std::regex_search(lower, m, timeRe)) {
        hour = std::atoi(m[1].str().c_str());
        if (m[2].matched) minute = std::atoi(m[2].str().c_str());
        if (hour >= 1 && hour <= 12 && minute < 60) {
            bool pm = m[3].str() == "pm";
            if (hour == 12) hour = pm ? 12 : 0;
            else if (pm)    hour += 12;
            hasTime = true;
        }
    }

    if (!hasDate && !hasTime) return std::nullopt;

    ZoneClock clock(zone);
    std::tm today = clock.wallClock(now);

    if (!hasDate) {
        // Time only: today, or tomorrow if that moment has passed
        int y = today.tm_year + 1900, mo = today.tm_mon + 1, d = today.tm_mday;
        TimePoint candidate = clock.toInstant(y, mo, d, hour, minute);
        if (candidate <= now) {
            long long next = daysFromCivil(y, mo, d) + 1;
            std::time_t t = static_cast<std::time_t>(next * 86400);
            std::tm ymd{};
            gmtime_r(&t, &ymd);
            candidate = clock.toInstant(ymd.tm_year + 1900, ymd.tm_mon + 1,
                                        ymd.tm_mday, hour, minute);
        }
        return candidate;
    }

    if (year > 0)
        return clock.toInstant(year, month, day, hour, minute);

    // Month and day without a year: this year, or next if already past
    int y = today.tm_year + 1900;
    TimePoint candidate = clock.toInstant(y, month, day, hour, minute);
    if (candidate <= now)
        candidate = clock.toInstant(y + 1, month, day, hour, minute);
    return candidate;
}

std::optional<TimePoint> ParseHelpers::resetTime(std::string_view text, TimePoint now) {
    if (auto rel = relativeResetTime(text, now)) return rel;
    return absoluteResetTime(text, now);
}

std::string ParseHelpers::collapseRepeat(std::string_view line) {
    std::string s = trim(line);
    size_t n = s.size();
    if (n >= 2 && n % 2 == 0 && s.compare(0, n / 2, s, n / 2, n / 2) == 0)
        return s.substr(0, n / 2);

    // "Resets X Resets X" with whitespace between the copies
    for (size_t half = n / 2; half > 0; half--) {
        std::string first = trim(std::string_view(s).substr(0, half));
        std::string second = trim(std::string_view(s).substr(half));
        if (!first.empty() && first == second) return first;
    }
    return s;
}

std::optional<double> ParseHelpers::money(std::string_view text) {
    static const std::regex re(R"(\$?\s*(\d{1,3}(?:,\d{3})+|\d+)(\.\d+)?)");
    std::smatch m;
    std::string s(text);
    if (!std::regex_search(s, m, re)) return std::nullopt;

    std::string digits = m[1].str();
    digits.erase(std::remove(digits.begin(), digits.end(), ','), digits.end());
    if (m[2].matched) digits += m[2].str();
    return std::strtod(digits.c_str(), nullptr);
}

std::optional<CostUsage> ParseHelpers::costLine(std::string_view line) {
    static const std::regex re(
        R"(\$?\s*([\d,]+(?:\.\d+)?)\s*/\s*\$?\s*([\d,]+(?:\.\d+)?)\s*spent)",
        std::regex::icase);
    std::smatch m;
    std::string s(line);
    if (!std::regex_search(s, m, re)) return std::nullopt;

    auto spent  = money(m[1].str());
    auto budget = money(m[2].str());
    if (!spent || !budget) return std::nullopt;

    CostUsage cost;
    cost.spent  = *spent;
    cost.budget = *budget;

    auto resets = s.find("Resets", static_cast<size_t>(m.position(0) + m.length(0)));
    if (resets != std::string::npos) cost.resetText = collapseRepeat(s.substr(resets));
    return cost;
}

std::optional<TimePoint> ParseHelpers::isoTimestamp(std::string_view text) {
    static const std::regex re(
        R"((\d{4})-(\d{2})-(\d{2})[T ](\d{2}):(\d{2}):(\d{2})(\.\d+)?(Z|[+-]\d{2}:?\d{2})?)");
    std::smatch m;
    std::string s(text);
    if (!std::regex_search(s, m, re)) return std::nullopt;

    int y  = std::atoi(m[1].str().c_str());
    int mo = std::atoi(m[2].str().c_str());
    int d  = std::atoi(m[3].str().c_str());
    long long secs = daysFromCivil(y, mo, d) * 86400LL +
                     std::atoi(m[4].str().c_str()) * 3600LL +
                     std::atoi(m[5].str().c_str()) * 60LL +
                     std::atoi(m[6].str().c_str());

    double fraction = m[7].matched ? std::strtod(("0" + m[7].str()).c_str(), nullptr) : 0.0;

    if (m[8].matched && m[8].str() != "Z") {
        std::string off = m[8].str();
        off.erase(std::remove(off.begin(), off.end(), ':'), off.end());
        int sign = off[0] == '-' ? -1 : 1;
        int hh = std::atoi(off.substr(1, 2).c_str());
        int mm = std::atoi(off.substr(3, 2).c_str());
        secs -= sign * (hh * 3600LL + mm * 60LL);
    }

    auto instant = TimePoint(std::chrono::seconds(secs));
    return instant + std::chrono::duration_cast<Clock::duration>(
                         std::chrono::duration<double>(fraction));
}

double ParseHelpers::roundTo(double value, int decimals) {
    double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

std::optional<ProbeError> ParseHelpers::detectCliError(std::string_view text) {
    std::string lower = toLower(text);

    if (lower.find("do you trust the files in this folder") != std::string::npos ||
        lower.find("is this a project you created or one you trust") != std::string::npos ||
        lower.find("yes, i trust this folder") != std::string::npos)
        return ProbeError::folderTrustRequired("Claude CLI is waiting for folder trust");

    if (lower.find("only available for subscription plans") != std::string::npos)
        return ProbeError::subscriptionRequired();

    if (lower.find("token_expired") != std::string::npos ||
        lower.find("session has expired") != std::string::npos ||
        lower.find("token has expired") != std::string::npos)
        return ProbeError::sessionExpired("Run `claude` in terminal to log in again.");

    if (lower.find("authentication_error") != std::string::npos ||
        lower.find("not logged in") != std::string::npos ||
        lower.find("please run /login") != std::string::npos ||
        lower.find("claude login") != std::string::npos)
        return ProbeError::authenticationRequired();

    return std::nullopt;
}
