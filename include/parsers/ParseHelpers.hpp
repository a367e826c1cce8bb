#pragma once
#include "quota/ProbeError.hpp"
#include "quota/UsageSnapshot.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Text routines shared by every provider parser
class ParseHelpers {
public:
    static std::string trim(std::string_view s);
    static std::string toLower(std::string_view s);
    static std::vector<std::string> splitLines(std::string_view text);
    static bool containsIgnoreCase(std::string_view haystack, std::string_view needle);

    // Removes ESC sequences without emulating cursor movement
    static std::string stripAnsi(std::string_view text);

    // "65% left" -> 65, "25% used" -> 75, "40% remaining" -> 40
    static std::optional<double> percentRemaining(std::string_view line);

    // "2h 15m", "6d 23h 22m", "6m 19.7s", "30 minutes" -> seconds
    static std::optional<double> durationSeconds(std::string_view text);

    // Relative phrase ("Resets in 2h 15m", "resets in 30m") -> now + duration
    static std::optional<TimePoint> relativeResetTime(std::string_view text,
                                                      TimePoint now = Clock::now());

    // Absolute phrase ("Resets 4:59pm (America/New_York)",
    // "Resets Dec 25 at 4:59am (Asia/Shanghai)", "Resets Jan 1, 2026")
    // -> next future occurrence in the named zone, else local zone
    static std::optional<TimePoint> absoluteResetTime(std::string_view text,
                                                      TimePoint now = Clock::now());

    // Tries relative first, then absolute
    static std::optional<TimePoint> resetTime(std::string_view text,
                                              TimePoint now = Clock::now());

    // Collapses "XX" into "X" when a line is a phrase repeated back to
    // back by a terminal redraw
    static std::string collapseRepeat(std::string_view line);

    // "$1,234.56" / "1234.56" -> 1234.56
    static std::optional<double> money(std::string_view text);

    // "$5.41 / $20.00 spent" -> {spent, budget}
    static std::optional<CostUsage> costLine(std::string_view line);

    // Integer minor units (cents) to major units
    static double centsToDollars(long long cents) {
        return static_cast<double>(cents) / 100.0;
    }

    // ISO-8601 "2025-01-15T14:30:00Z" / with fraction / with offset
    static std::optional<TimePoint> isoTimestamp(std::string_view text);

    static TimePoint fromEpochMillis(long long ms) {
        return TimePoint(std::chrono::milliseconds(ms));
    }

    static double roundTo(double value, int decimals);

    // Trust prompts, auth failures and plan gating common to CLI output
    static std::optional<ProbeError> detectCliError(std::string_view text);
};
