#pragma once
#include "quota/ProbeError.hpp"
#include "quota/UsageSnapshot.hpp"
#include <optional>
#include <string>

struct CodexRateWindow {
    double                     usedPercent = 0;
    std::optional<TimePoint>   resetsAt;
    std::optional<std::string> resetDescription;   // "Resets in 2h 10m", "Free plan"
};

struct CodexRateLimits {
    std::string                    planType;
    std::optional<CodexRateWindow> primary;     // 5h window
    std::optional<CodexRateWindow> secondary;   // weekly window
};

// Codex exposes usage two ways: the `codex app-server` JSON-RPC
// `account/rateLimits/read` result, and the TTY `/status` screen.
class CodexParser {
public:
    // Picks the response with the given id out of newline-delimited
    // JSON-RPC traffic. Throws ExecutionFailed on an RPC error object
    // and ParseFailed when no usable rate limits came back.
    static CodexRateLimits parseRpcOutput(const std::string& output,
                                          int responseId = 2,
                                          TimePoint now = Clock::now());

    // {"usedPercent": 45.5, "resetsAt": 1735000000}; nullopt unless
    // usedPercent is a number
    static std::optional<CodexRateWindow> parseWindow(const nlohmann::json& value,
                                                      TimePoint now = Clock::now());

    // "  5h limit:  [████░░] 60% left (resets 14:32)"
    static CodexRateLimits parseStatus(const std::string& text, TimePoint now = Clock::now());

    // primary -> session, secondary -> weekly; throws when both are absent
    static UsageSnapshot toSnapshot(const CodexRateLimits& limits, TimePoint now = Clock::now());

    static std::string formatResetTime(TimePoint resetsAt, TimePoint now = Clock::now());

    // Known failure banners in CLI output
    static std::optional<ProbeError> extractUsageError(const std::string& text);
};
