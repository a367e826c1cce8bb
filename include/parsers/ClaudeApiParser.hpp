#pragma once
#include "quota/UsageSnapshot.hpp"
#include <optional>
#include <string>

// Parses the JSON body of GET api.anthropic.com/api/oauth/usage
//
//   { "five_hour":        { "utilization": 25.5, "resets_at": "..." },
//     "seven_day":        { ... },
//     "seven_day_opus":   { ... },
//     "extra_usage":      { "is_enabled": true, "used_credits": 541,
//                           "monthly_limit": 2000 } }
//
// utilization is percent used; credits are integer cents.
class ClaudeApiParser {
public:
    static UsageSnapshot parse(const std::string& body,
                               const std::optional<std::string>& subscriptionType = std::nullopt,
                               TimePoint now = Clock::now());

    // "claude_max" -> Claude Max, "claude_pro" -> Claude Pro
    static std::optional<std::string> tierFor(const std::optional<std::string>& subscriptionType);
};
