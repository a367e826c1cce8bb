#pragma once
#include "quota/UsageSnapshot.hpp"
#include <optional>
#include <string>

// Parses rendered `claude /usage` and `claude /cost` screens
class ClaudeCliParser {
public:
    static UsageSnapshot parse(const std::string& text, TimePoint now = Clock::now());

    // `/cost` output for pay-as-you-go accounts: no quotas, only spend
    static UsageSnapshot parseCost(const std::string& text);

    // Tier from the "Model · Plan · Account" header; Max when absent
    static std::string detectAccountTier(const std::string& text);

    static std::optional<CostUsage> extractExtraUsage(const std::string& text);

    // Text of the "Resets ..." line under the section whose title
    // contains labelSubstring, de-duplicated
    static std::optional<std::string> extractReset(const std::string& labelSubstring,
                                                   const std::string& text);

    static std::optional<double> extractCostValue(const std::string& line);
    static std::optional<double> extractApiDuration(const std::string& line);
};
