#pragma once
#include "quota/UsageSnapshot.hpp"
#include <optional>
#include <string>

// Gemini: the CLI `/stats` model table, and the Code Assist
// retrieveUserQuota buckets.
class GeminiParser {
public:
    // Rows like "gemini-2.5-pro   -   100.0% (Resets in 24h)"
    static UsageSnapshot parseCli(const std::string& text, TimePoint now = Clock::now());

    // {"buckets": [{"modelId", "remainingFraction", "resetTime"}]};
    // keeps the lowest fraction per model, sorted by model id
    static UsageSnapshot parseQuota(const std::string& body, TimePoint now = Clock::now());

    // Picks the project to bill quota against from a cloudresourcemanager
    // project list: a "gen-lang-client" project, else one labelled
    // "generative-language", else nothing
    static std::optional<std::string> bestProject(const std::string& body);
};
