#include "parsers/ClaudeCliParser.hpp"
#include "parsers/ParseHelpers.hpp"
#include "quota/ProbeError.hpp"
#include <spdlog/spdlog.h>
#include <regex>

namespace {

constexpr const char* kProviderId = "claude";
constexpr const char* kMiddleDot  = "\xC2\xB7";   // ·

struct Section {
    QuotaType type;
    size_t    line;   // index of the title line
};

std::optional<QuotaType> sectionType(const std::string& line) {
    static const std::regex modelRe(R"(Current week \(([A-Za-z]+)(?: only)?\))");
    if (line.find("Current session") != std::string::npos)
        return QuotaType::session();
    if (line.find("Current week (all models)") != std::string::npos)
        return QuotaType::weekly();

    std::smatch m;
    if (std::regex_search(line, m, modelRe))
        return QuotaType::modelSpecific(ParseHelpers::toLower(m[1].str()));
    return std::nullopt;
}

bool endsSection(const std::string& line) {
    return sectionType(line).has_value() ||
           line.find("Extra usage") != std::string::npos ||
           line.find("Esc to cancel") != std::string::npos;
}

std::vector<std::string> splitHeader(const std::string& line) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = line.find(kMiddleDot, start);
        parts.push_back(ParseHelpers::trim(line.substr(start, pos == std::string::npos
                                                                  ? std::string::npos
                                                                  : pos - start)));
        if (pos == std::string::npos) break;
        start = pos + 2;
    }
    return parts;
}

// "Opus 4.5 · Claude Pro · Some User" -> {"Opus 4.5", "Claude Pro", "Some User"}
std::optional<std::vector<std::string>> findHeader(const std::vector<std::string>& lines) {
    for (auto& line : lines) {
        if (line.find(kMiddleDot) == std::string::npos) continue;
        auto parts = splitHeader(line);
        if (parts.size() < 2) continue;
        if (parts[1].find("Claude") != std::string::npos ||
            parts[1].find("API Usage Billing") != std::string::npos)
            return parts;
    }
    return std::nullopt;
}

std::optional<std::string> fieldValue(const std::vector<std::string>& lines,
                                      const std::string& key) {
    for (auto& line : lines) {
        auto pos = line.find(key);
        if (pos == std::string::npos) continue;
        std::string value = ParseHelpers::trim(line.substr(pos + key.size()));
        if (!value.empty()) return value;
    }
    return std::nullopt;
}

} // namespace

std::string ClaudeCliParser::detectAccountTier(const std::string& text) {
    auto lines = ParseHelpers::splitLines(ParseHelpers::stripAnsi(text));
    if (auto header = findHeader(lines)) {
        const std::string& plan = (*header)[1];
        if (plan.find("API Usage Billing") != std::string::npos) return AccountTier::ClaudeApi;
        if (plan.find("Claude Pro") != std::string::npos)        return AccountTier::ClaudePro;
        if (plan.find("Claude Max") != std::string::npos)        return AccountTier::ClaudeMax;
    }
    // "Claude API" subscriptions and header-less screens carry quotas like Max
    return AccountTier::ClaudeMax;
}

std::optional<std::string> ClaudeCliParser::extractReset(const std::string& labelSubstring,
                                                         const std::string& text) {
    auto lines = ParseHelpers::splitLines(ParseHelpers::stripAnsi(text));
    for (size_t i = 0; i < lines.size(); i++) {
        if (lines[i].find(labelSubstring) == std::string::npos) continue;
        for (size_t j = i + 1; j < lines.size() && j <= i + 4; j++) {
            if (endsSection(lines[j])) break;
            auto pos = lines[j].find("Resets");
            if (pos != std::string::npos)
                return ParseHelpers::collapseRepeat(lines[j].substr(pos));
        }
        return std::nullopt;
    }
    return std::nullopt;
}

std::optional<CostUsage> ClaudeCliParser::extractExtraUsage(const std::string& text) {
    auto lines = ParseHelpers::splitLines(ParseHelpers::stripAnsi(text));
    for (size_t i = 0; i < lines.size(); i++) {
        if (ParseHelpers::trim(lines[i]) != "Extra usage") continue;
        for (size_t j = i + 1; j < lines.size() && j <= i + 4; j++) {
            if (lines[j].find("not enabled") != std::string::npos) return std::nullopt;
            if (auto cost = ParseHelpers::costLine(lines[j])) return cost;
        }
    }
    return std::nullopt;
}

std::optional<double> ClaudeCliParser::extractCostValue(const std::string& line) {
    auto pos = line.find("Total cost:");
    if (pos == std::string::npos) return std::nullopt;
    return ParseHelpers::money(line.substr(pos + 11));
}

std::optional<double> ClaudeCliParser::extractApiDuration(const std::string& line) {
    auto pos = line.find("Total duration (API):");
    if (pos == std::string::npos) return std::nullopt;
    return ParseHelpers::durationSeconds(line.substr(pos + 21));
}

UsageSnapshot ClaudeCliParser::parse(const std::string& text, TimePoint now) {
    std::string clean = ParseHelpers::stripAnsi(text);
    auto lines = ParseHelpers::splitLines(clean);

    // Only surfaced when no quota made it onto the screen; an answered
    // trust prompt can still linger in the scrollback
    auto cliError = ParseHelpers::detectCliError(clean);

    std::string tier = detectAccountTier(clean);
    if (tier == AccountTier::ClaudeApi) {
        spdlog::info("Claude: API Usage Billing account, /usage unavailable");
        throw ProbeError::subscriptionRequired();
    }

    std::vector<Section> sections;
    for (size_t i = 0; i < lines.size(); i++) {
        if (auto type = sectionType(lines[i])) {
            bool duplicate = false;
            for (auto& s : sections) duplicate |= s.type == *type;
            if (!duplicate) sections.push_back({*type, i});
        }
    }

    UsageSnapshot snapshot;
    snapshot.providerId = kProviderId;
    snapshot.capturedAt = now;

    for (auto& section : sections) {
        std::optional<double> percent;
        std::optional<std::string> resetText;

        for (size_t j = section.line; j < lines.size() && j <= section.line + 4; j++) {
            if (j > section.line && endsSection(lines[j])) break;
            if (!percent) percent = ParseHelpers::percentRemaining(lines[j]);
            auto pos = lines[j].find("Resets");
            if (!resetText && pos != std::string::npos)
                resetText = ParseHelpers::collapseRepeat(lines[j].substr(pos));
        }
        if (!percent) continue;

        std::optional<TimePoint> resetsAt;
        if (resetText) resetsAt = ParseHelpers::resetTime(*resetText, now);

        snapshot.quotas.emplace_back(*percent, section.type, kProviderId,
                                     resetsAt, resetText);
    }

    if (snapshot.quotas.empty()) {
        if (cliError) throw *cliError;
        throw ProbeError::parseFailed("No usage data found in Claude output");
    }

    snapshot.accountTier  = tier;
    snapshot.accountEmail = fieldValue(lines, "Account:");
    if (!snapshot.accountEmail) snapshot.accountEmail = fieldValue(lines, "Email:");
    snapshot.accountOrganization = fieldValue(lines, "Organization:");
    snapshot.loginMethod         = fieldValue(lines, "Login method:");

    if (!snapshot.accountOrganization) {
        auto header = findHeader(lines);
        if (header && header->size() >= 3 && !(*header)[2].empty())
            snapshot.accountOrganization = (*header)[2];
    }

    snapshot.costUsage = extractExtraUsage(clean);
    return snapshot;
}

UsageSnapshot ClaudeCliParser::parseCost(const std::string& text) {
    auto lines = ParseHelpers::splitLines(ParseHelpers::stripAnsi(text));

    std::optional<double> cost;
    std::optional<double> apiDuration;
    for (auto& line : lines) {
        if (!cost)        cost = extractCostValue(line);
        if (!apiDuration) apiDuration = extractApiDuration(line);
    }
    if (!cost) throw ProbeError::parseFailed("No total cost in Claude /cost output");

    UsageSnapshot snapshot;
    snapshot.providerId  = kProviderId;
    snapshot.accountTier = AccountTier::ClaudeApi;

    CostUsage usage;
    usage.spent = *cost;
    usage.apiDurationSeconds = apiDuration;
    snapshot.costUsage = usage;
    return snapshot;
}
