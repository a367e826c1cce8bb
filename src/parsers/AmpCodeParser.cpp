#include "parsers/AmpCodeParser.hpp"
#include "parsers/ParseHelpers.hpp"
#include "quota/ProbeError.hpp"
#include <regex>

namespace {

constexpr const char* kProviderId = "ampcode";

std::optional<std::string> tierForLabel(const std::string& label) {
    if (ParseHelpers::toLower(label) == "amp free") return std::string("Free");
    return std::nullopt;
}

} // namespace

UsageSnapshot AmpCodeParser::parse(const std::string& text, TimePoint now) {
    static const std::regex emailRe(R"(Signed in as\s+(\S+)\s+\()");
    static const std::regex creditRe(
        R"(^(.+?):\s*\$([0-9]+(?:\.[0-9]+)?)\s*/\s*\$([0-9]+(?:\.[0-9]+)?)\s+remaining)",
        std::regex::icase);
    static const std::regex replenishRe(R"(\(replenishes\s+([^)]+)\))", std::regex::icase);

    UsageSnapshot snapshot;
    snapshot.providerId = kProviderId;
    snapshot.capturedAt = now;

    for (auto& raw : ParseHelpers::splitLines(ParseHelpers::stripAnsi(text))) {
        std::string line = ParseHelpers::trim(raw);
        if (line.empty()) continue;

        std::smatch m;
        if (!snapshot.accountEmail && std::regex_search(line, m, emailRe)) {
            snapshot.accountEmail = m[1].str();
            continue;
        }
        if (!std::regex_search(line, m, creditRe)) continue;

        std::string label = ParseHelpers::trim(m[1].str());
        double remaining = std::strtod(m[2].str().c_str(), nullptr);
        double total     = std::strtod(m[3].str().c_str(), nullptr);
        if (total <= 0) continue;

        std::optional<std::string> resetText;
        std::smatch r;
        if (std::regex_search(line, r, replenishRe))
            resetText = "Replenishes " + ParseHelpers::trim(r[1].str());

        snapshot.quotas.emplace_back(ParseHelpers::roundTo(remaining / total * 100.0, 2),
                                     QuotaType::modelSpecific(label), kProviderId,
                                     std::nullopt, resetText);
        if (!snapshot.accountTier) snapshot.accountTier = tierForLabel(label);
    }

    if (snapshot.quotas.empty())
        throw ProbeError::parseFailed("No valid credit lines found in amp usage output");
    return snapshot;
}
