#include "parsers/CodexParser.hpp"
#include "parsers/ParseHelpers.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <regex>

using json = nlohmann::json;

namespace {

constexpr const char* kProviderId = "codex";

std::optional<json> findResponse(const std::string& output, int id) {
    for (auto& line : ParseHelpers::splitLines(output)) {
        std::string trimmed = ParseHelpers::trim(line);
        if (trimmed.empty() || trimmed[0] != '{') continue;

        json msg = json::parse(trimmed, nullptr, false);
        if (msg.is_discarded() || !msg.is_object()) continue;

        auto it = msg.find("id");
        if (it != msg.end() && it->is_number_integer() && it->get<int>() == id)
            return msg;
    }
    return std::nullopt;
}

} // namespace

std::optional<CodexRateWindow> CodexParser::parseWindow(const json& value, TimePoint now) {
    if (!value.is_object()) return std::nullopt;
    auto used = value.find("usedPercent");
    if (used == value.end() || !used->is_number()) return std::nullopt;

    CodexRateWindow window;
    window.usedPercent = used->get<double>();

    auto resets = value.find("resetsAt");
    if (resets != value.end() && resets->is_number()) {
        window.resetsAt = TimePoint(std::chrono::seconds(resets->get<long long>()));
        window.resetDescription = formatResetTime(*window.resetsAt, now);
    }
    return window;
}

CodexRateLimits CodexParser::parseRpcOutput(const std::string& output, int responseId,
                                            TimePoint now) {
    auto response = findResponse(output, responseId);
    if (!response)
        throw ProbeError::parseFailed("No rate limit response from codex app-server");

    if (auto err = response->find("error"); err != response->end()) {
        std::string message = err->dump();
        if (err->is_object() && err->contains("message") && (*err)["message"].is_string())
            message = (*err)["message"].get<std::string>();
        throw ProbeError::executionFailed("codex app-server: " + message);
    }

    auto result = response->find("result");
    if (result == response->end() || !result->is_object())
        throw ProbeError::parseFailed("codex app-server response has no result");

    auto rl = result->find("rateLimits");
    if (rl == result->end() || !rl->is_object())
        throw ProbeError::parseFailed("codex app-server response has no rateLimits");

    CodexRateLimits limits;
    if (auto plan = rl->find("planType"); plan != rl->end() && plan->is_string())
        limits.planType = plan->get<std::string>();
    if (auto p = rl->find("primary"); p != rl->end())   limits.primary   = parseWindow(*p, now);
    if (auto s = rl->find("secondary"); s != rl->end()) limits.secondary = parseWindow(*s, now);

    if (!limits.primary && !limits.secondary) {
        if (limits.planType == "free") {
            CodexRateWindow free;
            free.resetDescription = "Free plan";
            limits.primary = free;
        } else {
            throw ProbeError::parseFailed("No rate limits for plan " + limits.planType);
        }
    }
    return limits;
}

CodexRateLimits CodexParser::parseStatus(const std::string& text, TimePoint now) {
    static const std::regex resetRe(R"(\(resets\s+([^)]+)\))", std::regex::icase);

    CodexRateLimits limits;
    for (auto& line : ParseHelpers::splitLines(ParseHelpers::stripAnsi(text))) {
        bool session = ParseHelpers::containsIgnoreCase(line, "5h limit");
        bool weekly  = ParseHelpers::containsIgnoreCase(line, "weekly limit");
        if (!session && !weekly) continue;

        auto remaining = ParseHelpers::percentRemaining(line);
        if (!remaining) continue;

        CodexRateWindow window;
        window.usedPercent = 100.0 - *remaining;

        std::smatch m;
        if (std::regex_search(line, m, resetRe)) {
            std::string phrase = "Resets " + ParseHelpers::trim(m[1].str());
            window.resetDescription = phrase;
            window.resetsAt = ParseHelpers::resetTime(phrase, now);
        }

        if (session && !limits.primary)  limits.primary = window;
        if (weekly && !limits.secondary) limits.secondary = window;
    }

    if (!limits.primary && !limits.secondary) {
        if (auto err = extractUsageError(text)) throw *err;
        throw ProbeError::parseFailed("No rate limits in codex /status output");
    }
    return limits;
}

UsageSnapshot CodexParser::toSnapshot(const CodexRateLimits& limits, TimePoint now) {
    if (!limits.primary && !limits.secondary)
        throw ProbeError::parseFailed("No rate limits found");

    UsageSnapshot snapshot;
    snapshot.providerId = kProviderId;
    snapshot.capturedAt = now;
    if (!limits.planType.empty()) snapshot.accountTier = limits.planType;

    if (limits.primary)
        snapshot.quotas.emplace_back(100.0 - limits.primary->usedPercent, QuotaType::session(),
                                     kProviderId, limits.primary->resetsAt,
                                     limits.primary->resetDescription);
    if (limits.secondary)
        snapshot.quotas.emplace_back(100.0 - limits.secondary->usedPercent, QuotaType::weekly(),
                                     kProviderId, limits.secondary->resetsAt,
                                     limits.secondary->resetDescription);
    return snapshot;
}

std::string CodexParser::formatResetTime(TimePoint resetsAt, TimePoint now) {
    return UsageQuota(0, QuotaType::session(), kProviderId, resetsAt).resetDescription(now);
}

std::optional<ProbeError> CodexParser::extractUsageError(const std::string& text) {
    std::string lower = ParseHelpers::toLower(ParseHelpers::stripAnsi(text));

    if (lower.find("data not available yet") != std::string::npos)
        return ProbeError::noData();
    if (lower.find("update available") != std::string::npos &&
        lower.find("codex") != std::string::npos)
        return ProbeError::updateRequired("codex");
    if (lower.find("not logged in") != std::string::npos ||
        lower.find("please login") != std::string::npos ||
        lower.find("codex login") != std::string::npos)
        return ProbeError::authenticationRequired();
    return std::nullopt;
}
