#include "parsers/GeminiParser.hpp"
#include "parsers/ParseHelpers.hpp"
#include "quota/ProbeError.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <map>
#include <regex>

using json = nlohmann::json;

namespace {

constexpr const char* kProviderId  = "gemini";
constexpr const char* kBoxVertical = "\xE2\x94\x82";   // │

std::string replaceAll(std::string s, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
    return s;
}

} // namespace

UsageSnapshot GeminiParser::parseCli(const std::string& text, TimePoint now) {
    static const std::regex rowRe(
        R"((gemini[-\w.]+)\s+.*?([0-9]+(?:\.[0-9]+)?)\s*%\s*\(([^)]+)\))",
        std::regex::icase);

    std::string clean = ParseHelpers::stripAnsi(text);
    std::string lower = ParseHelpers::toLower(clean);
    if (lower.find("login with google") != std::string::npos ||
        lower.find("use gemini api key") != std::string::npos ||
        lower.find("waiting for auth") != std::string::npos)
        throw ProbeError::authenticationRequired();

    UsageSnapshot snapshot;
    snapshot.providerId = kProviderId;
    snapshot.capturedAt = now;

    for (auto& raw : ParseHelpers::splitLines(clean)) {
        std::string line = replaceAll(raw, kBoxVertical, " ");
        std::smatch m;
        if (!std::regex_search(line, m, rowRe)) continue;

        double percent = std::strtod(m[2].str().c_str(), nullptr);
        std::string resetText = ParseHelpers::trim(m[3].str());
        snapshot.quotas.emplace_back(percent, QuotaType::modelSpecific(m[1].str()), kProviderId,
                                     ParseHelpers::relativeResetTime(resetText, now),
                                     resetText);
    }

    if (snapshot.quotas.empty())
        throw ProbeError::parseFailed("No usage data found in output");
    return snapshot;
}

UsageSnapshot GeminiParser::parseQuota(const std::string& body, TimePoint now) {
    json doc = json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object())
        throw ProbeError::parseFailed("Invalid quota response");

    auto buckets = doc.find("buckets");
    if (buckets == doc.end() || !buckets->is_array() || buckets->empty())
        throw ProbeError::parseFailed("No quota buckets in response");

    struct Lowest {
        double fraction;
        std::optional<std::string> resetTime;
    };
    std::map<std::string, Lowest> byModel;   // ordered by model id

    for (auto& b : *buckets) {
        if (!b.is_object()) continue;
        auto model    = b.find("modelId");
        auto fraction = b.find("remainingFraction");
        if (model == b.end() || !model->is_string() ||
            fraction == b.end() || !fraction->is_number())
            continue;

        std::optional<std::string> resetTime;
        if (auto r = b.find("resetTime"); r != b.end() && r->is_string())
            resetTime = r->get<std::string>();

        double f = fraction->get<double>();
        auto [it, inserted] = byModel.try_emplace(model->get<std::string>(), Lowest{f, resetTime});
        if (!inserted && f < it->second.fraction) it->second = {f, resetTime};
    }

    UsageSnapshot snapshot;
    snapshot.providerId = kProviderId;
    snapshot.capturedAt = now;
    for (auto& [model, lowest] : byModel) {
        std::optional<TimePoint> resetsAt;
        std::optional<std::string> resetText;
        if (lowest.resetTime) {
            resetsAt  = ParseHelpers::isoTimestamp(*lowest.resetTime);
            resetText = "Resets " + *lowest.resetTime;
        }
        snapshot.quotas.emplace_back(lowest.fraction * 100.0, QuotaType::modelSpecific(model),
                                     kProviderId, resetsAt, resetText);
    }

    if (snapshot.quotas.empty())
        throw ProbeError::parseFailed("No valid quotas found");
    return snapshot;
}

std::optional<std::string> GeminiParser::bestProject(const std::string& body) {
    json doc = json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) return std::nullopt;

    auto projects = doc.find("projects");
    if (projects == doc.end() || !projects->is_array()) return std::nullopt;

    std::optional<std::string> labelled;
    for (auto& p : *projects) {
        if (!p.is_object() || !p.contains("projectId") || !p["projectId"].is_string()) continue;
        std::string id = p["projectId"].get<std::string>();
        if (id.empty()) continue;
        if (id.rfind("gen-lang-client", 0) == 0) return id;

        auto labels = p.find("labels");
        if (!labelled && labels != p.end() && labels->is_object() &&
            labels->contains("generative-language"))
            labelled = id;
    }
    return labelled;
}
