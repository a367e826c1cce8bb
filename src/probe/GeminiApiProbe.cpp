#include "probe/GeminiApiProbe.hpp"
#include "parsers/ProviderParser.hpp"
#include "quota/ProbeError.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

std::optional<std::string> GeminiApiProbe::discoverProject(const std::string& accessToken) {
    HttpRequest req;
    req.url       = kProjectsUrl;
    req.timeoutMs = timeoutMs_;
    req.headers["Authorization"] = "Bearer " + accessToken;

    auto res = transport_.send(req);
    if (res.status != 200) {
        spdlog::debug("Gemini: project lookup failed (HTTP {})", res.status);
        return std::nullopt;
    }
    return GeminiParser::bestProject(res.body);
}

UsageSnapshot GeminiApiProbe::probe() {
    auto cred = store_.load();
    if (!cred) throw ProbeError::authenticationRequired();

    nlohmann::json body = nlohmann::json::object();
    if (auto project = discoverProject(cred->accessToken)) {
        spdlog::debug("Gemini: using project {}", *project);
        body["project"] = *project;
    }

    HttpRequest req;
    req.method    = "POST";
    req.url       = kQuotaUrl;
    req.body      = body.dump();
    req.timeoutMs = timeoutMs_;
    req.headers["Content-Type"] = "application/json";

    auto res = client_.send(req);
    if (res.status != 200) {
        spdlog::error("Gemini: HTTP error {}", res.status);
        throw ProbeError::executionFailed("HTTP " + std::to_string(res.status));
    }

    auto snapshot = parseOutput(GeminiApiFormat{}, res.body);
    for (auto& q : snapshot.quotas)
        spdlog::info("Gemini: {} {:.0f}% remaining", q.quotaType().displayName(),
                     q.percentRemaining());
    return snapshot;
}
