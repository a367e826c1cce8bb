#include "probe/CopilotProbe.hpp"
#include "parsers/ParseHelpers.hpp"
#include "parsers/ProviderParser.hpp"
#include "quota/ProbeError.hpp"
#include <spdlog/spdlog.h>

namespace {

// 200 passes; everything else becomes the matching ProbeError
void checkStatus(const HttpResponse& res, const char* forbidden, const char* notFound) {
    switch (res.status) {
        case 200:
            return;
        case 0:
            throw ProbeError::executionFailed(res.error.empty() ? "No response" : res.error);
        case 401:
            throw ProbeError::authenticationRequired();
        case 403:
            throw ProbeError::executionFailed(forbidden);
        case 404:
            throw ProbeError::executionFailed(notFound);
        default:
            throw ProbeError::executionFailed("HTTP error: " + std::to_string(res.status));
    }
}

} // namespace

std::optional<std::string> CopilotProbe::githubToken(const EnvLookup& env) {
    auto value = env(kEnvToken);
    if (!value) return std::nullopt;
    std::string t = ParseHelpers::trim(*value);
    if (t.empty()) return std::nullopt;
    return t;
}

bool CopilotProbe::isAvailable() {
    return githubToken(env_).has_value() && !username_.empty();
}

UsageSnapshot CopilotProbe::probe() {
    auto tok = githubToken(env_);
    if (!tok) throw ProbeError::authenticationRequired();
    if (username_.empty()) throw ProbeError::executionFailed("GitHub username not configured");

    HttpRequest req;
    req.url       = std::string(kApiBase) + "/users/" + username_ +
                    "/settings/billing/premium_request/usage";
    req.timeoutMs = timeoutMs_;
    req.headers["Authorization"]        = "Bearer " + *tok;
    req.headers["Accept"]               = "application/vnd.github+json";
    req.headers["X-GitHub-Api-Version"] = kApiVersion;

    auto res = transport_.send(req);
    spdlog::debug("Copilot: HTTP {}", res.status);
    checkStatus(res, "Forbidden - ensure PAT has 'Plan: read' permission",
                "User not found or no billing access");

    return parseOutput(CopilotFormat{username_, monthlyLimit_}, res.body);
}

bool CopilotInternalProbe::isAvailable() {
    return CopilotProbe::githubToken(env_).has_value();
}

UsageSnapshot CopilotInternalProbe::probe() {
    auto tok = CopilotProbe::githubToken(env_);
    if (!tok) throw ProbeError::authenticationRequired();

    HttpRequest req;
    req.url       = std::string(CopilotProbe::kApiBase) + "/copilot_internal/user";
    req.timeoutMs = timeoutMs_;
    req.headers["Authorization"] = "Bearer " + *tok;
    req.headers["Accept"]        = "application/json";

    auto res = transport_.send(req);
    spdlog::debug("Copilot internal API: HTTP {}", res.status);
    checkStatus(res, "Forbidden - ensure classic PAT has 'copilot' scope",
                "No Copilot subscription found");

    return parseOutput(CopilotInternalFormat{}, res.body);
}
