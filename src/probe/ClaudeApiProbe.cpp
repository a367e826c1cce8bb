#include "probe/ClaudeApiProbe.hpp"
#include "parsers/ProviderParser.hpp"
#include "quota/ProbeError.hpp"
#include <spdlog/spdlog.h>

UsageSnapshot ClaudeApiProbe::probe() {
    HttpRequest req;
    req.url       = kUsageUrl;
    req.timeoutMs = timeoutMs_;
    req.headers["anthropic-beta"] = kBetaHeader;
    req.headers["Accept"]         = "application/json";

    auto res = client_.send(req);
    spdlog::debug("Claude API: HTTP {}", res.status);
    if (res.status != 200)
        throw ProbeError::executionFailed("HTTP error: " + std::to_string(res.status));

    std::optional<std::string> subscription;
    if (client_.credential()) subscription = client_.credential()->subscriptionType;

    auto snapshot = parseOutput(ClaudeApiFormat{subscription}, res.body);
    spdlog::info("Claude API: {} quotas", snapshot.quotas.size());
    return snapshot;
}
