#include "probe/KimiApiProbe.hpp"
#include "parsers/ProviderParser.hpp"
#include "quota/ProbeError.hpp"
#include <spdlog/spdlog.h>

UsageSnapshot KimiApiProbe::probe() {
    auto cred = store_.load();
    if (!cred) throw ProbeError::authenticationRequired();

    HttpRequest req;
    req.method    = "POST";
    req.url       = kUsageUrl;
    req.body      = R"({"scope":["FEATURE_CODING"]})";
    req.timeoutMs = timeoutMs_;
    req.headers["Content-Type"]             = "application/json";
    req.headers["Cookie"]                   = "kimi-auth=" + cred->accessToken;
    req.headers["Origin"]                   = "https://www.kimi.com";
    req.headers["Referer"]                  = "https://www.kimi.com/code/console";
    req.headers["Accept"]                   = "*/*";
    req.headers["connect-protocol-version"] = "1";
    req.headers["x-msh-platform"]           = "web";

    auto res = client_.send(req);
    if (res.status != 200) {
        spdlog::error("Kimi: HTTP {}", res.status);
        throw ProbeError::executionFailed("Kimi API returned HTTP " + std::to_string(res.status) +
                                          ": " + res.body);
    }

    auto snapshot = parseOutput(KimiApiFormat{}, res.body);
    spdlog::info("Kimi: {} quotas, tier {}", snapshot.quotas.size(),
                 snapshot.accountTier.value_or("unknown"));
    return snapshot;
}
