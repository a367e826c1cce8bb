#include "auth/OAuthRefresher.hpp"
#include "quota/ProbeError.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

OAuthClientConfig OAuthClientConfig::claude() {
    return {
        "https://platform.claude.com/v1/oauth/token",
        "9d1c250a-e61b-44d9-88ed-5944d1962f5e",
        15000,
        "Run `claude` in terminal to log in again."
    };
}

StoredCredential OAuthRefresher::refresh(const StoredCredential& credential, TimePoint now) {
    if (!credential.canRefresh()) {
        spdlog::warn("OAuth refresh requested without a refresh token");
        throw ProbeError::sessionExpired(config_.loginHint);
    }

    refreshCount_++;

    nlohmann::json body = {
        {"grant_type",    "refresh_token"},
        {"refresh_token", *credential.refreshToken},
        {"client_id",     config_.clientId}
    };

    HttpRequest req;
    req.method    = "POST";
    req.url       = config_.tokenUrl;
    req.body      = body.dump();
    req.timeoutMs = config_.timeoutMs;
    req.headers   = {{"Content-Type", "application/json"}};

    auto res = transport_.send(req);
    if (res.status == 0)
        throw ProbeError::executionFailed("Token refresh failed: " + res.error);

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(res.body);
    } catch (const nlohmann::json::exception&) {
        j = nlohmann::json::object();
    }

    std::string oauthError = j.is_object() ? j.value("error", "") : "";
    if (oauthError == "invalid_grant" || res.status == 400 || res.status == 401) {
        spdlog::warn("OAuth refresh rejected (HTTP {}, {})", res.status,
                     oauthError.empty() ? "no error code" : oauthError);
        throw ProbeError::sessionExpired(config_.loginHint);
    }
    if (res.status < 200 || res.status >= 300) {
        throw ProbeError::executionFailed(
            "Token refresh failed: HTTP " + std::to_string(res.status));
    }

    std::string accessToken = j.is_object() ? j.value("access_token", "") : "";
    if (accessToken.empty())
        throw ProbeError::executionFailed("Token refresh returned no access token");

    StoredCredential updated = credential;
    updated.accessToken = accessToken;
    if (j.contains("refresh_token") && j["refresh_token"].is_string())
        updated.refreshToken = j["refresh_token"].get<std::string>();
    if (j.contains("expires_in") && j["expires_in"].is_number())
        updated.expiresAt = now + std::chrono::seconds(j["expires_in"].get<long long>());
    else
        updated.expiresAt.reset();

    spdlog::info("OAuth token refreshed");
    return updated;
}
