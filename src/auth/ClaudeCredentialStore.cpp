#include "auth/ClaudeCredentialStore.hpp"
#include "auth/CredentialFile.hpp"
#include "parsers/ParseHelpers.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cstdlib>

EnvLookup systemEnvironment() {
    return [](const std::string& key) -> std::optional<std::string> {
        const char* val = std::getenv(key.c_str());
        if (!val) return std::nullopt;
        return std::string(val);
    };
}

ClaudeCredentialStore::ClaudeCredentialStore(std::filesystem::path homeDirectory,
                                             EnvLookup env)
    : path_(homeDirectory / ".claude" / ".credentials.json"),
      env_(std::move(env)) {}

std::optional<StoredCredential> ClaudeCredentialStore::fromJson(const std::string& body) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(body);
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Claude credentials are not valid JSON: {}", e.what());
        return std::nullopt;
    }

    if (!j.is_object() || !j.contains("claudeAiOauth") || !j["claudeAiOauth"].is_object())
        return std::nullopt;
    const auto& oauth = j["claudeAiOauth"];

    StoredCredential cred;
    cred.accessToken = oauth.value("accessToken", "");
    if (cred.accessToken.empty()) return std::nullopt;

    if (oauth.contains("refreshToken") && oauth["refreshToken"].is_string())
        cred.refreshToken = oauth["refreshToken"].get<std::string>();
    if (oauth.contains("expiresAt") && oauth["expiresAt"].is_number())
        cred.expiresAt = ParseHelpers::fromEpochMillis(oauth["expiresAt"].get<long long>());
    if (oauth.contains("subscriptionType") && oauth["subscriptionType"].is_string())
        cred.subscriptionType = oauth["subscriptionType"].get<std::string>();
    cred.source = StoredCredential::Source::File;
    return cred;
}

std::optional<StoredCredential> ClaudeCredentialStore::loadFile() {
    auto body = CredentialFile::read(path_);
    if (!body) return std::nullopt;
    return fromJson(*body);
}

std::optional<StoredCredential> ClaudeCredentialStore::loadEnvironment() {
    auto raw = env_ ? env_(kEnvToken) : std::nullopt;
    if (!raw) return std::nullopt;

    std::string token = ParseHelpers::trim(*raw);
    if (token.empty()) return std::nullopt;

    StoredCredential cred;
    cred.accessToken = token;
    cred.source = StoredCredential::Source::Environment;
    return cred;
}

std::optional<StoredCredential> ClaudeCredentialStore::load() {
    if (auto cred = loadFile()) {
        spdlog::debug("Claude credentials loaded from {}", path_.string());
        return cred;
    }
    if (auto cred = loadEnvironment()) {
        spdlog::debug("Claude credentials loaded from {}", kEnvToken);
        return cred;
    }
    return std::nullopt;
}

bool ClaudeCredentialStore::save(const StoredCredential& credential) {
    if (credential.source == StoredCredential::Source::Environment)
        return true;

    // Keep unrelated top-level keys (MCP OAuth entries and the like)
    nlohmann::json doc = nlohmann::json::object();
    if (auto body = CredentialFile::read(path_)) {
        try {
            auto existing = nlohmann::json::parse(*body);
            if (existing.is_object()) doc = existing;
        } catch (const nlohmann::json::exception& e) {
            spdlog::warn("Overwriting unreadable credentials file: {}", e.what());
        }
    }

    auto& oauth = doc["claudeAiOauth"];
    if (!oauth.is_object()) oauth = nlohmann::json::object();
    oauth["accessToken"] = credential.accessToken;
    if (credential.refreshToken)
        oauth["refreshToken"] = *credential.refreshToken;
    // A stale expiry left behind would force a refresh on every load
    if (credential.expiresAt)
        oauth["expiresAt"] = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 credential.expiresAt->time_since_epoch()).count();
    else
        oauth.erase("expiresAt");
    if (credential.subscriptionType)
        oauth["subscriptionType"] = *credential.subscriptionType;

    return CredentialFile::write(path_, doc.dump(2));
}
