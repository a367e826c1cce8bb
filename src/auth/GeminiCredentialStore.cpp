#include "auth/GeminiCredentialStore.hpp"
#include "auth/CredentialFile.hpp"
#include "parsers/ParseHelpers.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

std::optional<StoredCredential> GeminiCredentialStore::load() {
    auto body = CredentialFile::read(path_);
    if (!body) return std::nullopt;

    try {
        auto j = nlohmann::json::parse(*body);
        StoredCredential cred;
        cred.accessToken = j.value("access_token", "");
        if (cred.accessToken.empty()) return std::nullopt;

        if (j.contains("refresh_token") && j["refresh_token"].is_string())
            cred.refreshToken = j["refresh_token"].get<std::string>();
        if (j.contains("expiry_date") && j["expiry_date"].is_number())
            cred.expiresAt = ParseHelpers::fromEpochMillis(j["expiry_date"].get<long long>());
        return cred;
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Gemini credentials unreadable: {}", e.what());
        return std::nullopt;
    }
}

bool GeminiCredentialStore::save(const StoredCredential& credential) {
    nlohmann::json doc = nlohmann::json::object();
    if (auto body = CredentialFile::read(path_)) {
        try {
            auto existing = nlohmann::json::parse(*body);
            if (existing.is_object()) doc = existing;
        } catch (const nlohmann::json::exception& e) {
            spdlog::warn("Overwriting unreadable Gemini credentials: {}", e.what());
        }
    }

    doc["access_token"] = credential.accessToken;
    if (credential.refreshToken) doc["refresh_token"] = *credential.refreshToken;
    if (credential.expiresAt)
        doc["expiry_date"] = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 credential.expiresAt->time_since_epoch()).count();
    else
        doc.erase("expiry_date");
    return CredentialFile::write(path_, doc.dump(2));
}
