#pragma once
#include "StoredCredential.hpp"
#include <filesystem>
#include <string>

// ~/.claude/.credentials.json, falling back to CLAUDE_CODE_OAUTH_TOKEN
class ClaudeCredentialStore : public ICredentialStore {
public:
    static constexpr const char* kEnvToken = "CLAUDE_CODE_OAUTH_TOKEN";

    explicit ClaudeCredentialStore(std::filesystem::path homeDirectory,
                                   EnvLookup env = systemEnvironment());

    std::optional<StoredCredential> load() override;
    bool save(const StoredCredential& credential) override;

    const std::filesystem::path& credentialsPath() const { return path_; }

    // Decodes the claudeAiOauth object; nullopt when the token is absent
    static std::optional<StoredCredential> fromJson(const std::string& body);

private:
    std::optional<StoredCredential> loadFile();
    std::optional<StoredCredential> loadEnvironment();

    std::filesystem::path path_;
    EnvLookup env_;
};
