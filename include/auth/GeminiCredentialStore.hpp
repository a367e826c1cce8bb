#pragma once
#include "StoredCredential.hpp"
#include <filesystem>

// ~/.gemini/oauth_creds.json written by the Gemini CLI login flow
class GeminiCredentialStore : public ICredentialStore {
public:
    explicit GeminiCredentialStore(std::filesystem::path homeDirectory)
        : path_(homeDirectory / ".gemini" / "oauth_creds.json") {}

    std::optional<StoredCredential> load() override;
    bool save(const StoredCredential& credential) override;

    const std::filesystem::path& credentialsPath() const { return path_; }

private:
    std::filesystem::path path_;
};
