#pragma once
#include "StoredCredential.hpp"
#include "parsers/ParseHelpers.hpp"
#include <string>

// A bare API key or session token taken from one environment variable.
// Never refreshed and never written.
class EnvironmentTokenStore : public ICredentialStore {
public:
    explicit EnvironmentTokenStore(std::string variable, EnvLookup env = systemEnvironment())
        : variable_(std::move(variable)), env_(std::move(env)) {}

    std::optional<StoredCredential> load() override {
        auto value = env_(variable_);
        if (!value) return std::nullopt;
        std::string token = ParseHelpers::trim(*value);
        if (token.empty()) return std::nullopt;

        StoredCredential cred;
        cred.accessToken = token;
        cred.source = StoredCredential::Source::Environment;
        return cred;
    }

    bool save(const StoredCredential&) override { return true; }

    const std::string& variable() const { return variable_; }

private:
    std::string variable_;
    EnvLookup env_;
};
