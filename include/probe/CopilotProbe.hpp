#pragma once
#include "IUsageProbe.hpp"
#include "auth/StoredCredential.hpp"
#include "net/IHttpTransport.hpp"
#include <string>

// GitHub Copilot premium requests from the user billing API. Needs a
// fine-grained PAT with "Plan: read" in GITHUB_TOKEN and the username.
class CopilotProbe : public IUsageProbe {
public:
    static constexpr const char* kApiBase    = "https://api.github.com";
    static constexpr const char* kApiVersion = "2022-11-28";
    static constexpr const char* kEnvToken   = "GITHUB_TOKEN";

    CopilotProbe(IHttpTransport& transport, std::string username, int monthlyLimit = 50,
                 EnvLookup env = systemEnvironment(), int timeoutMs = 15000)
        : transport_(transport), username_(std::move(username)),
          monthlyLimit_(monthlyLimit), env_(std::move(env)), timeoutMs_(timeoutMs) {}

    std::string id() const override { return "copilot"; }
    bool isAvailable() override;
    UsageSnapshot probe() override;

    // Trimmed GITHUB_TOKEN, nullopt when unset or blank
    static std::optional<std::string> githubToken(const EnvLookup& env);

private:
    IHttpTransport& transport_;
    std::string     username_;
    int             monthlyLimit_;
    EnvLookup       env_;
    int             timeoutMs_;
};

// Copilot Internal API (/copilot_internal/user). Covers Business and
// Enterprise seats that the billing API reports as empty. Needs a
// classic PAT with the "copilot" scope; no username.
class CopilotInternalProbe : public IUsageProbe {
public:
    CopilotInternalProbe(IHttpTransport& transport, EnvLookup env = systemEnvironment(),
                         int timeoutMs = 15000)
        : transport_(transport), env_(std::move(env)), timeoutMs_(timeoutMs) {}

    std::string id() const override { return "copilot"; }
    bool isAvailable() override;
    UsageSnapshot probe() override;

private:
    IHttpTransport& transport_;
    EnvLookup       env_;
    int             timeoutMs_;
};
