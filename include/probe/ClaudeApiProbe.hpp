#pragma once
#include "IUsageProbe.hpp"
#include "auth/AuthorizedClient.hpp"
#include "auth/ClaudeCredentialStore.hpp"
#include "auth/OAuthRefresher.hpp"
#include "net/IHttpTransport.hpp"

// Claude usage straight from the OAuth usage endpoint, using the token
// the Claude CLI stored at login.
class ClaudeApiProbe : public IUsageProbe {
public:
    static constexpr const char* kUsageUrl  = "https://api.anthropic.com/api/oauth/usage";
    static constexpr const char* kBetaHeader = "oauth-2025-04-20";

    ClaudeApiProbe(IHttpTransport& transport, ICredentialStore& store,
                   OAuthRefresher& refresher, int timeoutMs = 15000)
        : store_(store), client_(transport, store, &refresher), timeoutMs_(timeoutMs) {}

    std::string id() const override { return "claude"; }
    bool isAvailable() override { return store_.load().has_value(); }
    UsageSnapshot probe() override;

private:
    ICredentialStore& store_;
    AuthorizedClient  client_;
    int               timeoutMs_;
};
