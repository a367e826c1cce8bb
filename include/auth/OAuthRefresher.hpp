#pragma once
#include "StoredCredential.hpp"
#include "net/IHttpTransport.hpp"
#include <string>

struct OAuthClientConfig {
    std::string tokenUrl;
    std::string clientId;
    int         timeoutMs = 15000;
    std::string loginHint;      // shown when the grant is rejected

    static OAuthClientConfig claude();
};

// Exchanges a refresh token for a new token set. One HTTP call per
// refresh(); never retries.
class OAuthRefresher {
public:
    OAuthRefresher(IHttpTransport& transport, OAuthClientConfig config)
        : transport_(transport), config_(std::move(config)) {}

    // Throws ProbeError: SessionExpired when the grant is rejected,
    // ExecutionFailed for transport or server trouble
    StoredCredential refresh(const StoredCredential& credential,
                             TimePoint now = Clock::now());

    int refreshCount() const { return refreshCount_; }
    const std::string& loginHint() const { return config_.loginHint; }

private:
    IHttpTransport&   transport_;
    OAuthClientConfig config_;
    int               refreshCount_ = 0;
};
