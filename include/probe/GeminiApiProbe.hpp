#pragma once
#include "IUsageProbe.hpp"
#include "auth/AuthorizedClient.hpp"
#include "auth/GeminiCredentialStore.hpp"
#include "net/IHttpTransport.hpp"
#include <optional>

// Gemini Code Assist quota buckets, billed against the user's
// generative-language project when one can be found.
class GeminiApiProbe : public IUsageProbe {
public:
    static constexpr const char* kQuotaUrl =
        "https://cloudcode-pa.googleapis.com/v1internal:retrieveUserQuota";
    static constexpr const char* kProjectsUrl =
        "https://cloudresourcemanager.googleapis.com/v1/projects";

    GeminiApiProbe(IHttpTransport& transport, ICredentialStore& store, int timeoutMs = 15000)
        : transport_(transport), store_(store), client_(transport, store), timeoutMs_(timeoutMs) {}

    std::string id() const override { return "gemini"; }
    bool isAvailable() override { return store_.load().has_value(); }
    UsageSnapshot probe() override;

private:
    // Best effort; nullopt on any failure
    std::optional<std::string> discoverProject(const std::string& accessToken);

    IHttpTransport&   transport_;
    ICredentialStore& store_;
    AuthorizedClient  client_;
    int               timeoutMs_;
};
