#pragma once
#include "IUsageProbe.hpp"
#include "auth/AuthorizedClient.hpp"
#include "auth/EnvironmentTokenStore.hpp"
#include "net/IHttpTransport.hpp"

// Kimi Code billing usage, authenticated by the kimi-auth web token
// from KIMI_AUTH_TOKEN
class KimiApiProbe : public IUsageProbe {
public:
    static constexpr const char* kUsageUrl =
        "https://www.kimi.com/apiv2/kimi.gateway.billing.v1.BillingService/GetUsages";
    static constexpr const char* kEnvToken = "KIMI_AUTH_TOKEN";

    KimiApiProbe(IHttpTransport& transport, EnvLookup env = systemEnvironment(),
                 int timeoutMs = 15000)
        : store_(kEnvToken, std::move(env)), client_(transport, store_), timeoutMs_(timeoutMs) {}

    std::string id() const override { return "kimi"; }
    bool isAvailable() override { return store_.load().has_value(); }
    UsageSnapshot probe() override;

private:
    EnvironmentTokenStore store_;
    AuthorizedClient      client_;
    int                   timeoutMs_;
};
