#pragma once
#include "IUsageProbe.hpp"
#include "auth/AuthorizedClient.hpp"
#include "auth/EnvironmentTokenStore.hpp"
#include "net/IHttpTransport.hpp"
#include "parsers/ProviderParser.hpp"
#include "quota/ProbeError.hpp"
#include <spdlog/spdlog.h>

// MiniMax coding plan remains, keyed by MINIMAX_API_KEY
class MiniMaxProbe : public IUsageProbe {
public:
    static constexpr const char* kEnvKey = "MINIMAX_API_KEY";

    MiniMaxProbe(IHttpTransport& transport, MiniMaxRegion region,
                 EnvLookup env = systemEnvironment(), int timeoutMs = 15000)
        : region_(region), store_(kEnvKey, std::move(env)),
          client_(transport, store_), timeoutMs_(timeoutMs) {}

    std::string id() const override { return "minimax"; }
    bool isAvailable() override { return store_.load().has_value(); }

    UsageSnapshot probe() override {
        HttpRequest req;
        req.url       = MiniMaxEndpoints::codingPlanRemains(region_);
        req.timeoutMs = timeoutMs_;
        req.headers["Accept"] = "application/json";

        auto res = client_.send(req);
        if (res.status != 200)
            throw ProbeError::executionFailed("MiniMax API returned HTTP " +
                                              std::to_string(res.status));

        auto snapshot = parseOutput(MiniMaxFormat{id()}, res.body);
        spdlog::info("MiniMax: {} models", snapshot.quotas.size());
        return snapshot;
    }

    MiniMaxRegion region() const { return region_; }

private:
    MiniMaxRegion         region_;
    EnvironmentTokenStore store_;
    AuthorizedClient      client_;
    int                   timeoutMs_;
};
