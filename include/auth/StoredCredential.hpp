#pragma once
#include "quota/UsageQuota.hpp"
#include <chrono>
#include <functional>
#include <optional>
#include <string>

struct StoredCredential {
    enum class Source {
        File,           // on-disk store, refreshable and persistable
        Environment     // fixed setup token, never refreshed
    };

    std::string                accessToken;
    std::optional<std::string> refreshToken;
    std::optional<TimePoint>   expiresAt;
    std::optional<std::string> subscriptionType;
    Source                     source = Source::File;

    bool isExpired(TimePoint now = Clock::now()) const {
        return expiresAt && *expiresAt <= now;
    }

    // Unknown expiry counts as stale; so does expiry inside the margin
    bool needsRefresh(TimePoint now = Clock::now(),
                      std::chrono::seconds margin = std::chrono::minutes(5)) const {
        if (!expiresAt) return true;
        return *expiresAt - now <= margin;
    }

    bool canRefresh() const {
        return source == Source::File && refreshToken && !refreshToken->empty();
    }
};

// Environment lookup, injectable for tests
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

EnvLookup systemEnvironment();

// Abstract interface: provider-specific credential location
class ICredentialStore {
public:
    virtual ~ICredentialStore() = default;

    virtual std::optional<StoredCredential> load() = 0;

    // Persists a refreshed credential; false when the write failed.
    // Environment-sourced credentials are never written.
    virtual bool save(const StoredCredential& credential) = 0;
};
