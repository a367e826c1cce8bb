#pragma once
#include <optional>
#include <string>
#include <vector>

struct ProviderInfo {
    std::string id;             // "claude"
    std::string name;           // "Claude"
    std::string binary;         // CLI executable, empty for API-only providers
    std::string dashboardUrl;
};

// Display metadata for every supported provider. Built once at startup
// and passed to whatever needs names.
class ProviderRegistry {
public:
    ProviderRegistry() = default;
    explicit ProviderRegistry(std::vector<ProviderInfo> providers)
        : providers_(std::move(providers)) {}

    // Built-in provider table
    static ProviderRegistry defaults();

    // Replaces an entry with the same id
    void add(ProviderInfo info);

    const ProviderInfo* find(const std::string& id) const;

    // Registered name, or the id itself when unknown
    std::string displayName(const std::string& id) const;

    const std::vector<ProviderInfo>& all() const { return providers_; }

private:
    std::vector<ProviderInfo> providers_;
};
