#pragma once
#include "parsers/MiniMaxParser.hpp"
#include "quota/UsageQuota.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <stdexcept>
#include <string>

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ProviderSettings {
    bool        enabled = true;
    std::string mode;           // "cli", "api" or, for copilot, "internal"; empty picks the default
};

struct AppConfig {
    QuotaThresholds thresholds;
    int    cliTimeoutSeconds   = 20;
    int    httpTimeoutMs       = 15000;
    size_t maxRecentSessions   = 10;
    std::map<std::string, ProviderSettings> providers;
    MiniMaxRegion minimaxRegion = MiniMaxRegion::International;
    std::string copilotUsername;
    int    copilotMonthlyLimit = 50;

    // Providers absent from the file are enabled in their default mode
    ProviderSettings provider(const std::string& id) const;
    bool enabled(const std::string& id) const { return provider(id).enabled; }

    // "api" for cursor, minimax and copilot, which have no CLI; "cli" otherwise
    static std::string defaultMode(const std::string& id);

    // "cli" and "api" everywhere; "internal" selects the Copilot Internal API
    static bool modeSupported(const std::string& id, const std::string& mode);

    static AppConfig fromJson(const nlohmann::json& config);

    // Throws ConfigError when the file is missing or malformed
    static AppConfig load(const std::string& path);
};
