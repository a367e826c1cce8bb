#include "config/AppConfig.hpp"
#include <spdlog/spdlog.h>
#include <fstream>

ProviderSettings AppConfig::provider(const std::string& id) const {
    ProviderSettings s;
    auto it = providers.find(id);
    if (it != providers.end()) s = it->second;
    if (s.mode.empty()) s.mode = defaultMode(id);
    return s;
}

std::string AppConfig::defaultMode(const std::string& id) {
    if (id == "cursor" || id == "minimax" || id == "copilot") return "api";
    return "cli";
}

bool AppConfig::modeSupported(const std::string& id, const std::string& mode) {
    if (mode == "cli" || mode == "api") return true;
    return mode == "internal" && id == "copilot";
}

AppConfig AppConfig::fromJson(const nlohmann::json& config) {
    if (!config.is_object())
        throw ConfigError("Config root must be an object");

    AppConfig out;
    try {
        if (auto t = config.find("thresholds"); t != config.end() && t->is_object()) {
            out.thresholds.healthyAbove     = t->value("healthy_above", 50.0);
            out.thresholds.warningAtOrAbove = t->value("warning_at_or_above", 20.0);
            out.thresholds.paceTolerance    = t->value("pace_tolerance", 5.0);
        }
        out.cliTimeoutSeconds   = config.value("cli_timeout_seconds", 20);
        out.httpTimeoutMs       = config.value("http_timeout_ms", 15000);
        out.maxRecentSessions   = config.value("max_recent_sessions", size_t{10});
        out.copilotUsername     = config.value("copilot_username", "");
        out.copilotMonthlyLimit = config.value("copilot_monthly_limit", 50);

        std::string region = config.value("minimax_region", "international");
        if (auto r = miniMaxRegionFromString(region))
            out.minimaxRegion = *r;
        else
            spdlog::warn("Unknown minimax_region '{}', using international", region);

        if (auto p = config.find("providers"); p != config.end() && p->is_object()) {
            for (auto& [id, entry] : p->items()) {
                if (!entry.is_object()) continue;
                ProviderSettings s;
                s.enabled = entry.value("enabled", true);
                s.mode    = entry.value("mode", "");
                if (!s.mode.empty() && !modeSupported(id, s.mode)) {
                    spdlog::warn("Provider {}: unknown mode '{}'", id, s.mode);
                    s.mode.clear();
                }
                out.providers[id] = s;
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Invalid config: ") + e.what());
    }

    if (out.thresholds.warningAtOrAbove > out.thresholds.healthyAbove)
        throw ConfigError("warning_at_or_above must not exceed healthy_above");
    if (out.cliTimeoutSeconds <= 0 || out.httpTimeoutMs <= 0)
        throw ConfigError("Timeouts must be positive");
    return out;
}

AppConfig AppConfig::load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open())
        throw ConfigError("Cannot open config file: " + path);

    nlohmann::json config = nlohmann::json::parse(f, nullptr, false);
    if (config.is_discarded())
        throw ConfigError("Config file is not valid JSON: " + path);
    return fromJson(config);
}
