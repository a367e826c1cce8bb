#include "auth/ClaudeCredentialStore.hpp"
#include "auth/GeminiCredentialStore.hpp"
#include "auth/OAuthRefresher.hpp"
#include "config/AppConfig.hpp"
#include "monitor/QuotaMonitor.hpp"
#include "net/IHttpTransport.hpp"
#include "probe/ClaudeApiProbe.hpp"
#include "probe/CliUsageProbe.hpp"
#include "probe/CodexProbe.hpp"
#include "probe/CopilotProbe.hpp"
#include "probe/CursorProbe.hpp"
#include "probe/GeminiApiProbe.hpp"
#include "probe/KimiApiProbe.hpp"
#include "probe/MiniMaxProbe.hpp"
#include "probe/ProviderRegistry.hpp"
#include "process/PipeExecutor.hpp"
#include "process/PtyExecutor.hpp"
#include "session/SessionEventParser.hpp"
#include "session/SessionMonitor.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>

static std::atomic<bool> g_cancelled{false};

static void signalHandler(int sig) {
    spdlog::info("Received signal {}, cancelling running probes", sig);
    g_cancelled = true;
}

static std::string getEnv(const std::string& key,
                           const std::string& defaultVal = "") {
    const char* val = std::getenv(key.c_str());
    return val ? val : defaultVal;
}

static void loadDotEnv(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return;

    std::string line;
    while (std::getline(file, line)) {
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = line.substr(0, eq);
        std::string val = line.substr(eq + 1);
        // Remove quotes
        if (val.size() >= 2 && val.front() == '"' && val.back() == '"')
            val = val.substr(1, val.size() - 2);
        setenv(key.c_str(), val.c_str(), 0);  // don't override existing
    }
}

static void setupLogging() {
    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto fileSink    = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        "quotabar.log", 1048576 * 5, 3);  // 5MB, 3 files

    auto logger = std::make_shared<spdlog::logger>(
        "quotabar",
        spdlog::sinks_init_list{consoleSink, fileSink});
    spdlog::set_default_logger(logger);

    std::string logLevel = getEnv("QUOTABAR_LOG_LEVEL", "info");
    if (logLevel == "debug")      spdlog::set_level(spdlog::level::debug);
    else if (logLevel == "warn")  spdlog::set_level(spdlog::level::warn);
    else if (logLevel == "error") spdlog::set_level(spdlog::level::err);
    else                          spdlog::set_level(spdlog::level::info);
}

// Everything the probes borrow by reference; must outlive the monitor
struct ProbeDeps {
    std::filesystem::path home;
    std::string           workingDirectory;
    PtyExecutor           claudePty{std::vector<std::string>{ClaudeCredentialStore::kEnvToken}};
    PtyExecutor           pty;
    PipeExecutor          pipe;
    std::unique_ptr<IHttpTransport> transport = createHttpTransport();
    std::unique_ptr<ClaudeCredentialStore> claudeStore;
    std::unique_ptr<GeminiCredentialStore> geminiStore;
    std::unique_ptr<OAuthRefresher>        claudeRefresher;
};

static std::unique_ptr<IUsageProbe> makeProbe(const std::string& id,
                                              const std::string& mode,
                                              const AppConfig& cfg,
                                              ProbeDeps& deps) {
    auto cliTimeout = std::chrono::seconds(cfg.cliTimeoutSeconds);
    bool api = mode == "api";

    if (id == "claude") {
        if (api)
            return std::make_unique<ClaudeApiProbe>(*deps.transport, *deps.claudeStore,
                                                    *deps.claudeRefresher, cfg.httpTimeoutMs);
        return std::make_unique<ClaudeCliProbe>(deps.claudePty, deps.workingDirectory,
                                                cliTimeout);
    }
    if (id == "codex")
        return std::make_unique<CodexProbe>(deps.pipe, deps.pty, cliTimeout);
    if (id == "gemini") {
        if (api)
            return std::make_unique<GeminiApiProbe>(*deps.transport, *deps.geminiStore,
                                                    cfg.httpTimeoutMs);
        return std::make_unique<CliUsageProbe>(deps.pty, CliProbes::gemini(cliTimeout));
    }
    if (id == "kimi") {
        if (api)
            return std::make_unique<KimiApiProbe>(*deps.transport, systemEnvironment(),
                                                  cfg.httpTimeoutMs);
        return std::make_unique<CliUsageProbe>(deps.pty, CliProbes::kimi());
    }
    if (id == "kiro")
        return std::make_unique<CliUsageProbe>(deps.pipe, CliProbes::kiro());
    if (id == "ampcode")
        return std::make_unique<CliUsageProbe>(deps.pipe, CliProbes::ampCode());
    if (id == "cursor")
        return std::make_unique<CursorProbe>(*deps.transport, deps.pipe,
                                             CursorProbe::defaultStateDatabase(deps.home),
                                             systemEnvironment(), cfg.httpTimeoutMs);
    if (id == "minimax")
        return std::make_unique<MiniMaxProbe>(*deps.transport, cfg.minimaxRegion,
                                              systemEnvironment(), cfg.httpTimeoutMs);
    if (id == "copilot") {
        if (mode == "internal")
            return std::make_unique<CopilotInternalProbe>(*deps.transport, systemEnvironment(),
                                                          cfg.httpTimeoutMs);
        if (cfg.copilotUsername.empty()) {
            spdlog::warn("copilot: copilot_username is not set, skipping");
            return nullptr;
        }
        return std::make_unique<CopilotProbe>(*deps.transport, cfg.copilotUsername,
                                              cfg.copilotMonthlyLimit, systemEnvironment(),
                                              cfg.httpTimeoutMs);
    }

    spdlog::warn("No probe for provider '{}'", id);
    return nullptr;
}

static void printSnapshot(const ProviderRegistry& registry,
                          const UsageSnapshot& snap,
                          const QuotaThresholds& thresholds) {
    std::string header = registry.displayName(snap.providerId);
    if (snap.accountTier)  header += " (" + *snap.accountTier + ")";
    if (snap.accountEmail) header += " " + *snap.accountEmail;
    fmt::print("{} [{}]\n", header, quotaStatusName(snap.overallStatus(thresholds)));

    for (auto& q : snap.quotas) {
        fmt::print("  {:<14} {:>6.1f}%  {:<8}  {:<26}  {}\n",
                   q.quotaType().displayName(), q.percentRemaining(),
                   quotaStatusName(q.status(thresholds)),
                   q.paceInsight(thresholds, snap.capturedAt),
                   q.resetDescription(snap.capturedAt));
    }
    if (snap.costUsage) {
        std::string line = "  Cost           " + snap.costUsage->formattedSpent();
        if (snap.costUsage->budget)
            line += fmt::format(" of ${:.2f}", *snap.costUsage->budget);
        fmt::print("{}\n", line);
    }
}

static int runHookEvent(const AppConfig& cfg) {
    std::string payload((std::istreambuf_iterator<char>(std::cin)),
                        std::istreambuf_iterator<char>());

    auto event = SessionEventParser::parse(payload);
    if (!event) {
        spdlog::error("Hook payload rejected");
        return 1;
    }

    SessionMonitor sessions(cfg.maxRecentSessions);
    sessions.setListener([](const Session& s) {
        spdlog::info("Session {}: {} ({} subagents, {} tasks, {})", s.id(), s.phaseLabel(),
                     s.activeSubagentCount(), s.completedTaskCount(),
                     s.durationDescription());
    });
    sessions.processEvent(*event);

    if (!sessions.activeSession() && sessions.recentSessions().empty())
        spdlog::info("{} for {} has no tracked session", sessionEventNameString(event->name),
                     event->sessionId);
    return 0;
}

int main(int argc, char* argv[]) {
    // Load .env file
    loadDotEnv(".env");
    setupLogging();

    spdlog::info("quotabar v0.1.0 starting");

    bool hookMode = argc > 1 && std::string(argv[1]) == "--hook-event";

    std::string configPath = "config/quotabar.json";
    if (argc > (hookMode ? 2 : 1)) configPath = argv[hookMode ? 2 : 1];

    AppConfig cfg;
    try {
        cfg = AppConfig::load(configPath);
        spdlog::info("Loaded config: {}", configPath);
    } catch (const ConfigError& e) {
        if (!hookMode) {
            spdlog::error("{}", e.what());
            return 1;
        }
        spdlog::debug("{}; using defaults", e.what());
    }

    if (hookMode) return runHookEvent(cfg);

    // Setup signal handlers
    std::signal(SIGINT,  signalHandler);
    std::signal(SIGTERM, signalHandler);

    ProviderRegistry registry = ProviderRegistry::defaults();

    ProbeDeps deps;
    deps.home = getEnv("HOME", ".");
    deps.workingDirectory = std::filesystem::current_path().string();
    deps.claudePty.setCancelFlag(&g_cancelled);
    deps.pty.setCancelFlag(&g_cancelled);
    deps.pipe.setCancelFlag(&g_cancelled);
    deps.claudeStore = std::make_unique<ClaudeCredentialStore>(deps.home);
    deps.geminiStore = std::make_unique<GeminiCredentialStore>(deps.home);

    OAuthClientConfig oauth = OAuthClientConfig::claude();
    oauth.timeoutMs = cfg.httpTimeoutMs;
    deps.claudeRefresher = std::make_unique<OAuthRefresher>(*deps.transport, oauth);

    QuotaMonitor monitor(registry, cfg.thresholds);
    monitor.setAlertSink([](const QuotaAlert& alert) {
        fmt::print("! {}: {}\n", alert.title, alert.body);
    });

    for (auto& info : registry.all()) {
        ProviderSettings settings = cfg.provider(info.id);
        if (!settings.enabled) {
            spdlog::debug("{}: disabled", info.id);
            continue;
        }
        if (auto probe = makeProbe(info.id, settings.mode, cfg, deps)) {
            spdlog::info("{}: {} probe", info.id, settings.mode);
            monitor.addProbe(std::move(probe));
        }
    }

    auto refreshed = monitor.refreshAll();

    for (auto& id : monitor.probeIds()) {
        auto state = monitor.state(id);
        if (!state) continue;
        if (state->snapshot) {
            printSnapshot(registry, *state->snapshot, cfg.thresholds);
        } else if (state->lastError) {
            fmt::print("{} [error] {}\n", registry.displayName(id), state->lastError->what());
        }
    }

    spdlog::info("{} of {} providers refreshed", refreshed.size(), monitor.probeIds().size());
    return refreshed.empty() ? 1 : 0;
}
