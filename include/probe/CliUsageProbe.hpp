#pragma once
#include "IUsageProbe.hpp"
#include "parsers/ProviderParser.hpp"
#include "process/ICliExecutor.hpp"
#include "quota/ProbeError.hpp"
#include <string>

struct CliProbeConfig {
    std::string    id;
    std::string    binary;
    ExecOptions    options;
    ProviderParser parser = ClaudeCliFormat{};
    bool           renderTerminal = true;      // replay escape sequences before parsing
    bool           requireZeroExit = false;    // non-zero exit is a failure, not a state
};

// Runs a provider CLI once and hands the rendered screen to its parser.
class CliUsageProbe : public IUsageProbe {
public:
    CliUsageProbe(ICliExecutor& executor, CliProbeConfig config)
        : executor_(executor), config_(std::move(config)) {}

    std::string id() const override { return config_.id; }
    bool isAvailable() override;
    UsageSnapshot probe() override;

    const CliProbeConfig& config() const { return config_; }

    static ProbeError fromProcessError(const ProcessError& e, const std::string& binary);

protected:
    // Executes with the given options and returns parse-ready text.
    // Throws ProbeError.
    std::string run(const ExecOptions& options);

    ICliExecutor&  executor_;
    CliProbeConfig config_;
};

// Claude: `/usage` for subscription accounts, `/cost` when the account
// bills per API call
class ClaudeCliProbe : public CliUsageProbe {
public:
    ClaudeCliProbe(ICliExecutor& executor, std::string workingDirectory,
                   std::chrono::milliseconds timeout = std::chrono::seconds(20));

    UsageSnapshot probe() override;

    static ExecOptions usageOptions(const std::string& workingDirectory,
                                    std::chrono::milliseconds timeout);
    static ExecOptions costOptions(const std::string& workingDirectory,
                                   std::chrono::milliseconds timeout);
};

// Provider CLI probes with fixed arguments and triggers
namespace CliProbes {
    CliProbeConfig kimi(std::chrono::milliseconds timeout = std::chrono::seconds(15));
    CliProbeConfig kiro(std::chrono::milliseconds timeout = std::chrono::seconds(30));
    CliProbeConfig ampCode(std::chrono::milliseconds timeout = std::chrono::seconds(8));
    CliProbeConfig gemini(std::chrono::milliseconds timeout = std::chrono::seconds(20));
}
