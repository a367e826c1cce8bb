#include "probe/CliUsageProbe.hpp"
#include "terminal/TerminalRenderer.hpp"
#include <spdlog/spdlog.h>

ProbeError CliUsageProbe::fromProcessError(const ProcessError& e, const std::string& binary) {
    switch (e.kind()) {
        case ProcessError::Kind::BinaryNotFound: return ProbeError::binaryNotFound(binary);
        case ProcessError::Kind::TimedOut:       return ProbeError::timeout();
        case ProcessError::Kind::LaunchFailed:
        case ProcessError::Kind::Cancelled:      break;
    }
    return ProbeError::executionFailed(e.what());
}

bool CliUsageProbe::isAvailable() {
    return executor_.locate(config_.binary).has_value();
}

std::string CliUsageProbe::run(const ExecOptions& options) {
    if (!executor_.locate(config_.binary)) {
        spdlog::warn("{}: '{}' not found on the login shell PATH", config_.id, config_.binary);
        throw ProbeError::binaryNotFound(config_.binary);
    }

    CliResult result;
    try {
        result = executor_.execute(config_.binary, options);
    } catch (const ProcessError& e) {
        spdlog::error("{}: {}", config_.id, e.what());
        throw fromProcessError(e, config_.binary);
    }

    if (config_.requireZeroExit && result.exitCode != 0 && !result.quiesced)
        throw ProbeError::executionFailed(config_.binary + " exited with code " +
                                          std::to_string(result.exitCode));

    spdlog::debug("{}: {} bytes of output, exit {}", config_.id, result.output.size(),
                  result.exitCode);
    if (!config_.renderTerminal) return result.output;
    return TerminalRenderer::render(result.output);
}

UsageSnapshot CliUsageProbe::probe() {
    std::string text = run(config_.options);
    auto snapshot = parseOutput(config_.parser, text);
    spdlog::info("{}: {} quotas", config_.id, snapshot.quotas.size());
    return snapshot;
}

// --- Claude ---

namespace {

void addClaudePrompts(ExecOptions& o) {
    // First-run and update screens that block the REPL
    o.optionalResponses["Press Enter to continue"] = "\r";
    o.optionalResponses["Yes, I trust this folder"] = "\r";
}

} // namespace

ExecOptions ClaudeCliProbe::usageOptions(const std::string& workingDirectory,
                                         std::chrono::milliseconds timeout) {
    ExecOptions o;
    o.args             = {"/usage"};
    o.timeout          = timeout;
    o.workingDirectory = workingDirectory;
    o.quiescence       = std::chrono::milliseconds(1500);
    // The usage panel is drawn once its footer appears; Esc closes it
    o.autoResponses["Esc to cancel"] = "\x1b";
    addClaudePrompts(o);
    return o;
}

ExecOptions ClaudeCliProbe::costOptions(const std::string& workingDirectory,
                                        std::chrono::milliseconds timeout) {
    ExecOptions o;
    o.args             = {"/cost"};
    o.timeout          = timeout;
    o.workingDirectory = workingDirectory;
    o.quiescence       = std::chrono::milliseconds(1500);
    o.autoResponses["Total cost"] = "\x1b";
    addClaudePrompts(o);
    return o;
}

ClaudeCliProbe::ClaudeCliProbe(ICliExecutor& executor, std::string workingDirectory,
                               std::chrono::milliseconds timeout)
    : CliUsageProbe(executor, CliProbeConfig{
          .id       = "claude",
          .binary   = "claude",
          .options  = usageOptions(workingDirectory, timeout),
          .parser   = ClaudeCliFormat{},
      }) {}

UsageSnapshot ClaudeCliProbe::probe() {
    std::string text = run(config_.options);
    try {
        return parseOutput(config_.parser, text);
    } catch (const ProbeError& e) {
        if (e.kind() != ProbeErrorKind::SubscriptionRequired) throw;
    }

    spdlog::info("claude: pay-as-you-go account, reading /cost instead");
    ExecOptions cost = costOptions(config_.options.workingDirectory, config_.options.timeout);
    return parseOutput(ClaudeCostFormat{}, run(cost));
}

// --- fixed-shape CLIs ---

CliProbeConfig CliProbes::kimi(std::chrono::milliseconds timeout) {
    CliProbeConfig c;
    c.id     = "kimi";
    c.binary = "kimi";
    c.parser = KimiCliFormat{};
    c.options.timeout    = timeout;
    c.options.quiescence = std::chrono::milliseconds(1500);
    c.options.autoResponses["\xF0\x9F\x92\xAB"] = "/usage\r";   // 💫 prompt glyph
    return c;
}

CliProbeConfig CliProbes::kiro(std::chrono::milliseconds timeout) {
    CliProbeConfig c;
    c.id     = "kiro";
    c.binary = "kiro-cli";
    c.parser = KiroFormat{};
    c.renderTerminal = false;
    c.options.input   = "/usage\n/quit\n";
    c.options.timeout = timeout;
    return c;
}

CliProbeConfig CliProbes::ampCode(std::chrono::milliseconds timeout) {
    CliProbeConfig c;
    c.id     = "ampcode";
    c.binary = "amp";
    c.parser = AmpCodeFormat{};
    c.renderTerminal  = false;
    c.requireZeroExit = true;
    c.options.args    = {"usage", "--no-color"};
    c.options.timeout = timeout;
    return c;
}

CliProbeConfig CliProbes::gemini(std::chrono::milliseconds timeout) {
    CliProbeConfig c;
    c.id     = "gemini";
    c.binary = "gemini";
    c.parser = GeminiCliFormat{};
    c.options.timeout    = timeout;
    c.options.quiescence = std::chrono::milliseconds(2000);
    c.options.autoResponses["Type your message"] = "/stats\r";
    return c;
}
