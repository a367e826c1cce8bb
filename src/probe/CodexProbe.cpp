#include "probe/CodexProbe.hpp"
#include "parsers/ProviderParser.hpp"
#include "probe/CliUsageProbe.hpp"
#include "terminal/TerminalRenderer.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace {

constexpr const char* kBinary = "codex";

} // namespace

std::string CodexProbe::initializeRequest() {
    json msg = {
        {"id", 1},
        {"method", "initialize"},
        {"params", {{"clientInfo", {{"name", "quotabar"}, {"version", "1.0.0"}}}}},
    };
    return msg.dump() + "\n";
}

std::string CodexProbe::rateLimitsRequest() {
    json initialized = {{"method", "initialized"}};
    json read = {{"id", 2}, {"method", "account/rateLimits/read"}, {"params", json::object()}};
    return initialized.dump() + "\n" + read.dump() + "\n";
}

ExecOptions CodexProbe::rpcOptions(std::chrono::milliseconds timeout) {
    ExecOptions o;
    o.args       = {"app-server"};
    o.input      = initializeRequest();
    o.timeout    = timeout;
    o.quiescence = std::chrono::milliseconds(1000);
    // Once the initialize response arrives, ask for the limits
    o.autoResponses["\"id\":1"] = rateLimitsRequest();
    return o;
}

ExecOptions CodexProbe::statusOptions(std::chrono::milliseconds timeout) {
    ExecOptions o;
    o.timeout    = timeout;
    o.quiescence = std::chrono::milliseconds(1500);
    o.autoResponses["context left"] = "/status\r";
    o.optionalResponses["Press enter to continue"] = "\r";
    return o;
}

bool CodexProbe::isAvailable() {
    return rpc_.locate(kBinary).has_value();
}

UsageSnapshot CodexProbe::probeRpc() {
    CliResult result;
    try {
        result = rpc_.execute(kBinary, rpcOptions(timeout_));
    } catch (const ProcessError& e) {
        throw CliUsageProbe::fromProcessError(e, kBinary);
    }
    return parseOutput(CodexRpcFormat{}, result.output);
}

UsageSnapshot CodexProbe::probeStatus() {
    CliResult result;
    try {
        result = tty_.execute(kBinary, statusOptions(timeout_));
    } catch (const ProcessError& e) {
        throw CliUsageProbe::fromProcessError(e, kBinary);
    }
    std::string text = TerminalRenderer::render(result.output);
    return parseOutput(CodexStatusFormat{}, text);
}

UsageSnapshot CodexProbe::probe() {
    if (!rpc_.locate(kBinary)) throw ProbeError::binaryNotFound(kBinary);

    try {
        auto snapshot = probeRpc();
        spdlog::info("codex: {} quotas via app-server", snapshot.quotas.size());
        return snapshot;
    } catch (const ProbeError& e) {
        if (e.kind() == ProbeErrorKind::BinaryNotFound) throw;
        spdlog::warn("codex: app-server failed ({}), trying /status", e.what());
    }

    auto snapshot = probeStatus();
    spdlog::info("codex: {} quotas via /status", snapshot.quotas.size());
    return snapshot;
}
