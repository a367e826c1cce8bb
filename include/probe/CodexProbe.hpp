#pragma once
#include "IUsageProbe.hpp"
#include "process/ICliExecutor.hpp"
#include <chrono>
#include <string>

// Reads Codex rate limits through `codex app-server` JSON-RPC on pipes,
// falling back to the interactive `/status` screen on a PTY.
class CodexProbe : public IUsageProbe {
public:
    CodexProbe(ICliExecutor& rpcExecutor, ICliExecutor& ttyExecutor,
               std::chrono::milliseconds timeout = std::chrono::seconds(20))
        : rpc_(rpcExecutor), tty_(ttyExecutor), timeout_(timeout) {}

    std::string id() const override { return "codex"; }
    bool isAvailable() override;
    UsageSnapshot probe() override;

    // Newline-delimited JSON-RPC messages sent to the app server
    static std::string initializeRequest();
    static std::string rateLimitsRequest();

    static ExecOptions rpcOptions(std::chrono::milliseconds timeout);
    static ExecOptions statusOptions(std::chrono::milliseconds timeout);

private:
    UsageSnapshot probeRpc();
    UsageSnapshot probeStatus();

    ICliExecutor& rpc_;
    ICliExecutor& tty_;
    std::chrono::milliseconds timeout_;
};
