#pragma once
#include "ICliExecutor.hpp"
#include <string>
#include <vector>

// Runs CLIs on plain pipes with stdout and stderr merged. For tools
// that behave better without a terminal (scripted stdin, JSON-RPC).
class PipeExecutor : public ICliExecutor {
public:
    explicit PipeExecutor(std::vector<std::string> environmentExclusions = {})
        : environmentExclusions_(std::move(environmentExclusions)) {}

    std::optional<std::string> locate(const std::string& binary) const override;
    CliResult execute(const std::string& binary, const ExecOptions& options) override;

    // Used for runs whose options carry no cancel flag of their own
    void setCancelFlag(const std::atomic<bool>* flag) { cancel_ = flag; }

private:
    std::vector<std::string> environmentExclusions_;
    const std::atomic<bool>* cancel_ = nullptr;
};
