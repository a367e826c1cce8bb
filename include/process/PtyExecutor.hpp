#pragma once
#include "ICliExecutor.hpp"
#include <string>
#include <vector>

// Runs CLIs attached to a pseudo-terminal. Interactive tools only
// print their full UI when they believe a terminal is present.
class PtyExecutor : public ICliExecutor {
public:
    // Keys removed from the child environment, e.g. a token that would
    // otherwise override the CLI's own login
    explicit PtyExecutor(std::vector<std::string> environmentExclusions = {},
                         unsigned short columns = 200,
                         unsigned short rows = 60);

    std::optional<std::string> locate(const std::string& binary) const override;
    CliResult execute(const std::string& binary, const ExecOptions& options) override;

    // Used for runs whose options carry no cancel flag of their own
    void setCancelFlag(const std::atomic<bool>* flag) { cancel_ = flag; }

private:
    std::vector<std::string> environmentExclusions_;
    const std::atomic<bool>* cancel_ = nullptr;
    unsigned short columns_;
    unsigned short rows_;
};
