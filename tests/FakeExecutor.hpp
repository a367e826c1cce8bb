#pragma once
#include "process/ICliExecutor.hpp"
#include <deque>
#include <variant>
#include <vector>

// Scripted executor: each execute() pops the next outcome
class FakeExecutor : public ICliExecutor {
public:
    using Outcome = std::variant<CliResult, ProcessError>;

    explicit FakeExecutor(bool installed = true) : installed_(installed) {}

    void output(std::string text, int exitCode = 0) {
        CliResult r;
        r.output   = std::move(text);
        r.exitCode = exitCode;
        outcomes.push_back(r);
    }
    void error(ProcessError::Kind kind, const std::string& what) {
        outcomes.push_back(ProcessError(kind, what));
    }

    std::optional<std::string> locate(const std::string& binary) const override {
        if (!installed_) return std::nullopt;
        return "/usr/local/bin/" + binary;
    }

    CliResult execute(const std::string& binary, const ExecOptions& options) override {
        calls.push_back({binary, options});
        if (outcomes.empty())
            throw ProcessError(ProcessError::Kind::LaunchFailed, "no scripted outcome");
        Outcome next = outcomes.front();
        outcomes.pop_front();
        if (auto* err = std::get_if<ProcessError>(&next)) throw *err;
        return std::get<CliResult>(next);
    }

    struct Call {
        std::string binary;
        ExecOptions options;
    };
    std::vector<Call>   calls;
    std::deque<Outcome> outcomes;

private:
    bool installed_;
};
