#pragma once
#include <atomic>
#include <chrono>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

struct CliResult {
    std::string output;
    int         exitCode = 0;
    bool        quiesced = false;   // ended by the idle window, not by process exit
};

struct ExecOptions {
    std::vector<std::string>  args;
    std::string               input;              // written once after spawn
    std::chrono::milliseconds timeout{20000};
    std::string               workingDirectory;   // empty = inherit

    // trigger substring -> response, each written exactly once. Every
    // entry here must fire before the quiescence window may end the run.
    std::map<std::string, std::string> autoResponses;

    // Same, but the prompt may never appear (trust dialogs, nag screens)
    std::map<std::string, std::string> optionalResponses;

    // End the run once output has been idle this long and every
    // required trigger has fired. Zero waits for exit or timeout.
    std::chrono::milliseconds quiescence{0};

    // Polled during the run; setting it kills the child
    const std::atomic<bool>* cancel = nullptr;
};

class ProcessError : public std::runtime_error {
public:
    enum class Kind {
        BinaryNotFound,
        LaunchFailed,
        TimedOut,
        Cancelled
    };

    ProcessError(Kind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

// Abstract interface: runs an external CLI and returns its raw output.
// Exit codes are reported, never interpreted.
class ICliExecutor {
public:
    virtual ~ICliExecutor() = default;

    virtual std::optional<std::string> locate(const std::string& binary) const = 0;

    // Throws ProcessError on launch failure, timeout or cancellation
    virtual CliResult execute(const std::string& binary,
                              const ExecOptions& options) = 0;
};
