#pragma once
#include "ICliExecutor.hpp"
#include <sys/types.h>
#include <string>
#include <vector>

// Owns one spawned child and the descriptors talking to it. The
// destructor kills the child's process group and reaps it if the
// child is still alive, so no exit path leaves an orphan behind.
class ChildProcess {
public:
    struct LaunchSpec {
        std::string              path;
        std::vector<std::string> argv;      // argv[0] included
        std::vector<std::string> env;       // "KEY=VALUE"
        std::string              workingDirectory;
        bool                     discardStderr = false;   // pipes only
    };

    // Child attached to a fresh pseudo-terminal of the given size
    static ChildProcess spawnPty(const LaunchSpec& spec,
                                 unsigned short columns, unsigned short rows);

    // Child with stdin on a pipe and stdout+stderr merged on another
    static ChildProcess spawnPipes(const LaunchSpec& spec);

    ChildProcess(ChildProcess&& other) noexcept;
    ChildProcess& operator=(ChildProcess&&) = delete;
    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;
    ~ChildProcess();

    // Feeds input, answers prompts and collects output until exit,
    // quiescence, timeout or cancellation
    CliResult interact(const ExecOptions& options);

    pid_t pid() const { return pid_; }

    // Environment of this process minus the excluded keys, with PATH
    // replaced by the login-shell PATH
    static std::vector<std::string> buildEnvironment(
        const std::vector<std::string>& exclusions,
        const std::vector<std::string>& overrides = {});

private:
    ChildProcess(pid_t pid, int readFd, int writeFd)
        : pid_(pid), readFd_(readFd), writeFd_(writeFd) {}

    bool writeAll(const std::string& data);
    void closeWrite();
    bool reap(bool block);
    void terminate();

    pid_t pid_     = -1;
    int   readFd_  = -1;
    int   writeFd_ = -1;   // same as readFd_ for a PTY master
    bool  reaped_  = false;
    int   exitCode_ = -1;
};
