#include "process/ChildProcess.hpp"
#include "process/AutoResponder.hpp"
#include "process/BinaryLocator.hpp"
#include <spdlog/spdlog.h>
#include <pty.h>
#include <poll.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <thread>

extern char** environ;

namespace {

std::vector<char*> toCArray(const std::vector<std::string>& items) {
    std::vector<char*> out;
    out.reserve(items.size() + 1);
    for (auto& s : items) out.push_back(const_cast<char*>(s.c_str()));
    out.push_back(nullptr);
    return out;
}

// Runs in the forked child; never returns
[[noreturn]] void execChild(const ChildProcess::LaunchSpec& spec) {
    if (!spec.workingDirectory.empty() && chdir(spec.workingDirectory.c_str()) != 0)
        _exit(126);

    auto argv = toCArray(spec.argv);
    auto envp = toCArray(spec.env);
    execve(spec.path.c_str(), argv.data(), envp.data());
    _exit(127);
}

void setNonBlocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

} // namespace

std::vector<std::string> ChildProcess::buildEnvironment(
    const std::vector<std::string>& exclusions,
    const std::vector<std::string>& overrides)
{
    auto keyOf = [](const std::string& entry) {
        return entry.substr(0, entry.find('='));
    };
    auto listed = [&](const std::vector<std::string>& list, const std::string& key) {
        for (auto& item : list)
            if (keyOf(item) == key || item == key) return true;
        return false;
    };

    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        std::string entry = *e;
        std::string key = keyOf(entry);
        if (key == "PATH" || listed(exclusions, key) || listed(overrides, key))
            continue;
        env.push_back(entry);
    }
    env.push_back("PATH=" + BinaryLocator::cachedShellPath());
    for (auto& o : overrides) env.push_back(o);
    return env;
}

ChildProcess ChildProcess::spawnPty(const LaunchSpec& spec,
                                    unsigned short columns, unsigned short rows)
{
    struct winsize ws{};
    ws.ws_col = columns;
    ws.ws_row = rows;

    int master = -1;
    pid_t pid = forkpty(&master, nullptr, nullptr, &ws);
    if (pid < 0) {
        throw ProcessError(ProcessError::Kind::LaunchFailed,
                           std::string("forkpty failed: ") + std::strerror(errno));
    }
    if (pid == 0) execChild(spec);

    setNonBlocking(master);
    spdlog::debug("ChildProcess: spawned {} (pid {}) on pty", spec.path, pid);
    return ChildProcess(pid, master, master);
}

ChildProcess ChildProcess::spawnPipes(const LaunchSpec& spec) {
    int in[2], out[2];
    if (pipe(in) != 0) {
        throw ProcessError(ProcessError::Kind::LaunchFailed,
                           std::string("pipe failed: ") + std::strerror(errno));
    }
    if (pipe(out) != 0) {
        ::close(in[0]);
        ::close(in[1]);
        throw ProcessError(ProcessError::Kind::LaunchFailed,
                           std::string("pipe failed: ") + std::strerror(errno));
    }

    pid_t pid = fork();
    if (pid < 0) {
        for (int fd : {in[0], in[1], out[0], out[1]}) ::close(fd);
        throw ProcessError(ProcessError::Kind::LaunchFailed,
                           std::string("fork failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        setpgid(0, 0);
        dup2(in[0], STDIN_FILENO);
        dup2(out[1], STDOUT_FILENO);
        int devnull = spec.discardStderr ? ::open("/dev/null", O_WRONLY) : -1;
        dup2(devnull >= 0 ? devnull : out[1], STDERR_FILENO);
        if (devnull >= 0) ::close(devnull);
        for (int fd : {in[0], in[1], out[0], out[1]}) ::close(fd);
        execChild(spec);
    }

    setpgid(pid, pid);
    ::close(in[0]);
    ::close(out[1]);
    setNonBlocking(out[0]);
    signal(SIGPIPE, SIG_IGN);
    spdlog::debug("ChildProcess: spawned {} (pid {}) on pipes", spec.path, pid);
    return ChildProcess(pid, out[0], in[1]);
}

ChildProcess::ChildProcess(ChildProcess&& other) noexcept
    : pid_(other.pid_), readFd_(other.readFd_), writeFd_(other.writeFd_),
      reaped_(other.reaped_), exitCode_(other.exitCode_)
{
    other.pid_ = -1;
    other.readFd_ = -1;
    other.writeFd_ = -1;
    other.reaped_ = true;
}

ChildProcess::~ChildProcess() {
    if (pid_ > 0 && !reaped_) terminate();
    if (writeFd_ >= 0 && writeFd_ != readFd_) ::close(writeFd_);
    if (readFd_ >= 0) ::close(readFd_);
}

bool ChildProcess::writeAll(const std::string& data) {
    if (writeFd_ < 0) return false;
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::write(writeFd_, data.data() + off, data.size() - off);
        if (n > 0) {
            off += static_cast<size_t>(n);
        } else if (n < 0 && (errno == EAGAIN || errno == EINTR)) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        } else {
            spdlog::warn("ChildProcess: write to pid {} failed: {}", pid_, std::strerror(errno));
            return false;
        }
    }
    return true;
}

void ChildProcess::closeWrite() {
    if (writeFd_ >= 0 && writeFd_ != readFd_) {
        ::close(writeFd_);
        writeFd_ = -1;
    }
}

bool ChildProcess::reap(bool block) {
    if (reaped_) return true;
    int status = 0;
    pid_t r = waitpid(pid_, &status, block ? 0 : WNOHANG);
    if (r != pid_) return false;
    reaped_ = true;
    if (WIFEXITED(status))        exitCode_ = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) exitCode_ = 128 + WTERMSIG(status);
    return true;
}

void ChildProcess::terminate() {
    // PTY children lead their own session, pipe children their own group
    kill(-pid_, SIGTERM);
    for (int i = 0; i < 20; i++) {
        if (reap(false)) return;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    kill(-pid_, SIGKILL);
    kill(pid_, SIGKILL);
    reap(true);
}

CliResult ChildProcess::interact(const ExecOptions& options) {
    using SteadyClock = std::chrono::steady_clock;

    AutoResponder responder(options.autoResponses, options.optionalResponses);
    bool keepStdinOpen = !options.autoResponses.empty() ||
                         !options.optionalResponses.empty();

    if (!options.input.empty()) writeAll(options.input);
    if (!keepStdinOpen) closeWrite();

    std::string output;
    auto start      = SteadyClock::now();
    auto lastOutput = start;
    bool eof = false;
    char buf[8192];

    while (true) {
        if (options.cancel && options.cancel->load()) {
            terminate();
            throw ProcessError(ProcessError::Kind::Cancelled, "Execution cancelled");
        }

        auto now = SteadyClock::now();
        if (now - start >= options.timeout) {
            spdlog::warn("ChildProcess: pid {} timed out after {}ms",
                         pid_, options.timeout.count());
            terminate();
            throw ProcessError(ProcessError::Kind::TimedOut,
                               "Command timed out after " +
                               std::to_string(options.timeout.count()) + "ms");
        }

        if (!eof) {
            struct pollfd pfd{readFd_, POLLIN, 0};
            int ready = poll(&pfd, 1, 50);
            if (ready > 0) {
                ssize_t n = ::read(readFd_, buf, sizeof(buf));
                if (n > 0) {
                    output.append(buf, static_cast<size_t>(n));
                    lastOutput = SteadyClock::now();
                    for (auto& response : responder.scan(output)) {
                        spdlog::debug("ChildProcess: answering prompt for pid {}", pid_);
                        writeAll(response);
                    }
                } else if (n == 0 || (errno != EAGAIN && errno != EINTR)) {
                    // EIO on a PTY master means the slave side closed
                    eof = true;
                }
            }
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        if (reap(false)) {
            // Drain whatever the child wrote before exiting
            ssize_t n;
            while ((n = ::read(readFd_, buf, sizeof(buf))) > 0)
                output.append(buf, static_cast<size_t>(n));
            return {output, exitCode_, false};
        }

        if (options.quiescence.count() > 0 && !output.empty() &&
            responder.allRequiredFired() &&
            SteadyClock::now() - lastOutput >= options.quiescence) {
            spdlog::debug("ChildProcess: pid {} idle for {}ms, stopping",
                          pid_, options.quiescence.count());
            terminate();
            return {output, 0, true};
        }
    }
}
