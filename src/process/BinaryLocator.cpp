#include "process/BinaryLocator.hpp"
#include "process/ChildProcess.hpp"
#include <spdlog/spdlog.h>
#include <unistd.h>
#include <cstdlib>
#include <sstream>

extern char** environ;

namespace {

bool isSafeToolName(const std::string& tool) {
    if (tool.empty()) return false;
    for (char c : tool) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                  (c >= '0' && c <= '9') || c == '-' || c == '_' ||
                  c == '.' || c == '+';
        if (!ok) return false;
    }
    return true;
}

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

} // namespace

std::string BinaryLocator::loginShell() {
    const char* shell = std::getenv("SHELL");
    return (shell && *shell) ? shell : "/bin/sh";
}

BinaryLocator::Shell BinaryLocator::detect(const std::string& shellPath) {
    auto slash = shellPath.rfind('/');
    std::string name = slash == std::string::npos ? shellPath
                                                  : shellPath.substr(slash + 1);
    if (name == "fish") return Shell::Fish;
    if (name == "nu" || name == "nushell") return Shell::Nushell;
    return Shell::Posix;
}

std::vector<std::string> BinaryLocator::whichArguments(Shell shell, const std::string& tool) {
    switch (shell) {
        case Shell::Nushell: return {"-l", "-c", "which " + tool + " | get path.0"};
        case Shell::Fish:
        case Shell::Posix:   return {"-l", "-c", "command -v " + tool};
    }
    return {"-l", "-c", "command -v " + tool};
}

std::vector<std::string> BinaryLocator::pathArguments(Shell shell) {
    switch (shell) {
        case Shell::Nushell: return {"-l", "-c", "$env.PATH | str join (char esep)"};
        case Shell::Fish:    return {"-l", "-c", "string join : $PATH"};
        case Shell::Posix:   return {"-l", "-c", "echo $PATH"};
    }
    return {"-l", "-c", "echo $PATH"};
}

// rc files may print banners; the answer is the last absolute path line
std::optional<std::string> BinaryLocator::parseWhichOutput(const std::string& output) {
    std::istringstream in(output);
    std::string line;
    std::optional<std::string> found;
    while (std::getline(in, line)) {
        line = trim(line);
        if (!line.empty() && line[0] == '/') found = line;
    }
    return found;
}

std::string BinaryLocator::parsePathOutput(const std::string& output) {
    std::istringstream in(output);
    std::string line, last;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.find('/') != std::string::npos) last = line;
    }
    return last;
}

std::optional<std::string> BinaryLocator::runShell(const std::vector<std::string>& args) {
    ChildProcess::LaunchSpec spec;
    spec.path = loginShell();
    spec.argv.push_back(spec.path);
    spec.argv.insert(spec.argv.end(), args.begin(), args.end());
    // rc-file noise on stderr would look like paths
    spec.discardStderr = true;
    // Not buildEnvironment(): that asks this class for PATH
    for (char** e = environ; e && *e; ++e) spec.env.emplace_back(*e);

    ExecOptions options;
    options.timeout = kShellTimeout;

    try {
        auto child = ChildProcess::spawnPipes(spec);
        auto result = child.interact(options);
        if (result.exitCode != 0) return std::nullopt;
        return result.output;
    } catch (const ProcessError& e) {
        spdlog::warn("BinaryLocator: {} -l failed: {}", spec.path, e.what());
        return std::nullopt;
    }
}

std::optional<std::string> BinaryLocator::which(const std::string& tool) {
    if (tool.find('/') != std::string::npos) {
        if (access(tool.c_str(), X_OK) == 0) return tool;
        return std::nullopt;
    }
    if (!isSafeToolName(tool)) {
        spdlog::warn("BinaryLocator: refusing to resolve '{}'", tool);
        return std::nullopt;
    }

    auto output = runShell(whichArguments(detect(loginShell()), tool));
    if (!output) {
        spdlog::debug("BinaryLocator: '{}' not found", tool);
        return std::nullopt;
    }
    auto path = parseWhichOutput(*output);
    if (path) spdlog::debug("BinaryLocator: {} -> {}", tool, *path);
    return path;
}

std::string BinaryLocator::shellPath() {
    const char* env = std::getenv("PATH");
    std::string fallback = env ? env : "/usr/bin:/bin";

    auto output = runShell(pathArguments(detect(loginShell())));
    if (!output) return fallback;

    std::string path = parsePathOutput(*output);
    return path.empty() ? fallback : path;
}

const std::string& BinaryLocator::cachedShellPath() {
    static const std::string path = shellPath();
    return path;
}
