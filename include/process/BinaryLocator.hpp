#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>

// Resolves CLI tools through the user's login shell so PATH entries
// from shell rc files (Homebrew, nix, npm globals) are visible.
class BinaryLocator {
public:
    enum class Shell { Posix, Fish, Nushell };

    // A login shell stuck in its rc files is abandoned after this long
    static constexpr std::chrono::milliseconds kShellTimeout{5000};

    static std::optional<std::string> which(const std::string& tool);

    // PATH as seen by a login shell; falls back to this process's PATH
    static std::string shellPath();

    // Cached shellPath(), resolved once per process
    static const std::string& cachedShellPath();

    static Shell detect(const std::string& shellPath);
    static std::vector<std::string> whichArguments(Shell shell, const std::string& tool);
    static std::vector<std::string> pathArguments(Shell shell);
    static std::optional<std::string> parseWhichOutput(const std::string& output);
    static std::string parsePathOutput(const std::string& output);

private:
    static std::string loginShell();
    static std::optional<std::string> runShell(const std::vector<std::string>& args);
};
