#pragma once
#include <filesystem>
#include <optional>

// Publishes the local hook receiver port so the Claude CLI hook script can
// find it. The file holds the decimal port number and nothing else.
class PortDiscovery {
public:
    // Defaults to ~/.claude/quotabar-hook-port under the given home
    explicit PortDiscovery(const std::filesystem::path& home);

    const std::filesystem::path& path() const { return path_; }

    // Creates the parent directory when missing
    bool writePort(int port) const;
    std::optional<int> readPort() const;
    bool removePortFile() const;

private:
    std::filesystem::path path_;
};
