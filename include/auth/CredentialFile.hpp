#pragma once
#include <filesystem>
#include <optional>
#include <string>

// Small-file IO for credential stores. Writes go through a temp file
// and rename, with owner-only permissions.
class CredentialFile {
public:
    static std::optional<std::string> read(const std::filesystem::path& path);
    static bool write(const std::filesystem::path& path, const std::string& contents);
};
