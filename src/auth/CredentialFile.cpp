#include "auth/CredentialFile.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

std::optional<std::string> CredentialFile::read(const fs::path& path) {
    std::ifstream f(path);
    if (!f.is_open()) return std::nullopt;
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

bool CredentialFile::write(const fs::path& path, const std::string& contents) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        spdlog::warn("Cannot create {}: {}", path.parent_path().string(), ec.message());
        return false;
    }

    fs::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream f(tmp, std::ios::trunc);
        if (!f.is_open()) {
            spdlog::warn("Cannot write {}", tmp.string());
            return false;
        }
        f << contents;
        if (!f.good()) {
            spdlog::warn("Short write to {}", tmp.string());
            return false;
        }
    }

    fs::permissions(tmp, fs::perms::owner_read | fs::perms::owner_write,
                    fs::perm_options::replace, ec);
    fs::rename(tmp, path, ec);
    if (ec) {
        spdlog::warn("Cannot replace {}: {}", path.string(), ec.message());
        fs::remove(tmp, ec);
        return false;
    }
    return true;
}
