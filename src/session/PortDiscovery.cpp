#include "session/PortDiscovery.hpp"
#include "parsers/ParseHelpers.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

PortDiscovery::PortDiscovery(const fs::path& home)
    : path_(home / ".claude" / "quotabar-hook-port") {}

bool PortDiscovery::writePort(int port) const {
    std::error_code ec;
    fs::create_directories(path_.parent_path(), ec);
    if (ec) {
        spdlog::warn("Cannot create {}: {}", path_.parent_path().string(), ec.message());
        return false;
    }
    std::ofstream out(path_, std::ios::trunc);
    if (!out) {
        spdlog::warn("Cannot write port file {}", path_.string());
        return false;
    }
    out << port;
    return static_cast<bool>(out);
}

std::optional<int> PortDiscovery::readPort() const {
    std::ifstream in(path_);
    if (!in) return std::nullopt;
    std::stringstream ss;
    ss << in.rdbuf();
    std::string text = ParseHelpers::trim(ss.str());
    if (text.empty()) return std::nullopt;

    size_t used = 0;
    try {
        int port = std::stoi(text, &used);
        if (used != text.size()) return std::nullopt;
        return port;
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

bool PortDiscovery::removePortFile() const {
    std::error_code ec;
    bool removed = fs::remove(path_, ec);
    if (ec) spdlog::warn("Cannot remove {}: {}", path_.string(), ec.message());
    return removed;
}
