#include "probe/CursorProbe.hpp"
#include "parsers/ProviderParser.hpp"
#include "parsers/ParseHelpers.hpp"
#include "probe/CliUsageProbe.hpp"
#include "quota/ProbeError.hpp"
#include <spdlog/spdlog.h>

std::filesystem::path CursorProbe::defaultStateDatabase(const std::filesystem::path& home) {
    return home / ".config" / "Cursor" / "User" / "globalStorage" / "state.vscdb";
}

bool CursorProbe::isAvailable() {
    if (auto v = env_(kEnvToken); v && !ParseHelpers::trim(*v).empty()) return true;
    std::error_code ec;
    return std::filesystem::exists(db_, ec) && executor_.locate("sqlite3").has_value();
}

std::string CursorProbe::accessToken() {
    if (auto v = env_(kEnvToken)) {
        std::string t = ParseHelpers::trim(*v);
        if (!t.empty()) return t;
    }

    std::error_code ec;
    if (!std::filesystem::exists(db_, ec)) {
        spdlog::warn("Cursor: state database not found at {}", db_.string());
        throw ProbeError::authenticationRequired();
    }

    ExecOptions opts;
    opts.args    = {db_.string(),
                    "SELECT value FROM ItemTable WHERE key = 'cursorAuth/accessToken'"};
    opts.timeout = std::chrono::seconds(5);

    CliResult result;
    try {
        result = executor_.execute("sqlite3", opts);
    } catch (const ProcessError& e) {
        throw CliUsageProbe::fromProcessError(e, "sqlite3");
    }
    if (result.exitCode != 0)
        throw ProbeError::executionFailed("sqlite3 exited with status " +
                                          std::to_string(result.exitCode));

    std::string token = ParseHelpers::trim(result.output);
    if (token.empty()) {
        spdlog::error("Cursor: no access token in state database (not logged in?)");
        throw ProbeError::authenticationRequired();
    }
    return token;
}

UsageSnapshot CursorProbe::probe() {
    std::string token = accessToken();

    HttpRequest req;
    req.url       = kUsageUrl;
    req.timeoutMs = timeoutMs_;
    req.headers["Cookie"]       = CursorParser::sessionCookie(token);
    req.headers["Content-Type"] = "application/json";

    auto res = transport_.send(req);
    spdlog::debug("Cursor: HTTP {}", res.status);
    switch (res.status) {
        case 200:
            break;
        case 0:
            throw ProbeError::executionFailed(res.error.empty() ? "No response" : res.error);
        case 401:
            spdlog::error("Cursor: token rejected (401)");
            throw ProbeError::sessionExpired(
                "Sign in to Cursor again or update CURSOR_SESSION_TOKEN.");
        case 403:
            throw ProbeError::authenticationRequired();
        default:
            throw ProbeError::executionFailed("HTTP error: " + std::to_string(res.status));
    }

    auto snapshot = parseOutput(CursorFormat{}, res.body);
    spdlog::info("Cursor: {} quotas", snapshot.quotas.size());
    return snapshot;
}
