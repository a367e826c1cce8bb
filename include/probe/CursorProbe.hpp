#pragma once
#include "IUsageProbe.hpp"
#include "auth/StoredCredential.hpp"
#include "net/IHttpTransport.hpp"
#include "process/ICliExecutor.hpp"
#include <filesystem>
#include <optional>
#include <string>

// Cursor plan usage. The IDE keeps its access token in a SQLite state
// database; CURSOR_SESSION_TOKEN overrides it.
class CursorProbe : public IUsageProbe {
public:
    static constexpr const char* kUsageUrl = "https://cursor.com/api/usage-summary";
    static constexpr const char* kEnvToken = "CURSOR_SESSION_TOKEN";

    CursorProbe(IHttpTransport& transport, ICliExecutor& executor,
                std::filesystem::path stateDatabase,
                EnvLookup env = systemEnvironment(), int timeoutMs = 15000)
        : transport_(transport), executor_(executor), db_(std::move(stateDatabase)),
          env_(std::move(env)), timeoutMs_(timeoutMs) {}

    // ~/.config/Cursor/User/globalStorage/state.vscdb
    static std::filesystem::path defaultStateDatabase(const std::filesystem::path& home);

    std::string id() const override { return "cursor"; }
    bool isAvailable() override;
    UsageSnapshot probe() override;

private:
    // Throws AuthenticationRequired when no token can be found
    std::string accessToken();

    IHttpTransport&       transport_;
    ICliExecutor&         executor_;
    std::filesystem::path db_;
    EnvLookup             env_;
    int                   timeoutMs_;
};
