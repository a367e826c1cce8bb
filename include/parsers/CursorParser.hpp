#pragma once
#include "quota/UsageSnapshot.hpp"
#include <string>

// Cursor dashboard: GET cursor.com/api/usage-summary, authenticated by
// the WorkosCursorSessionToken cookie derived from the IDE access token.
class CursorParser {
public:
    static UsageSnapshot parseUsageSummary(const std::string& body, TimePoint now = Clock::now());

    // The "sub" claim of a JWT access token; throws ParseFailed
    static std::string userIdFromJwt(const std::string& token);

    // "WorkosCursorSessionToken=<sub>%3A%3A<token>"
    static std::string sessionCookie(const std::string& token);

    // "pro" -> "PRO"; empty for an empty membership
    static std::string tierFor(const std::string& membershipType);
};
