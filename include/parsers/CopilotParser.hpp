#pragma once
#include "quota/UsageSnapshot.hpp"
#include <string>

// GitHub billing: /users/<name>/settings/billing/premium_request/usage.
// Premium requests from items whose product mentions "copilot" are
// summed and measured against the configured monthly allowance.
class CopilotParser {
public:
    static UsageSnapshot parse(const std::string& body,
                               const std::string& username,
                               int monthlyLimit = 50,
                               TimePoint now = Clock::now());

    // /copilot_internal/user: premium interaction quota of any plan,
    // organisation seats included. The plan name becomes the tier.
    static UsageSnapshot parseInternal(const std::string& body, TimePoint now = Clock::now());
};
