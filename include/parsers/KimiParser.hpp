#pragma once
#include "quota/UsageSnapshot.hpp"
#include <string>

class KimiParser {
public:
    // Rendered `/usage` panel: "Weekly limit  ██░░  82% left (resets in 3d 4h)"
    static UsageSnapshot parseCli(const std::string& text, TimePoint now = Clock::now());

    // BillingService/GetUsages JSON. The FEATURE_CODING scope carries the
    // weekly allowance in `detail` and rate windows in `limits`.
    static UsageSnapshot parseUsages(const std::string& body, TimePoint now = Clock::now());

    // Plan name from the weekly request limit; empty when unrecognised
    static std::string tierForLimit(long long weeklyLimit);
};
