#pragma once
#include "quota/UsageSnapshot.hpp"
#include <string>

// Parses `amp usage --no-color`:
//
//   Signed in as user@example.com (username)
//   Amp Free: $17.59/$20 remaining (replenishes +$0.83/hour) - https://...
//   Individual credits: $0 remaining - https://...
//
// Only "$remaining/$total" lines become quotas, one per label.
class AmpCodeParser {
public:
    static UsageSnapshot parse(const std::string& text, TimePoint now = Clock::now());
};
