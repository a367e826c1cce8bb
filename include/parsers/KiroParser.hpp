#pragma once
#include "quota/UsageSnapshot.hpp"
#include <string>

// Parses `kiro-cli chat` output after `/usage`:
//
//   Bonus credits: 143.31/500 credits used, expires in 12 days
//   Credits (0.00 of 50 covered in plan), resets on 03/01
class KiroParser {
public:
    static UsageSnapshot parse(const std::string& text, TimePoint now = Clock::now());
};
