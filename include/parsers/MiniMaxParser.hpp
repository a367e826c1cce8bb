#pragma once
#include "quota/UsageSnapshot.hpp"
#include <optional>
#include <string>

enum class MiniMaxRegion {
    International,   // minimax.io
    China            // minimaxi.com
};

// "international" | "china"; nullopt otherwise
std::optional<MiniMaxRegion> miniMaxRegionFromString(const std::string& name);

struct MiniMaxEndpoints {
    static std::string apiBase(MiniMaxRegion r) {
        return r == MiniMaxRegion::China ? "https://api.minimaxi.com" : "https://api.minimax.io";
    }
    static std::string codingPlanRemains(MiniMaxRegion r) {
        return apiBase(r) + "/v1/api/openplatform/coding_plan/remains";
    }
    static std::string dashboard(MiniMaxRegion r) {
        return r == MiniMaxRegion::China
                   ? "https://platform.minimaxi.com/user-center/payment/coding-plan"
                   : "https://platform.minimax.io/user-center/payment/coding-plan";
    }
};

// Parses the coding_plan/remains body. `current_interval_usage_count`
// is the REMAINING count despite its name.
class MiniMaxParser {
public:
    static UsageSnapshot parse(const std::string& body,
                               const std::string& providerId = "minimax",
                               TimePoint now = Clock::now());
};
