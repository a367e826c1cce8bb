#include "parsers/MiniMaxParser.hpp"
#include "parsers/ParseHelpers.hpp"
#include "quota/ProbeError.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>

using json = nlohmann::json;

std::optional<MiniMaxRegion> miniMaxRegionFromString(const std::string& name) {
    std::string lower = ParseHelpers::toLower(ParseHelpers::trim(name));
    if (lower == "international") return MiniMaxRegion::International;
    if (lower == "china")         return MiniMaxRegion::China;
    return std::nullopt;
}

UsageSnapshot MiniMaxParser::parse(const std::string& body, const std::string& providerId,
                                   TimePoint now) {
    json doc = json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object())
        throw ProbeError::parseFailed("Invalid JSON from MiniMax");

    UsageSnapshot snapshot;
    snapshot.providerId = providerId;
    snapshot.capturedAt = now;

    try {
        const json& base = doc.at("base_resp");
        if (base.at("status_code").get<int>() != 0) {
            std::string message = base.contains("status_msg") && base["status_msg"].is_string()
                                      ? base["status_msg"].get<std::string>()
                                      : "Unknown error";
            throw ProbeError::executionFailed("MiniMax API error: " + message);
        }

        auto remains = doc.find("model_remains");
        if (remains == doc.end() || !remains->is_array() || remains->empty())
            throw ProbeError::noData();

        for (auto& model : *remains) {
            long long total = model.at("current_interval_total_count").get<long long>();
            long long left  = std::clamp(model.at("current_interval_usage_count").get<long long>(),
                                         0LL, std::max(total, 0LL));
            long long used  = total - left;
            double percent  = total > 0 ? static_cast<double>(left) / static_cast<double>(total) * 100.0
                                        : 0.0;

            std::optional<TimePoint> resetsAt;
            auto end = model.find("end_time");
            if (end != model.end() && end->is_number())
                resetsAt = ParseHelpers::fromEpochMillis(end->get<long long>());

            snapshot.quotas.emplace_back(
                percent, QuotaType::modelSpecific(model.at("model_name").get<std::string>()),
                providerId, resetsAt,
                std::to_string(used) + "/" + std::to_string(total) + " requests");
        }
    } catch (const json::exception& e) {
        throw ProbeError::parseFailed(std::string("Invalid JSON: ") + e.what());
    }
    return snapshot;
}
