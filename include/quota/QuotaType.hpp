#pragma once
#include <chrono>
#include <optional>
#include <string>

// Which limit a quota measures. Model-specific and time-limit quotas
// carry a name ("opus", "Monthly").
struct QuotaType {
    enum class Kind {
        Session,        // rolling 5h window
        Weekly,         // rolling 7d window
        ModelSpecific,  // per-model weekly cap
        TimeLimit       // calendar-bound allowance
    };

    Kind        kind = Kind::Session;
    std::string name;

    static QuotaType session()  { return {Kind::Session, ""}; }
    static QuotaType weekly()   { return {Kind::Weekly, ""}; }
    static QuotaType modelSpecific(const std::string& model) {
        return {Kind::ModelSpecific, model};
    }
    static QuotaType timeLimit(const std::string& label) {
        return {Kind::TimeLimit, label};
    }

    std::string displayName() const {
        switch (kind) {
            case Kind::Session: return "Session";
            case Kind::Weekly:  return "Weekly";
            case Kind::ModelSpecific: {
                std::string out = name;
                if (!out.empty() && out[0] >= 'a' && out[0] <= 'z')
                    out[0] = static_cast<char>(out[0] - 'a' + 'A');
                return out;
            }
            case Kind::TimeLimit: return name;
        }
        return name;
    }

    // Total length of the reset window, when known for this type
    std::optional<std::chrono::seconds> duration() const {
        using namespace std::chrono;
        switch (kind) {
            case Kind::Session:       return hours(5);
            case Kind::Weekly:        return hours(24 * 7);
            case Kind::ModelSpecific: return hours(24 * 7);
            case Kind::TimeLimit:
                if (name == "Monthly") return hours(24 * 30);
                return std::nullopt;
        }
        return std::nullopt;
    }

    bool operator==(const QuotaType& o) const {
        return kind == o.kind && name == o.name;
    }
    bool operator!=(const QuotaType& o) const { return !(*this == o); }
};
