#pragma once
#include "parsers/AmpCodeParser.hpp"
#include "parsers/ClaudeApiParser.hpp"
#include "parsers/ClaudeCliParser.hpp"
#include "parsers/CodexParser.hpp"
#include "parsers/CopilotParser.hpp"
#include "parsers/CursorParser.hpp"
#include "parsers/GeminiParser.hpp"
#include "parsers/KimiParser.hpp"
#include "parsers/KiroParser.hpp"
#include "parsers/MiniMaxParser.hpp"
#include <optional>
#include <string>
#include <variant>

// Closed set of output formats. Each alternative carries whatever
// context its parser needs beyond the raw text.
enum class ParserId {
    ClaudeCli,
    ClaudeCost,
    ClaudeApi,
    CodexRpc,
    CodexStatus,
    GeminiCli,
    GeminiApi,
    KimiCli,
    KimiApi,
    Kiro,
    AmpCode,
    Cursor,
    MiniMax,
    Copilot,
    CopilotInternal
};

struct ClaudeCliFormat {
    UsageSnapshot parse(const std::string& in, TimePoint now) const {
        return ClaudeCliParser::parse(in, now);
    }
};

struct ClaudeCostFormat {
    UsageSnapshot parse(const std::string& in, TimePoint now) const {
        auto s = ClaudeCliParser::parseCost(in);
        s.capturedAt = now;
        return s;
    }
};

struct ClaudeApiFormat {
    std::optional<std::string> subscriptionType;
    UsageSnapshot parse(const std::string& in, TimePoint now) const {
        return ClaudeApiParser::parse(in, subscriptionType, now);
    }
};

struct CodexRpcFormat {
    UsageSnapshot parse(const std::string& in, TimePoint now) const {
        return CodexParser::toSnapshot(CodexParser::parseRpcOutput(in, 2, now), now);
    }
};

struct CodexStatusFormat {
    UsageSnapshot parse(const std::string& in, TimePoint now) const {
        return CodexParser::toSnapshot(CodexParser::parseStatus(in, now), now);
    }
};

struct GeminiCliFormat {
    UsageSnapshot parse(const std::string& in, TimePoint now) const {
        return GeminiParser::parseCli(in, now);
    }
};

struct GeminiApiFormat {
    UsageSnapshot parse(const std::string& in, TimePoint now) const {
        return GeminiParser::parseQuota(in, now);
    }
};

struct KimiCliFormat {
    UsageSnapshot parse(const std::string& in, TimePoint now) const {
        return KimiParser::parseCli(in, now);
    }
};

struct KimiApiFormat {
    UsageSnapshot parse(const std::string& in, TimePoint now) const {
        return KimiParser::parseUsages(in, now);
    }
};

struct KiroFormat {
    UsageSnapshot parse(const std::string& in, TimePoint now) const {
        return KiroParser::parse(in, now);
    }
};

struct AmpCodeFormat {
    UsageSnapshot parse(const std::string& in, TimePoint now) const {
        return AmpCodeParser::parse(in, now);
    }
};

struct CursorFormat {
    UsageSnapshot parse(const std::string& in, TimePoint now) const {
        return CursorParser::parseUsageSummary(in, now);
    }
};

struct MiniMaxFormat {
    std::string providerId = "minimax";
    UsageSnapshot parse(const std::string& in, TimePoint now) const {
        return MiniMaxParser::parse(in, providerId, now);
    }
};

struct CopilotFormat {
    std::string username;
    int monthlyLimit = 50;
    UsageSnapshot parse(const std::string& in, TimePoint now) const {
        return CopilotParser::parse(in, username, monthlyLimit, now);
    }
};

struct CopilotInternalFormat {
    UsageSnapshot parse(const std::string& in, TimePoint now) const {
        return CopilotParser::parseInternal(in, now);
    }
};

using ProviderParser = std::variant<ClaudeCliFormat, ClaudeCostFormat, ClaudeApiFormat,
                                    CodexRpcFormat, CodexStatusFormat,
                                    GeminiCliFormat, GeminiApiFormat,
                                    KimiCliFormat, KimiApiFormat,
                                    KiroFormat, AmpCodeFormat, CursorFormat,
                                    MiniMaxFormat, CopilotFormat, CopilotInternalFormat>;

// Default-context parser for an id
inline ProviderParser makeParser(ParserId id) {
    switch (id) {
        case ParserId::ClaudeCli:   return ClaudeCliFormat{};
        case ParserId::ClaudeCost:  return ClaudeCostFormat{};
        case ParserId::ClaudeApi:   return ClaudeApiFormat{};
        case ParserId::CodexRpc:    return CodexRpcFormat{};
        case ParserId::CodexStatus: return CodexStatusFormat{};
        case ParserId::GeminiCli:   return GeminiCliFormat{};
        case ParserId::GeminiApi:   return GeminiApiFormat{};
        case ParserId::KimiCli:     return KimiCliFormat{};
        case ParserId::KimiApi:     return KimiApiFormat{};
        case ParserId::Kiro:        return KiroFormat{};
        case ParserId::AmpCode:     return AmpCodeFormat{};
        case ParserId::Cursor:      return CursorFormat{};
        case ParserId::MiniMax:     return MiniMaxFormat{};
        case ParserId::Copilot:     return CopilotFormat{};
        case ParserId::CopilotInternal: return CopilotInternalFormat{};
    }
    return ClaudeCliFormat{};
}

inline UsageSnapshot parseOutput(const ProviderParser& parser, const std::string& input,
                                 TimePoint now = Clock::now()) {
    return std::visit([&](const auto& p) { return p.parse(input, now); }, parser);
}

inline UsageSnapshot parseOutput(ParserId id, const std::string& input,
                                 TimePoint now = Clock::now()) {
    return parseOutput(makeParser(id), input, now);
}
