#include "probe/ProviderRegistry.hpp"
#include <algorithm>

ProviderRegistry ProviderRegistry::defaults() {
    return ProviderRegistry({
        {"claude",  "Claude",  "claude",   "https://claude.ai/settings/usage"},
        {"codex",   "Codex",   "codex",    "https://chatgpt.com/codex/settings/usage"},
        {"gemini",  "Gemini",  "gemini",   "https://aistudio.google.com"},
        {"kimi",    "Kimi",    "kimi",     "https://www.kimi.com/code/console"},
        {"kiro",    "Kiro",    "kiro-cli", "https://app.kiro.dev/account/usage"},
        {"ampcode", "Amp",     "amp",      "https://ampcode.com/settings"},
        {"cursor",  "Cursor",  "",         "https://cursor.com/dashboard?tab=usage"},
        {"minimax", "MiniMax", "",         "https://platform.minimax.io/user-center/payment/coding-plan"},
        {"copilot", "Copilot", "",         "https://github.com/settings/copilot/features"},
    });
}

void ProviderRegistry::add(ProviderInfo info) {
    auto it = std::find_if(providers_.begin(), providers_.end(),
                           [&](const ProviderInfo& p) { return p.id == info.id; });
    if (it != providers_.end())
        *it = std::move(info);
    else
        providers_.push_back(std::move(info));
}

const ProviderInfo* ProviderRegistry::find(const std::string& id) const {
    for (auto& p : providers_)
        if (p.id == id) return &p;
    return nullptr;
}

std::string ProviderRegistry::displayName(const std::string& id) const {
    if (auto* p = find(id)) return p->name;
    return id;
}
