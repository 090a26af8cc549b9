#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>

struct TokenUsage {
    int64_t input_tokens = 0;
    int64_t output_tokens = 0;
    std::optional<int64_t> cached_input_tokens;
};

inline nlohmann::json usage_json(const std::optional<TokenUsage>& usage) {
    if (!usage) return nullptr;
    nlohmann::json j = {
        {"inputTokens", usage->input_tokens},
        {"outputTokens", usage->output_tokens},
    };
    if (usage->cached_input_tokens) j["cachedInputTokens"] = *usage->cached_input_tokens;
    return j;
}
