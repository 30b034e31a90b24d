#pragma once

#include <string>
#include <vector>

#include "providers/llm_provider.hpp"

namespace codebox::providers {

// Chat client for OpenAI-compatible /chat/completions endpoints and the
// Anthropic /messages endpoint.
class HttpLLMProvider : public LLMProvider {
public:
    explicit HttpLLMProvider(ProviderSettings settings);

    LLMResponse Chat(
        const std::vector<Message>& messages,
        const std::string& model,
        int max_tokens,
        double temperature) override;

    std::string GetDefaultModel() const override { return settings_.model; }

    static bool UsesAnthropicMessages(const std::string& model, const std::string& api_base);
    static std::string NormalizeModel(const std::string& model, bool is_openrouter);

private:
    ProviderSettings settings_;
    bool is_openrouter_ = false;
};

}  // namespace codebox::providers
