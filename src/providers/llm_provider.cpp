#include "providers/llm_provider.hpp"

#include "providers/http_llm_provider.hpp"

namespace codebox::providers {

ProviderSettings ResolveProviderSettings(const codebox::config::Config& config) {
    ProviderSettings settings{};
    const codebox::config::GeneratorConfig defaults{};
    settings.model = config.generator.model.empty() ? defaults.model : config.generator.model;
    settings.use_proxy_for_llm = config.providers.use_proxy_for_llm;
    settings.timeout_s = config.generator.timeout_s;

    if (!config.providers.openrouter.api_key.empty()) {
        settings.api_key = config.providers.openrouter.api_key;
        settings.api_base = config.providers.openrouter.api_base.empty()
            ? "https://openrouter.ai/api/v1"
            : config.providers.openrouter.api_base;
        return settings;
    }

    if (!config.providers.openai.api_key.empty()) {
        settings.api_key = config.providers.openai.api_key;
        settings.api_base = config.providers.openai.api_base;
        return settings;
    }

    if (!config.providers.anthropic.api_key.empty()) {
        settings.api_key = config.providers.anthropic.api_key;
        settings.api_base = config.providers.anthropic.api_base;
        if (settings.model == defaults.model) {
            settings.model = "anthropic/claude-3-5-haiku-latest";
        }
        return settings;
    }

    return settings;
}

std::unique_ptr<LLMProvider> CreateProvider(const codebox::config::Config& config) {
    const auto settings = ResolveProviderSettings(config);
    if (settings.api_key.empty()) {
        return nullptr;
    }
    return std::make_unique<HttpLLMProvider>(settings);
}

}  // namespace codebox::providers
