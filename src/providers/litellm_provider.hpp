#pragma once

#include <string>
#include <vector>

#include "providers/llm_provider.hpp"

namespace sandforge::providers {

// Speaks the OpenAI chat-completions API, or the Anthropic messages API when
// the model or base URL names an Anthropic-compatible endpoint.
class LiteLLMProvider : public LLMProvider {
public:
    explicit LiteLLMProvider(ProviderSettings settings);

    LLMResponse Chat(
        const std::vector<Message>& messages,
        const std::string& model,
        int max_tokens,
        double temperature) override;

    std::string GetDefaultModel() const override { return settings_.model; }

private:
    ProviderSettings settings_;
    bool is_openrouter_ = false;
};

// Exposed for tests.
bool ShouldUseAnthropicMessages(const std::string& model, const std::string& api_base);
std::string StripProviderPrefix(const std::string& model);

}  // namespace sandforge::providers
