#pragma once

#include <optional>
#include <string>
#include <vector>

#include "generator/code_generator.hpp"
#include "providers/llm_provider.hpp"

namespace sandforge::generator {

struct GeneratorSettings {
    std::string model;
    int max_tokens = 4096;
    double temperature = 0.2;
};

class LlmCodeGenerator : public CodeGenerator {
public:
    LlmCodeGenerator(providers::LLMProvider& provider, GeneratorSettings settings);

    CodeCandidate Generate(const std::string& task_description,
                           const std::string& language,
                           const std::optional<std::string>& feedback) override;

private:
    providers::LLMProvider& provider_;
    GeneratorSettings settings_;
};

std::string BuildSystemPrompt(const std::string& language);
std::vector<providers::Message> BuildMessages(const std::string& task_description,
                                              const std::string& language,
                                              const std::optional<std::string>& feedback);

// Body of the first fenced code block, or the trimmed text when there is none.
std::string ExtractCode(const std::string& reply);

}  // namespace sandforge::generator
