#include "generator/llm_code_generator.hpp"

#include <exception>
#include <sstream>

#include "core/errors.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace sandforge::generator {

LlmCodeGenerator::LlmCodeGenerator(providers::LLMProvider& provider, GeneratorSettings settings)
    : provider_(provider)
    , settings_(std::move(settings)) {}

std::string BuildSystemPrompt(const std::string& language) {
    std::ostringstream oss;
    oss << "You write a single " << language << " code node for a data pipeline.\n"
        << "Contract:\n"
        << "- Input arrives as the global `items`: a list of objects shaped like {\"json\": {...}}.\n"
        << "- Other named inputs may be bound as globals as well.\n"
        << "- Assign the output to the global `result`. It must be JSON-serializable.\n"
        << "- Do not import os, sys, subprocess, socket or any module that touches the "
        << "filesystem, processes or the network.\n"
        << "- Do not call eval, exec, compile, open, getattr, setattr, globals or __import__.\n"
        << "- Do not access dunder attributes.\n"
        << "Reply with one fenced code block and nothing else.";
    return oss.str();
}

std::vector<providers::Message> BuildMessages(const std::string& task_description,
                                              const std::string& language,
                                              const std::optional<std::string>& feedback) {
    std::vector<providers::Message> messages;
    messages.push_back({"system", BuildSystemPrompt(language)});

    std::string prompt = "Task:\n" + task_description;
    if (feedback && !feedback->empty()) {
        prompt += "\n\nYour previous attempt was rejected:\n" + *feedback +
            "\n\nFix these problems and reply with the complete corrected code.";
    }
    messages.push_back({"user", prompt});
    return messages;
}

std::string ExtractCode(const std::string& reply) {
    const auto open = reply.find("```");
    if (open == std::string::npos) {
        return utils::Trim(reply);
    }
    // Skip the info string ("python", "py", ...) on the opening fence line.
    const auto body_start = reply.find('\n', open);
    if (body_start == std::string::npos) {
        return "";
    }
    const auto close = reply.find("```", body_start + 1);
    const auto body = close == std::string::npos
        ? reply.substr(body_start + 1)
        : reply.substr(body_start + 1, close - body_start - 1);

    std::string code = body;
    while (!code.empty() && (code.back() == '\n' || code.back() == '\r' || code.back() == ' ')) {
        code.pop_back();
    }
    return code;
}

CodeCandidate LlmCodeGenerator::Generate(const std::string& task_description,
                                         const std::string& language,
                                         const std::optional<std::string>& feedback) {
    providers::LLMResponse response;
    try {
        response = provider_.Chat(BuildMessages(task_description, language, feedback),
                                  settings_.model,
                                  settings_.max_tokens,
                                  settings_.temperature);
    } catch (const std::exception& ex) {
        throw GeneratorUnavailable(std::string("generator: ") + ex.what());
    }

    if (response.IsError()) {
        throw GeneratorUnavailable("generator: " + response.content);
    }

    CodeCandidate candidate{};
    candidate.language = language;
    candidate.source = ExtractCode(response.content);
    if (candidate.source.empty()) {
        throw GeneratorUnavailable("generator: provider returned no code");
    }

    utils::Log(utils::LogLevel::kDebug, "generator", "candidate received", {
        {"bytes", std::to_string(candidate.source.size())},
        {"finish_reason", response.finish_reason}});
    return candidate;
}

}  // namespace sandforge::generator
