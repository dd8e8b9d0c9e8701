#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "core/errors.hpp"
#include "generator/llm_code_generator.hpp"
#include "providers/litellm_provider.hpp"

namespace sandforge::generator {
namespace {

// Returns a canned reply and remembers the last conversation it was sent.
class CannedProvider : public providers::LLMProvider {
public:
    explicit CannedProvider(providers::LLMResponse reply) : reply_(std::move(reply)) {}

    providers::LLMResponse Chat(const std::vector<providers::Message>& messages,
                                const std::string& model,
                                int,
                                double) override {
        last_messages = messages;
        last_model = model;
        if (throw_on_chat) {
            throw std::runtime_error("connection reset");
        }
        return reply_;
    }

    std::string GetDefaultModel() const override { return "canned"; }

    std::vector<providers::Message> last_messages;
    std::string last_model;
    bool throw_on_chat = false;

private:
    providers::LLMResponse reply_;
};

providers::LLMResponse Reply(const std::string& content, const std::string& finish_reason = "stop") {
    providers::LLMResponse response{};
    response.content = content;
    response.finish_reason = finish_reason;
    return response;
}

TEST(ExtractCodeTest, TakesFirstFencedBlock) {
    EXPECT_EQ(ExtractCode("Here you go:\n```python\nresult = 1\n```\nand\n```\nresult = 2\n```"), "result = 1");
}

TEST(ExtractCodeTest, AcceptsUnclosedFence) {
    EXPECT_EQ(ExtractCode("```py\nresult = [1, 2]\n\n"), "result = [1, 2]");
}

TEST(ExtractCodeTest, FallsBackToTrimmedText) {
    EXPECT_EQ(ExtractCode("  result = 3  \n"), "result = 3");
}

TEST(BuildMessagesTest, AddsFeedbackOnlyWhenPresent) {
    const auto first = BuildMessages("sum the values", "python", std::nullopt);
    ASSERT_EQ(first.size(), 2u);
    EXPECT_EQ(first[0].role, "system");
    EXPECT_NE(first[0].content.find("result"), std::string::npos);
    EXPECT_EQ(first[1].content.find("rejected"), std::string::npos);

    const auto retry = BuildMessages("sum the values", "python", std::string("1 of 1 tests failed"));
    EXPECT_NE(retry[1].content.find("Your previous attempt was rejected:\n1 of 1 tests failed"),
              std::string::npos);
}

TEST(LlmCodeGeneratorTest, ReturnsExtractedSource) {
    CannedProvider provider(Reply("```python\nresult = sum(i['json']['v'] for i in items)\n```"));
    LlmCodeGenerator generator(provider, GeneratorSettings{"anthropic/claude-sonnet-4-5", 1024, 0.0});

    const auto candidate = generator.Generate("sum", "python", std::nullopt);

    EXPECT_EQ(candidate.source, "result = sum(i['json']['v'] for i in items)");
    EXPECT_EQ(candidate.language, "python");
    EXPECT_EQ(provider.last_model, "anthropic/claude-sonnet-4-5");
}

TEST(LlmCodeGeneratorTest, ErrorResponseMeansUnavailable) {
    CannedProvider provider(Reply("Error calling LLM: HTTP 401", "error"));
    LlmCodeGenerator generator(provider, GeneratorSettings{"m"});
    EXPECT_THROW(generator.Generate("sum", "python", std::nullopt), GeneratorUnavailable);
}

TEST(LlmCodeGeneratorTest, EmptyReplyMeansUnavailable) {
    CannedProvider provider(Reply("```python\n```"));
    LlmCodeGenerator generator(provider, GeneratorSettings{"m"});
    EXPECT_THROW(generator.Generate("sum", "python", std::nullopt), GeneratorUnavailable);
}

TEST(LlmCodeGeneratorTest, ProviderExceptionMeansUnavailable) {
    CannedProvider provider(Reply("unused"));
    provider.throw_on_chat = true;
    LlmCodeGenerator generator(provider, GeneratorSettings{"m"});
    EXPECT_THROW(generator.Generate("sum", "python", std::nullopt), GeneratorUnavailable);
}

TEST(LlmCodeGeneratorTest, ForwardsFeedbackToProvider) {
    CannedProvider provider(Reply("result = 2"));
    LlmCodeGenerator generator(provider, GeneratorSettings{"m"});
    generator.Generate("double", "python", std::string("expected 10, got 11"));
    ASSERT_EQ(provider.last_messages.size(), 2u);
    EXPECT_NE(provider.last_messages[1].content.find("expected 10, got 11"), std::string::npos);
}

TEST(ProviderRoutingTest, DetectsAnthropicStyle) {
    EXPECT_TRUE(providers::ShouldUseAnthropicMessages("anthropic/claude-sonnet-4-5", ""));
    EXPECT_TRUE(providers::ShouldUseAnthropicMessages("custom", "https://api.anthropic.com/v1"));
    EXPECT_FALSE(providers::ShouldUseAnthropicMessages("openai/gpt-4o", ""));
}

TEST(ProviderRoutingTest, StripsKnownPrefixesOnly) {
    EXPECT_EQ(providers::StripProviderPrefix("anthropic/claude-sonnet-4-5"), "claude-sonnet-4-5");
    EXPECT_EQ(providers::StripProviderPrefix("openai/gpt-4o"), "gpt-4o");
    EXPECT_EQ(providers::StripProviderPrefix("meta-llama/llama-3"), "meta-llama/llama-3");
    EXPECT_EQ(providers::StripProviderPrefix("gpt-4o"), "gpt-4o");
}

}  // namespace
}  // namespace sandforge::generator
