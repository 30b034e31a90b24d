#include <memory>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "agent/coding_agent.hpp"
#include "providers/llm_provider.hpp"

namespace {

using codebox::agent::CodingAgent;
using codebox::agent::GenerationErrorKind;
using codebox::providers::LLMProvider;
using codebox::providers::LLMResponse;
using codebox::providers::Message;

class FakeProvider : public LLMProvider {
public:
    explicit FakeProvider(LLMResponse reply)
        : reply_(std::move(reply)) {}

    LLMResponse Chat(const std::vector<Message>& messages,
                     const std::string& model,
                     int max_tokens,
                     double temperature) override {
        last_messages = messages;
        last_model = model;
        last_max_tokens = max_tokens;
        last_temperature = temperature;
        ++calls;
        return reply_;
    }

    std::string GetDefaultModel() const override { return "fake-model"; }

    std::vector<Message> last_messages;
    std::string last_model;
    int last_max_tokens = 0;
    double last_temperature = 0.0;
    int calls = 0;

private:
    LLMResponse reply_;
};

TEST(CodingAgentTest, ParsesPythonBlockAndExplanation) {
    const auto reply = CodingAgent::ParseReply(
        "Here you go:\n```python\nprint('hi')\n```\n\nExplanation: Prints a greeting.");
    EXPECT_EQ(reply.code, "print('hi')");
    EXPECT_EQ(reply.explanation, "Prints a greeting.");
}

TEST(CodingAgentTest, FallsBackToBareBlockThenWholeReply) {
    const auto bare = CodingAgent::ParseReply("```\nx = 1\n```");
    EXPECT_EQ(bare.code, "x = 1");
    EXPECT_EQ(bare.explanation, "Generated code based on the given task description.");

    const auto plain = CodingAgent::ParseReply("  print(3)  \n");
    EXPECT_EQ(plain.code, "print(3)");
    EXPECT_EQ(plain.explanation, "Generated code based on the given task description.");
}

TEST(CodingAgentTest, ValidatesTaskDescriptions) {
    CodingAgent agent(nullptr, {});
    const auto short_task = agent.ValidateTask(" ab ");
    EXPECT_FALSE(short_task.valid);
    EXPECT_EQ(short_task.message, "Task description is too short. Please provide more details.");
    EXPECT_EQ(short_task.suggestions.size(), 3u);

    const auto vague = agent.ValidateTask("Write Something useful");
    EXPECT_TRUE(vague.valid);
    EXPECT_EQ(vague.message, "Your description seems vague. Consider being more specific.");
    EXPECT_EQ(vague.suggestions.size(), 3u);

    const auto good = agent.ValidateTask("Compute the first 10 primes");
    EXPECT_TRUE(good.valid);
    EXPECT_EQ(good.message, "Task description looks good!");
    EXPECT_TRUE(good.suggestions.empty());
}

TEST(CodingAgentTest, GenerateSendsPromptsWithConfiguredSampling) {
    auto provider = std::make_shared<FakeProvider>(
        LLMResponse{.content = "```python\nprint(sum(range(5)))\n```\nExplanation: Sums.", .finish_reason = "stop"});
    CodingAgent agent(provider, {});
    const auto outcome = agent.Generate("Sum the numbers 0 to 4");
    ASSERT_TRUE(outcome.ok);
    EXPECT_EQ(outcome.result.source_text, "print(sum(range(5)))");
    EXPECT_EQ(outcome.result.explanation, "Sums.");
    EXPECT_EQ(outcome.result.model, "gpt-3.5-turbo");

    ASSERT_EQ(provider->last_messages.size(), 2u);
    EXPECT_EQ(provider->last_messages[0].role, "system");
    EXPECT_EQ(provider->last_messages[1].role, "user");
    EXPECT_NE(provider->last_messages[1].content.find("Task: Sum the numbers 0 to 4"), std::string::npos);
    EXPECT_EQ(provider->last_max_tokens, 1500);
    EXPECT_DOUBLE_EQ(provider->last_temperature, 0.3);
}

TEST(CodingAgentTest, InvalidTaskSkipsProvider) {
    auto provider = std::make_shared<FakeProvider>(LLMResponse{.content = "x", .finish_reason = "stop"});
    CodingAgent agent(provider, {});
    const auto outcome = agent.Generate("hi");
    EXPECT_FALSE(outcome.ok);
    EXPECT_EQ(outcome.error.kind, GenerationErrorKind::kInvalidTask);
    EXPECT_EQ(outcome.error.suggestions.size(), 3u);
    EXPECT_EQ(provider->calls, 0);
}

TEST(CodingAgentTest, ProviderErrorBecomesFailed) {
    auto provider = std::make_shared<FakeProvider>(
        LLMResponse{.content = "Error calling LLM: HTTP 401", .finish_reason = "error"});
    CodingAgent agent(provider, {});
    const auto outcome = agent.Generate("Print the current date");
    EXPECT_FALSE(outcome.ok);
    EXPECT_EQ(outcome.error.kind, GenerationErrorKind::kFailed);
    EXPECT_EQ(outcome.error.message, "Code generation failed: Error calling LLM: HTTP 401");
}

TEST(CodingAgentTest, MissingProviderIsUnavailable) {
    CodingAgent agent(nullptr, {});
    const auto outcome = agent.Generate("Print the current date");
    EXPECT_FALSE(outcome.ok);
    EXPECT_EQ(outcome.error.kind, GenerationErrorKind::kUnavailable);
}

}  // namespace
