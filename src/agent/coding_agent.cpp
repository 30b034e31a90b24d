#include "agent/coding_agent.hpp"

#include <algorithm>
#include <cctype>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace codebox::agent {
namespace {

constexpr std::size_t kMinTaskLength = 5;
constexpr const char* kDefaultExplanation = "Generated code based on the given task description.";

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

// Finds the first fenced block opened by `fence` and returns its body.
bool FindFencedBlock(const std::string& content,
                     const std::string& fence,
                     std::string& body,
                     std::size_t& block_end) {
    const auto open = content.find(fence);
    if (open == std::string::npos) {
        return false;
    }
    const auto body_start = open + fence.size();
    const auto close = content.find("```", body_start);
    if (close == std::string::npos) {
        return false;
    }
    body = content.substr(body_start, close - body_start);
    block_end = close + 3;
    return true;
}

std::string StripExplanationLabel(const std::string& text) {
    static const std::string kLabel = "explanation:";
    if (ToLower(text.substr(0, kLabel.size())) == kLabel) {
        return codebox::utils::Trim(text.substr(kLabel.size()));
    }
    return text;
}

GenerationOutcome Failure(GenerationErrorKind kind,
                          std::string message,
                          std::vector<std::string> suggestions = {}) {
    GenerationOutcome outcome{};
    outcome.ok = false;
    outcome.error = GenerationError{kind, std::move(message), std::move(suggestions)};
    return outcome;
}

}  // namespace

CodingAgent::CodingAgent(std::shared_ptr<codebox::providers::LLMProvider> provider,
                         codebox::config::GeneratorConfig config)
    : provider_(std::move(provider))
    , config_(std::move(config)) {}

std::string CodingAgent::SystemPrompt() {
    return R"(You are an expert Python programmer. Your job is to generate clean, efficient, and well-commented Python code based on natural language descriptions.

Guidelines:
1. Write clean, readable Python code that follows best practices
2. Include helpful comments explaining the logic
3. Use appropriate variable names and function structures
4. Handle common edge cases and errors when appropriate
5. Keep the code focused and avoid unnecessary complexity
6. Use only standard Python libraries or commonly available packages (math, random, datetime, json, etc.)
7. Format your response with the code in triple backticks followed by an explanation

Response format:
```python
# Your generated Python code here
```

Explanation: Brief explanation of what the code does and how it works.)";
}

std::string CodingAgent::TaskPrompt(const std::string& task) {
    return "Generate Python code for the following task:\n\n"
           "Task: " + task + "\n\n"
           "Please provide:\n"
           "1. Clean, working Python code that accomplishes the task\n"
           "2. Appropriate comments explaining the code\n"
           "3. A brief explanation after the code block\n\n"
           "Make sure the code is ready to run and includes any necessary imports.";
}

ParsedReply CodingAgent::ParseReply(const std::string& content) {
    ParsedReply reply{};
    std::string body;
    std::size_t block_end = 0;
    if (FindFencedBlock(content, "```python\n", body, block_end) ||
        FindFencedBlock(content, "```\n", body, block_end)) {
        reply.code = codebox::utils::Trim(body);
        reply.explanation = StripExplanationLabel(codebox::utils::Trim(content.substr(block_end)));
        if (reply.explanation.empty()) {
            reply.explanation = kDefaultExplanation;
        }
        return reply;
    }
    reply.code = codebox::utils::Trim(content);
    reply.explanation = kDefaultExplanation;
    return reply;
}

TaskValidation CodingAgent::ValidateTask(const std::string& task) const {
    if (codebox::utils::Trim(task).size() < kMinTaskLength) {
        return TaskValidation{
            false,
            "Task description is too short. Please provide more details.",
            {"Describe what you want the code to do",
             "Include input/output requirements",
             "Specify any constraints or requirements"}};
    }

    static const std::vector<std::string> kVagueKeywords = {"something", "anything", "stuff", "thing"};
    const auto lowered = ToLower(task);
    for (const auto& keyword : kVagueKeywords) {
        if (lowered.find(keyword) != std::string::npos) {
            return TaskValidation{
                true,
                "Your description seems vague. Consider being more specific.",
                {"Be more specific about the desired functionality",
                 "Include examples of expected input/output",
                 "Mention any specific algorithms or approaches"}};
        }
    }

    return TaskValidation{true, "Task description looks good!", {}};
}

GenerationOutcome CodingAgent::Generate(const std::string& task) const {
    if (codebox::utils::Trim(task).empty()) {
        return Failure(GenerationErrorKind::kInvalidTask, "Please provide a task description");
    }
    const auto validation = ValidateTask(task);
    if (!validation.valid) {
        return Failure(GenerationErrorKind::kInvalidTask, validation.message, validation.suggestions);
    }
    if (!provider_) {
        return Failure(GenerationErrorKind::kUnavailable,
                       "Coding agent not available. Please check your API key configuration.");
    }

    const auto model = config_.model.empty() ? provider_->GetDefaultModel() : config_.model;
    const std::vector<codebox::providers::Message> messages = {
        {"system", SystemPrompt()},
        {"user", TaskPrompt(task)}
    };

    utils::Log(utils::LogLevel::kInfo, "agent", "generating code",
               {{"model", model}, {"task_chars", std::to_string(task.size())}});
    const auto response = provider_->Chat(messages, model, config_.max_tokens, config_.temperature);
    if (response.IsError()) {
        utils::Log(utils::LogLevel::kWarn, "agent", "generation failed", {{"reason", response.content}});
        return Failure(GenerationErrorKind::kFailed, "Code generation failed: " + response.content);
    }

    const auto reply = ParseReply(response.content);
    if (reply.code.empty()) {
        return Failure(GenerationErrorKind::kFailed, "Code generation failed: empty reply");
    }

    GenerationOutcome outcome{};
    outcome.ok = true;
    outcome.result = GenerationResult{reply.code, reply.explanation, model};
    return outcome;
}

}  // namespace codebox::agent
