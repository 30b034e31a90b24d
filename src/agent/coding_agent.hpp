#pragma once

#include <memory>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "providers/llm_provider.hpp"

namespace codebox::agent {

struct TaskValidation {
    bool valid = true;
    std::string message;
    std::vector<std::string> suggestions;
};

struct GenerationResult {
    std::string source_text;
    std::string explanation;
    std::string model;
};

enum class GenerationErrorKind {
    kUnavailable,
    kFailed,
    kInvalidTask
};

inline const char* ToString(GenerationErrorKind kind) {
    switch (kind) {
        case GenerationErrorKind::kUnavailable: return "unavailable";
        case GenerationErrorKind::kFailed: return "failed";
        case GenerationErrorKind::kInvalidTask: return "invalid_task";
    }
    return "unknown";
}

struct GenerationError {
    GenerationErrorKind kind = GenerationErrorKind::kFailed;
    std::string message;
    std::vector<std::string> suggestions;
};

struct GenerationOutcome {
    bool ok = false;
    GenerationResult result;
    GenerationError error;
};

struct ParsedReply {
    std::string code;
    std::string explanation;
};

// Turns a task description into Python source through an LLM provider.
class CodingAgent {
public:
    CodingAgent(std::shared_ptr<codebox::providers::LLMProvider> provider,
                codebox::config::GeneratorConfig config);

    TaskValidation ValidateTask(const std::string& task) const;
    GenerationOutcome Generate(const std::string& task) const;

    static std::string SystemPrompt();
    static std::string TaskPrompt(const std::string& task);
    static ParsedReply ParseReply(const std::string& content);

private:
    std::shared_ptr<codebox::providers::LLMProvider> provider_;
    codebox::config::GeneratorConfig config_;
};

}  // namespace codebox::agent
