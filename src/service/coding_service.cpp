#include "service/coding_service.hpp"

#include "providers/llm_provider.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace codebox::service {
namespace {

const std::vector<std::string>& SetupSuggestions() {
    static const std::vector<std::string> kSuggestions = {
        "Set OPENAI_API_KEY or CODEBOX_PROVIDERS__OPENAI__API_KEY",
        "Or configure providers.openai.apiKey in ~/.codebox/config.json"
    };
    return kSuggestions;
}

}  // namespace

CodingService::CodingService(std::shared_ptr<const codebox::sandbox::Policy> policy,
                             std::string python_executable,
                             std::shared_ptr<codebox::agent::CodingAgent> agent)
    : engine_(std::move(policy), std::move(python_executable))
    , agent_(std::move(agent)) {}

std::unique_ptr<CodingService> CodingService::FromConfig(const codebox::config::Config& config) {
    auto policy = codebox::sandbox::Policy::FromConfig(config.sandbox);
    std::shared_ptr<codebox::agent::CodingAgent> agent;
    std::shared_ptr<codebox::providers::LLMProvider> provider = codebox::providers::CreateProvider(config);
    if (provider) {
        agent = std::make_shared<codebox::agent::CodingAgent>(provider, config.generator);
    } else {
        utils::Log(utils::LogLevel::kInfo, "service", "no LLM provider configured, generation disabled");
    }
    return std::make_unique<CodingService>(std::move(policy), config.sandbox.python_executable, std::move(agent));
}

codebox::agent::TaskValidation CodingService::Validate(const std::string& task) const {
    if (!agent_) {
        return codebox::agent::TaskValidation{
            true, "Task validation not available (coding agent not initialized)", {}};
    }
    return agent_->ValidateTask(task);
}

codebox::agent::GenerationOutcome CodingService::Generate(const std::string& task) const {
    codebox::agent::GenerationOutcome outcome{};
    if (codebox::utils::Trim(task).empty()) {
        outcome.error = codebox::agent::GenerationError{
            codebox::agent::GenerationErrorKind::kInvalidTask, "Please provide a task description", {}};
        return outcome;
    }
    if (!agent_) {
        outcome.error = codebox::agent::GenerationError{
            codebox::agent::GenerationErrorKind::kUnavailable,
            "Coding agent not available. Please check your API key configuration.",
            SetupSuggestions()};
        return outcome;
    }
    return agent_->Generate(task);
}

codebox::sandbox::ExecutionResult CodingService::Execute(const std::string& source) const {
    return engine_.Execute(source);
}

CombinedOutcome CodingService::GenerateAndExecute(const std::string& task) const {
    CombinedOutcome combined{};
    combined.task_description = task;
    const auto generated = Generate(task);
    if (!generated.ok) {
        combined.error = generated.error;
        combined.timestamp = codebox::utils::FormatIsoTimestamp(codebox::utils::Now());
        return combined;
    }
    combined.ok = true;
    combined.generation = generated.result;
    combined.execution = engine_.Execute(generated.result.source_text);
    combined.timestamp = codebox::utils::FormatIsoTimestamp(codebox::utils::Now());
    return combined;
}

ServiceStats CodingService::Stats() const {
    const auto& policy = engine_.GetPolicy();
    ServiceStats stats{};
    stats.max_execution_time = policy.MaxExecutionSeconds();
    stats.max_output_length = policy.MaxOutputChars();
    stats.allowed_imports = policy.SortedAllowedImports();
    stats.generator_available = GeneratorAvailable();
    stats.timestamp = codebox::utils::FormatIsoTimestamp(codebox::utils::Now());
    return stats;
}

}  // namespace codebox::service
