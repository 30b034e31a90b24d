#include "service/json_codec.hpp"

namespace codebox::service {

nlohmann::json ToJson(const codebox::sandbox::ExecutionResult& result) {
    return {
        {"success", result.success},
        {"output", result.output},
        {"error", result.error},
        {"execution_time_seconds", result.execution_time_seconds},
        {"output_truncated", result.output_truncated},
        {"stderr_output", result.stderr_output}
    };
}

nlohmann::json ToJson(const codebox::agent::TaskValidation& validation) {
    return {
        {"valid", validation.valid},
        {"message", validation.message},
        {"suggestions", validation.suggestions}
    };
}

nlohmann::json ToJson(const codebox::agent::GenerationResult& result) {
    return {
        {"success", true},
        {"source_text", result.source_text},
        {"explanation", result.explanation},
        {"model", result.model}
    };
}

nlohmann::json ToJson(const codebox::agent::GenerationError& error) {
    return {
        {"success", false},
        {"kind", codebox::agent::ToString(error.kind)},
        {"error", error.message},
        {"suggestions", error.suggestions}
    };
}

nlohmann::json ToJson(const codebox::agent::GenerationOutcome& outcome) {
    return outcome.ok ? ToJson(outcome.result) : ToJson(outcome.error);
}

nlohmann::json ToJson(const CombinedOutcome& outcome) {
    if (!outcome.ok) {
        auto json = ToJson(outcome.error);
        json["task_description"] = outcome.task_description;
        json["timestamp"] = outcome.timestamp;
        return json;
    }
    return {
        {"success", true},
        {"task_description", outcome.task_description},
        {"generation", ToJson(outcome.generation)},
        {"execution", ToJson(outcome.execution)},
        {"timestamp", outcome.timestamp}
    };
}

nlohmann::json ToJson(const ServiceStats& stats) {
    return {
        {"max_execution_time", stats.max_execution_time},
        {"max_output_length", stats.max_output_length},
        {"allowed_imports", stats.allowed_imports},
        {"security_level", stats.security_level},
        {"generator_available", stats.generator_available},
        {"timestamp", stats.timestamp}
    };
}

}  // namespace codebox::service
