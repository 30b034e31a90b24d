#pragma once

#include <memory>
#include <string>
#include <vector>

#include "agent/coding_agent.hpp"
#include "config/config_schema.hpp"
#include "sandbox/execution_engine.hpp"

namespace codebox::service {

struct CombinedOutcome {
    bool ok = false;
    std::string task_description;
    codebox::agent::GenerationResult generation;
    codebox::sandbox::ExecutionResult execution;
    codebox::agent::GenerationError error;
    std::string timestamp;
};

struct ServiceStats {
    double max_execution_time = 0.0;
    std::size_t max_output_length = 0;
    std::vector<std::string> allowed_imports;
    std::string security_level = "restricted";
    bool generator_available = false;
    std::string timestamp;
};

// Operations offered to the request layer: task validation, generation,
// sandboxed execution and introspection.
class CodingService {
public:
    CodingService(std::shared_ptr<const codebox::sandbox::Policy> policy,
                  std::string python_executable,
                  std::shared_ptr<codebox::agent::CodingAgent> agent);

    // Throws std::invalid_argument when the sandbox settings are invalid.
    static std::unique_ptr<CodingService> FromConfig(const codebox::config::Config& config);

    codebox::agent::TaskValidation Validate(const std::string& task) const;
    codebox::agent::GenerationOutcome Generate(const std::string& task) const;
    codebox::sandbox::ExecutionResult Execute(const std::string& source) const;
    CombinedOutcome GenerateAndExecute(const std::string& task) const;
    ServiceStats Stats() const;

    bool GeneratorAvailable() const { return agent_ != nullptr; }

private:
    codebox::sandbox::ExecutionEngine engine_;
    std::shared_ptr<codebox::agent::CodingAgent> agent_;
};

}  // namespace codebox::service
