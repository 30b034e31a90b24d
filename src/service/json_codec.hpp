#pragma once

#include "agent/coding_agent.hpp"
#include "nlohmann/json.hpp"
#include "sandbox/result_classifier.hpp"
#include "service/coding_service.hpp"

namespace codebox::service {

nlohmann::json ToJson(const codebox::sandbox::ExecutionResult& result);
nlohmann::json ToJson(const codebox::agent::TaskValidation& validation);
nlohmann::json ToJson(const codebox::agent::GenerationResult& result);
nlohmann::json ToJson(const codebox::agent::GenerationError& error);
nlohmann::json ToJson(const codebox::agent::GenerationOutcome& outcome);
nlohmann::json ToJson(const CombinedOutcome& outcome);
nlohmann::json ToJson(const ServiceStats& stats);

}  // namespace codebox::service
