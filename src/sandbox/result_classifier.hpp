#pragma once

#include <string>
#include <vector>

#include "sandbox/deadline_supervisor.hpp"
#include "sandbox/output_capture.hpp"
#include "sandbox/policy.hpp"
#include "sandbox/pre_check.hpp"

namespace codebox::sandbox {

struct ExecutionResult {
    bool success = false;
    std::string output;
    std::string error;
    double execution_time_seconds = 0.0;
    bool output_truncated = false;
    std::string stderr_output;
};

ExecutionResult ClassifyEmpty(double elapsed_seconds);
ExecutionResult ClassifyViolations(const std::vector<Violation>& violations, double elapsed_seconds);
ExecutionResult ClassifyOutcome(const OutcomeStatus& outcome,
                                const OutputCapture::Snapshot& captured,
                                const Policy& policy,
                                double elapsed_seconds);

// Strips host paths and interpreter frame lines, keeps the first 10 lines
// and at most 2000 characters.
std::string SanitizeErrorMessage(const std::string& message);

// 10.0 -> "10", 2.5 -> "2.5"
std::string FormatTimeLimit(double seconds);

}  // namespace codebox::sandbox
