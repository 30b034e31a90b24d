#pragma once

#include <memory>
#include <string>

#include "sandbox/policy.hpp"
#include "sandbox/result_classifier.hpp"
#include "sandbox/worker_process.hpp"

namespace codebox::sandbox {

// Entry point of the sandbox. Stateless apart from the shared policy, so one
// engine serves any number of concurrent callers.
class ExecutionEngine {
public:
    ExecutionEngine(std::shared_ptr<const Policy> policy, std::string python_executable = "python3");

    ExecutionResult Execute(const std::string& source) const;

    const Policy& GetPolicy() const { return *policy_; }

private:
    std::shared_ptr<const Policy> policy_;
    WorkerProcess worker_;
};

}  // namespace codebox::sandbox
