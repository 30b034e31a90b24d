#include "sandbox/execution_engine.hpp"

#include <chrono>
#include <stdexcept>

#include "sandbox/deadline_supervisor.hpp"
#include "sandbox/execution_context.hpp"
#include "sandbox/output_capture.hpp"
#include "sandbox/pre_check.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace codebox::sandbox {

ExecutionEngine::ExecutionEngine(std::shared_ptr<const Policy> policy, std::string python_executable)
    : policy_(std::move(policy))
    , worker_(std::move(python_executable)) {
    if (!policy_) {
        throw std::invalid_argument("ExecutionEngine requires a policy");
    }
}

ExecutionResult ExecutionEngine::Execute(const std::string& source) const {
    const auto started = std::chrono::steady_clock::now();
    auto elapsed = [started]() {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    };

    if (codebox::utils::Trim(source).empty()) {
        return ClassifyEmpty(elapsed());
    }

    const auto violations = Check(source, *policy_);
    if (!violations.empty()) {
        utils::Log(utils::LogLevel::kInfo, "sandbox", "rejected by pre-check",
                   {{"violations", DescribeViolations(violations)}});
        return ClassifyViolations(violations, elapsed());
    }

    auto capture = std::make_shared<OutputCapture>(policy_->MaxOutputChars());
    auto handle = std::make_shared<WorkerHandle>();
    auto request = std::make_shared<WorkerRequest>();
    request->source = source;
    request->context = BuildContext(*policy_);
    request->max_output_chars = policy_->MaxOutputChars();

    const auto outcome = RunWithDeadline<WorkerReport>(
        [worker = worker_, request, capture, handle]() {
            return worker.Run(*request, *capture, *handle);
        },
        policy_->ExecutionLimit(),
        [capture, handle]() {
            capture->Seal();
            handle->Kill();
        });

    auto result = ClassifyOutcome(outcome, capture->Take(), *policy_, elapsed());
    utils::Log(utils::LogLevel::kInfo, "sandbox", "execution finished",
               {{"outcome", ToString(outcome.kind)},
                {"seconds", std::to_string(result.execution_time_seconds)},
                {"output_bytes", std::to_string(result.output.size())},
                {"truncated", result.output_truncated ? "true" : "false"}});
    if (outcome.kind == OutcomeKind::kFaulted) {
        utils::Log(utils::LogLevel::kWarn, "sandbox", "attempt faulted", {{"reason", outcome.message}});
    }
    return result;
}

}  // namespace codebox::sandbox
