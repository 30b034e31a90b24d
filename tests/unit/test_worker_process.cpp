#include <string>
#include <gtest/gtest.h>
#include "config/config_schema.hpp"
#include "sandbox/deadline_supervisor.hpp"
#include "sandbox/execution_context.hpp"
#include "sandbox/output_capture.hpp"
#include "sandbox/policy.hpp"
#include "sandbox/worker_process.hpp"

namespace {

using codebox::sandbox::BuildContext;
using codebox::sandbox::GuestError;
using codebox::sandbox::OutputCapture;
using codebox::sandbox::Policy;
using codebox::sandbox::WorkerHandle;
using codebox::sandbox::WorkerProcess;
using codebox::sandbox::WorkerRequest;

WorkerRequest MakeRequest(const std::string& source) {
    const auto policy = Policy::FromConfig(codebox::config::SandboxConfig{});
    WorkerRequest request{};
    request.source = source;
    request.context = BuildContext(*policy);
    request.max_output_chars = policy->MaxOutputChars();
    return request;
}

// Runs the request and returns the reported error type and message.
std::string RunExpectingError(const WorkerRequest& request, OutputCapture& capture) {
    WorkerProcess worker("python3");
    WorkerHandle handle;
    try {
        worker.Run(request, capture, handle);
    } catch (const GuestError& ex) {
        return ex.what();
    }
    return "";
}

TEST(WorkerProcessTest, RunsSnippetAndStreamsOutput) {
    OutputCapture capture(100);
    WorkerProcess worker("python3");
    WorkerHandle handle;
    const auto report = worker.Run(MakeRequest("print(math.floor(2.5))"), capture, handle);
    EXPECT_TRUE(report.finished);
    EXPECT_EQ(report.exit_code, 0);
    EXPECT_EQ(capture.Take().stdout_text, "2\n");
}

TEST(WorkerProcessTest, RefusesNormalisedEscapeNames) {
    OutputCapture capture(100);
    const auto error = RunExpectingError(MakeRequest("print('ran')\nprint(().__ｃlass__)\n"), capture);
    EXPECT_EQ(error, "PermissionError: blocked name '__class__'");
    EXPECT_EQ(capture.Take().stdout_text, "");
}

TEST(WorkerProcessTest, RefusesModuleNamesInNestedCode) {
    OutputCapture capture(100);
    const auto error = RunExpectingError(
        MakeRequest("def leak():\n    return [m for m in [datetime.ｓys]]\nprint('ran')\n"), capture);
    EXPECT_EQ(error, "PermissionError: blocked name 'sys'");
    EXPECT_EQ(capture.Take().stdout_text, "");
}

TEST(WorkerProcessTest, RefusesPrivateModuleAliases) {
    OutputCapture capture(100);
    const auto error = RunExpectingError(MakeRequest("random._os.getpid()"), capture);
    EXPECT_EQ(error, "PermissionError: blocked name '_os'");
}

TEST(WorkerProcessTest, OrdinaryMethodsSharingBlockedNamesRun) {
    OutputCapture capture(100);
    WorkerProcess worker("python3");
    WorkerHandle handle;
    const auto report = worker.Run(MakeRequest("print(re.compile('a+').match('aa').end())"), capture, handle);
    EXPECT_TRUE(report.finished);
    EXPECT_EQ(capture.Take().stdout_text, "2\n");
}

}  // namespace
