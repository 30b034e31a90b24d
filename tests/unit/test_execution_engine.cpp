#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include "config/config_schema.hpp"
#include "sandbox/execution_engine.hpp"
#include "sandbox/policy.hpp"

namespace {

using codebox::sandbox::ExecutionEngine;
using codebox::sandbox::ExecutionResult;
using codebox::sandbox::Policy;

std::shared_ptr<const Policy> MakePolicy(double seconds, int max_output_chars = 10000) {
    codebox::config::SandboxConfig config{};
    config.max_execution_seconds = seconds;
    config.max_output_chars = max_output_chars;
    return Policy::FromConfig(config);
}

TEST(ExecutionEngineTest, PrintsArithmetic) {
    ExecutionEngine engine(MakePolicy(10.0));
    const auto result = engine.Execute("print(2+2)");
    EXPECT_TRUE(result.success) << result.error;
    EXPECT_EQ(result.output, "4\n");
    EXPECT_EQ(result.error, "");
    EXPECT_GE(result.execution_time_seconds, 0.0);
}

TEST(ExecutionEngineTest, EmptySourceIsRejected) {
    ExecutionEngine engine(MakePolicy(10.0));
    const auto result = engine.Execute("  \n\t");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, "No code provided");
}

TEST(ExecutionEngineTest, DisallowedImportNeverRuns) {
    ExecutionEngine engine(MakePolicy(10.0));
    const auto result = engine.Execute("print('ran')\nimport os\n");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.output, "");
    EXPECT_NE(result.error.find("os"), std::string::npos);
    EXPECT_LT(result.execution_time_seconds, 1.0);
}

TEST(ExecutionEngineTest, RaisedErrorKeepsPartialOutput) {
    ExecutionEngine engine(MakePolicy(10.0));
    const auto result = engine.Execute("print('partial')\nraise ValueError(\"bad\")\n");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.output, "partial\n");
    EXPECT_EQ(result.error, "ValueError: bad (line 2)");
}

TEST(ExecutionEngineTest, RaiseValueError) {
    ExecutionEngine engine(MakePolicy(10.0));
    const auto result = engine.Execute("raise ValueError(\"bad\")");
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.error.find("bad"), std::string::npos);
}

TEST(ExecutionEngineTest, SyntaxErrorIsReported) {
    ExecutionEngine engine(MakePolicy(10.0));
    const auto result = engine.Execute("print(\n");
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.error.find("SyntaxError"), std::string::npos);
}

TEST(ExecutionEngineTest, InfiniteLoopTimesOutNearLimit) {
    ExecutionEngine engine(MakePolicy(10.0));
    const auto result = engine.Execute("while True: pass");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, "Code execution timed out after 10 seconds");
    EXPECT_GE(result.execution_time_seconds, 10.0);
    EXPECT_LT(result.execution_time_seconds, 12.0);
}

TEST(ExecutionEngineTest, TimeoutKeepsOutputWrittenBeforeDeadline) {
    ExecutionEngine engine(MakePolicy(1.5));
    const auto result = engine.Execute("print('tick')\nx = 0\nwhile True:\n    x += 1\n");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.output, "tick\n");
    EXPECT_EQ(result.error, "Code execution timed out after 1.5 seconds");
    EXPECT_GE(result.execution_time_seconds, 1.5);
    EXPECT_LT(result.execution_time_seconds, 3.5);
}

TEST(ExecutionEngineTest, OutputIsTruncatedToExactCap) {
    ExecutionEngine engine(MakePolicy(10.0, 100));
    const auto result = engine.Execute("print('x' * 600)");
    EXPECT_TRUE(result.success) << result.error;
    EXPECT_EQ(result.output, std::string(100, 'x'));
    EXPECT_TRUE(result.output_truncated);
}

TEST(ExecutionEngineTest, NonAsciiOutputCountsCharacters) {
    ExecutionEngine engine(MakePolicy(10.0, 3));
    const auto result = engine.Execute("print('h\\u00e9\\u20ac\\u00e9')");
    EXPECT_TRUE(result.success) << result.error;
    EXPECT_EQ(result.output, "h\xC3\xA9\xE2\x82\xAC");
    EXPECT_TRUE(result.output_truncated);
}

TEST(ExecutionEngineTest, RepeatedExecutionIsIdempotent) {
    ExecutionEngine engine(MakePolicy(10.0));
    const std::string source = "total = sum(range(10))\nprint(total)\n";
    const auto first = engine.Execute(source);
    const auto second = engine.Execute(source);
    EXPECT_TRUE(first.success);
    EXPECT_EQ(first.success, second.success);
    EXPECT_EQ(first.output, second.output);
    EXPECT_EQ(first.error, second.error);
    EXPECT_EQ(first.output, "45\n");
}

TEST(ExecutionEngineTest, BindingsDoNotSurviveBetweenRuns) {
    ExecutionEngine engine(MakePolicy(10.0));
    ASSERT_TRUE(engine.Execute("leaked = 1").success);
    const auto result = engine.Execute("print(leaked)");
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.error.find("NameError"), std::string::npos);
}

TEST(ExecutionEngineTest, ConcurrentExecutionsAreIsolated) {
    ExecutionEngine engine(MakePolicy(10.0));
    constexpr int kRuns = 6;
    std::vector<ExecutionResult> results(kRuns);
    std::vector<std::thread> callers;
    for (int i = 0; i < kRuns; ++i) {
        callers.emplace_back([&engine, &results, i]() {
            results[i] = engine.Execute(
                "marker = " + std::to_string(i) + "\nfor _ in range(3):\n    print(marker)\n");
        });
    }
    for (auto& caller : callers) {
        caller.join();
    }
    for (int i = 0; i < kRuns; ++i) {
        const auto line = std::to_string(i) + "\n";
        EXPECT_TRUE(results[i].success) << results[i].error;
        EXPECT_EQ(results[i].output, line + line + line);
    }
}

TEST(ExecutionEngineTest, TimeoutDoesNotBlockOtherCallers) {
    ExecutionEngine engine(MakePolicy(2.0));
    ExecutionResult slow;
    std::thread looping([&engine, &slow]() { slow = engine.Execute("while True: pass"); });
    const auto fast = engine.Execute("print('fast')");
    looping.join();
    EXPECT_TRUE(fast.success) << fast.error;
    EXPECT_EQ(fast.output, "fast\n");
    EXPECT_LT(fast.execution_time_seconds, 2.0);
    EXPECT_FALSE(slow.success);
}

TEST(ExecutionEngineTest, AllowedModulesAreBoundAndImportable) {
    ExecutionEngine engine(MakePolicy(10.0));
    const auto result = engine.Execute(
        "print(math.sqrt(16))\n"
        "import json\n"
        "from collections import Counter\n"
        "print(json.dumps(Counter('aab').most_common(1)))\n");
    EXPECT_TRUE(result.success) << result.error;
    EXPECT_EQ(result.output, "4.0\n[[\"a\", 2]]\n");
}

TEST(ExecutionEngineTest, ClassesAndExceptionsWork) {
    ExecutionEngine engine(MakePolicy(10.0));
    const auto result = engine.Execute(
        "class Box:\n"
        "    def __init__(self, v):\n"
        "        self.v = v\n"
        "try:\n"
        "    1 / 0\n"
        "except ZeroDivisionError:\n"
        "    print(Box(3).v)\n");
    EXPECT_TRUE(result.success) << result.error;
    EXPECT_EQ(result.output, "3\n");
}

TEST(ExecutionEngineTest, UnsafeBuiltinsAreAbsentAtRuntime) {
    const auto policy = std::make_shared<const Policy>(
        std::set<std::string>{"math"}, std::set<std::string>{}, 10.0, 1000);
    ExecutionEngine engine(policy);
    const auto result = engine.Execute("open('/etc/passwd')");
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.error.find("NameError"), std::string::npos);
    EXPECT_EQ(result.error.find("/etc/passwd"), std::string::npos);
}

TEST(ExecutionEngineTest, RuntimeImportGuardRejectsUnlistedModules) {
    const auto policy = std::make_shared<const Policy>(
        std::set<std::string>{"math"}, std::set<std::string>{}, 10.0, 1000);
    ExecutionEngine engine(policy);
    const auto result = engine.Execute("__import__('os')");
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.error.find("ImportError"), std::string::npos);
}

TEST(ExecutionEngineTest, FullWidthDunderNeverRuns) {
    ExecutionEngine engine(MakePolicy(10.0));
    const auto result = engine.Execute(
        "w = [c for c in ().__ｃlass__.__ｂase__.__ｓubclasses__() if c.__ｎame__ == '_wrap_close'][0]\n"
        "print(w.__ｉnit__.__ｇlobals__['popen']('id').read())\n");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.output, "");
    EXPECT_EQ(result.error.find("Security policy violation"), 0u) << result.error;
}

TEST(ExecutionEngineTest, ModuleReachedThroughAllowedModuleNeverRuns) {
    ExecutionEngine engine(MakePolicy(10.0));
    const auto result = engine.Execute("print(datetime.sys.modules['os'].popen('id').read())");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.output, "");
    EXPECT_EQ(result.error, "Security policy violation: blocked name 'sys'");
}

TEST(ExecutionEngineTest, PrivateModuleAliasNeverRuns) {
    ExecutionEngine engine(MakePolicy(10.0));
    const auto result = engine.Execute("random._os.system('id')");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, "Security policy violation: blocked name '_os'");
}

TEST(ExecutionEngineTest, MissingInterpreterIsSandboxFailure) {
    ExecutionEngine engine(MakePolicy(10.0), "codebox-no-such-python");
    const auto result = engine.Execute("print(1)");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, "Sandbox failure: python interpreter not found: codebox-no-such-python");
}

}  // namespace
