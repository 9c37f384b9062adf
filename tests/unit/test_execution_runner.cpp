#include <filesystem>
#include <string>
#include <gtest/gtest.h>
#include "runtime/execution_runner.hpp"
#include "unit/test_support.hpp"

namespace {

using venvbox::runtime::ExecutionRunner;
using venvbox::runtime::RunnerOptions;
using venvbox::runtime::interpreter_path;
using venvbox::runtime::timeout_message;
using venvbox::testing::TempWorkspace;
using venvbox::testing::make_fake_environment;

class ExecutionRunnerTest : public ::testing::Test {
protected:
    ExecutionRunnerTest() : workspace_("execution_runner") {
        make_fake_environment(env_root());
    }

    std::filesystem::path env_root() const { return workspace_.root() / "env"; }

    TempWorkspace workspace_;
};

TEST_F(ExecutionRunnerTest, ReturnsStdoutWithEmptyDiagnostic) {
    ExecutionRunner runner(RunnerOptions{5000, 1024});
    const auto outcome = runner.run(env_root(), "echo 'Hello, World!'");
    EXPECT_EQ(outcome.stdout_text, "Hello, World!\n");
    EXPECT_EQ(outcome.diagnostic, "");
    EXPECT_EQ(outcome.exit_code, 0);
    EXPECT_FALSE(outcome.timed_out);
}

TEST_F(ExecutionRunnerTest, PassesStderrThroughVerbatim) {
    ExecutionRunner runner(RunnerOptions{5000, 1024});
    const auto outcome = runner.run(
        env_root(), "echo partial; echo 'ZeroDivisionError: division by zero' >&2; exit 1");
    EXPECT_EQ(outcome.stdout_text, "partial\n");
    EXPECT_EQ(outcome.diagnostic, "ZeroDivisionError: division by zero\n");
    EXPECT_EQ(outcome.exit_code, 1);
}

TEST_F(ExecutionRunnerTest, WarningsOnSuccessfulRunStayInDiagnostic) {
    ExecutionRunner runner(RunnerOptions{5000, 1024});
    const auto outcome = runner.run(env_root(), "echo ok; echo 'DeprecationWarning' >&2");
    EXPECT_EQ(outcome.exit_code, 0);
    EXPECT_EQ(outcome.stdout_text, "ok\n");
    EXPECT_EQ(outcome.diagnostic, "DeprecationWarning\n");
}

TEST_F(ExecutionRunnerTest, DescribesSilentFailure) {
    ExecutionRunner runner(RunnerOptions{5000, 1024});
    const auto outcome = runner.run(env_root(), "exit 4");
    EXPECT_EQ(outcome.diagnostic, "Process exited with code 4");
}

TEST_F(ExecutionRunnerTest, TimesOutWithFixedMessage) {
    ExecutionRunner runner(RunnerOptions{1000, 1024});
    const auto outcome = runner.run(env_root(), "echo early; sleep 30");
    EXPECT_TRUE(outcome.timed_out);
    EXPECT_EQ(outcome.stdout_text, "");
    EXPECT_EQ(outcome.diagnostic, "Error: Code execution timed out (1 second limit)");
    EXPECT_LT(outcome.duration_ms, 5000.0);
}

TEST_F(ExecutionRunnerTest, MarksTruncatedOutput) {
    ExecutionRunner runner(RunnerOptions{5000, 16});
    const auto outcome = runner.run(env_root(), "head -c 1000 /dev/zero | tr '\\000' x");
    EXPECT_EQ(outcome.stdout_text, std::string(16, 'x') + "\n[output truncated]");
}

TEST_F(ExecutionRunnerTest, SetsUnbufferedOutput) {
    ExecutionRunner runner(RunnerOptions{5000, 1024});
    const auto outcome = runner.run(env_root(), "printf %s \"$PYTHONUNBUFFERED\"");
    EXPECT_EQ(outcome.stdout_text, "1");
}

TEST_F(ExecutionRunnerTest, ReportsMissingInterpreter) {
    ExecutionRunner runner(RunnerOptions{5000, 1024});
    const auto outcome = runner.run(workspace_.root() / "nowhere", "echo hi");
    EXPECT_EQ(outcome.stdout_text, "");
    EXPECT_EQ(outcome.diagnostic.rfind("Error: Python interpreter not found: ", 0), 0u);
}

TEST(TimeoutMessageTest, FormatsWholeSecondsAndMilliseconds) {
    EXPECT_EQ(timeout_message(30000), "Error: Code execution timed out (30 seconds limit)");
    EXPECT_EQ(timeout_message(1500), "Error: Code execution timed out (1500 ms limit)");
    EXPECT_EQ(timeout_message(1000), "Error: Code execution timed out (1 second limit)");
}

TEST(InterpreterPathTest, PointsIntoEnvironment) {
    EXPECT_EQ(interpreter_path("/cache/web"), std::filesystem::path("/cache/web/bin/python"));
}

}  // namespace
