/**
 * @file test_process_sandbox.cpp
 * @brief Integration tests running real interpreters on the process backend.
 * @author Dimitris Kafetzis
 *
 * Each test skips when the interpreter or compiler it needs is not on PATH.
 */

#include "feedback/feedback_controller.hpp"
#include "orchestrator/test_orchestrator.hpp"
#include "sandbox/process_backend.hpp"
#include "sandbox/sandbox_environment.hpp"
#include "sandbox/container_backend.hpp"
#include "sandbox/environment_filter.hpp"
#include "sandbox/sandbox_executor.hpp"
#include "sandbox/subprocess.hpp"
#include "support/fake_backend.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <cstdlib>

using namespace code_sandbox;
using namespace std::chrono_literals;
using code_sandbox::test_support::tool_available;

namespace {

/// Returns a fresh (still failing) revision every time.
class StubbornDeveloper final : public IDeveloperClient {
public:
    std::optional<std::string> revise(const RevisionRequest& request) override {
        ++calls;
        return "import sys\nsys.exit(" + std::to_string(request.attempt + 1) + ")\n";
    }
    int calls = 0;
};

bool contains(std::string_view text, std::string_view needle) {
    return text.find(needle) != std::string_view::npos;
}

}  // namespace

// ═══════════════════════════════════════════════
// Process Backend Pipeline Tests
// ═══════════════════════════════════════════════

class ProcessSandboxTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto selected = SandboxEnvironment::select(
            nullptr, std::make_unique<ProcessBackend>(ProcessConfig{}, 10ms), *logger);
        ASSERT_TRUE(selected.has_value()) << selected.error().message;
        environment = std::make_unique<SandboxEnvironment>(std::move(*selected));
        executor = std::make_unique<SandboxExecutor>(*environment, *logger, SandboxExecutor::Options{});

        settings.default_policy = ResourceLimitPolicy::subprocess_default();
        settings.default_policy.wall_timeout_seconds = 10;
        orchestrator = std::make_unique<TestOrchestrator>(*executor, settings, *logger);
    }

    Submission python(std::string id, Discipline discipline, std::string code) {
        Submission s;
        s.id = std::move(id);
        s.language = Language::Python;
        s.discipline = discipline;
        s.code = std::move(code);
        return s;
    }

    std::unique_ptr<Logger> logger = code_sandbox::test_support::quiet_logger();
    std::unique_ptr<SandboxEnvironment> environment;
    std::unique_ptr<SandboxExecutor> executor;
    std::unique_ptr<TestOrchestrator> orchestrator;
    EvaluationSettings settings;
};

TEST_F(ProcessSandboxTest, PythonUnitTestsPass) {
    if (!tool_available("python3")) GTEST_SKIP() << "python3 not on PATH";

    auto s = python("adder", Discipline::Unit, "def add(a, b):\n    return a + b\n");
    s.test_code =
        "import unittest\n"
        "class AddTests(unittest.TestCase):\n"
        "    def test_small(self):\n"
        "        self.assertEqual(add(2, 3), 5)\n"
        "    def test_negative(self):\n"
        "        self.assertEqual(add(-1, 1), 0)\n";

    auto verdict = orchestrator->evaluate(s);
    EXPECT_TRUE(verdict.passed()) << verdict.message;
    ASSERT_NE(verdict.outcome, nullptr);
    EXPECT_EQ(verdict.outcome->backend_used, BackendKind::Subprocess);
}

TEST_F(ProcessSandboxTest, PythonGeneratedHarnessCatchesWrongArithmetic) {
    if (!tool_available("python3")) GTEST_SKIP() << "python3 not on PATH";

    auto verdict = orchestrator->evaluate(
        python("adder", Discipline::Unit, "def add(a, b):\n    return a - b\n"));
    EXPECT_EQ(verdict.status, VerdictStatus::Failed);
    EXPECT_EQ(verdict.failure, FailureKind::RuntimeFailure);
    EXPECT_TRUE(contains(verdict.message, "test_add_known_arithmetic")) << verdict.message;
}

TEST_F(ProcessSandboxTest, InfiniteLoopIsKilledAtDeadline) {
    if (!tool_available("python3")) GTEST_SKIP() << "python3 not on PATH";

    auto s = python("spinner", Discipline::Basic, "while True:\n    pass\n");
    s.timeout = 2s;

    const auto start = std::chrono::steady_clock::now();
    auto verdict = orchestrator->evaluate(s);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(verdict.status, VerdictStatus::Failed);
    EXPECT_EQ(verdict.failure, FailureKind::TimeoutExceeded);
    ASSERT_NE(verdict.outcome, nullptr);
    EXPECT_TRUE(verdict.outcome->timed_out);
    EXPECT_LT(elapsed, 6s);
}

TEST_F(ProcessSandboxTest, SecurityScanFlagsEval) {
    if (!tool_available("python3")) GTEST_SKIP() << "python3 not on PATH";

    auto verdict = orchestrator->evaluate(
        python("config_reader", Discipline::Security, "print(eval('2 * 21'))\n"));
    EXPECT_EQ(verdict.status, VerdictStatus::Failed);
    ASSERT_FALSE(verdict.findings.empty());
    EXPECT_EQ(verdict.findings[0].pattern, "eval usage");
    ASSERT_NE(verdict.outcome, nullptr);
    EXPECT_EQ(verdict.outcome->stdout_data, "42\n");
}

TEST_F(ProcessSandboxTest, EachRunGetsAFreshWorkspace) {
    if (!tool_available("python3")) GTEST_SKIP() << "python3 not on PATH";

    const std::string code =
        "import os, sys\n"
        "if os.path.exists('marker.txt'):\n"
        "    sys.exit(3)\n"
        "with open('marker.txt', 'w') as f:\n"
        "    f.write('seen')\n";
    auto first = orchestrator->evaluate(python("writer", Discipline::Basic, code));
    auto second = orchestrator->evaluate(python("writer", Discipline::Basic, code));
    EXPECT_TRUE(first.passed()) << first.message;
    EXPECT_TRUE(second.passed()) << second.message;
}

TEST_F(ProcessSandboxTest, HostCredentialsAreNotInherited) {
    if (!tool_available("python3")) GTEST_SKIP() << "python3 not on PATH";

    ::setenv("CS_INTEGRATION_API_KEY", "sk-should-not-leak", 1);
    auto verdict = orchestrator->evaluate(python(
        "env_probe", Discipline::Basic,
        "import os\nprint(os.environ.get('CS_INTEGRATION_API_KEY', 'absent'))\n"));
    ::unsetenv("CS_INTEGRATION_API_KEY");

    ASSERT_TRUE(verdict.passed()) << verdict.message;
    EXPECT_EQ(verdict.outcome->stdout_data, "absent\n");
}

TEST_F(ProcessSandboxTest, OutputFloodHitsResourceLimit) {
    if (!tool_available("python3")) GTEST_SKIP() << "python3 not on PATH";

    auto verdict = orchestrator->evaluate(
        python("flood", Discipline::Basic, "while True:\n    print('x' * 1000)\n"));
    EXPECT_EQ(verdict.status, VerdictStatus::Failed);
    EXPECT_EQ(verdict.failure, FailureKind::ResourceExceeded);
}

TEST_F(ProcessSandboxTest, CoverageCountsExecutedLines) {
    if (!tool_available("python3")) GTEST_SKIP() << "python3 not on PATH";

    const std::string code =
        "def sign(x):\n"
        "    if x > 0:\n"
        "        return 1\n"
        "    if x < 0:\n"
        "        return -1\n"
        "    return 0\n"
        "\n"
        "print(sign(5))\n";
    auto verdict = orchestrator->evaluate(python("sign", Discipline::Coverage, code));
    ASSERT_TRUE(verdict.metric.has_value()) << verdict.message;
    EXPECT_EQ(verdict.metric->kind, MetricKind::CoveragePercent);
    EXPECT_GT(verdict.metric->value, 0.0);
    EXPECT_LT(verdict.metric->value, 100.0);
    EXPECT_EQ(verdict.status, VerdictStatus::Failed);
}

TEST_F(ProcessSandboxTest, JavaScriptBasicRun) {
    if (!tool_available("node")) GTEST_SKIP() << "node not on PATH";

    Submission s;
    s.id = "greeter";
    s.language = Language::JavaScript;
    s.code = "console.log('hello ' + 'sandbox');\n";
    auto verdict = orchestrator->evaluate(s);
    EXPECT_TRUE(verdict.passed()) << verdict.message;
    EXPECT_EQ(verdict.outcome->stdout_data, "hello sandbox\n");
}

TEST_F(ProcessSandboxTest, JavaMissingSemicolonIsCompileError) {
    if (!tool_available("javac") || !tool_available("java")) GTEST_SKIP() << "JDK not on PATH";

    Submission s;
    s.id = "broken";
    s.language = Language::Java;
    s.code =
        "public class Main {\n"
        "    public static void main(String[] args) {\n"
        "        int x = 1\n"
        "        System.out.println(x);\n"
        "    }\n"
        "}\n";
    auto verdict = orchestrator->evaluate(s);
    EXPECT_EQ(verdict.status, VerdictStatus::Error);
    EXPECT_EQ(verdict.failure, FailureKind::CompileError);
    EXPECT_TRUE(contains(verdict.message, "expected")) << verdict.message;
}

TEST_F(ProcessSandboxTest, NeverPassingSubtaskStopsAfterThreeAttempts) {
    if (!tool_available("python3")) GTEST_SKIP() << "python3 not on PATH";

    StubbornDeveloper developer;
    FeedbackController controller{*orchestrator, developer, *logger, 2};
    auto result = controller.attempt(python("stubborn", Discipline::Basic, "import sys\nsys.exit(1)\n"));

    EXPECT_EQ(result.attempts, 3u);
    EXPECT_EQ(developer.calls, 2);
    EXPECT_TRUE(result.retries_exhausted);
    EXPECT_EQ(result.verdict.status, VerdictStatus::Failed);
    EXPECT_TRUE(contains(result.verdict.message, "(final after 3 attempts)"));
    ASSERT_NE(result.verdict.outcome, nullptr);
    EXPECT_EQ(result.verdict.outcome->exit_status, 3);
}

// ─────────────────────────────────────────────
// Image entry command, run on the host
// ─────────────────────────────────────────────

namespace {

Result<ProcessResult> run_entry(std::vector<std::string> program, std::string timeout_s) {
    SpawnOptions options;
    options.argv = {"sh", CODE_SANDBOX_ENTRYPOINT,
                    "--timeout", std::move(timeout_s), "--cpu", "10", "--memory-kb", "0", "--"};
    options.argv.insert(options.argv.end(), program.begin(), program.end());
    options.env = strip_credentials(current_environment());
    options.timeout = 10'000ms;
    options.poll_interval = 10ms;
    return run_supervised(options);
}

}  // namespace

TEST(EntryCommandTest, DeadlineExitsWithTimeoutStatus) {
    if (!tool_available("timeout")) GTEST_SKIP() << "timeout(1) not on PATH";
    auto started = std::chrono::steady_clock::now();
    auto result = run_entry({"sleep", "5"}, "0.500");
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result->exit_code, ContainerBackend::kEntryTimeoutExit);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 3s);
}

TEST(EntryCommandTest, ProgramStatusPassesThrough) {
    if (!tool_available("timeout")) GTEST_SKIP() << "timeout(1) not on PATH";
    auto result = run_entry({"sh", "-c", "echo ok; exit 3"}, "5.000");
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result->exit_code, 3);
    EXPECT_EQ(result->stdout_data, "ok\n");
}
