/**
 * @file test_pipeline.cpp
 * @brief End-to-end tests of TestRun: pool, feedback loop, aggregation, report.
 * @author Dimitris Kafetzis
 */

#include "pipeline/test_run.hpp"
#include "sandbox/process_backend.hpp"
#include "support/fake_backend.hpp"
#include "telemetry/metrics_collector.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

#include <unistd.h>

using namespace code_sandbox;
using namespace std::chrono_literals;
using code_sandbox::test_support::CaptureSink;
using code_sandbox::test_support::FakeBackend;
using code_sandbox::test_support::tool_available;

namespace {

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

Submission python(std::string id, Discipline discipline, std::string code) {
    Submission s;
    s.id = std::move(id);
    s.language = Language::Python;
    s.discipline = discipline;
    s.code = std::move(code);
    return s;
}

/// Replaces failing code with a fixed passing version, once per subtask.
class FixingDeveloper final : public IDeveloperClient {
public:
    std::optional<std::string> revise(const RevisionRequest& request) override {
        std::lock_guard lock(mutex_);
        requests.push_back(request.subtask_id);
        return std::string{"print('fixed')\n"};
    }

    std::vector<SubtaskId> requests;

private:
    std::mutex mutex_;
};

}  // namespace

class PipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path()
               / ("cs_pipeline_test_" + std::to_string(::getpid()));
        std::filesystem::remove_all(dir_);
        config_ = default_config();
        config_.sandbox.prefer_container = false;
        config_.sandbox.poll_interval_ms = 10;
        config_.executor.thread_count = 4;
        config_.report.output_path = dir_ / "report.json";
    }

    void TearDown() override { std::filesystem::remove_all(dir_); }

    std::filesystem::path dir_;
    Config config_;
    std::unique_ptr<Logger> logger_ = code_sandbox::test_support::quiet_logger();
};

TEST_F(PipelineTest, ResultsFollowSubmissionOrderUnderConcurrency) {
    auto backend = std::make_unique<FakeBackend>();
    backend->set_handler([](const ExecutionRequest& request) -> Result<ExecutionOutcome> {
        const auto source = read_file(request.workdir / "main.py");
        if (source.find("slow") != std::string::npos) std::this_thread::sleep_for(150ms);
        const int status = source.find("fail") != std::string::npos ? 1 : 0;
        return FakeBackend::exited(status, 5);
    });
    auto environment = SandboxEnvironment::select(nullptr, std::move(backend), *logger_);
    ASSERT_TRUE(environment.has_value());

    auto lines = std::make_shared<std::vector<std::string>>();
    MetricsCollector metrics(std::make_unique<CaptureSink>(lines));
    DecliningDeveloper developer;
    TestRun run(config_, *environment, developer, *logger_, &metrics);

    const std::vector<Submission> submissions{
        python("first_slow", Discipline::Basic, "# slow\nprint(1)"),
        python("second_fail", Discipline::Basic, "# fail\nprint(2)"),
        python("third", Discipline::Basic, "print(3)"),
        python("fourth_slow", Discipline::Basic, "# slow\nprint(4)"),
        python("fifth", Discipline::Basic, "print(5)")};

    auto report = run.run(submissions);
    ASSERT_TRUE(report.has_value()) << report.error().message;
    ASSERT_EQ(report->results.size(), submissions.size());
    for (size_t i = 0; i < submissions.size(); ++i) {
        EXPECT_EQ(report->results[i].verdict.subtask_id, submissions[i].id);
    }

    EXPECT_EQ(report->summary.total, 5u);
    EXPECT_EQ(report->summary.passed, 4u);
    EXPECT_EQ(report->summary.failed, 1u);
    EXPECT_TRUE(report->results[1].revision_declined);
    EXPECT_TRUE(report->degraded);

    ASSERT_TRUE(report->report_path.has_value());
    const auto json = read_file(*report->report_path);
    EXPECT_NE(json.find(R"("id":"first_slow")"), std::string::npos);
    EXPECT_LT(json.find(R"("id":"first_slow")"), json.find(R"("id":"fifth")"));

    ASSERT_FALSE(lines->empty());
    EXPECT_NE(lines->back().find(R"("event":"run_summary")"), std::string::npos);
}

TEST_F(PipelineTest, RevisionIsReevaluated) {
    auto backend = std::make_unique<FakeBackend>();
    backend->set_handler([](const ExecutionRequest& request) -> Result<ExecutionOutcome> {
        const auto source = read_file(request.workdir / "main.py");
        return FakeBackend::exited(source.find("fixed") != std::string::npos ? 0 : 1);
    });
    auto environment = SandboxEnvironment::select(nullptr, std::move(backend), *logger_);
    ASSERT_TRUE(environment.has_value());

    FixingDeveloper developer;
    TestRun run(config_, *environment, developer, *logger_);
    auto report = run.run({python("broken", Discipline::Basic, "raise SystemExit(1)")});

    ASSERT_TRUE(report.has_value());
    const auto& row = report->results.at(0);
    EXPECT_TRUE(row.verdict.passed());
    EXPECT_EQ(row.attempts, 2u);
    ASSERT_EQ(row.history.size(), 2u);
    EXPECT_EQ(row.history[0].status, VerdictStatus::Failed);
    EXPECT_EQ(developer.requests, std::vector<SubtaskId>{"broken"});
}

TEST_F(PipelineTest, DuplicateIdsAreRejected) {
    auto environment = SandboxEnvironment::select(nullptr, std::make_unique<FakeBackend>(), *logger_);
    ASSERT_TRUE(environment.has_value());
    DecliningDeveloper developer;
    TestRun run(config_, *environment, developer, *logger_);

    auto report = run.run({python("same", Discipline::Basic, "print(1)"),
                           python("same", Discipline::Basic, "print(2)")});
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().kind, ErrorKind::Config);
}

TEST_F(PipelineTest, UnwritableReportIsNotedNotFatal) {
    std::filesystem::create_directories(dir_);
    std::ofstream(dir_ / "blocker") << "x";
    config_.report.output_path = dir_ / "blocker" / "report.json";

    auto environment = SandboxEnvironment::select(nullptr, std::make_unique<FakeBackend>(), *logger_);
    ASSERT_TRUE(environment.has_value());
    DecliningDeveloper developer;
    TestRun run(config_, *environment, developer, *logger_);

    auto report = run.run({python("ok", Discipline::Basic, "print(1)")});
    ASSERT_TRUE(report.has_value());
    EXPECT_TRUE(report->summary.all_passed());
    EXPECT_FALSE(report->report_path.has_value());
    EXPECT_TRUE(report->report_error.has_value());
}

TEST_F(PipelineTest, MixedDisciplinesOnProcessBackend) {
    if (!tool_available("python3")) GTEST_SKIP() << "python3 not on PATH";

    auto environment = SandboxEnvironment::from_config(config_, *logger_);
    ASSERT_TRUE(environment.has_value()) << environment.error().message;
    EXPECT_EQ(environment->kind(), BackendKind::Subprocess);

    DecliningDeveloper developer;
    TestRun run(config_, *environment, developer, *logger_);

    auto unit = python("adder", Discipline::Unit, "def add(a, b):\n    return a + b\n");
    auto integration = python("calculator", Discipline::Integration,
                              "def twice(x):\n    return add(x, x)\n");
    integration.companions = {{"adder", unit.code}};
    integration.scenario_code = "assert twice(21) == 42\nprint('scenario ok')\n";
    auto performance = python("summer", Discipline::Performance, "print(sum(range(100000)))\n");
    auto security = python("evaluator", Discipline::Security, "print(eval('1 + 1'))\n");

    auto report = run.run({unit, integration, performance, security});
    ASSERT_TRUE(report.has_value()) << report.error().message;
    ASSERT_EQ(report->results.size(), 4u);

    EXPECT_TRUE(report->results[0].verdict.passed()) << report->results[0].verdict.message;
    EXPECT_TRUE(report->results[1].verdict.passed()) << report->results[1].verdict.message;
    EXPECT_TRUE(report->results[2].verdict.passed()) << report->results[2].verdict.message;
    ASSERT_TRUE(report->results[2].verdict.metric.has_value());
    EXPECT_GT(report->results[2].verdict.metric->value, 0.0);
    EXPECT_EQ(report->results[3].verdict.status, VerdictStatus::Failed);

    EXPECT_EQ(report->summary.passed, 3u);
    EXPECT_FALSE(report->summary.all_passed());

    const auto json = read_file(dir_ / "report.json");
    EXPECT_NE(json.find(R"("discipline":"integration")"), std::string::npos);
    EXPECT_NE(json.find(R"("pattern":"eval usage")"), std::string::npos);
}
