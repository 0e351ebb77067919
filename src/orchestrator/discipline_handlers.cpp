/**
 * @file discipline_handlers.cpp
 * @brief Discipline handler implementations.
 * @author Dimitris Kafetzis
 */

#include "orchestrator/discipline_handlers.hpp"

#include "orchestrator/coverage_probe.hpp"
#include "orchestrator/security_scanner.hpp"
#include "orchestrator/unit_harness.hpp"

#include <algorithm>
#include <cctype>
#include <csignal>
#include <iomanip>
#include <sstream>

namespace code_sandbox {

namespace {

constexpr size_t kMaxExcerptLines = 15;
constexpr size_t kMaxExcerptChars = 1500;

std::string first_lines(std::string_view text) {
    std::string out;
    size_t lines = 0;
    for (char c : text) {
        if (out.size() >= kMaxExcerptChars) break;
        if (c == '\n' && ++lines >= kMaxExcerptLines) break;
        out += c;
    }
    while (!out.empty() && std::isspace(static_cast<unsigned char>(out.back()))) out.pop_back();
    return out;
}

std::string last_lines(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    size_t start = text.size();
    size_t lines = 0;
    while (start > 0 && text.size() - start < kMaxExcerptChars) {
        if (text[start - 1] == '\n' && ++lines >= kMaxExcerptLines) break;
        --start;
    }
    return std::string{text.substr(start)};
}

std::string format_fixed(double value, int precision = 1) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

std::shared_ptr<const ExecutionOutcome> share(ExecutionOutcome outcome) {
    return std::make_shared<const ExecutionOutcome>(std::move(outcome));
}

/// File stem usable as a Java/C# identifier.
std::string identifier_for(std::string_view id) {
    std::string out;
    for (char c : id) {
        out += std::isalnum(static_cast<unsigned char>(c)) ? c : '_';
    }
    if (out.empty() || !std::isalpha(static_cast<unsigned char>(out.front()))) {
        out.insert(0, "Artifact_");
    }
    return out;
}

std::string java_file_for(std::string_view source, std::string_view fallback_stem) {
    return find_java_public_class(source).value_or(std::string{fallback_stem}) + ".java";
}

std::string join(const std::vector<std::string>& parts, std::string_view separator) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) out += separator;
        out += parts[i];
    }
    return out;
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Common rules
// ─────────────────────────────────────────────

TestVerdict make_verdict(const Submission& submission,
                         VerdictStatus status,
                         FailureKind failure,
                         std::string message,
                         std::shared_ptr<const ExecutionOutcome> outcome) {
    TestVerdict verdict;
    verdict.subtask_id = submission.id;
    verdict.discipline = submission.discipline;
    verdict.status = status;
    verdict.failure = failure;
    verdict.message = std::move(message);
    verdict.outcome = std::move(outcome);
    return verdict;
}

std::string describe_failure(const ExecutionOutcome& outcome) {
    std::ostringstream oss;
    switch (outcome.failure) {
        case FailureKind::CompileError: {
            // javac reports on stderr, dotnet build on stdout.
            const auto& log = outcome.stderr_data.empty() ? outcome.stdout_data : outcome.stderr_data;
            oss << "Compilation failed";
            if (!outcome.diagnostic.empty()) oss << " (" << outcome.diagnostic << ")";
            if (auto excerpt = first_lines(log); !excerpt.empty()) oss << ":\n" << excerpt;
            return oss.str();
        }
        case FailureKind::SetupFailure:
            return "Sandbox setup failed: " + outcome.diagnostic;
        case FailureKind::BackendUnavailable:
            return "Isolation backend unavailable: " + outcome.diagnostic;
        case FailureKind::TimeoutExceeded:
            oss << "Execution timed out after " << format_fixed(outcome.duration_ms(), 0) << " ms";
            return oss.str();
        case FailureKind::ResourceExceeded:
            if (!outcome.diagnostic.empty()) return "Resource limit exceeded: " + outcome.diagnostic;
            if (outcome.output_truncated) return "Resource limit exceeded: output cap reached";
            if (outcome.term_signal == SIGXCPU) return "Resource limit exceeded: CPU time";
            if (outcome.term_signal == SIGXFSZ) return "Resource limit exceeded: file size";
            return "Resource limit exceeded";
        case FailureKind::RuntimeFailure:
            if (outcome.term_signal) {
                oss << "Killed by signal " << *outcome.term_signal;
            } else {
                oss << "Exited with status " << outcome.exit_status;
            }
            if (auto excerpt = last_lines(outcome.stderr_data); !excerpt.empty()) {
                oss << ":\n" << excerpt;
            }
            return oss.str();
        case FailureKind::None:
            break;
    }
    if (outcome.timed_out) {
        oss << "Execution timed out after " << format_fixed(outcome.duration_ms(), 0) << " ms";
        return oss.str();
    }
    return "Execution did not succeed";
}

std::optional<TestVerdict> apply_common_rules(const Submission& submission,
                                              const std::shared_ptr<const ExecutionOutcome>& outcome) {
    switch (outcome->failure) {
        case FailureKind::CompileError:
        case FailureKind::SetupFailure:
        case FailureKind::BackendUnavailable:
            return make_verdict(submission, VerdictStatus::Error, outcome->failure,
                                describe_failure(*outcome), outcome);
        case FailureKind::TimeoutExceeded:
        case FailureKind::ResourceExceeded:
        case FailureKind::RuntimeFailure:
            return make_verdict(submission, VerdictStatus::Failed, outcome->failure,
                                describe_failure(*outcome), outcome);
        case FailureKind::None:
            break;
    }
    if (outcome->timed_out) {
        return make_verdict(submission, VerdictStatus::Failed, FailureKind::TimeoutExceeded,
                            describe_failure(*outcome), outcome);
    }
    if (!outcome->succeeded()) {
        return make_verdict(submission, VerdictStatus::Failed, FailureKind::RuntimeFailure,
                            describe_failure(*outcome), outcome);
    }
    return std::nullopt;
}

// ─────────────────────────────────────────────
// Basic
// ─────────────────────────────────────────────

TestVerdict BasicHandler::evaluate(const Submission& submission, SandboxExecutor& executor) const {
    auto outcome = share(executor.run(submission.code, submission.language,
                                      settings_.policy_for(submission),
                                      settings_.timeout_for(submission)));
    const PrimaryMetric metric{MetricKind::DurationMs, outcome->duration_ms()};

    if (auto verdict = apply_common_rules(submission, outcome)) {
        verdict->metric = metric;
        return *verdict;
    }
    auto verdict = make_verdict(submission, VerdictStatus::Passed, FailureKind::None,
                                "Exited 0 in " + format_fixed(metric.value) + " ms", outcome);
    verdict.metric = metric;
    return verdict;
}

// ─────────────────────────────────────────────
// Unit
// ─────────────────────────────────────────────

ExecutionUnit UnitHandler::build_unit(const Submission& submission,
                                      const SandboxExecutor& executor) const {
    const auto& code = submission.code;
    const auto& tests = submission.test_code;

    switch (submission.language) {
        case Language::Python: {
            auto entry = tests ? wrap_python_tests(*tests) : synthesize_python_harness(code);
            return executor.prepare(Language::Python, std::move(entry),
                                    {{std::string{kPythonSolutionModule} + ".py", code}});
        }
        case Language::JavaScript: {
            auto entry = tests ? code + "\n\n" + *tests + "\n" : synthesize_javascript_harness(code);
            return executor.prepare(Language::JavaScript, std::move(entry));
        }
        case Language::Java:
            if (tests) {
                return executor.prepare(Language::Java, *tests,
                                        {{java_file_for(code, "Solution"), code}});
            }
            return executor.prepare(Language::Java, code);
        case Language::CSharp:
            if (tests) {
                return executor.prepare(Language::CSharp, *tests, {{"Solution.cs", code}});
            }
            return executor.prepare(Language::CSharp, code);
    }
    return executor.prepare(submission.language, code);
}

TestVerdict UnitHandler::evaluate(const Submission& submission, SandboxExecutor& executor) const {
    auto outcome = share(executor.run(build_unit(submission, executor),
                                      settings_.policy_for(submission),
                                      settings_.timeout_for(submission)));
    const PrimaryMetric metric{MetricKind::DurationMs, outcome->duration_ms()};

    if (outcome->failure == FailureKind::RuntimeFailure) {
        auto failures = parse_test_failures(outcome->stdout_data + "\n" + outcome->stderr_data);
        auto message = failures.empty() ? describe_failure(*outcome)
                                        : "Failed cases: " + join(failures, "; ");
        auto verdict = make_verdict(submission, VerdictStatus::Failed, FailureKind::RuntimeFailure,
                                    std::move(message), outcome);
        verdict.metric = metric;
        return verdict;
    }
    if (auto verdict = apply_common_rules(submission, outcome)) {
        verdict->metric = metric;
        return *verdict;
    }

    const char* source = submission.test_code ? "provided tests" : "generated harness";
    auto verdict = make_verdict(submission, VerdictStatus::Passed, FailureKind::None,
                                std::string{"All cases passed ("} + source + ")", outcome);
    verdict.metric = metric;
    return verdict;
}

// ─────────────────────────────────────────────
// Integration
// ─────────────────────────────────────────────

ExecutionUnit IntegrationHandler::build_unit(const Submission& submission,
                                             const SandboxExecutor& executor) const {
    const auto language = submission.language;

    if (language == Language::Python || language == Language::JavaScript) {
        // Interpreted languages compose into one source: companions, artifact, scenario.
        const std::string_view comment = language == Language::Python ? "# " : "// ";
        std::ostringstream composed;
        for (const auto& companion : submission.companions) {
            composed << comment << "--- " << companion.name << " ---\n" << companion.content << "\n\n";
        }
        composed << comment << "--- " << submission.id << " ---\n" << submission.code << "\n";
        if (submission.scenario_code) {
            composed << "\n" << comment << "--- scenario ---\n" << *submission.scenario_code << "\n";
        }
        return executor.prepare(language, composed.str());
    }

    // Compiled languages keep one artifact per file and build them together.
    auto file_for = [language](const std::string& content, std::string_view id) {
        return language == Language::Java ? java_file_for(content, identifier_for(id))
                                          : identifier_for(id) + ".cs";
    };

    std::vector<SourceFile> files;
    for (const auto& companion : submission.companions) {
        files.push_back({file_for(companion.content, companion.name), companion.content});
    }
    if (submission.scenario_code) {
        files.push_back({file_for(submission.code, submission.id), submission.code});
        return executor.prepare(language, *submission.scenario_code, std::move(files));
    }
    return executor.prepare(language, submission.code, std::move(files));
}

TestVerdict IntegrationHandler::evaluate(const Submission& submission, SandboxExecutor& executor) const {
    auto outcome = share(executor.run(build_unit(submission, executor),
                                      settings_.policy_for(submission),
                                      settings_.timeout_for(submission)));
    const PrimaryMetric metric{MetricKind::DurationMs, outcome->duration_ms()};

    if (auto verdict = apply_common_rules(submission, outcome)) {
        verdict->metric = metric;
        return *verdict;
    }

    std::ostringstream oss;
    oss << "Composed " << (submission.companions.size() + 1) << " artifact(s)"
        << (submission.scenario_code ? " with scenario" : "") << "; exited 0";
    auto verdict = make_verdict(submission, VerdictStatus::Passed, FailureKind::None, oss.str(), outcome);
    verdict.metric = metric;
    return verdict;
}

// ─────────────────────────────────────────────
// Performance
// ─────────────────────────────────────────────

TestVerdict PerformanceHandler::evaluate(const Submission& submission, SandboxExecutor& executor) const {
    auto outcome = share(executor.run(submission.code, submission.language,
                                      settings_.policy_for(submission),
                                      settings_.timeout_for(submission)));
    const double duration_ms = outcome->duration_ms();
    const double memory_kb = static_cast<double>(outcome->peak_memory_bytes) / 1024.0;
    const PrimaryMetric metric{MetricKind::DurationMs, duration_ms};

    if (auto verdict = apply_common_rules(submission, outcome)) {
        verdict->metric = metric;
        return *verdict;
    }

    std::ostringstream summary;
    summary << "duration " << format_fixed(duration_ms) << " ms";
    if (outcome->peak_memory_bytes > 0) {
        summary << ", peak memory " << format_fixed(memory_kb, 0) << " KB";
    }

    std::vector<std::string> breaches;
    const auto& limits = settings_.disciplines;
    if (limits.max_duration_ms && duration_ms > *limits.max_duration_ms) {
        breaches.push_back("duration exceeds " + format_fixed(*limits.max_duration_ms) + " ms");
    }
    // Peak memory is best effort; an unknown value never fails the run.
    if (limits.max_memory_kb && outcome->peak_memory_bytes > 0 && memory_kb > *limits.max_memory_kb) {
        breaches.push_back("peak memory exceeds " + format_fixed(*limits.max_memory_kb, 0) + " KB");
    }

    TestVerdict verdict;
    if (breaches.empty()) {
        verdict = make_verdict(submission, VerdictStatus::Passed, FailureKind::None,
                               summary.str(), outcome);
    } else {
        verdict = make_verdict(submission, VerdictStatus::Failed, FailureKind::None,
                               summary.str() + " (" + join(breaches, ", ") + ")", outcome);
    }
    verdict.metric = metric;
    return verdict;
}

// ─────────────────────────────────────────────
// Coverage
// ─────────────────────────────────────────────

TestVerdict CoverageHandler::evaluate(const Submission& submission, SandboxExecutor& executor) const {
    if (submission.language != Language::Python) {
        return make_verdict(submission, VerdictStatus::Error, FailureKind::SetupFailure,
                            "No coverage instrumentation for "
                                + std::string{to_string(submission.language)});
    }

    auto unit = executor.prepare(Language::Python, python_coverage_wrapper(),
                                 {{std::string{kCoverageTargetFile}, submission.code}});
    auto outcome = share(executor.run(unit, settings_.policy_for(submission),
                                      settings_.timeout_for(submission)));
    const auto counts = parse_coverage_marker(outcome->stdout_data);

    std::optional<PrimaryMetric> metric;
    if (counts) metric = PrimaryMetric{MetricKind::CoveragePercent, counts->percent()};

    if (auto verdict = apply_common_rules(submission, outcome)) {
        verdict->metric = metric;
        return *verdict;
    }
    if (!counts) {
        return make_verdict(submission, VerdictStatus::Error, FailureKind::SetupFailure,
                            "Coverage report missing from instrumented run", outcome);
    }

    const double threshold = settings_.disciplines.min_coverage_percent;
    std::ostringstream oss;
    oss << "Coverage " << format_fixed(counts->percent()) << "% (" << counts->covered << "/"
        << counts->total << " lines), threshold " << format_fixed(threshold) << "%";

    auto status = counts->percent() >= threshold ? VerdictStatus::Passed : VerdictStatus::Failed;
    auto verdict = make_verdict(submission, status, FailureKind::None, oss.str(), outcome);
    verdict.metric = metric;
    return verdict;
}

// ─────────────────────────────────────────────
// Security
// ─────────────────────────────────────────────

TestVerdict SecurityHandler::evaluate(const Submission& submission, SandboxExecutor& executor) const {
    const SecurityScanner scanner{submission.language};
    auto findings = scanner.scan(submission.code);
    const auto floor = settings_.disciplines.security_severity_floor;
    const auto blocking = SecurityScanner::count_at_or_above(findings, floor);
    const PrimaryMetric metric{MetricKind::FindingCount, static_cast<double>(findings.size())};

    auto outcome = share(executor.run(submission.code, submission.language,
                                      settings_.policy_for(submission),
                                      settings_.timeout_for(submission)));

    if (auto verdict = apply_common_rules(submission, outcome)) {
        verdict->metric = metric;
        verdict->findings = std::move(findings);
        return *verdict;
    }

    TestVerdict verdict;
    if (blocking == 0) {
        std::ostringstream oss;
        oss << "No findings at or above " << to_string(floor);
        if (!findings.empty()) oss << " (" << findings.size() << " below)";
        verdict = make_verdict(submission, VerdictStatus::Passed, FailureKind::None, oss.str(), outcome);
    } else {
        std::vector<std::string> described;
        for (const auto& f : findings) {
            if (f.severity < floor) continue;
            described.push_back(f.pattern + " (" + std::string{to_string(f.severity)} + ", line "
                                + std::to_string(f.line) + ", col " + std::to_string(f.column) + ")");
        }
        verdict = make_verdict(submission, VerdictStatus::Failed, FailureKind::None,
                               std::to_string(blocking) + " security finding(s): "
                                   + join(described, "; "),
                               outcome);
    }
    verdict.metric = metric;
    verdict.findings = std::move(findings);
    return verdict;
}

// ─────────────────────────────────────────────
// Factory
// ─────────────────────────────────────────────

DisciplineHandler make_handler(Discipline discipline, const EvaluationSettings& settings) {
    switch (discipline) {
        case Discipline::Basic:       return BasicHandler{settings};
        case Discipline::Unit:        return UnitHandler{settings};
        case Discipline::Integration: return IntegrationHandler{settings};
        case Discipline::Performance: return PerformanceHandler{settings};
        case Discipline::Coverage:    return CoverageHandler{settings};
        case Discipline::Security:    return SecurityHandler{settings};
    }
    return BasicHandler{settings};
}

}  // namespace code_sandbox
