#include "pipeline/test_runner.hpp"

#include "pipeline/feedback.hpp"

namespace sandforge::pipeline {

nlohmann::json BindInput(const nlohmann::json& input_example) {
    if (input_example.is_null()) {
        return nlohmann::json::object();
    }
    if (input_example.is_object()) {
        return input_example;
    }
    return nlohmann::json{{"items", input_example}};
}

std::vector<TestCase> BuildTestCases(const std::vector<TestCase>& explicit_cases,
                                     const nlohmann::json& input_example,
                                     const std::optional<nlohmann::json>& expected_output) {
    std::vector<TestCase> cases = explicit_cases;
    for (std::size_t i = 0; i < cases.size(); ++i) {
        if (cases[i].name.empty()) {
            cases[i].name = "test_" + std::to_string(i + 1);
        }
        cases[i].input = BindInput(cases[i].input);
    }
    if (expected_output) {
        TestCase example{};
        example.name = "input_example";
        example.input = BindInput(input_example);
        example.expected = *expected_output;
        cases.push_back(std::move(example));
    }
    return cases;
}

TestRunner::TestRunner(sandbox::SandboxExecutor& executor, ExecutionLimits limits)
    : executor_(executor)
    , limits_(limits) {}

TestReport TestRunner::Run(const CodeCandidate& candidate,
                           const SecurityVerdict& verdict,
                           const ExecutionResult& main_execution,
                           const std::vector<TestCase>& cases,
                           const sandbox::CancellationToken& token) {
    TestReport report{};

    if (cases.empty()) {
        report.total = 1;
        if (main_execution.status == ExecutionStatus::kSuccess) {
            report.passed = 1;
        } else {
            report.failed = 1;
            report.failures.push_back(TestFailure{
                "execution", nlohmann::json(), nlohmann::json(), ExecutionFeedback(main_execution)});
        }
        return report;
    }

    for (const auto& test : cases) {
        ++report.total;
        CodeCandidate run = candidate;
        run.context = test.input;
        const auto result = executor_.Execute(run, verdict, limits_, token);

        if (result.status != ExecutionStatus::kSuccess) {
            ++report.failed;
            report.failures.push_back(TestFailure{test.name, test.expected, nlohmann::json(),
                                                  ExecutionFeedback(result)});
            continue;
        }
        if (result.return_value == test.expected) {
            ++report.passed;
        } else {
            ++report.failed;
            report.failures.push_back(TestFailure{test.name, test.expected, result.return_value, ""});
        }
    }
    return report;
}

}  // namespace sandforge::pipeline
