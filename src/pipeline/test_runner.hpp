#pragma once

#include <optional>
#include <vector>

#include "core/types.hpp"
#include "sandbox/cancellation.hpp"
#include "sandbox/sandbox_executor.hpp"

namespace sandforge::pipeline {

// Binds a request's input example as execution globals. Objects are used as
// is; any other value is bound as `items`.
nlohmann::json BindInput(const nlohmann::json& input_example);

// Explicit cases first, then one synthesized from the input example when an
// expected output is given.
std::vector<TestCase> BuildTestCases(const std::vector<TestCase>& explicit_cases,
                                     const nlohmann::json& input_example,
                                     const std::optional<nlohmann::json>& expected_output);

// Runs every case through the executor with the case input as context and
// compares `result` against the expectation. With no cases the report has a
// single check that the main execution succeeded.
class TestRunner {
public:
    TestRunner(sandbox::SandboxExecutor& executor, ExecutionLimits limits);

    // Propagates Cancelled and sandbox infrastructure errors.
    TestReport Run(const CodeCandidate& candidate,
                   const SecurityVerdict& verdict,
                   const ExecutionResult& main_execution,
                   const std::vector<TestCase>& cases,
                   const sandbox::CancellationToken& token);

private:
    sandbox::SandboxExecutor& executor_;
    ExecutionLimits limits_;
};

}  // namespace sandforge::pipeline
