#include "pipeline/orchestrator.hpp"

#include <algorithm>

#include "core/errors.hpp"
#include "pipeline/feedback.hpp"
#include "pipeline/test_runner.hpp"
#include "sandbox/sandbox_executor.hpp"
#include "utils/logging.hpp"

namespace sandforge::pipeline {
namespace {

using utils::LogLevel;

double Score(const GenerationAttempt& attempt) {
    return attempt.tests ? attempt.tests->Ratio() : 0.0;
}

// Applies a transition and appends it to the log.
class Driver {
public:
    Driver(PipelineState state, std::vector<StateTransition>& log)
        : state_(std::move(state))
        , log_(log) {}

    const PipelineState& State() const { return state_; }

    void Advance(PipelineState next) {
        log_.push_back(StateTransition{state_.phase, next.phase, state_.attempt});
        utils::Log(LogLevel::kDebug, "pipeline", "transition", {
            {"from", ToString(state_.phase)},
            {"to", ToString(next.phase)},
            {"attempt", std::to_string(state_.attempt)}});
        state_ = std::move(next);
    }

private:
    PipelineState state_;
    std::vector<StateTransition>& log_;
};

}  // namespace

std::optional<std::size_t> SelectBestAttempt(const std::vector<GenerationAttempt>& attempts) {
    if (attempts.empty()) {
        return std::nullopt;
    }
    std::size_t best = 0;
    for (std::size_t i = 1; i < attempts.size(); ++i) {
        if (Score(attempts[i]) > Score(attempts[best])) {
            best = i;
        }
    }
    return best;
}

GenerationOrchestrator::GenerationOrchestrator(generator::CodeGenerator& generator,
                                               const security::SecurityValidator& validator,
                                               sandbox::IsolationBackend& backend,
                                               cache::ResultCache* cache,
                                               const analysis::ComplexityAnalyzer& analyzer,
                                               OrchestratorSettings settings)
    : generator_(generator)
    , validator_(validator)
    , backend_(backend)
    , cache_(cache)
    , analyzer_(analyzer)
    , settings_(settings) {}

int GenerationOrchestrator::ResolveMaxAttempts(const std::optional<int>& requested) const {
    const int wanted = requested.value_or(settings_.default_max_attempts);
    return std::clamp(wanted, 1, std::max(1, settings_.max_attempts_cap));
}

PipelineResult GenerationOrchestrator::Run(const PipelineRequest& request,
                                           const sandbox::CancellationToken& token) const {
    PipelineResult result{};
    Driver driver(Start(ResolveMaxAttempts(request.max_attempts)), result.transitions);

    sandbox::SandboxExecutor executor(backend_, cache_, settings_.cache_ttl);
    TestRunner runner(executor, settings_.limits);
    const auto context = BindInput(request.input_example);
    const auto cases = BuildTestCases(request.test_cases, request.input_example, request.expected_output);

    utils::Log(LogLevel::kInfo, "pipeline", "run started", {
        {"language", request.language},
        {"max_attempts", std::to_string(driver.State().max_attempts)},
        {"tests", std::to_string(cases.size())}});

    while (!driver.State().IsTerminal()) {
        const auto& state = driver.State();
        if (token.IsCancelled()) {
            result.error = "run cancelled";
            driver.Advance(OnCancelled(state));
            break;
        }

        switch (state.phase) {
            case Phase::kGenerating: {
                std::optional<std::string> feedback;
                if (state.attempt > 0) {
                    feedback = state.feedback;
                }
                CodeCandidate candidate;
                try {
                    candidate = generator_.Generate(request.task_description, request.language, feedback);
                } catch (const GeneratorUnavailable& ex) {
                    utils::Log(LogLevel::kError, "pipeline", "generator unavailable", {{"error", ex.what()}});
                    result.error = ex.what();
                    driver.Advance(OnGeneratorUnavailable(state));
                    break;
                }
                if (candidate.language.empty()) {
                    candidate.language = request.language;
                }
                candidate.context = context;
                candidate.attempt_index = state.attempt;

                GenerationAttempt attempt{};
                attempt.attempt_index = state.attempt;
                attempt.candidate = std::move(candidate);
                result.attempts.push_back(std::move(attempt));
                driver.Advance(OnGenerated(state));
                break;
            }
            case Phase::kValidating: {
                auto& attempt = result.attempts.back();
                attempt.verdict = validator_.Validate(attempt.candidate);
                if (!attempt.verdict.allowed) {
                    attempt.feedback = SecurityFeedback(attempt.verdict);
                    utils::Log(LogLevel::kInfo, "pipeline", "candidate rejected", {
                        {"attempt", std::to_string(state.attempt)},
                        {"violations", std::to_string(attempt.verdict.violations.size())}});
                }
                driver.Advance(OnValidated(state, attempt.verdict.allowed, attempt.feedback));
                break;
            }
            case Phase::kExecuting: {
                auto& attempt = result.attempts.back();
                try {
                    attempt.execution = executor.Execute(attempt.candidate, attempt.verdict,
                                                         settings_.limits, token);
                } catch (const Cancelled&) {
                    result.error = "run cancelled";
                    driver.Advance(OnCancelled(state));
                    break;
                } catch (const Error& ex) {
                    utils::Log(LogLevel::kError, "pipeline", "sandbox failure", {{"error", ex.what()}});
                    result.error = ex.what();
                    driver.Advance(OnSandboxUnavailable(state));
                    break;
                }
                driver.Advance(OnExecuted(state));
                break;
            }
            case Phase::kTesting: {
                auto& attempt = result.attempts.back();
                try {
                    attempt.tests = runner.Run(attempt.candidate, attempt.verdict, *attempt.execution,
                                               cases, token);
                } catch (const Cancelled&) {
                    result.error = "run cancelled";
                    driver.Advance(OnCancelled(state));
                    break;
                } catch (const Error& ex) {
                    utils::Log(LogLevel::kError, "pipeline", "sandbox failure", {{"error", ex.what()}});
                    result.error = ex.what();
                    driver.Advance(OnSandboxUnavailable(state));
                    break;
                }
                const bool executed = attempt.execution->status == ExecutionStatus::kSuccess;
                const bool passed = executed && attempt.tests->AllPassed();
                if (!passed) {
                    attempt.feedback = executed ? TestFeedback(*attempt.tests)
                                                : ExecutionFeedback(*attempt.execution);
                }
                utils::Log(LogLevel::kInfo, "pipeline", "attempt tested", {
                    {"attempt", std::to_string(state.attempt)},
                    {"status", ToString(attempt.execution->status)},
                    {"passed", std::to_string(attempt.tests->passed)},
                    {"total", std::to_string(attempt.tests->total)}});
                driver.Advance(OnTested(state, passed, attempt.feedback));
                break;
            }
            case Phase::kAnalyzingComplexity: {
                auto& attempt = result.attempts.back();
                try {
                    attempt.complexity = analyzer_.Analyze(attempt.candidate.source);
                } catch (const SyntaxError& ex) {
                    utils::Log(LogLevel::kWarn, "pipeline", "complexity analysis failed", {{"error", ex.what()}});
                }
                driver.Advance(OnAnalyzed(state));
                break;
            }
            case Phase::kSucceeded:
            case Phase::kFailed:
                break;
        }
    }

    const auto& final_state = driver.State();
    result.success = final_state.phase == Phase::kSucceeded;
    result.failure = final_state.failure;
    if (result.success) {
        result.selected = result.attempts.size() - 1;
    } else {
        result.selected = SelectBestAttempt(result.attempts);
        if (result.error.empty()) {
            result.error = final_state.feedback;
        }
    }

    utils::Log(result.success ? LogLevel::kInfo : LogLevel::kWarn, "pipeline", "run finished", {
        {"success", result.success ? "true" : "false"},
        {"attempts", std::to_string(result.attempts.size())},
        {"failure", ToString(result.failure)}});
    return result;
}

}  // namespace sandforge::pipeline
