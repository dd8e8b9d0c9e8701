#pragma once

#include <string>

namespace sandforge::pipeline {

enum class Phase {
    kGenerating,
    kValidating,
    kExecuting,
    kTesting,
    kAnalyzingComplexity,
    kSucceeded,
    kFailed
};

const char* ToString(Phase phase);

enum class FailureReason {
    kNone,
    kAttemptsExhausted,
    kGeneratorUnavailable,
    kSandboxUnavailable,
    kCancelled
};

// "attempts-exhausted", "generator-unavailable", ...; empty for kNone.
const char* ToString(FailureReason reason);

// Retry state of one pipeline run. Values are never modified in place: every
// transition function returns the successor state and throws
// std::logic_error when called from a phase it does not apply to.
struct PipelineState {
    Phase phase = Phase::kGenerating;
    // Zero-based index of the attempt in progress.
    int attempt = 0;
    int max_attempts = 3;
    // Passed to the generator on the next attempt.
    std::string feedback;
    FailureReason failure = FailureReason::kNone;

    bool IsTerminal() const { return phase == Phase::kSucceeded || phase == Phase::kFailed; }
    bool AttemptsRemain() const { return attempt + 1 < max_attempts; }
};

// Throws std::invalid_argument unless max_attempts >= 1.
PipelineState Start(int max_attempts);

PipelineState OnGenerated(const PipelineState& state);
PipelineState OnGeneratorUnavailable(const PipelineState& state);
PipelineState OnValidated(const PipelineState& state, bool allowed, const std::string& feedback);
PipelineState OnExecuted(const PipelineState& state);
PipelineState OnSandboxUnavailable(const PipelineState& state);
PipelineState OnTested(const PipelineState& state, bool passed, const std::string& feedback);
PipelineState OnAnalyzed(const PipelineState& state);
// Valid from any non-terminal phase.
PipelineState OnCancelled(const PipelineState& state);

}  // namespace sandforge::pipeline
