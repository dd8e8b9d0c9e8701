#include "pipeline/state_machine.hpp"

#include <stdexcept>

namespace sandforge::pipeline {
namespace {

void Require(const PipelineState& state, Phase expected, const char* event) {
    if (state.phase != expected) {
        throw std::logic_error(std::string("pipeline: ") + event + " is not valid in phase " +
                               ToString(state.phase));
    }
}

PipelineState Fail(PipelineState next, FailureReason reason) {
    next.phase = Phase::kFailed;
    next.failure = reason;
    return next;
}

// Either starts the next attempt with the given feedback or gives up.
PipelineState Retry(const PipelineState& state, const std::string& feedback) {
    PipelineState next = state;
    if (!state.AttemptsRemain()) {
        next.feedback = feedback;
        return Fail(next, FailureReason::kAttemptsExhausted);
    }
    next.phase = Phase::kGenerating;
    next.attempt = state.attempt + 1;
    next.feedback = feedback;
    return next;
}

}  // namespace

const char* ToString(Phase phase) {
    switch (phase) {
        case Phase::kGenerating: return "generating";
        case Phase::kValidating: return "validating";
        case Phase::kExecuting: return "executing";
        case Phase::kTesting: return "testing";
        case Phase::kAnalyzingComplexity: return "analyzing_complexity";
        case Phase::kSucceeded: return "succeeded";
        case Phase::kFailed: return "failed";
    }
    return "unknown";
}

const char* ToString(FailureReason reason) {
    switch (reason) {
        case FailureReason::kNone: return "";
        case FailureReason::kAttemptsExhausted: return "attempts-exhausted";
        case FailureReason::kGeneratorUnavailable: return "generator-unavailable";
        case FailureReason::kSandboxUnavailable: return "sandbox-unavailable";
        case FailureReason::kCancelled: return "cancelled";
    }
    return "unknown";
}

PipelineState Start(int max_attempts) {
    if (max_attempts < 1) {
        throw std::invalid_argument("pipeline: max_attempts must be at least 1");
    }
    PipelineState state{};
    state.max_attempts = max_attempts;
    return state;
}

PipelineState OnGenerated(const PipelineState& state) {
    Require(state, Phase::kGenerating, "generated");
    PipelineState next = state;
    next.phase = Phase::kValidating;
    return next;
}

PipelineState OnGeneratorUnavailable(const PipelineState& state) {
    Require(state, Phase::kGenerating, "generator-unavailable");
    return Fail(state, FailureReason::kGeneratorUnavailable);
}

PipelineState OnValidated(const PipelineState& state, bool allowed, const std::string& feedback) {
    Require(state, Phase::kValidating, "validated");
    if (!allowed) {
        return Retry(state, feedback);
    }
    PipelineState next = state;
    next.phase = Phase::kExecuting;
    return next;
}

PipelineState OnExecuted(const PipelineState& state) {
    Require(state, Phase::kExecuting, "executed");
    PipelineState next = state;
    next.phase = Phase::kTesting;
    return next;
}

PipelineState OnSandboxUnavailable(const PipelineState& state) {
    if (state.phase != Phase::kExecuting && state.phase != Phase::kTesting) {
        throw std::logic_error(std::string("pipeline: sandbox-unavailable is not valid in phase ") +
                               ToString(state.phase));
    }
    return Fail(state, FailureReason::kSandboxUnavailable);
}

PipelineState OnTested(const PipelineState& state, bool passed, const std::string& feedback) {
    Require(state, Phase::kTesting, "tested");
    if (!passed) {
        return Retry(state, feedback);
    }
    PipelineState next = state;
    next.phase = Phase::kAnalyzingComplexity;
    next.feedback.clear();
    return next;
}

PipelineState OnAnalyzed(const PipelineState& state) {
    Require(state, Phase::kAnalyzingComplexity, "analyzed");
    PipelineState next = state;
    next.phase = Phase::kSucceeded;
    return next;
}

PipelineState OnCancelled(const PipelineState& state) {
    if (state.IsTerminal()) {
        throw std::logic_error("pipeline: cannot cancel a finished run");
    }
    return Fail(state, FailureReason::kCancelled);
}

}  // namespace sandforge::pipeline
