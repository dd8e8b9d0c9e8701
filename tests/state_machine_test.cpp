#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "pipeline/state_machine.hpp"

namespace sandforge::pipeline {
namespace {

TEST(StateMachineTest, StartsGeneratingFirstAttempt) {
    const auto state = Start(3);
    EXPECT_EQ(state.phase, Phase::kGenerating);
    EXPECT_EQ(state.attempt, 0);
    EXPECT_EQ(state.max_attempts, 3);
    EXPECT_TRUE(state.feedback.empty());
    EXPECT_EQ(state.failure, FailureReason::kNone);
    EXPECT_FALSE(state.IsTerminal());
}

TEST(StateMachineTest, StartRejectsNonPositiveAttempts) {
    EXPECT_THROW(Start(0), std::invalid_argument);
    EXPECT_THROW(Start(-2), std::invalid_argument);
}

TEST(StateMachineTest, HappyPathReachesSucceeded) {
    auto state = Start(3);
    state = OnGenerated(state);
    EXPECT_EQ(state.phase, Phase::kValidating);
    state = OnValidated(state, true, "");
    EXPECT_EQ(state.phase, Phase::kExecuting);
    state = OnExecuted(state);
    EXPECT_EQ(state.phase, Phase::kTesting);
    state = OnTested(state, true, "");
    EXPECT_EQ(state.phase, Phase::kAnalyzingComplexity);
    state = OnAnalyzed(state);
    EXPECT_EQ(state.phase, Phase::kSucceeded);
    EXPECT_TRUE(state.IsTerminal());
    EXPECT_EQ(state.attempt, 0);
}

TEST(StateMachineTest, RejectedValidationRetriesWithFeedback) {
    auto state = OnGenerated(Start(3));
    state = OnValidated(state, false, "forbidden import");
    EXPECT_EQ(state.phase, Phase::kGenerating);
    EXPECT_EQ(state.attempt, 1);
    EXPECT_EQ(state.feedback, "forbidden import");
}

TEST(StateMachineTest, FailedTestsRetryAndSuccessClearsFeedback) {
    auto state = OnExecuted(OnValidated(OnGenerated(Start(2)), true, ""));
    state = OnTested(state, false, "1 of 1 tests failed");
    EXPECT_EQ(state.phase, Phase::kGenerating);
    EXPECT_EQ(state.attempt, 1);

    state = OnExecuted(OnValidated(OnGenerated(state), true, ""));
    state = OnTested(state, true, "");
    EXPECT_EQ(state.phase, Phase::kAnalyzingComplexity);
    EXPECT_TRUE(state.feedback.empty());
}

TEST(StateMachineTest, ExhaustedAttemptsFailAndKeepFeedback) {
    auto state = OnGenerated(Start(1));
    EXPECT_FALSE(state.AttemptsRemain());
    state = OnValidated(state, false, "still bad");
    EXPECT_EQ(state.phase, Phase::kFailed);
    EXPECT_EQ(state.failure, FailureReason::kAttemptsExhausted);
    EXPECT_EQ(state.feedback, "still bad");
    EXPECT_EQ(state.attempt, 0);
}

TEST(StateMachineTest, GeneratorUnavailableFailsImmediately) {
    const auto state = OnGeneratorUnavailable(Start(5));
    EXPECT_EQ(state.phase, Phase::kFailed);
    EXPECT_EQ(state.failure, FailureReason::kGeneratorUnavailable);
}

TEST(StateMachineTest, SandboxUnavailableFromExecutingOrTesting) {
    const auto executing = OnValidated(OnGenerated(Start(3)), true, "");
    EXPECT_EQ(OnSandboxUnavailable(executing).failure, FailureReason::kSandboxUnavailable);
    const auto testing = OnExecuted(executing);
    EXPECT_EQ(OnSandboxUnavailable(testing).phase, Phase::kFailed);
    EXPECT_THROW(OnSandboxUnavailable(Start(3)), std::logic_error);
}

TEST(StateMachineTest, CancelFromAnyNonTerminalPhase) {
    auto state = Start(3);
    EXPECT_EQ(OnCancelled(state).failure, FailureReason::kCancelled);
    state = OnGenerated(state);
    EXPECT_EQ(OnCancelled(state).phase, Phase::kFailed);
    state = OnValidated(state, true, "");
    EXPECT_EQ(OnCancelled(state).failure, FailureReason::kCancelled);

    const auto done = OnAnalyzed(OnTested(OnExecuted(state), true, ""));
    EXPECT_THROW(OnCancelled(done), std::logic_error);
}

TEST(StateMachineTest, TransitionsFromWrongPhaseThrow) {
    const auto start = Start(3);
    EXPECT_THROW(OnValidated(start, true, ""), std::logic_error);
    EXPECT_THROW(OnExecuted(start), std::logic_error);
    EXPECT_THROW(OnTested(start, true, ""), std::logic_error);
    EXPECT_THROW(OnAnalyzed(start), std::logic_error);
    EXPECT_THROW(OnGenerated(OnGenerated(start)), std::logic_error);
}

TEST(StateMachineTest, NamesPhasesAndReasons) {
    EXPECT_STREQ(ToString(Phase::kAnalyzingComplexity), "analyzing_complexity");
    EXPECT_STREQ(ToString(Phase::kGenerating), "generating");
    EXPECT_STREQ(ToString(FailureReason::kAttemptsExhausted), "attempts-exhausted");
    EXPECT_STREQ(ToString(FailureReason::kSandboxUnavailable), "sandbox-unavailable");
    EXPECT_STREQ(ToString(FailureReason::kNone), "");
}

}  // namespace
}  // namespace sandforge::pipeline
