#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "analysis/complexity_analyzer.hpp"
#include "cache/result_cache.hpp"
#include "core/types.hpp"
#include "generator/code_generator.hpp"
#include "pipeline/state_machine.hpp"
#include "sandbox/cancellation.hpp"
#include "sandbox/isolation_backend.hpp"
#include "security/security_validator.hpp"

namespace sandforge::pipeline {

struct PipelineRequest {
    std::string task_description;
    std::string language = "python";
    nlohmann::json input_example = nlohmann::json::object();
    std::optional<nlohmann::json> expected_output;
    std::optional<int> max_attempts;
    std::vector<TestCase> test_cases;
};

struct StateTransition {
    Phase from = Phase::kGenerating;
    Phase to = Phase::kGenerating;
    int attempt = 0;
};

struct PipelineResult {
    bool success = false;
    FailureReason failure = FailureReason::kNone;
    // Most informative terminal error; empty on success.
    std::string error;
    std::vector<GenerationAttempt> attempts;
    // Index into attempts of the returned candidate: the accepted one on
    // success, otherwise the best scoring one. Unset when nothing was generated.
    std::optional<std::size_t> selected;
    std::vector<StateTransition> transitions;

    const GenerationAttempt* Selected() const {
        return selected ? &attempts[*selected] : nullptr;
    }
};

struct OrchestratorSettings {
    int default_max_attempts = 3;
    int max_attempts_cap = 10;
    ExecutionLimits limits;
    std::chrono::seconds cache_ttl = cache::kDefaultTtl;
};

// Index of the attempt with the highest passed/total ratio; the earliest wins
// ties. Attempts that never reached testing score zero.
std::optional<std::size_t> SelectBestAttempt(const std::vector<GenerationAttempt>& attempts);

// Drives generate / validate / execute / test cycles for one request at a
// time per call. Holds no per-run state, so concurrent Run calls only share
// the cache and the collaborators, which are required to be thread-safe.
class GenerationOrchestrator {
public:
    GenerationOrchestrator(generator::CodeGenerator& generator,
                           const security::SecurityValidator& validator,
                           sandbox::IsolationBackend& backend,
                           cache::ResultCache* cache,
                           const analysis::ComplexityAnalyzer& analyzer,
                           OrchestratorSettings settings);

    PipelineResult Run(const PipelineRequest& request, const sandbox::CancellationToken& token) const;

    int ResolveMaxAttempts(const std::optional<int>& requested) const;

private:
    generator::CodeGenerator& generator_;
    const security::SecurityValidator& validator_;
    sandbox::IsolationBackend& backend_;
    cache::ResultCache* cache_;
    const analysis::ComplexityAnalyzer& analyzer_;
    OrchestratorSettings settings_;
};

}  // namespace sandforge::pipeline
