#pragma once

#include <chrono>

#include "cache/result_cache.hpp"
#include "core/types.hpp"
#include "sandbox/cancellation.hpp"
#include "sandbox/isolation_backend.hpp"

namespace sandforge::sandbox {

// Runs validated candidates through an isolation backend, consulting the
// result cache first. One instance serves one pipeline run: after the first
// cache failure it stops using the cache for the rest of the run.
class SandboxExecutor {
public:
    SandboxExecutor(IsolationBackend& backend,
                    cache::ResultCache* cache,
                    std::chrono::seconds cache_ttl = cache::kDefaultTtl);

    // The verdict must allow execution; passing a rejected one is a caller
    // bug and throws SecurityViolation without touching the backend.
    ExecutionResult Execute(const CodeCandidate& candidate,
                            const SecurityVerdict& verdict,
                            const ExecutionLimits& limits,
                            const CancellationToken& token);

    bool CacheActive() const { return cache_ != nullptr && !cache_degraded_; }

private:
    void DisableCache(const std::exception& error);

    IsolationBackend& backend_;
    cache::ResultCache* cache_;
    std::chrono::seconds cache_ttl_;
    bool cache_degraded_ = false;
};

// Throws ExecutionTimeout, ExecutionMemoryExceeded or ExecutionRuntimeError
// matching a non-success status; returns normally on success.
void RaiseForStatus(const ExecutionResult& result);

}  // namespace sandforge::sandbox
