#include "sandbox/sandbox_executor.hpp"

#include "cache/fingerprint.hpp"
#include "core/errors.hpp"
#include "utils/logging.hpp"

namespace sandforge::sandbox {

SandboxExecutor::SandboxExecutor(IsolationBackend& backend,
                                 cache::ResultCache* cache,
                                 std::chrono::seconds cache_ttl)
    : backend_(backend)
    , cache_(cache)
    , cache_ttl_(cache_ttl) {}

void SandboxExecutor::DisableCache(const std::exception& error) {
    cache_degraded_ = true;
    utils::Log(utils::LogLevel::kWarn, "sandbox", "result cache unavailable, executing without it",
               {{"backend", cache_->BackendId()}, {"error", error.what()}});
}

ExecutionResult SandboxExecutor::Execute(const CodeCandidate& candidate,
                                         const SecurityVerdict& verdict,
                                         const ExecutionLimits& limits,
                                         const CancellationToken& token) {
    if (!verdict.allowed) {
        throw SecurityViolation("refusing to execute a candidate rejected by the security validator");
    }
    ExecutionRequest request{};
    request.fingerprint = cache::Fingerprint(
        candidate.language, backend_.RuntimeVersion(), candidate.source, candidate.context);
    request.code = candidate.source;
    request.context = candidate.context;
    request.limits = limits;

    if (CacheActive()) {
        try {
            if (auto hit = cache_->Get(request.fingerprint)) {
                utils::Log(utils::LogLevel::kDebug, "sandbox", "cache hit", {{"fingerprint", request.fingerprint}});
                return *hit;
            }
        } catch (const CacheUnavailable& error) {
            DisableCache(error);
        }
    }

    auto result = backend_.Run(request, token);

    if (CacheActive() && cache::IsCacheable(result.status)) {
        try {
            cache_->Put(request.fingerprint, result, cache_ttl_);
        } catch (const CacheUnavailable& error) {
            DisableCache(error);
        }
    }
    return result;
}

void RaiseForStatus(const ExecutionResult& result) {
    switch (result.status) {
        case ExecutionStatus::kSuccess:
            return;
        case ExecutionStatus::kTimeout:
            throw ExecutionTimeout("execution exceeded its time limit");
        case ExecutionStatus::kMemoryExceeded:
            throw ExecutionMemoryExceeded(result.stderr_text.empty() ? "execution exceeded its memory limit"
                                                                     : result.stderr_text);
        case ExecutionStatus::kRuntimeError:
            throw ExecutionRuntimeError(result.stderr_text);
        case ExecutionStatus::kSecurityRejected:
            throw SecurityViolation("execution rejected by security policy");
    }
}

}  // namespace sandforge::sandbox
