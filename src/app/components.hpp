#pragma once

#include <chrono>
#include <memory>

#include "cache/result_cache.hpp"
#include "config/config_schema.hpp"
#include "core/types.hpp"
#include "pipeline/orchestrator.hpp"
#include "sandbox/process_sandbox.hpp"
#include "security/security_policy.hpp"

namespace sandforge::app {

// Config lists replace the matching default deny-list when non-empty.
security::SecurityPolicy BuildSecurityPolicy(const config::Config& config);
sandbox::SandboxSettings BuildSandboxSettings(const config::Config& config);
ExecutionLimits BuildLimits(const config::Config& config);
std::chrono::seconds CacheTtl(const config::Config& config);
pipeline::OrchestratorSettings BuildOrchestratorSettings(const config::Config& config);

// nullptr when caching is disabled. Throws CacheUnavailable when the
// configured backend cannot be opened.
std::unique_ptr<cache::ResultCache> OpenResultCache(const config::Config& config);

}  // namespace sandforge::app
