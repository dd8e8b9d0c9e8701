#include "app/components.hpp"

#include <cmath>

#include "cache/memory_result_cache.hpp"
#include "cache/sqlite_result_cache.hpp"
#include "config/config_loader.hpp"

namespace sandforge::app {
namespace {

void OverrideIfSet(std::set<std::string>& target, const std::vector<std::string>& configured) {
    if (!configured.empty()) {
        target = std::set<std::string>(configured.begin(), configured.end());
    }
}

}  // namespace

security::SecurityPolicy BuildSecurityPolicy(const config::Config& config) {
    auto policy = security::DefaultSecurityPolicy();
    OverrideIfSet(policy.forbidden_modules, config.security.forbidden_modules);
    OverrideIfSet(policy.forbidden_calls, config.security.forbidden_calls);
    OverrideIfSet(policy.allowed_dunders, config.security.allowed_dunders);
    return policy;
}

sandbox::SandboxSettings BuildSandboxSettings(const config::Config& config) {
    sandbox::SandboxSettings settings{};
    settings.python = config.sandbox.python;
    if (!config.sandbox.scratch_root.empty()) {
        settings.scratch_root = config::ExpandHome(config.sandbox.scratch_root);
    }
    settings.module_whitelist = config.sandbox.module_whitelist;
    settings.max_output_bytes = static_cast<std::size_t>(config.sandbox.max_output_bytes);
    settings.isolate_network = config.sandbox.isolate_network;
    settings.confine_filesystem = config.sandbox.confine_filesystem;
    settings.runtime_version = config.sandbox.runtime_version;
    return settings;
}

ExecutionLimits BuildLimits(const config::Config& config) {
    ExecutionLimits limits{};
    limits.timeout = std::chrono::milliseconds(config.sandbox.timeout_ms);
    limits.memory_bytes = static_cast<std::uint64_t>(config.sandbox.memory_mb) * 1024 * 1024;
    return limits;
}

std::chrono::seconds CacheTtl(const config::Config& config) {
    return std::chrono::seconds(static_cast<std::int64_t>(std::llround(config.cache.ttl_hours * 3600.0)));
}

pipeline::OrchestratorSettings BuildOrchestratorSettings(const config::Config& config) {
    pipeline::OrchestratorSettings settings{};
    settings.default_max_attempts = config.pipeline.max_attempts;
    settings.max_attempts_cap = config.pipeline.max_attempts_cap;
    settings.limits = BuildLimits(config);
    settings.cache_ttl = CacheTtl(config);
    return settings;
}

std::unique_ptr<cache::ResultCache> OpenResultCache(const config::Config& config) {
    if (!config.cache.enabled) {
        return nullptr;
    }
    if (config.cache.backend == "memory") {
        return std::make_unique<cache::MemoryResultCache>();
    }
    return std::make_unique<cache::SqliteResultCache>(config::ExpandHome(config.cache.path));
}

}  // namespace sandforge::app
