#pragma once

#include <string>
#include <vector>

namespace sandforge::config {

struct SandboxConfig {
    std::string python = "python3";
    // Empty means the system temporary directory.
    std::string scratch_root;
    int timeout_ms = 5000;
    int memory_mb = 256;
    int max_output_bytes = 64 * 1024;
    std::vector<std::string> module_whitelist;
    bool isolate_network = true;
    bool confine_filesystem = true;
    // Empty means probe "<python> --version".
    std::string runtime_version;
};

// Empty lists keep the built-in deny-lists.
struct SecurityConfig {
    std::vector<std::string> forbidden_modules;
    std::vector<std::string> forbidden_calls;
    std::vector<std::string> allowed_dunders;
};

struct CacheConfig {
    bool enabled = true;
    // "memory" or "sqlite".
    std::string backend = "sqlite";
    std::string path = "~/.sandforge/cache.db";
    double ttl_hours = 24.0;
};

struct PipelineConfig {
    int max_attempts = 3;
    // Requests asking for more attempts are clamped to this.
    int max_attempts_cap = 10;
};

struct ProviderConfig {
    std::string api_key;
    std::string api_base;
};

struct ProvidersConfig {
    ProviderConfig anthropic;
    ProviderConfig openai;
    ProviderConfig openrouter;
    ProviderConfig vllm;
    bool use_proxy_for_llm = false;
};

struct GeneratorConfig {
    std::string model = "anthropic/claude-sonnet-4-5";
    int max_tokens = 4096;
    double temperature = 0.2;
    int timeout_s = 60;
};

struct LoggingConfig {
    std::string level = "info";
};

struct Config {
    SandboxConfig sandbox;
    SecurityConfig security;
    CacheConfig cache;
    PipelineConfig pipeline;
    ProvidersConfig providers;
    GeneratorConfig generator;
    LoggingConfig logging;
};

}  // namespace sandforge::config
