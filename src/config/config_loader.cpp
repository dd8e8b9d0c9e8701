#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include "core/errors.hpp"
#include "utils/common.hpp"

namespace sandforge::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

void ApplyProviderConfig(ProviderConfig& target, const nlohmann::json& source) {
    if (!source.is_object()) {
        return;
    }
    if (source.contains("apiKey") && source["apiKey"].is_string()) {
        target.api_key = source["apiKey"].get<std::string>();
    }
    if (source.contains("apiBase") && source["apiBase"].is_string()) {
        target.api_base = source["apiBase"].get<std::string>();
    }
}

void ApplyStringList(std::vector<std::string>& target, const nlohmann::json& source) {
    if (!source.is_array()) {
        return;
    }
    target.clear();
    for (const auto& item : source) {
        if (item.is_string()) {
            target.push_back(item.get<std::string>());
        }
    }
}

bool ParseBool(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

int ParseInt(const char* name, const std::string& value) {
    try {
        std::size_t consumed = 0;
        const int parsed = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw ConfigError(std::string("config: ") + name + " is not an integer: " + value);
    }
}

double ParseDouble(const char* name, const std::string& value) {
    try {
        std::size_t consumed = 0;
        const double parsed = std::stod(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw ConfigError(std::string("config: ") + name + " is not a number: " + value);
    }
}

std::vector<std::string> SplitCsv(const std::string& value) {
    std::vector<std::string> items;
    for (const auto& item : utils::Split(value, ',')) {
        const auto trimmed = utils::Trim(item);
        if (!trimmed.empty()) {
            items.push_back(trimmed);
        }
    }
    return items;
}

}  // namespace

std::filesystem::path GetConfigPath() {
    const auto custom = GetEnv("SANDFORGE_CONFIG");
    if (!custom.empty()) {
        return ExpandHome(custom);
    }
    return GetHomePath() / ".sandforge" / "config.json";
}

std::filesystem::path ExpandHome(const std::string& path) {
    if (path == "~") {
        return GetHomePath();
    }
    if (path.rfind("~/", 0) == 0) {
        return GetHomePath() / path.substr(2);
    }
    return std::filesystem::path(path);
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("sandbox") && data["sandbox"].is_object()) {
        const auto& sandbox = data["sandbox"];
        if (sandbox.contains("python") && sandbox["python"].is_string()) {
            config.sandbox.python = sandbox["python"].get<std::string>();
        }
        if (sandbox.contains("scratchRoot") && sandbox["scratchRoot"].is_string()) {
            config.sandbox.scratch_root = sandbox["scratchRoot"].get<std::string>();
        }
        if (sandbox.contains("timeoutMs") && sandbox["timeoutMs"].is_number_integer()) {
            config.sandbox.timeout_ms = sandbox["timeoutMs"].get<int>();
        }
        if (sandbox.contains("memoryMb") && sandbox["memoryMb"].is_number_integer()) {
            config.sandbox.memory_mb = sandbox["memoryMb"].get<int>();
        }
        if (sandbox.contains("maxOutputBytes") && sandbox["maxOutputBytes"].is_number_integer()) {
            config.sandbox.max_output_bytes = sandbox["maxOutputBytes"].get<int>();
        }
        if (sandbox.contains("moduleWhitelist")) {
            ApplyStringList(config.sandbox.module_whitelist, sandbox["moduleWhitelist"]);
        }
        if (sandbox.contains("isolateNetwork") && sandbox["isolateNetwork"].is_boolean()) {
            config.sandbox.isolate_network = sandbox["isolateNetwork"].get<bool>();
        }
        if (sandbox.contains("confineFilesystem") && sandbox["confineFilesystem"].is_boolean()) {
            config.sandbox.confine_filesystem = sandbox["confineFilesystem"].get<bool>();
        }
        if (sandbox.contains("runtimeVersion") && sandbox["runtimeVersion"].is_string()) {
            config.sandbox.runtime_version = sandbox["runtimeVersion"].get<std::string>();
        }
    }

    if (data.contains("security") && data["security"].is_object()) {
        const auto& security = data["security"];
        if (security.contains("forbiddenModules")) {
            ApplyStringList(config.security.forbidden_modules, security["forbiddenModules"]);
        }
        if (security.contains("forbiddenCalls")) {
            ApplyStringList(config.security.forbidden_calls, security["forbiddenCalls"]);
        }
        if (security.contains("allowedDunders")) {
            ApplyStringList(config.security.allowed_dunders, security["allowedDunders"]);
        }
    }

    if (data.contains("cache") && data["cache"].is_object()) {
        const auto& cache = data["cache"];
        if (cache.contains("enabled") && cache["enabled"].is_boolean()) {
            config.cache.enabled = cache["enabled"].get<bool>();
        }
        if (cache.contains("backend") && cache["backend"].is_string()) {
            config.cache.backend = cache["backend"].get<std::string>();
        }
        if (cache.contains("path") && cache["path"].is_string()) {
            config.cache.path = cache["path"].get<std::string>();
        }
        if (cache.contains("ttlHours") && cache["ttlHours"].is_number()) {
            config.cache.ttl_hours = cache["ttlHours"].get<double>();
        }
    }

    if (data.contains("pipeline") && data["pipeline"].is_object()) {
        const auto& pipeline = data["pipeline"];
        if (pipeline.contains("maxAttempts") && pipeline["maxAttempts"].is_number_integer()) {
            config.pipeline.max_attempts = pipeline["maxAttempts"].get<int>();
        }
        if (pipeline.contains("maxAttemptsCap") && pipeline["maxAttemptsCap"].is_number_integer()) {
            config.pipeline.max_attempts_cap = pipeline["maxAttemptsCap"].get<int>();
        }
    }

    if (data.contains("providers") && data["providers"].is_object()) {
        const auto& providers = data["providers"];
        if (providers.contains("useProxyForLLM") && providers["useProxyForLLM"].is_boolean()) {
            config.providers.use_proxy_for_llm = providers["useProxyForLLM"].get<bool>();
        }
        if (providers.contains("anthropic")) {
            ApplyProviderConfig(config.providers.anthropic, providers["anthropic"]);
        }
        if (providers.contains("openai")) {
            ApplyProviderConfig(config.providers.openai, providers["openai"]);
        }
        if (providers.contains("openrouter")) {
            ApplyProviderConfig(config.providers.openrouter, providers["openrouter"]);
        }
        if (providers.contains("vllm")) {
            ApplyProviderConfig(config.providers.vllm, providers["vllm"]);
        }
    }

    if (data.contains("generator") && data["generator"].is_object()) {
        const auto& generator = data["generator"];
        if (generator.contains("model") && generator["model"].is_string()) {
            config.generator.model = generator["model"].get<std::string>();
        }
        if (generator.contains("maxTokens") && generator["maxTokens"].is_number_integer()) {
            config.generator.max_tokens = generator["maxTokens"].get<int>();
        }
        if (generator.contains("temperature") && generator["temperature"].is_number()) {
            config.generator.temperature = generator["temperature"].get<double>();
        }
        if (generator.contains("timeoutS") && generator["timeoutS"].is_number_integer()) {
            config.generator.timeout_s = generator["timeoutS"].get<int>();
        }
    }

    if (data.contains("logging") && data["logging"].is_object()) {
        const auto& logging = data["logging"];
        if (logging.contains("level") && logging["level"].is_string()) {
            config.logging.level = logging["level"].get<std::string>();
        }
    }
}

void ApplyEnvOverrides(Config& config) {
    const auto python = GetEnvFallback("SANDFORGE_SANDBOX__PYTHON", "SANDFORGE_PYTHON");
    if (!python.empty()) {
        config.sandbox.python = python;
    }

    const auto scratch_root = GetEnv("SANDFORGE_SANDBOX__SCRATCH_ROOT");
    if (!scratch_root.empty()) {
        config.sandbox.scratch_root = scratch_root;
    }

    const auto timeout_ms = GetEnv("SANDFORGE_SANDBOX__TIMEOUT_MS");
    if (!timeout_ms.empty()) {
        config.sandbox.timeout_ms = ParseInt("SANDFORGE_SANDBOX__TIMEOUT_MS", timeout_ms);
    }

    const auto memory_mb = GetEnv("SANDFORGE_SANDBOX__MEMORY_MB");
    if (!memory_mb.empty()) {
        config.sandbox.memory_mb = ParseInt("SANDFORGE_SANDBOX__MEMORY_MB", memory_mb);
    }

    const auto whitelist = GetEnv("SANDFORGE_SANDBOX__MODULE_WHITELIST");
    if (!whitelist.empty()) {
        config.sandbox.module_whitelist = SplitCsv(whitelist);
    }

    const auto isolate_network = GetEnv("SANDFORGE_SANDBOX__ISOLATE_NETWORK");
    if (!isolate_network.empty()) {
        config.sandbox.isolate_network = ParseBool(isolate_network);
    }
    const auto confine_filesystem = GetEnv("SANDFORGE_SANDBOX__CONFINE_FILESYSTEM");
    if (!confine_filesystem.empty()) {
        config.sandbox.confine_filesystem = ParseBool(confine_filesystem);
    }

    const auto runtime_version = GetEnv("SANDFORGE_SANDBOX__RUNTIME_VERSION");
    if (!runtime_version.empty()) {
        config.sandbox.runtime_version = runtime_version;
    }

    const auto forbidden_modules = GetEnv("SANDFORGE_SECURITY__FORBIDDEN_MODULES");
    if (!forbidden_modules.empty()) {
        config.security.forbidden_modules = SplitCsv(forbidden_modules);
    }

    const auto cache_enabled = GetEnv("SANDFORGE_CACHE__ENABLED");
    if (!cache_enabled.empty()) {
        config.cache.enabled = ParseBool(cache_enabled);
    }

    const auto cache_backend = GetEnv("SANDFORGE_CACHE__BACKEND");
    if (!cache_backend.empty()) {
        config.cache.backend = cache_backend;
    }

    const auto cache_path = GetEnv("SANDFORGE_CACHE__PATH");
    if (!cache_path.empty()) {
        config.cache.path = cache_path;
    }

    const auto ttl_hours = GetEnv("SANDFORGE_CACHE__TTL_HOURS");
    if (!ttl_hours.empty()) {
        config.cache.ttl_hours = ParseDouble("SANDFORGE_CACHE__TTL_HOURS", ttl_hours);
    }

    const auto max_attempts = GetEnv("SANDFORGE_PIPELINE__MAX_ATTEMPTS");
    if (!max_attempts.empty()) {
        config.pipeline.max_attempts = ParseInt("SANDFORGE_PIPELINE__MAX_ATTEMPTS", max_attempts);
    }

    const auto use_proxy_for_llm = GetEnvFallback(
        "SANDFORGE_PROVIDERS__USE_PROXY_FOR_LLM",
        "SANDFORGE_PROVIDERS_USE_PROXY_FOR_LLM");
    if (!use_proxy_for_llm.empty()) {
        config.providers.use_proxy_for_llm = ParseBool(use_proxy_for_llm);
    }

    const auto anthropic_key = GetEnvFallback(
        "SANDFORGE_PROVIDERS__ANTHROPIC__API_KEY",
        "ANTHROPIC_API_KEY");
    if (!anthropic_key.empty()) {
        config.providers.anthropic.api_key = anthropic_key;
    }

    const auto openai_key = GetEnvFallback(
        "SANDFORGE_PROVIDERS__OPENAI__API_KEY",
        "OPENAI_API_KEY");
    if (!openai_key.empty()) {
        config.providers.openai.api_key = openai_key;
    }

    const auto openrouter_key = GetEnvFallback(
        "SANDFORGE_PROVIDERS__OPENROUTER__API_KEY",
        "OPENROUTER_API_KEY");
    if (!openrouter_key.empty()) {
        config.providers.openrouter.api_key = openrouter_key;
    }

    const auto openrouter_base = GetEnv("SANDFORGE_PROVIDERS__OPENROUTER__API_BASE");
    if (!openrouter_base.empty()) {
        config.providers.openrouter.api_base = openrouter_base;
    }

    const auto vllm_key = GetEnv("SANDFORGE_PROVIDERS__VLLM__API_KEY");
    if (!vllm_key.empty()) {
        config.providers.vllm.api_key = vllm_key;
    }

    const auto vllm_base = GetEnv("SANDFORGE_PROVIDERS__VLLM__API_BASE");
    if (!vllm_base.empty()) {
        config.providers.vllm.api_base = vllm_base;
    }

    const auto model = GetEnvFallback("SANDFORGE_GENERATOR__MODEL", "SANDFORGE_MODEL");
    if (!model.empty()) {
        config.generator.model = model;
    }

    const auto max_tokens = GetEnv("SANDFORGE_GENERATOR__MAX_TOKENS");
    if (!max_tokens.empty()) {
        config.generator.max_tokens = ParseInt("SANDFORGE_GENERATOR__MAX_TOKENS", max_tokens);
    }

    const auto temperature = GetEnv("SANDFORGE_GENERATOR__TEMPERATURE");
    if (!temperature.empty()) {
        config.generator.temperature = ParseDouble("SANDFORGE_GENERATOR__TEMPERATURE", temperature);
    }

    const auto log_level = GetEnv("SANDFORGE_LOG_LEVEL");
    if (!log_level.empty()) {
        config.logging.level = log_level;
    }
}

void ValidateConfig(const Config& config) {
    if (config.sandbox.timeout_ms <= 0) {
        throw ConfigError("config: sandbox.timeoutMs must be positive");
    }
    if (config.sandbox.memory_mb <= 0) {
        throw ConfigError("config: sandbox.memoryMb must be positive");
    }
    if (config.sandbox.max_output_bytes <= 0) {
        throw ConfigError("config: sandbox.maxOutputBytes must be positive");
    }
    if (config.cache.backend != "memory" && config.cache.backend != "sqlite") {
        throw ConfigError("config: cache.backend must be \"memory\" or \"sqlite\", got \"" +
                          config.cache.backend + "\"");
    }
    if (config.cache.ttl_hours <= 0.0) {
        throw ConfigError("config: cache.ttlHours must be positive");
    }
    if (config.pipeline.max_attempts < 1) {
        throw ConfigError("config: pipeline.maxAttempts must be at least 1");
    }
    if (config.pipeline.max_attempts_cap < config.pipeline.max_attempts) {
        throw ConfigError("config: pipeline.maxAttemptsCap must not be below pipeline.maxAttempts");
    }
}

Config LoadConfig() {
    Config config{};

    const auto config_path = GetConfigPath();
    if (std::filesystem::exists(config_path)) {
        std::ifstream input(config_path);
        if (!input) {
            throw ConfigError("config: cannot read " + config_path.string());
        }
        const auto data = nlohmann::json::parse(input, nullptr, false);
        if (data.is_discarded()) {
            throw ConfigError("config: " + config_path.string() + " is not valid JSON");
        }
        ApplyConfigFromJson(config, data);
    }

    ApplyEnvOverrides(config);
    ValidateConfig(config);
    return config;
}

}  // namespace sandforge::config
