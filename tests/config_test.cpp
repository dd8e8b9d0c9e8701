#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <unistd.h>

#include "config/config_loader.hpp"
#include "core/errors.hpp"
#include "providers/llm_provider.hpp"

namespace sandforge::config {
namespace {

// Sets an environment variable for the lifetime of the guard.
class ScopedEnv {
public:
    ScopedEnv(const char* name, const std::string& value) : name_(name) {
        if (const char* previous = std::getenv(name)) {
            previous_ = previous;
        }
        ::setenv(name, value.c_str(), 1);
    }
    ~ScopedEnv() {
        if (previous_) {
            ::setenv(name_, previous_->c_str(), 1);
        } else {
            ::unsetenv(name_);
        }
    }

    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;

private:
    const char* name_;
    std::optional<std::string> previous_;
};

std::filesystem::path WriteTempFile(const std::string& name, const std::string& content) {
    const auto path = std::filesystem::temp_directory_path() /
        ("sandforge-config-" + std::to_string(::getpid()) + "-" + name);
    std::ofstream output(path, std::ios::trunc);
    output << content;
    return path;
}

TEST(ConfigTest, DefaultsAreValid) {
    const Config config{};
    EXPECT_EQ(config.sandbox.timeout_ms, 5000);
    EXPECT_EQ(config.sandbox.memory_mb, 256);
    EXPECT_EQ(config.cache.backend, "sqlite");
    EXPECT_DOUBLE_EQ(config.cache.ttl_hours, 24.0);
    EXPECT_EQ(config.pipeline.max_attempts, 3);
    EXPECT_NO_THROW(ValidateConfig(config));
}

TEST(ConfigTest, AppliesJsonSections) {
    Config config{};
    ApplyConfigFromJson(config, nlohmann::json::parse(R"({
        "sandbox": {"timeoutMs": 1500, "memoryMb": 64, "moduleWhitelist": ["/opt/libs"],
                    "isolateNetwork": false, "confineFilesystem": false, "runtimeVersion": "cpython-3.12"},
        "security": {"forbiddenModules": ["os", "requests"]},
        "cache": {"enabled": false, "backend": "memory", "ttlHours": 1.5},
        "pipeline": {"maxAttempts": 5},
        "providers": {"openrouter": {"apiKey": "sk-or-test"}},
        "generator": {"model": "openai/gpt-4o", "temperature": 0.0},
        "logging": {"level": "debug"}
    })"));
    EXPECT_EQ(config.sandbox.timeout_ms, 1500);
    EXPECT_EQ(config.sandbox.memory_mb, 64);
    ASSERT_EQ(config.sandbox.module_whitelist.size(), 1u);
    EXPECT_FALSE(config.sandbox.isolate_network);
    EXPECT_FALSE(config.sandbox.confine_filesystem);
    EXPECT_EQ(config.sandbox.runtime_version, "cpython-3.12");
    EXPECT_EQ(config.security.forbidden_modules.size(), 2u);
    EXPECT_FALSE(config.cache.enabled);
    EXPECT_EQ(config.cache.backend, "memory");
    EXPECT_DOUBLE_EQ(config.cache.ttl_hours, 1.5);
    EXPECT_EQ(config.pipeline.max_attempts, 5);
    EXPECT_EQ(config.providers.openrouter.api_key, "sk-or-test");
    EXPECT_EQ(config.generator.model, "openai/gpt-4o");
    EXPECT_EQ(config.logging.level, "debug");
}

TEST(ConfigTest, IgnoresValuesOfTheWrongType) {
    Config config{};
    ApplyConfigFromJson(config, nlohmann::json::parse(R"({"sandbox": {"timeoutMs": "fast"}, "cache": 3})"));
    EXPECT_EQ(config.sandbox.timeout_ms, 5000);
    EXPECT_TRUE(config.cache.enabled);
}

TEST(ConfigTest, EnvironmentOverridesFile) {
    Config config{};
    ApplyConfigFromJson(config, {{"sandbox", {{"timeoutMs", 1500}}}});
    ScopedEnv timeout("SANDFORGE_SANDBOX__TIMEOUT_MS", "2500");
    ScopedEnv whitelist("SANDFORGE_SANDBOX__MODULE_WHITELIST", "/a, /b,,");
    ScopedEnv cache("SANDFORGE_CACHE__ENABLED", "no");
    ScopedEnv attempts("SANDFORGE_PIPELINE__MAX_ATTEMPTS", "7");
    ApplyEnvOverrides(config);
    EXPECT_EQ(config.sandbox.timeout_ms, 2500);
    EXPECT_EQ(config.sandbox.module_whitelist, (std::vector<std::string>{"/a", "/b"}));
    EXPECT_FALSE(config.cache.enabled);
    EXPECT_EQ(config.pipeline.max_attempts, 7);
}

TEST(ConfigTest, MalformedNumericEnvironmentValueThrows) {
    Config config{};
    ScopedEnv memory("SANDFORGE_SANDBOX__MEMORY_MB", "lots");
    EXPECT_THROW(ApplyEnvOverrides(config), ConfigError);
}

TEST(ConfigTest, ValidationRejectsUnusableValues) {
    Config config{};
    config.sandbox.timeout_ms = 0;
    EXPECT_THROW(ValidateConfig(config), ConfigError);

    config = Config{};
    config.cache.backend = "redis";
    EXPECT_THROW(ValidateConfig(config), ConfigError);

    config = Config{};
    config.pipeline.max_attempts = 0;
    EXPECT_THROW(ValidateConfig(config), ConfigError);

    config = Config{};
    config.pipeline.max_attempts = 12;
    EXPECT_THROW(ValidateConfig(config), ConfigError);
}

TEST(ConfigTest, LoadsFileNamedByEnvironment) {
    const auto path = WriteTempFile("good.json", R"({"sandbox": {"memoryMb": 128}})");
    {
        ScopedEnv config_path("SANDFORGE_CONFIG", path.string());
        const auto config = LoadConfig();
        EXPECT_EQ(config.sandbox.memory_mb, 128);
    }
    std::filesystem::remove(path);
}

TEST(ConfigTest, InvalidConfigFileThrows) {
    const auto path = WriteTempFile("bad.json", "{ not json");
    {
        ScopedEnv config_path("SANDFORGE_CONFIG", path.string());
        EXPECT_THROW(LoadConfig(), ConfigError);
    }
    std::filesystem::remove(path);
}

TEST(ConfigTest, ExpandsHome) {
    ScopedEnv home("HOME", "/home/tester");
    EXPECT_EQ(ExpandHome("~/cache.db"), std::filesystem::path("/home/tester/cache.db"));
    EXPECT_EQ(ExpandHome("/var/cache.db"), std::filesystem::path("/var/cache.db"));
}

TEST(ProviderSettingsTest, PrefersOpenRouterThenAnthropic) {
    Config config{};
    config.providers.anthropic.api_key = "sk-ant";
    auto settings = providers::ResolveProviderSettings(config);
    EXPECT_EQ(settings.api_key, "sk-ant");

    config.providers.openrouter.api_key = "sk-or";
    settings = providers::ResolveProviderSettings(config);
    EXPECT_EQ(settings.api_key, "sk-or");
    EXPECT_EQ(settings.api_base, "https://openrouter.ai/api/v1");
    EXPECT_EQ(settings.model, config.generator.model);
}

}  // namespace
}  // namespace sandforge::config
