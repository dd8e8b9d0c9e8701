#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "analysis/complexity_analyzer.hpp"
#include "app/components.hpp"
#include "config/config_loader.hpp"
#include "core/errors.hpp"
#include "core/json.hpp"
#include "generator/llm_code_generator.hpp"
#include "nlohmann/json.hpp"
#include "pipeline/orchestrator.hpp"
#include "pipeline/serialization.hpp"
#include "providers/llm_provider.hpp"
#include "sandbox/process_sandbox.hpp"
#include "sandbox/sandbox_executor.hpp"
#include "security/security_validator.hpp"
#include "utils/logging.hpp"

namespace {

using namespace sandforge;

volatile std::sig_atomic_t g_signal = 0;

// Exit codes of `exec`, one per execution outcome.
constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitRuntimeError = 2;
constexpr int kExitTimeout = 3;
constexpr int kExitMemoryExceeded = 4;
constexpr int kExitRejected = 5;

void HandleSignal(int signal) {
    g_signal = signal;
}

void InstallSignalHandlers() {
    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

// Turns SIGINT/SIGTERM into cancellation of the running job.
class SignalWatcher {
public:
    explicit SignalWatcher(sandbox::CancellationToken& token)
        : thread_([this, &token] {
              while (!done_.load()) {
                  if (g_signal != 0) {
                      utils::Log(utils::LogLevel::kWarn, "cli", "signal received, cancelling");
                      token.Cancel();
                      return;
                  }
                  std::this_thread::sleep_for(std::chrono::milliseconds(50));
              }
          }) {}

    ~SignalWatcher() {
        done_.store(true);
        if (thread_.joinable()) {
            thread_.join();
        }
    }

private:
    std::atomic<bool> done_{false};
    std::thread thread_;
};

std::string ReadFile(const std::string& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw Error("cannot read " + path);
    }
    return std::string(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
}

nlohmann::json ReadJsonFile(const std::string& path) {
    const auto data = nlohmann::json::parse(ReadFile(path), nullptr, false);
    if (data.is_discarded()) {
        throw Error(path + " is not valid JSON");
    }
    return data;
}

// Value following `flag` in args, if present.
std::optional<std::string> FlagValue(const std::vector<std::string>& args, const std::string& flag) {
    for (std::size_t i = 0; i + 1 < args.size(); ++i) {
        if (args[i] == flag) {
            return args[i + 1];
        }
    }
    return std::nullopt;
}

void PrintJson(const nlohmann::json& json) {
    std::cout << json.dump(2) << std::endl;
}

// Opens the cache for a pipeline job; an unavailable cache only disables caching.
std::unique_ptr<cache::ResultCache> OpenCacheOrWarn(const config::Config& config) {
    try {
        return app::OpenResultCache(config);
    } catch (const CacheUnavailable& ex) {
        utils::Log(utils::LogLevel::kWarn, "cli", "result cache unavailable, continuing without it",
                   {{"error", ex.what()}});
        return nullptr;
    }
}

int RunPipeline(const config::Config& config, const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cout << "Usage: sandforge run <request.json>" << std::endl;
        return kExitUsage;
    }
    const auto request = pipeline::RequestFromJson(ReadJsonFile(args[0]));

    auto provider = providers::CreateProvider(config);
    generator::LlmCodeGenerator generator(*provider, generator::GeneratorSettings{
        config.generator.model, config.generator.max_tokens, config.generator.temperature});
    const security::SecurityValidator validator(app::BuildSecurityPolicy(config));
    sandbox::ProcessSandbox backend(app::BuildSandboxSettings(config));
    auto cache = OpenCacheOrWarn(config);
    const analysis::ComplexityAnalyzer analyzer;

    const pipeline::GenerationOrchestrator orchestrator(
        generator, validator, backend, cache.get(), analyzer, app::BuildOrchestratorSettings(config));

    sandbox::CancellationToken token;
    pipeline::PipelineResult result;
    {
        SignalWatcher watcher(token);
        result = orchestrator.Run(request, token);
    }
    PrintJson(pipeline::ResponseToJson(result));
    return result.success ? kExitOk : kExitRuntimeError;
}

int ExitCodeFor(const ExecutionResult& result) {
    try {
        sandbox::RaiseForStatus(result);
        return kExitOk;
    } catch (const ExecutionTimeout&) {
        return kExitTimeout;
    } catch (const ExecutionMemoryExceeded&) {
        return kExitMemoryExceeded;
    } catch (const ExecutionRuntimeError&) {
        return kExitRuntimeError;
    } catch (const SecurityViolation&) {
        return kExitRejected;
    }
}

int ExecFile(const config::Config& config, const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cout << "Usage: sandforge exec <file.py> [--context ctx.json]" << std::endl;
        return kExitUsage;
    }
    CodeCandidate candidate{};
    candidate.source = ReadFile(args[0]);
    if (const auto context_path = FlagValue(args, "--context")) {
        candidate.context = ReadJsonFile(*context_path);
        if (!candidate.context.is_object()) {
            throw Error("--context must hold a JSON object");
        }
    }

    const security::SecurityValidator validator(app::BuildSecurityPolicy(config));
    const auto verdict = validator.Validate(candidate);
    if (!verdict.allowed) {
        PrintJson({{"validation", ToJson(verdict)}, {"execution", nullptr}});
        return kExitRejected;
    }

    sandbox::ProcessSandbox backend(app::BuildSandboxSettings(config));
    auto cache = OpenCacheOrWarn(config);
    sandbox::SandboxExecutor executor(backend, cache.get(), app::CacheTtl(config));

    sandbox::CancellationToken token;
    ExecutionResult result;
    {
        SignalWatcher watcher(token);
        result = executor.Execute(candidate, verdict, app::BuildLimits(config), token);
    }
    PrintJson({{"validation", ToJson(verdict)}, {"execution", ToJson(result)}});
    return ExitCodeFor(result);
}

int ValidateFile(const config::Config& config, const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cout << "Usage: sandforge validate <file.py>" << std::endl;
        return kExitUsage;
    }
    CodeCandidate candidate{};
    candidate.source = ReadFile(args[0]);
    const security::SecurityValidator validator(app::BuildSecurityPolicy(config));
    const auto verdict = validator.Validate(candidate);
    PrintJson(ToJson(verdict));
    return verdict.allowed ? kExitOk : kExitRejected;
}

int AnalyzeFile(const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cout << "Usage: sandforge analyze <file.py>" << std::endl;
        return kExitUsage;
    }
    const analysis::ComplexityAnalyzer analyzer;
    try {
        PrintJson(ToJson(analyzer.Analyze(ReadFile(args[0]))));
    } catch (const SyntaxError& ex) {
        std::cout << "syntax error: " << ex.what() << std::endl;
        return kExitRejected;
    }
    return kExitOk;
}

int CacheCommand(const config::Config& config, const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cout << "Usage: sandforge cache stats | clear [--older-than-hours N] | purge" << std::endl;
        return kExitUsage;
    }
    auto cache = app::OpenResultCache(config);
    if (!cache) {
        std::cout << "Result cache is disabled." << std::endl;
        return kExitUsage;
    }

    const auto& action = args[0];
    if (action == "stats") {
        auto stats = cache::ToJson(cache->Stats());
        stats["backend"] = cache->BackendId();
        PrintJson(stats);
        return kExitOk;
    }
    if (action == "clear") {
        std::optional<double> older_than_hours;
        if (const auto hours = FlagValue(args, "--older-than-hours")) {
            std::size_t consumed = 0;
            double value = 0.0;
            try {
                value = std::stod(*hours, &consumed);
            } catch (const std::logic_error&) {
                consumed = 0;
            }
            if (consumed == 0 || consumed != hours->size() || value < 0.0) {
                std::cout << "--older-than-hours expects a non-negative number" << std::endl;
                return kExitUsage;
            }
            older_than_hours = value;
        }
        PrintJson({{"entries_deleted", cache->Clear(older_than_hours)}});
        return kExitOk;
    }
    if (action == "purge") {
        PrintJson({{"entries_deleted", cache->PurgeExpired()}});
        return kExitOk;
    }
    std::cout << "Unknown cache action: " << action << std::endl;
    return kExitUsage;
}

void PrintUsage() {
    std::cout << "Usage: sandforge <command> [args]\n"
              << "  run <request.json>                    generate, validate, execute and test\n"
              << "  exec <file.py> [--context ctx.json]   validate and execute one file\n"
              << "  validate <file.py>                    security check only\n"
              << "  analyze <file.py>                     complexity report\n"
              << "  cache stats | clear [--older-than-hours N] | purge" << std::endl;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return kExitUsage;
    }
    const std::string command = argv[1];
    const std::vector<std::string> args(argv + 2, argv + argc);

    try {
        const auto config = sandforge::config::LoadConfig();
        sandforge::utils::SetLogConfig(
            sandforge::utils::LogConfig{sandforge::utils::ParseLogLevel(config.logging.level)});
        InstallSignalHandlers();

        if (command == "run") {
            return RunPipeline(config, args);
        }
        if (command == "exec") {
            return ExecFile(config, args);
        }
        if (command == "validate") {
            return ValidateFile(config, args);
        }
        if (command == "analyze") {
            return AnalyzeFile(args);
        }
        if (command == "cache") {
            return CacheCommand(config, args);
        }
    } catch (const sandforge::Error& ex) {
        std::cerr << "sandforge: " << ex.what() << std::endl;
        return kExitUsage;
    }

    PrintUsage();
    return kExitUsage;
}
