#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "sandbox/confinement.hpp"
#include "sandbox/isolation_backend.hpp"

namespace sandforge::sandbox {

struct SandboxSettings {
    // Interpreter name or absolute path; names are resolved through PATH.
    std::string python = "python3";
    std::filesystem::path scratch_root = std::filesystem::temp_directory_path();
    // Directories exported as PYTHONPATH. Nothing else is importable beyond
    // the interpreter's standard library.
    std::vector<std::string> module_whitelist;
    std::size_t max_output_bytes = 64 * 1024;
    std::uint64_t max_file_bytes = 16ull * 1024 * 1024;
    std::uint64_t max_processes = 64;
    std::uint64_t max_open_files = 64;
    bool isolate_network = true;
    // Landlock ruleset limiting writes to the run's scratch directory. When
    // set and the kernel cannot enforce it, construction fails.
    bool confine_filesystem = true;
    // Overrides the probed "<python> --version" string when non-empty.
    std::string runtime_version;
};

// Runs each candidate in a fresh interpreter process under rlimits, in its
// own session and scratch directory, with a fixed environment. Writes are
// confined to the scratch directory and the network namespace is private
// where the host allows it.
class ProcessSandbox : public IsolationBackend {
public:
    // Throws ConfigError when the interpreter cannot be found or filesystem
    // confinement is required but unsupported.
    explicit ProcessSandbox(SandboxSettings settings);

    ExecutionResult Run(const ExecutionRequest& request, const CancellationToken& token) override;
    std::string RuntimeVersion() const override { return runtime_version_; }

    const std::string& InterpreterPath() const { return interpreter_; }
    NetworkIsolation Network() const { return network_; }

private:
    SandboxSettings settings_;
    std::string interpreter_;
    std::string runtime_version_;
    int landlock_abi_ = 0;
    NetworkIsolation network_ = NetworkIsolation::kNone;
};

// Outcome of a run whose interpreter died from `signal`. CPU time at the cap
// is a timeout, resident memory near the limit is a memory kill, anything
// else is reported as a runtime error naming the signal.
ExecutionResult ClassifySignal(int signal,
                               double cpu_seconds,
                               double cpu_limit_seconds,
                               std::uint64_t max_rss_bytes,
                               std::uint64_t memory_limit_bytes);

// Locates an interpreter by name or path; empty when none is found.
std::string FindInterpreter(const std::string& python);

}  // namespace sandforge::sandbox
