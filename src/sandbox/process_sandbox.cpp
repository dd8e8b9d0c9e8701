#include "sandbox/process_sandbox.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cmath>
#include <cstring>
#include <fstream>
#include <system_error>
#include <thread>
#include <tuple>
#include <utility>

#include <boost/version.hpp>
#if BOOST_VERSION >= 108600
#include <boost/process/v1.hpp>
#include <boost/process/v1/extend.hpp>
#else
#include <boost/process.hpp>
#include <boost/process/extend.hpp>
#endif

#include <signal.h>
#include <stdlib.h>
#include <sys/resource.h>
#include <sys/time.h>
#include <sys/wait.h>
#include <unistd.h>

#include "core/errors.hpp"
#include "sandbox/harness.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace sandforge::sandbox {
namespace {

#if BOOST_VERSION >= 108600
namespace bp = boost::process::v1;
#else
namespace bp = boost::process;
#endif
namespace fs = std::filesystem;

constexpr auto kPollInterval = std::chrono::milliseconds(5);
constexpr const char* kUnknownRuntime = "python3-unknown";

// Per-run working directory, created 0700 and removed with everything in it
// when the run ends.
class ScratchDirectory {
public:
    explicit ScratchDirectory(const fs::path& root) {
        std::error_code ec;
        fs::create_directories(root, ec);
        if (ec) {
            throw Error("sandbox: cannot create scratch root " + root.string() + ": " + ec.message());
        }
        std::string pattern = (root / "sandforge-XXXXXX").string();
        if (::mkdtemp(pattern.data()) == nullptr) {
            throw Error("sandbox: cannot create scratch directory: " + std::string(std::strerror(errno)));
        }
        path_ = pattern;
    }

    ~ScratchDirectory() {
        std::error_code ec;
        fs::remove_all(path_, ec);
        if (ec) {
            utils::Log(utils::LogLevel::kWarn, "sandbox", "failed to remove scratch directory",
                       {{"path", path_.string()}, {"error", ec.message()}});
        }
    }

    ScratchDirectory(const ScratchDirectory&) = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;

    const fs::path& Path() const { return path_; }

private:
    fs::path path_;
};

void WriteFile(const fs::path& path, const std::string& content) {
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output.is_open()) {
        throw Error("sandbox: cannot write " + path.string());
    }
    output << content;
    if (!output.good()) {
        throw Error("sandbox: short write to " + path.string());
    }
}

std::string ReadBounded(const fs::path& path, std::size_t limit) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return "";
    }
    std::string data(limit + 1, '\0');
    input.read(data.data(), static_cast<std::streamsize>(data.size()));
    data.resize(static_cast<std::size_t>(input.gcount()));
    if (data.size() > limit) {
        data.resize(limit);
        data += "\n(truncated)";
    }
    return data;
}

void KillGroup(pid_t pid) {
    if (::kill(-pid, SIGKILL) != 0 && errno != ESRCH) {
        utils::Log(utils::LogLevel::kWarn, "sandbox", "failed to kill process group",
                   {{"pid", std::to_string(pid)}, {"error", std::strerror(errno)}});
    }
}

void Reap(pid_t pid, int& status, rusage& usage) {
    while (::wait4(pid, &status, 0, &usage) < 0 && errno == EINTR) {
    }
}

double CpuSeconds(const rusage& usage) {
    return static_cast<double>(usage.ru_utime.tv_sec + usage.ru_stime.tv_sec) +
        static_cast<double>(usage.ru_utime.tv_usec + usage.ru_stime.tv_usec) / 1e6;
}

std::string ProbeRuntimeVersion(const std::string& interpreter) {
    try {
        bp::ipstream output;
        bp::child probe(bp::exe = interpreter,
                        bp::args = std::vector<std::string>{"--version"},
                        (bp::std_out & bp::std_err) > output);
        std::string line;
        std::getline(output, line);
        probe.wait();
        line = utils::Trim(line);
        if (probe.exit_code() == 0 && !line.empty()) {
            return line;
        }
    } catch (const std::system_error& ex) {
        utils::Log(utils::LogLevel::kWarn, "sandbox", "runtime version probe failed", {{"error", ex.what()}});
    }
    return kUnknownRuntime;
}

bp::environment BuildEnvironment(const SandboxSettings& settings,
                                 const fs::path& scratch,
                                 const fs::path& result_path) {
    // Starts empty; nothing from the parent process leaks in.
    bp::environment env;
    env["PYTHONHASHSEED"] = "0";
    env["PYTHONDONTWRITEBYTECODE"] = "1";
    env["PYTHONNOUSERSITE"] = "1";
    env["PYTHONUNBUFFERED"] = "1";
    env["PYTHONIOENCODING"] = "utf-8";
    env["LC_ALL"] = "C.UTF-8";
    env["LANG"] = "C.UTF-8";
    env["TZ"] = "UTC";
    env["PATH"] = "/usr/bin:/bin";
    env["HOME"] = scratch.string();
    env["TMPDIR"] = scratch.string();
    env["SANDFORGE_RESULT_PATH"] = result_path.string();
    if (!settings.module_whitelist.empty()) {
        env["PYTHONPATH"] = utils::Join(settings.module_whitelist, ":");
    }
    return env;
}

ExecutionResult InterpretOutcome(const fs::path& result_path, int exit_code, std::uint64_t memory_bytes) {
    ExecutionResult result{};
    std::ifstream input(result_path);
    nlohmann::json payload;
    if (input.is_open()) {
        payload = nlohmann::json::parse(input, nullptr, false);
    }
    const bool readable = payload.is_object() && payload.contains("status") && payload["status"].is_string();
    const auto status = readable ? payload["status"].get<std::string>() : std::string();
    if (status == "success") {
        result.status = ExecutionStatus::kSuccess;
        result.return_value = payload.value("result", nlohmann::json());
        return result;
    }
    if (status == "memory_exceeded" || (!readable && exit_code == kHarnessMemoryError)) {
        result.status = ExecutionStatus::kMemoryExceeded;
        result.stderr_text = "MemoryError: memory limit of " + std::to_string(memory_bytes) + " bytes exceeded";
        return result;
    }
    result.status = ExecutionStatus::kRuntimeError;
    if (status == "runtime_error") {
        const auto type = payload.value("error_type", std::string("Exception"));
        const auto message = payload.value("error", std::string());
        result.stderr_text = message.empty() ? type : type + ": " + message;
    } else {
        result.stderr_text = "InterpreterError: harness exited with code " + std::to_string(exit_code);
    }
    return result;
}

}  // namespace

ExecutionResult ClassifySignal(int signal,
                               double cpu_seconds,
                               double cpu_limit_seconds,
                               std::uint64_t max_rss_bytes,
                               std::uint64_t memory_limit_bytes) {
    ExecutionResult result{};
    if (signal == SIGXCPU || (signal == SIGKILL && cpu_seconds >= cpu_limit_seconds)) {
        result.status = ExecutionStatus::kTimeout;
        return result;
    }
    if (signal == SIGKILL && memory_limit_bytes > 0 && max_rss_bytes >= memory_limit_bytes / 10 * 9) {
        result.status = ExecutionStatus::kMemoryExceeded;
        result.stderr_text = "MemoryError: process killed after exceeding its memory limit";
        return result;
    }
    result.status = ExecutionStatus::kRuntimeError;
    result.stderr_text = "InterpreterError: terminated by signal " + std::to_string(signal);
    return result;
}

std::string FindInterpreter(const std::string& python) {
    if (python.find('/') != std::string::npos) {
        return ::access(python.c_str(), X_OK) == 0 ? python : std::string();
    }
    return bp::search_path(python).string();
}

ProcessSandbox::ProcessSandbox(SandboxSettings settings)
    : settings_(std::move(settings))
    , interpreter_(FindInterpreter(settings_.python)) {
    if (interpreter_.empty()) {
        throw ConfigError("sandbox: interpreter '" + settings_.python + "' not found");
    }
    runtime_version_ = settings_.runtime_version.empty()
        ? ProbeRuntimeVersion(interpreter_)
        : settings_.runtime_version;
    if (settings_.confine_filesystem) {
        landlock_abi_ = LandlockAbiVersion();
        if (landlock_abi_ == 0) {
            throw ConfigError("sandbox: filesystem confinement requires Landlock, which this kernel does not provide");
        }
    }
    if (settings_.isolate_network) {
        network_ = DetectNetworkIsolation();
        if (network_ == NetworkIsolation::kNone) {
            utils::Log(utils::LogLevel::kWarn, "sandbox",
                       "no network namespace available, relying on socket interception only");
        }
    }
    utils::Log(utils::LogLevel::kDebug, "sandbox", "process sandbox ready",
               {{"interpreter", interpreter_},
                {"runtime", runtime_version_},
                {"landlock_abi", std::to_string(landlock_abi_)},
                {"network", ToString(network_)}});
}

ExecutionResult ProcessSandbox::Run(const ExecutionRequest& request, const CancellationToken& token) {
    if (token.IsCancelled()) {
        throw Cancelled("execution cancelled before start");
    }
    ScratchDirectory scratch(settings_.scratch_root);
    const auto harness_path = scratch.Path() / "harness.py";
    const auto candidate_path = scratch.Path() / "candidate.py";
    const auto context_path = scratch.Path() / "context.json";
    const auto result_path = scratch.Path() / "result.json";
    const auto stdout_path = scratch.Path() / "stdout.log";
    const auto stderr_path = scratch.Path() / "stderr.log";
    WriteFile(harness_path, HarnessScript());
    WriteFile(candidate_path, request.code);
    WriteFile(context_path, request.context.is_null() ? std::string("{}") : request.context.dump());

    const auto timeout = request.limits.timeout;
    const rlim_t memory_limit = static_cast<rlim_t>(request.limits.memory_bytes);
    const rlim_t cpu_limit = static_cast<rlim_t>(
        std::max<long long>(1, static_cast<long long>(std::ceil(timeout.count() / 1000.0))));
    const rlim_t file_limit = static_cast<rlim_t>(settings_.max_file_bytes);
    const rlim_t process_limit = static_cast<rlim_t>(settings_.max_processes);
    const rlim_t open_file_limit = static_cast<rlim_t>(settings_.max_open_files);
    const NetworkIsolation network = network_;
    const int landlock_abi = landlock_abi_;
    const std::string writable_dir = scratch.Path().string();

    const auto child_setup = [=](auto& exec) {
        ::setsid();
        // The CPU hard limit sits one second above the soft one so SIGXCPU
        // arrives first and a SIGKILL at the cap stays recognisable.
        const std::tuple<int, rlim_t, rlim_t> limits[] = {
            {RLIMIT_AS, memory_limit, memory_limit},
            {RLIMIT_CPU, cpu_limit, cpu_limit + 1},
            {RLIMIT_FSIZE, file_limit, file_limit},
            {RLIMIT_NPROC, process_limit, process_limit},
            {RLIMIT_NOFILE, open_file_limit, open_file_limit},
        };
        for (const auto& [resource, soft, hard] : limits) {
            const rlimit limit{soft, hard};
            if (::setrlimit(resource, &limit) != 0) {
                exec.set_error(std::error_code(errno, std::system_category()), "setrlimit failed");
                return;
            }
        }
        if (const int error = EnterNetworkIsolation(network); error != 0) {
            exec.set_error(std::error_code(error, std::system_category()), "network isolation failed");
            return;
        }
        if (landlock_abi > 0) {
            if (const int error = RestrictWritesBeneath(writable_dir.c_str(), landlock_abi); error != 0) {
                exec.set_error(std::error_code(error, std::system_category()), "filesystem confinement failed");
                return;
            }
        }
    };

    const auto start = std::chrono::steady_clock::now();
    const auto deadline = start + timeout;
    int status = 0;
    rusage usage{};
    bool timed_out = false;
    pid_t pid = -1;
    try {
        bp::child child(
            bp::exe = interpreter_,
            bp::args = std::vector<std::string>{
                "-B", "-S", harness_path.string(), candidate_path.string(), context_path.string()},
            BuildEnvironment(settings_, scratch.Path(), result_path),
            bp::start_dir = scratch.Path().string(),
            bp::std_in < bp::null,
            bp::std_out > stdout_path.string(),
            bp::std_err > stderr_path.string(),
            bp::extend::on_exec_setup = child_setup);
        pid = child.id();
        // Reaped by hand below; the handle must not try to terminate it again.
        child.detach();
    } catch (const std::system_error& ex) {
        throw Error(std::string("sandbox: failed to start interpreter: ") + ex.what());
    }

    while (true) {
        const auto waited = ::wait4(pid, &status, WNOHANG, &usage);
        if (waited == pid) {
            break;
        }
        if (waited < 0 && errno != EINTR) {
            KillGroup(pid);
            throw Error(std::string("sandbox: wait4 failed: ") + std::strerror(errno));
        }
        if (token.IsCancelled()) {
            KillGroup(pid);
            Reap(pid, status, usage);
            utils::Log(utils::LogLevel::kInfo, "sandbox", "execution cancelled",
                       {{"fingerprint", request.fingerprint}});
            throw Cancelled("execution cancelled");
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            timed_out = true;
            KillGroup(pid);
            Reap(pid, status, usage);
            break;
        }
        std::this_thread::sleep_for(kPollInterval);
    }
    // Nothing started by the candidate outlives the run.
    KillGroup(pid);

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    ExecutionResult result{};
    if (timed_out) {
        result.status = ExecutionStatus::kTimeout;
    } else if (WIFSIGNALED(status)) {
        // ru_maxrss is reported in kilobytes.
        result = ClassifySignal(WTERMSIG(status), CpuSeconds(usage), static_cast<double>(cpu_limit),
                                static_cast<std::uint64_t>(usage.ru_maxrss) * 1024, request.limits.memory_bytes);
    } else {
        result = InterpretOutcome(result_path, WEXITSTATUS(status), request.limits.memory_bytes);
    }

    result.stdout_text = ReadBounded(stdout_path, settings_.max_output_bytes);
    if (result.status == ExecutionStatus::kSuccess || result.status == ExecutionStatus::kTimeout) {
        result.stderr_text = ReadBounded(stderr_path, settings_.max_output_bytes);
    }
    result.duration_ms = std::min<std::int64_t>(elapsed.count(), timeout.count());
    result.cached = false;

    utils::Log(utils::LogLevel::kDebug, "sandbox", "execution finished",
               {{"fingerprint", request.fingerprint},
                {"status", ToString(result.status)},
                {"duration_ms", std::to_string(result.duration_ms)}});
    return result;
}

}  // namespace sandforge::sandbox
