#include <gtest/gtest.h>

#include <chrono>
#include <csignal>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <unistd.h>

#include "core/errors.hpp"
#include "sandbox/process_sandbox.hpp"
#include "sandbox/sandbox_executor.hpp"

namespace sandforge::sandbox {
namespace {

class ProcessSandboxTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (FindInterpreter("python3").empty()) {
            GTEST_SKIP() << "python3 is not installed";
        }
        SandboxSettings settings{};
        settings.runtime_version = "python-test";
        settings.confine_filesystem = LandlockAbiVersion() > 0;
        sandbox_ = std::make_unique<ProcessSandbox>(settings);
    }

    ExecutionResult Run(const std::string& code,
                        nlohmann::json context = nlohmann::json::object(),
                        std::chrono::milliseconds timeout = std::chrono::milliseconds(5000),
                        std::uint64_t memory_bytes = 256ull * 1024 * 1024) {
        ExecutionRequest request{};
        request.fingerprint = "test";
        request.code = code;
        request.context = std::move(context);
        request.limits.timeout = timeout;
        request.limits.memory_bytes = memory_bytes;
        return sandbox_->Run(request, token_);
    }

    std::unique_ptr<ProcessSandbox> sandbox_;
    CancellationToken token_;
};

TEST_F(ProcessSandboxTest, ReturnsResultFromBoundContext) {
    const auto result = Run("result = items[0]['json']['value'] * 2\n",
                            {{"items", nlohmann::json::array({{{"json", {{"value", 5}}}}})}});
    ASSERT_EQ(result.status, ExecutionStatus::kSuccess) << result.stderr_text;
    EXPECT_EQ(result.return_value, 10);
    EXPECT_FALSE(result.cached);
}

TEST_F(ProcessSandboxTest, CapturesStdout) {
    const auto result = Run("print('hello')\nresult = None\n");
    ASSERT_EQ(result.status, ExecutionStatus::kSuccess);
    EXPECT_EQ(result.stdout_text, "hello\n");
    EXPECT_TRUE(result.return_value.is_null());
}

TEST_F(ProcessSandboxTest, ReportsRuntimeErrorWithoutTraceback) {
    const auto result = Run("result = 1 / 0\n");
    ASSERT_EQ(result.status, ExecutionStatus::kRuntimeError);
    EXPECT_EQ(result.stderr_text, "ZeroDivisionError: division by zero");
}

TEST_F(ProcessSandboxTest, KillsRunawayLoopAtTimeout) {
    const auto started = std::chrono::steady_clock::now();
    const auto result = Run("while True:\n    pass\n", nlohmann::json::object(), std::chrono::milliseconds(300));
    EXPECT_EQ(result.status, ExecutionStatus::kTimeout);
    EXPECT_LE(result.duration_ms, 300);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(3));
}

TEST_F(ProcessSandboxTest, ReportsMemoryExhaustion) {
    const auto result = Run("blob = bytearray(2 * 1024 * 1024 * 1024)\nresult = len(blob)\n",
                            nlohmann::json::object(), std::chrono::milliseconds(5000), 128ull * 1024 * 1024);
    EXPECT_EQ(result.status, ExecutionStatus::kMemoryExceeded);
}

TEST_F(ProcessSandboxTest, BlocksSocketCreation) {
    const auto result = Run("import socket\nresult = socket.socket()\n");
    ASSERT_EQ(result.status, ExecutionStatus::kRuntimeError);
    EXPECT_NE(result.stderr_text.find("PermissionError"), std::string::npos);
}

TEST_F(ProcessSandboxTest, BlocksRawSocketModule) {
    const auto result = Run("import _socket\nresult = _socket.socket(2, 1).fileno() >= 0\n");
    ASSERT_EQ(result.status, ExecutionStatus::kRuntimeError);
    EXPECT_NE(result.stderr_text.find("PermissionError"), std::string::npos);
}

TEST_F(ProcessSandboxTest, DeniesWritesOutsideScratchDirectory) {
    if (LandlockAbiVersion() == 0) {
        GTEST_SKIP() << "Landlock is not available";
    }
    const auto target = std::filesystem::temp_directory_path() /
        ("sandforge-outside-" + std::to_string(::getpid()));
    std::filesystem::remove(target);
    const auto result = Run("with open('" + target.string() + "', 'w') as handle:\n"
                            "    handle.write('escaped')\n"
                            "result = 1\n");
    EXPECT_EQ(result.status, ExecutionStatus::kRuntimeError);
    EXPECT_NE(result.stderr_text.find("PermissionError"), std::string::npos) << result.stderr_text;
    EXPECT_FALSE(std::filesystem::exists(target));
    std::filesystem::remove(target);
}

TEST_F(ProcessSandboxTest, AllowsWritesInsideScratchDirectory) {
    const auto result = Run("with open('note.txt', 'w') as handle:\n"
                            "    handle.write('kept')\n"
                            "with open('note.txt') as handle:\n"
                            "    result = handle.read()\n");
    ASSERT_EQ(result.status, ExecutionStatus::kSuccess) << result.stderr_text;
    EXPECT_EQ(result.return_value, "kept");
}

TEST_F(ProcessSandboxTest, ForeignSignalIsNotReportedAsMemoryExhaustion) {
    const auto result = Run("import os\nos.kill(os.getpid(), 9)\n");
    EXPECT_EQ(result.status, ExecutionStatus::kRuntimeError);
    EXPECT_EQ(result.stderr_text, "InterpreterError: terminated by signal 9");
}

TEST_F(ProcessSandboxTest, RejectsUnserializableResult) {
    const auto result = Run("result = object()\n");
    ASSERT_EQ(result.status, ExecutionStatus::kRuntimeError);
    EXPECT_NE(result.stderr_text.find("not JSON serializable"), std::string::npos);
}

TEST_F(ProcessSandboxTest, CancellationStopsTheRun) {
    std::thread canceller([this] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        token_.Cancel();
    });
    EXPECT_THROW(Run("while True:\n    pass\n"), Cancelled);
    canceller.join();
}

TEST_F(ProcessSandboxTest, UsesConfiguredRuntimeVersion) {
    EXPECT_EQ(sandbox_->RuntimeVersion(), "python-test");
}

TEST(ProcessSandboxConfigTest, MissingInterpreterIsAConfigError) {
    SandboxSettings settings{};
    settings.python = "/nonexistent/python-interpreter";
    EXPECT_THROW(ProcessSandbox{settings}, ConfigError);
}

TEST(ProcessSandboxConfigTest, RequiredConfinementWithoutLandlockIsAConfigError) {
    if (FindInterpreter("python3").empty()) {
        GTEST_SKIP() << "python3 is not installed";
    }
    if (LandlockAbiVersion() > 0) {
        GTEST_SKIP() << "Landlock is available on this kernel";
    }
    SandboxSettings settings{};
    settings.runtime_version = "python-test";
    settings.confine_filesystem = true;
    EXPECT_THROW(ProcessSandbox{settings}, ConfigError);
}

TEST(ClassifySignalTest, CpuCapKillIsATimeout) {
    EXPECT_EQ(ClassifySignal(SIGXCPU, 0.5, 2.0, 0, 1 << 20).status, ExecutionStatus::kTimeout);
    EXPECT_EQ(ClassifySignal(SIGKILL, 3.0, 2.0, 0, 1 << 20).status, ExecutionStatus::kTimeout);
}

TEST(ClassifySignalTest, KillNearMemoryLimitIsMemoryExceeded) {
    const auto result = ClassifySignal(SIGKILL, 0.1, 2.0, 950u * 1024, 1000u * 1024);
    EXPECT_EQ(result.status, ExecutionStatus::kMemoryExceeded);
    EXPECT_NE(result.stderr_text.find("MemoryError"), std::string::npos);
}

TEST(ClassifySignalTest, OtherKillsAreRuntimeErrors) {
    const auto killed = ClassifySignal(SIGKILL, 0.1, 2.0, 10u * 1024, 1000u * 1024);
    EXPECT_EQ(killed.status, ExecutionStatus::kRuntimeError);
    EXPECT_EQ(killed.stderr_text, "InterpreterError: terminated by signal 9");
    EXPECT_EQ(ClassifySignal(SIGSEGV, 0.1, 2.0, 0, 1000u * 1024).status, ExecutionStatus::kRuntimeError);
}

class CountingBackend : public IsolationBackend {
public:
    ExecutionResult Run(const ExecutionRequest&, const CancellationToken&) override {
        ++calls;
        ExecutionResult result{};
        result.status = ExecutionStatus::kSuccess;
        result.return_value = 1;
        return result;
    }
    std::string RuntimeVersion() const override { return "fake-1"; }

    int calls = 0;
};

TEST(SandboxExecutorTest, RefusesRejectedVerdict) {
    CountingBackend backend;
    SandboxExecutor executor(backend, nullptr);
    CancellationToken token;
    SecurityVerdict rejected{};
    EXPECT_THROW(executor.Execute(CodeCandidate{"result = 1"}, rejected, ExecutionLimits{}, token),
                 SecurityViolation);
    EXPECT_EQ(backend.calls, 0);
}

TEST(SandboxExecutorTest, ExecutesAllowedCandidateWithoutCache) {
    CountingBackend backend;
    SandboxExecutor executor(backend, nullptr);
    CancellationToken token;
    SecurityVerdict allowed{true, true, {}};
    const auto result = executor.Execute(CodeCandidate{"result = 1"}, allowed, ExecutionLimits{}, token);
    EXPECT_EQ(result.return_value, 1);
    EXPECT_EQ(backend.calls, 1);
    EXPECT_FALSE(executor.CacheActive());
}

TEST(RaiseForStatusTest, MapsStatusesToErrors) {
    ExecutionResult result{};
    result.status = ExecutionStatus::kSuccess;
    EXPECT_NO_THROW(RaiseForStatus(result));
    result.status = ExecutionStatus::kTimeout;
    EXPECT_THROW(RaiseForStatus(result), ExecutionTimeout);
    result.status = ExecutionStatus::kMemoryExceeded;
    EXPECT_THROW(RaiseForStatus(result), ExecutionMemoryExceeded);
    result.status = ExecutionStatus::kRuntimeError;
    EXPECT_THROW(RaiseForStatus(result), ExecutionRuntimeError);
}

}  // namespace
}  // namespace sandforge::sandbox
