#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace sandforge {

struct SourceLocation {
    int line = 0;
    int column = 0;
};

inline std::string ToString(const SourceLocation& location) {
    return std::to_string(location.line) + ":" + std::to_string(location.column);
}

struct CodeCandidate {
    std::string source;
    std::string language = "python";
    // Named external inputs bound as globals before the candidate runs.
    nlohmann::json context = nlohmann::json::object();
    int attempt_index = 0;
};

enum class Severity {
    kWarning,
    kError,
    kCritical
};

const char* ToString(Severity severity);

struct Violation {
    std::string rule_id;
    SourceLocation location;
    Severity severity = Severity::kError;
    std::string message;
};

struct SecurityVerdict {
    bool allowed = false;
    bool syntax_valid = false;
    std::vector<Violation> violations;
};

struct ExecutionLimits {
    std::chrono::milliseconds timeout{5000};
    std::uint64_t memory_bytes = 256ull * 1024 * 1024;
};

struct ExecutionRequest {
    std::string fingerprint;
    std::string code;
    nlohmann::json context = nlohmann::json::object();
    ExecutionLimits limits;
};

enum class ExecutionStatus {
    kSuccess,
    kRuntimeError,
    kTimeout,
    kMemoryExceeded,
    kSecurityRejected
};

const char* ToString(ExecutionStatus status);
std::optional<ExecutionStatus> ParseExecutionStatus(const std::string& value);

struct ExecutionResult {
    ExecutionStatus status = ExecutionStatus::kRuntimeError;
    nlohmann::json return_value;
    std::string stdout_text;
    std::string stderr_text;
    std::int64_t duration_ms = 0;
    bool cached = false;
};

struct CacheEntry {
    std::string fingerprint;
    ExecutionResult result;
    std::chrono::system_clock::time_point created_at;
    std::chrono::seconds ttl{0};
    std::uint64_t hit_count = 0;

    bool ExpiredAt(std::chrono::system_clock::time_point now) const {
        return now >= created_at + ttl;
    }
};

struct OptimizationSuggestion {
    std::string type;
    SourceLocation location;
    std::string message;
};

enum class ComplexityRating {
    kLow,
    kMedium,
    kHigh
};

const char* ToString(ComplexityRating rating);

struct ComplexityReport {
    double score = 0.0;
    ComplexityRating rating = ComplexityRating::kLow;
    std::map<std::string, double> metrics;
    std::vector<OptimizationSuggestion> suggestions;
};

struct TestCase {
    std::string name;
    nlohmann::json input = nlohmann::json::object();
    nlohmann::json expected;
};

struct TestFailure {
    std::string name;
    nlohmann::json expected;
    nlohmann::json actual;
    std::string error;
};

struct TestReport {
    int total = 0;
    int passed = 0;
    int failed = 0;
    std::vector<TestFailure> failures;

    bool AllPassed() const { return failed == 0; }
    double Ratio() const { return total == 0 ? 0.0 : static_cast<double>(passed) / total; }
};

struct GenerationAttempt {
    int attempt_index = 0;
    CodeCandidate candidate;
    SecurityVerdict verdict;
    std::optional<ExecutionResult> execution;
    std::optional<TestReport> tests;
    std::optional<ComplexityReport> complexity;
    std::string feedback;
};

}  // namespace sandforge
