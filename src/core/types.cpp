#include "core/types.hpp"

namespace sandforge {

const char* ToString(Severity severity) {
    switch (severity) {
        case Severity::kWarning: return "warning";
        case Severity::kError: return "error";
        case Severity::kCritical: return "critical";
    }
    return "unknown";
}

const char* ToString(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::kSuccess: return "success";
        case ExecutionStatus::kRuntimeError: return "runtime_error";
        case ExecutionStatus::kTimeout: return "timeout";
        case ExecutionStatus::kMemoryExceeded: return "memory_exceeded";
        case ExecutionStatus::kSecurityRejected: return "security_rejected";
    }
    return "unknown";
}

std::optional<ExecutionStatus> ParseExecutionStatus(const std::string& value) {
    if (value == "success") {
        return ExecutionStatus::kSuccess;
    }
    if (value == "runtime_error") {
        return ExecutionStatus::kRuntimeError;
    }
    if (value == "timeout") {
        return ExecutionStatus::kTimeout;
    }
    if (value == "memory_exceeded") {
        return ExecutionStatus::kMemoryExceeded;
    }
    if (value == "security_rejected") {
        return ExecutionStatus::kSecurityRejected;
    }
    return std::nullopt;
}

const char* ToString(ComplexityRating rating) {
    switch (rating) {
        case ComplexityRating::kLow: return "low";
        case ComplexityRating::kMedium: return "medium";
        case ComplexityRating::kHigh: return "high";
    }
    return "unknown";
}

}  // namespace sandforge
