#include "pipeline/feedback.hpp"

#include <sstream>

#include "security/security_validator.hpp"

namespace sandforge::pipeline {
namespace {

constexpr std::size_t kMaxListedFailures = 5;
constexpr std::size_t kMaxValueChars = 300;

std::string Abbreviate(const nlohmann::json& value) {
    auto text = value.dump();
    if (text.size() > kMaxValueChars) {
        text = text.substr(0, kMaxValueChars) + "...";
    }
    return text;
}

}  // namespace

std::string SecurityFeedback(const SecurityVerdict& verdict) {
    std::ostringstream oss;
    oss << (verdict.syntax_valid ? "The code was rejected by the security check:"
                                 : "The code does not parse:");
    for (const auto& violation : verdict.violations) {
        oss << "\n- " << security::Describe(violation);
    }
    return oss.str();
}

std::string ExecutionFeedback(const ExecutionResult& result) {
    switch (result.status) {
        case ExecutionStatus::kSuccess:
            return "";
        case ExecutionStatus::kRuntimeError:
            return "The code raised an error while running: " +
                (result.stderr_text.empty() ? std::string("unknown error") : result.stderr_text);
        case ExecutionStatus::kTimeout:
            return "The code did not finish within the time limit. Avoid unbounded loops "
                   "and reduce the amount of work.";
        case ExecutionStatus::kMemoryExceeded:
            return "The code exceeded the memory limit. Avoid building large intermediate "
                   "structures.";
        case ExecutionStatus::kSecurityRejected:
            return "The code was rejected by the security policy.";
    }
    return "";
}

std::string TestFeedback(const TestReport& report) {
    std::ostringstream oss;
    oss << report.failed << " of " << report.total << " tests failed:";
    std::size_t listed = 0;
    for (const auto& failure : report.failures) {
        if (listed == kMaxListedFailures) {
            oss << "\n- ... " << (report.failures.size() - listed) << " more";
            break;
        }
        oss << "\n- " << failure.name << ": ";
        if (!failure.error.empty()) {
            oss << failure.error;
        } else {
            oss << "expected " << Abbreviate(failure.expected) << ", got " << Abbreviate(failure.actual);
        }
        ++listed;
    }
    return oss.str();
}

}  // namespace sandforge::pipeline
