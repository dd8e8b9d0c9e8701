#include "core/json.hpp"

#include "core/errors.hpp"

namespace sandforge {

nlohmann::json ToJson(const SourceLocation& location) {
    return {{"line", location.line}, {"column", location.column}};
}

nlohmann::json ToJson(const Violation& violation) {
    return {
        {"rule_id", violation.rule_id},
        {"location", ToJson(violation.location)},
        {"severity", ToString(violation.severity)},
        {"message", violation.message}
    };
}

nlohmann::json ToJson(const SecurityVerdict& verdict) {
    nlohmann::json violations = nlohmann::json::array();
    for (const auto& violation : verdict.violations) {
        violations.push_back(ToJson(violation));
    }
    return {
        {"allowed", verdict.allowed},
        {"syntax_valid", verdict.syntax_valid},
        {"violations", violations}
    };
}

nlohmann::json ToJson(const ExecutionResult& result) {
    return {
        {"status", ToString(result.status)},
        {"return_value", result.return_value},
        {"stdout", result.stdout_text},
        {"stderr", result.stderr_text},
        {"duration_ms", result.duration_ms},
        {"cached", result.cached}
    };
}

nlohmann::json ToJson(const OptimizationSuggestion& suggestion) {
    return {
        {"type", suggestion.type},
        {"location", ToJson(suggestion.location)},
        {"message", suggestion.message}
    };
}

nlohmann::json ToJson(const ComplexityReport& report) {
    nlohmann::json suggestions = nlohmann::json::array();
    for (const auto& suggestion : report.suggestions) {
        suggestions.push_back(ToJson(suggestion));
    }
    nlohmann::json metrics = nlohmann::json::object();
    for (const auto& [name, value] : report.metrics) {
        metrics[name] = value;
    }
    return {
        {"score", report.score},
        {"rating", ToString(report.rating)},
        {"metrics", metrics},
        {"suggestions", suggestions}
    };
}

nlohmann::json ToJson(const TestReport& report) {
    nlohmann::json failures = nlohmann::json::array();
    for (const auto& failure : report.failures) {
        nlohmann::json entry = {
            {"name", failure.name},
            {"expected", failure.expected},
            {"actual", failure.actual}
        };
        if (!failure.error.empty()) {
            entry["error"] = failure.error;
        }
        failures.push_back(std::move(entry));
    }
    return {
        {"total", report.total},
        {"passed", report.passed},
        {"failed", report.failed},
        {"all_passed", report.AllPassed()},
        {"failures", failures}
    };
}

nlohmann::json ToJson(const GenerationAttempt& attempt) {
    nlohmann::json json = {
        {"attempt", attempt.attempt_index},
        {"code", attempt.candidate.source},
        {"validation", ToJson(attempt.verdict)},
        {"execution", attempt.execution ? ToJson(*attempt.execution) : nlohmann::json(nullptr)},
        {"test_results", attempt.tests ? ToJson(*attempt.tests) : nlohmann::json(nullptr)},
        {"complexity", attempt.complexity ? ToJson(*attempt.complexity) : nlohmann::json(nullptr)}
    };
    json["feedback"] = attempt.feedback.empty() ? nlohmann::json(nullptr) : nlohmann::json(attempt.feedback);
    return json;
}

ExecutionResult ExecutionResultFromJson(const nlohmann::json& json) {
    if (!json.is_object() || !json.contains("status") || !json["status"].is_string()) {
        throw Error("execution result: missing status");
    }
    const auto status = ParseExecutionStatus(json["status"].get<std::string>());
    if (!status) {
        throw Error("execution result: unknown status '" + json["status"].get<std::string>() + "'");
    }
    ExecutionResult result{};
    result.status = *status;
    result.return_value = json.value("return_value", nlohmann::json());
    result.stdout_text = json.value("stdout", std::string());
    result.stderr_text = json.value("stderr", std::string());
    result.duration_ms = json.value("duration_ms", static_cast<std::int64_t>(0));
    result.cached = json.value("cached", false);
    return result;
}

}  // namespace sandforge
