#pragma once

#include "core/types.hpp"
#include "nlohmann/json.hpp"

namespace sandforge {

nlohmann::json ToJson(const SourceLocation& location);
nlohmann::json ToJson(const Violation& violation);
nlohmann::json ToJson(const SecurityVerdict& verdict);
nlohmann::json ToJson(const ExecutionResult& result);
nlohmann::json ToJson(const OptimizationSuggestion& suggestion);
nlohmann::json ToJson(const ComplexityReport& report);
nlohmann::json ToJson(const TestReport& report);
nlohmann::json ToJson(const GenerationAttempt& attempt);

// Inverse of ToJson(ExecutionResult). Throws Error on malformed input.
ExecutionResult ExecutionResultFromJson(const nlohmann::json& json);

}  // namespace sandforge
