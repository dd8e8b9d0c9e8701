#pragma once

#include "nlohmann/json.hpp"
#include "pipeline/orchestrator.hpp"

namespace sandforge::pipeline {

// Accepts {task_description, language?, input_example?, expected_output?,
// max_attempts?, test_cases?[{name?, input, expected}]}. Throws Error
// naming the offending field.
PipelineRequest RequestFromJson(const nlohmann::json& json);

// {success, code, test_results, complexity, validation, attempts,
//  failure_reason?, error?, transitions}
nlohmann::json ResponseToJson(const PipelineResult& result);

nlohmann::json ToJson(const StateTransition& transition);

}  // namespace sandforge::pipeline
