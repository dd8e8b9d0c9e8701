#include "pipeline/serialization.hpp"

#include "core/errors.hpp"
#include "core/json.hpp"

namespace sandforge::pipeline {
namespace {

TestCase TestCaseFromJson(const nlohmann::json& json, std::size_t index) {
    const auto where = "request: test_cases[" + std::to_string(index) + "]";
    if (!json.is_object()) {
        throw Error(where + " must be an object");
    }
    if (!json.contains("expected")) {
        throw Error(where + " is missing \"expected\"");
    }
    TestCase test{};
    if (json.contains("name")) {
        if (!json["name"].is_string()) {
            throw Error(where + ".name must be a string");
        }
        test.name = json["name"].get<std::string>();
    }
    if (json.contains("input")) {
        test.input = json["input"];
    }
    test.expected = json["expected"];
    return test;
}

}  // namespace

PipelineRequest RequestFromJson(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw Error("request: expected a JSON object");
    }
    PipelineRequest request{};

    if (!json.contains("task_description") || !json["task_description"].is_string()) {
        throw Error("request: task_description must be a string");
    }
    request.task_description = json["task_description"].get<std::string>();
    if (request.task_description.empty()) {
        throw Error("request: task_description must not be empty");
    }

    if (json.contains("language")) {
        if (!json["language"].is_string()) {
            throw Error("request: language must be a string");
        }
        request.language = json["language"].get<std::string>();
    }
    if (json.contains("input_example")) {
        request.input_example = json["input_example"];
    }
    if (json.contains("expected_output")) {
        request.expected_output = json["expected_output"];
    }
    if (json.contains("max_attempts") && !json["max_attempts"].is_null()) {
        if (!json["max_attempts"].is_number_integer()) {
            throw Error("request: max_attempts must be an integer");
        }
        request.max_attempts = json["max_attempts"].get<int>();
    }
    if (json.contains("test_cases")) {
        const auto& cases = json["test_cases"];
        if (!cases.is_array()) {
            throw Error("request: test_cases must be an array");
        }
        for (std::size_t i = 0; i < cases.size(); ++i) {
            request.test_cases.push_back(TestCaseFromJson(cases[i], i));
        }
    }
    return request;
}

nlohmann::json ToJson(const StateTransition& transition) {
    return {
        {"from", ToString(transition.from)},
        {"to", ToString(transition.to)},
        {"attempt", transition.attempt}
    };
}

nlohmann::json ResponseToJson(const PipelineResult& result) {
    nlohmann::json json;
    json["success"] = result.success;

    const auto* selected = result.Selected();
    json["code"] = selected ? nlohmann::json(selected->candidate.source) : nlohmann::json();

    const bool tests_passed = selected && selected->execution &&
        selected->execution->status == ExecutionStatus::kSuccess &&
        selected->tests && selected->tests->AllPassed();
    if (selected && selected->tests) {
        const auto& tests = *selected->tests;
        json["test_results"] = {
            {"total", tests.total},
            {"passed", tests.passed},
            {"failed", tests.failed},
            {"all_passed", tests_passed}
        };
    } else {
        json["test_results"] = {{"total", 0}, {"passed", 0}, {"failed", 0}, {"all_passed", false}};
    }

    if (result.success && selected && selected->complexity) {
        const auto& report = *selected->complexity;
        json["complexity"] = {
            {"rating", ToString(report.rating)},
            {"score", report.score},
            {"metrics", report.metrics}
        };
    } else {
        json["complexity"] = nullptr;
    }

    json["validation"] = {
        {"syntax_valid", selected ? selected->verdict.syntax_valid : false},
        {"security_valid", selected ? selected->verdict.allowed : false},
        {"tests_passed", tests_passed}
    };

    json["attempts"] = nlohmann::json::array();
    for (const auto& attempt : result.attempts) {
        json["attempts"].push_back(sandforge::ToJson(attempt));
    }

    if (!result.success) {
        json["failure_reason"] = ToString(result.failure);
        json["error"] = result.error;
    }

    json["transitions"] = nlohmann::json::array();
    for (const auto& transition : result.transitions) {
        json["transitions"].push_back(ToJson(transition));
    }
    return json;
}

}  // namespace sandforge::pipeline
