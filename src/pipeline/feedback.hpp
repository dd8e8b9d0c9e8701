#pragma once

#include <string>

#include "core/types.hpp"

namespace sandforge::pipeline {

// Text handed back to the generator after a failed attempt. Never contains
// interpreter tracebacks: execution errors are already reduced to one line.
std::string SecurityFeedback(const SecurityVerdict& verdict);
std::string ExecutionFeedback(const ExecutionResult& result);
std::string TestFeedback(const TestReport& report);

}  // namespace sandforge::pipeline
