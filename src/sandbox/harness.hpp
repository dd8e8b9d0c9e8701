#pragma once

#include <string>

namespace sandforge::sandbox {

// Exit codes used by the harness script.
constexpr int kHarnessOk = 0;
constexpr int kHarnessRuntimeError = 1;
constexpr int kHarnessMemoryError = 3;

// Python wrapper that binds the context as globals, runs the candidate and
// writes {"status", "result" | "error_type", "error"} as JSON to the file named
// by SANDFORGE_RESULT_PATH. Invoked as: harness.py <candidate.py> <context.json>.
const std::string& HarnessScript();

}  // namespace sandforge::sandbox
