#pragma once

#include <string>

#include "core/types.hpp"
#include "sandbox/cancellation.hpp"

namespace sandforge::sandbox {

// Capability to run one validated candidate under resource limits. The
// concrete isolation technology lives behind this interface.
class IsolationBackend {
public:
    virtual ~IsolationBackend() = default;

    // Runs the request to completion, timeout or resource exhaustion; outcomes
    // are reported through ExecutionResult::status. Throws Cancelled when the
    // token fires, and Error when the isolation layer itself fails.
    virtual ExecutionResult Run(const ExecutionRequest& request, const CancellationToken& token) = 0;

    // Version tag of the execution environment, part of every fingerprint.
    virtual std::string RuntimeVersion() const = 0;
};

}  // namespace sandforge::sandbox
