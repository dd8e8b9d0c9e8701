#pragma once

#include <atomic>

namespace sandforge::sandbox {

// Shared between a caller and one pipeline run. Cancel() may be called from
// any thread; the sandbox wait loop and the orchestrator poll it.
class CancellationToken {
public:
    void Cancel() { cancelled_.store(true); }
    bool IsCancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

}  // namespace sandforge::sandbox
