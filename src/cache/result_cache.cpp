#include "cache/result_cache.hpp"

namespace sandforge::cache {

nlohmann::json ToJson(const CacheStats& stats) {
    return {
        {"total_cached", stats.total_cached},
        {"hits", stats.hits},
        {"misses", stats.misses},
        {"avg_duration_ms", stats.avg_duration_ms},
        {"hit_rate", stats.hit_rate}
    };
}

bool IsCacheable(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::kSuccess:
        case ExecutionStatus::kRuntimeError:
            return true;
        case ExecutionStatus::kTimeout:
        case ExecutionStatus::kMemoryExceeded:
        case ExecutionStatus::kSecurityRejected:
            return false;
    }
    return false;
}

}  // namespace sandforge::cache
