#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "core/types.hpp"
#include "nlohmann/json.hpp"

namespace sandforge::cache {

constexpr std::chrono::seconds kDefaultTtl = std::chrono::hours(24);

using Clock = std::function<std::chrono::system_clock::time_point()>;

inline Clock SystemClock() {
    return [] { return std::chrono::system_clock::now(); };
}

struct CacheStats {
    std::uint64_t total_cached = 0;
    std::uint64_t hits = 0;
    std::uint64_t misses = 0;
    double avg_duration_ms = 0.0;
    double hit_rate = 0.0;
};

nlohmann::json ToJson(const CacheStats& stats);

// Only outcomes that depend on nothing but (code, context, runtime) are kept.
bool IsCacheable(ExecutionStatus status);

// Content-addressed store of execution results. Implementations are safe for
// concurrent use; a live entry is never replaced (first writer wins) and
// expired entries read as misses. Backend failures throw CacheUnavailable.
class ResultCache {
public:
    virtual ~ResultCache() = default;

    // On a hit the stored result comes back with cached=true and duration_ms
    // set to the lookup time.
    virtual std::optional<ExecutionResult> Get(const std::string& fingerprint) = 0;
    // Stored entry with its hit count, expired or not. Not counted as a lookup.
    virtual std::optional<CacheEntry> Peek(const std::string& fingerprint) = 0;
    // Returns false when a live entry already exists or the status is not
    // cacheable; the store is left untouched in both cases.
    virtual bool Put(const std::string& fingerprint,
                     const ExecutionResult& result,
                     std::chrono::seconds ttl = kDefaultTtl) = 0;
    virtual CacheStats Stats() = 0;
    // Deletes entries created strictly more than older_than_hours ago, or all
    // entries when unset. Returns the number deleted.
    virtual std::size_t Clear(std::optional<double> older_than_hours = std::nullopt) = 0;
    virtual std::size_t PurgeExpired() = 0;
    virtual std::string BackendId() const = 0;
};

}  // namespace sandforge::cache
