#pragma once

#include <array>
#include <atomic>
#include <memory>
#include <shared_mutex>
#include <unordered_map>

#include "cache/result_cache.hpp"

namespace sandforge::cache {

// In-process cache striped over independently locked shards, so lookups and
// writes for fingerprints in different shards never contend. Entries are
// immutable once published.
class MemoryResultCache : public ResultCache {
public:
    explicit MemoryResultCache(Clock clock = SystemClock());

    std::optional<ExecutionResult> Get(const std::string& fingerprint) override;
    std::optional<CacheEntry> Peek(const std::string& fingerprint) override;
    bool Put(const std::string& fingerprint,
             const ExecutionResult& result,
             std::chrono::seconds ttl = kDefaultTtl) override;
    CacheStats Stats() override;
    std::size_t Clear(std::optional<double> older_than_hours = std::nullopt) override;
    std::size_t PurgeExpired() override;
    std::string BackendId() const override { return "memory"; }

private:
    static constexpr std::size_t kShardCount = 16;

    struct Slot {
        std::shared_ptr<const CacheEntry> entry;
        std::shared_ptr<std::atomic<std::uint64_t>> hits;
    };

    struct Shard {
        mutable std::shared_mutex mutex;
        std::unordered_map<std::string, Slot> slots;
    };

    Shard& ShardFor(const std::string& fingerprint);

    Clock clock_;
    std::array<Shard, kShardCount> shards_;
    std::atomic<std::uint64_t> hits_{0};
    std::atomic<std::uint64_t> misses_{0};
};

}  // namespace sandforge::cache
