#include "cache/memory_result_cache.hpp"

#include <functional>
#include <mutex>
#include <utility>

namespace sandforge::cache {

MemoryResultCache::MemoryResultCache(Clock clock) : clock_(std::move(clock)) {}

MemoryResultCache::Shard& MemoryResultCache::ShardFor(const std::string& fingerprint) {
    return shards_[std::hash<std::string>{}(fingerprint) % kShardCount];
}

std::optional<ExecutionResult> MemoryResultCache::Get(const std::string& fingerprint) {
    const auto started = std::chrono::steady_clock::now();
    auto& shard = ShardFor(fingerprint);
    const auto now = clock_();
    std::shared_ptr<const CacheEntry> entry;
    bool expired = false;
    {
        std::shared_lock<std::shared_mutex> lock(shard.mutex);
        const auto it = shard.slots.find(fingerprint);
        if (it != shard.slots.end()) {
            if (it->second.entry->ExpiredAt(now)) {
                expired = true;
            } else {
                entry = it->second.entry;
                it->second.hits->fetch_add(1);
            }
        }
    }
    if (expired) {
        std::unique_lock<std::shared_mutex> lock(shard.mutex);
        const auto it = shard.slots.find(fingerprint);
        if (it != shard.slots.end() && it->second.entry->ExpiredAt(now)) {
            shard.slots.erase(it);
        }
    }
    if (!entry) {
        misses_.fetch_add(1);
        return std::nullopt;
    }
    hits_.fetch_add(1);
    ExecutionResult result = entry->result;
    result.cached = true;
    result.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();
    return result;
}

std::optional<CacheEntry> MemoryResultCache::Peek(const std::string& fingerprint) {
    auto& shard = ShardFor(fingerprint);
    std::shared_lock<std::shared_mutex> lock(shard.mutex);
    const auto it = shard.slots.find(fingerprint);
    if (it == shard.slots.end()) {
        return std::nullopt;
    }
    CacheEntry entry = *it->second.entry;
    entry.hit_count = it->second.hits->load();
    return entry;
}

bool MemoryResultCache::Put(const std::string& fingerprint,
                            const ExecutionResult& result,
                            std::chrono::seconds ttl) {
    if (!IsCacheable(result.status)) {
        return false;
    }
    auto entry = std::make_shared<CacheEntry>();
    entry->fingerprint = fingerprint;
    entry->result = result;
    entry->result.cached = false;
    entry->created_at = clock_();
    entry->ttl = ttl;

    auto& shard = ShardFor(fingerprint);
    std::unique_lock<std::shared_mutex> lock(shard.mutex);
    const auto it = shard.slots.find(fingerprint);
    if (it != shard.slots.end() && !it->second.entry->ExpiredAt(entry->created_at)) {
        return false;
    }
    shard.slots[fingerprint] = Slot{std::move(entry), std::make_shared<std::atomic<std::uint64_t>>(0)};
    return true;
}

CacheStats MemoryResultCache::Stats() {
    const auto now = clock_();
    CacheStats stats{};
    double total_duration = 0.0;
    for (auto& shard : shards_) {
        std::shared_lock<std::shared_mutex> lock(shard.mutex);
        for (const auto& [fingerprint, slot] : shard.slots) {
            if (slot.entry->ExpiredAt(now)) {
                continue;
            }
            ++stats.total_cached;
            total_duration += static_cast<double>(slot.entry->result.duration_ms);
        }
    }
    stats.hits = hits_.load();
    stats.misses = misses_.load();
    if (stats.total_cached > 0) {
        stats.avg_duration_ms = total_duration / static_cast<double>(stats.total_cached);
    }
    const auto lookups = stats.hits + stats.misses;
    if (lookups > 0) {
        stats.hit_rate = static_cast<double>(stats.hits) / static_cast<double>(lookups);
    }
    return stats;
}

std::size_t MemoryResultCache::Clear(std::optional<double> older_than_hours) {
    const auto now = clock_();
    const auto cutoff = older_than_hours
        ? now - std::chrono::duration_cast<std::chrono::system_clock::duration>(
                    std::chrono::duration<double, std::ratio<3600>>(*older_than_hours))
        : now;
    std::size_t deleted = 0;
    for (auto& shard : shards_) {
        std::unique_lock<std::shared_mutex> lock(shard.mutex);
        if (!older_than_hours) {
            deleted += shard.slots.size();
            shard.slots.clear();
            continue;
        }
        for (auto it = shard.slots.begin(); it != shard.slots.end();) {
            if (it->second.entry->created_at < cutoff) {
                it = shard.slots.erase(it);
                ++deleted;
            } else {
                ++it;
            }
        }
    }
    return deleted;
}

std::size_t MemoryResultCache::PurgeExpired() {
    const auto now = clock_();
    std::size_t deleted = 0;
    for (auto& shard : shards_) {
        std::unique_lock<std::shared_mutex> lock(shard.mutex);
        for (auto it = shard.slots.begin(); it != shard.slots.end();) {
            if (it->second.entry->ExpiredAt(now)) {
                it = shard.slots.erase(it);
                ++deleted;
            } else {
                ++it;
            }
        }
    }
    return deleted;
}

}  // namespace sandforge::cache
