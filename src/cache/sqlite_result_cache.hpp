#pragma once

#include <filesystem>
#include <mutex>
#include <vector>

#include "cache/result_cache.hpp"
#include "sqlite3.h"

namespace sandforge::cache {

// Persistent cache, one row per fingerprint. Every operation is a single
// statement, so each write is atomic and racing writers for one fingerprint
// resolve inside SQLite. Safe to share between processes through WAL mode.
//
// Each call leases its own connection from a pool, so lookups never wait on
// one another and only concurrent writes queue, inside SQLite's write lock.
class SqliteResultCache : public ResultCache {
public:
    // Opens or creates the database; throws CacheUnavailable on failure.
    explicit SqliteResultCache(std::filesystem::path db_path, Clock clock = SystemClock());
    ~SqliteResultCache() override;

    SqliteResultCache(const SqliteResultCache&) = delete;
    SqliteResultCache& operator=(const SqliteResultCache&) = delete;

    std::optional<ExecutionResult> Get(const std::string& fingerprint) override;
    std::optional<CacheEntry> Peek(const std::string& fingerprint) override;
    bool Put(const std::string& fingerprint,
             const ExecutionResult& result,
             std::chrono::seconds ttl = kDefaultTtl) override;
    CacheStats Stats() override;
    std::size_t Clear(std::optional<double> older_than_hours = std::nullopt) override;
    std::size_t PurgeExpired() override;
    std::string BackendId() const override { return "sqlite:" + db_path_.string(); }

private:
    // Connection checked out for one call, handed back on destruction.
    class Lease {
    public:
        Lease(SqliteResultCache& owner, sqlite3* db) : owner_(owner), db_(db) {}
        ~Lease() { owner_.Release(db_); }

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        sqlite3* Get() const { return db_; }

    private:
        SqliteResultCache& owner_;
        sqlite3* db_;
    };

    sqlite3* Open();
    Lease Acquire();
    void Release(sqlite3* db);
    void EnsureSchema();
    std::int64_t NowSeconds() const;

    std::filesystem::path db_path_;
    Clock clock_;
    std::mutex pool_mutex_;
    std::vector<sqlite3*> idle_;
};

}  // namespace sandforge::cache
