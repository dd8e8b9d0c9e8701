#include "cache/sqlite_result_cache.hpp"

#include <cmath>
#include <utility>

#include "core/errors.hpp"
#include "core/json.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace sandforge::cache {
namespace {

constexpr const char* kCreateResults =
    "CREATE TABLE IF NOT EXISTS results ("
    "fingerprint TEXT PRIMARY KEY,"
    "result_json TEXT NOT NULL,"
    "duration_ms INTEGER NOT NULL,"
    "created_at INTEGER NOT NULL,"
    "ttl_s INTEGER NOT NULL,"
    "hit_count INTEGER NOT NULL DEFAULT 0"
    ");";

constexpr const char* kCreateCounters =
    "CREATE TABLE IF NOT EXISTS counters ("
    "name TEXT PRIMARY KEY,"
    "value INTEGER NOT NULL"
    ");";

// Replaces a row only when the existing one has expired.
constexpr const char* kUpsert =
    "INSERT INTO results(fingerprint, result_json, duration_ms, created_at, ttl_s, hit_count) "
    "VALUES(?1, ?2, ?3, ?4, ?5, 0) "
    "ON CONFLICT(fingerprint) DO UPDATE SET "
    "result_json=excluded.result_json, duration_ms=excluded.duration_ms, "
    "created_at=excluded.created_at, ttl_s=excluded.ttl_s, hit_count=0 "
    "WHERE results.created_at + results.ttl_s <= excluded.created_at;";

[[noreturn]] void Fail(sqlite3* db, const std::string& what) {
    const std::string detail = db ? sqlite3_errmsg(db) : "no database handle";
    throw CacheUnavailable("sqlite cache: " + what + ": " + detail);
}

// Owns a prepared statement for the duration of one call.
class Statement {
public:
    Statement(sqlite3* db, const char* sql) : db_(db) {
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            Fail(db_, "prepare failed");
        }
    }
    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void BindText(int index, const std::string& value) {
        Check(sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT));
    }
    void BindInt(int index, std::int64_t value) {
        Check(sqlite3_bind_int64(stmt_, index, value));
    }

    // True while rows are available.
    bool Step() {
        const auto rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) {
            return true;
        }
        if (rc != SQLITE_DONE) {
            Fail(db_, "step failed");
        }
        return false;
    }

    std::int64_t ColumnInt(int index) const { return sqlite3_column_int64(stmt_, index); }
    double ColumnDouble(int index) const { return sqlite3_column_double(stmt_, index); }
    std::string ColumnText(int index) const {
        const auto* text = sqlite3_column_text(stmt_, index);
        return text ? reinterpret_cast<const char*>(text) : std::string();
    }

private:
    void Check(int rc) {
        if (rc != SQLITE_OK) {
            Fail(db_, "bind failed");
        }
    }

    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

ExecutionResult DecodeResult(const std::string& text) {
    const auto json = nlohmann::json::parse(text, nullptr, false);
    if (json.is_discarded()) {
        throw CacheUnavailable("sqlite cache: stored result is not valid JSON");
    }
    try {
        return ExecutionResultFromJson(json);
    } catch (const Error& ex) {
        throw CacheUnavailable(std::string("sqlite cache: ") + ex.what());
    }
}

void Exec(sqlite3* db, const std::string& sql) {
    char* err = nullptr;
    const auto rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        const std::string detail = err ? err : "unknown error";
        sqlite3_free(err);
        throw CacheUnavailable("sqlite cache: exec failed: " + detail);
    }
}

void BumpCounter(sqlite3* db, const char* name) {
    Statement stmt(db,
                   "INSERT INTO counters(name, value) VALUES(?1, 1) "
                   "ON CONFLICT(name) DO UPDATE SET value = value + 1;");
    stmt.BindText(1, name);
    stmt.Step();
}

}  // namespace

SqliteResultCache::SqliteResultCache(std::filesystem::path db_path, Clock clock)
    : db_path_(std::move(db_path))
    , clock_(std::move(clock)) {
    EnsureSchema();
}

SqliteResultCache::~SqliteResultCache() {
    for (auto* db : idle_) {
        sqlite3_close(db);
    }
    idle_.clear();
}

sqlite3* SqliteResultCache::Open() {
    sqlite3* db = nullptr;
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX;
    if (sqlite3_open_v2(db_path_.string().c_str(), &db, flags, nullptr) != SQLITE_OK) {
        const std::string detail = db ? sqlite3_errmsg(db) : "out of memory";
        sqlite3_close(db);
        throw CacheUnavailable("sqlite cache: failed to open " + db_path_.string() + ": " + detail);
    }
    sqlite3_busy_timeout(db, 5000);
    try {
        Exec(db, "PRAGMA journal_mode=WAL;");
        Exec(db, "PRAGMA synchronous=NORMAL;");
    } catch (const CacheUnavailable&) {
        sqlite3_close(db);
        throw;
    }
    return db;
}

SqliteResultCache::Lease SqliteResultCache::Acquire() {
    {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        if (!idle_.empty()) {
            auto* db = idle_.back();
            idle_.pop_back();
            return Lease(*this, db);
        }
    }
    return Lease(*this, Open());
}

void SqliteResultCache::Release(sqlite3* db) {
    std::lock_guard<std::mutex> lock(pool_mutex_);
    idle_.push_back(db);
}

void SqliteResultCache::EnsureSchema() {
    if (db_path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(db_path_.parent_path(), ec);
        if (ec) {
            throw CacheUnavailable("sqlite cache: cannot create " + db_path_.parent_path().string() + ": " +
                                   ec.message());
        }
    }
    const auto db = Acquire();
    Exec(db.Get(), kCreateResults);
    Exec(db.Get(), kCreateCounters);
    Exec(db.Get(), "CREATE INDEX IF NOT EXISTS idx_results_created ON results(created_at);");
    utils::Log(utils::LogLevel::kDebug, "cache", "sqlite cache opened", {{"path", db_path_.string()}});
}

std::int64_t SqliteResultCache::NowSeconds() const {
    return utils::ToUnixSeconds(clock_());
}

std::optional<ExecutionResult> SqliteResultCache::Get(const std::string& fingerprint) {
    const auto started = std::chrono::steady_clock::now();
    const auto lease = Acquire();
    sqlite3* db = lease.Get();
    const auto now = NowSeconds();
    std::string text;
    {
        Statement select(db,
                         "SELECT result_json FROM results "
                         "WHERE fingerprint = ?1 AND created_at + ttl_s > ?2;");
        select.BindText(1, fingerprint);
        select.BindInt(2, now);
        if (select.Step()) {
            text = select.ColumnText(0);
        }
    }
    if (text.empty()) {
        Statement purge(db, "DELETE FROM results WHERE fingerprint = ?1 AND created_at + ttl_s <= ?2;");
        purge.BindText(1, fingerprint);
        purge.BindInt(2, now);
        purge.Step();
        BumpCounter(db, "misses");
        return std::nullopt;
    }
    Statement touch(db, "UPDATE results SET hit_count = hit_count + 1 WHERE fingerprint = ?1;");
    touch.BindText(1, fingerprint);
    touch.Step();
    BumpCounter(db, "hits");

    auto result = DecodeResult(text);
    result.cached = true;
    result.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();
    return result;
}

std::optional<CacheEntry> SqliteResultCache::Peek(const std::string& fingerprint) {
    const auto lease = Acquire();
    sqlite3* db = lease.Get();
    Statement select(db,
                     "SELECT result_json, created_at, ttl_s, hit_count FROM results WHERE fingerprint = ?1;");
    select.BindText(1, fingerprint);
    if (!select.Step()) {
        return std::nullopt;
    }
    CacheEntry entry{};
    entry.fingerprint = fingerprint;
    entry.result = DecodeResult(select.ColumnText(0));
    entry.created_at = utils::FromUnixSeconds(select.ColumnInt(1));
    entry.ttl = std::chrono::seconds(select.ColumnInt(2));
    entry.hit_count = static_cast<std::uint64_t>(select.ColumnInt(3));
    return entry;
}

bool SqliteResultCache::Put(const std::string& fingerprint,
                            const ExecutionResult& result,
                            std::chrono::seconds ttl) {
    if (!IsCacheable(result.status)) {
        return false;
    }
    auto stored = result;
    stored.cached = false;
    const auto text = ToJson(stored).dump();

    const auto lease = Acquire();
    sqlite3* db = lease.Get();
    Statement upsert(db, kUpsert);
    upsert.BindText(1, fingerprint);
    upsert.BindText(2, text);
    upsert.BindInt(3, stored.duration_ms);
    upsert.BindInt(4, NowSeconds());
    upsert.BindInt(5, ttl.count());
    upsert.Step();
    return sqlite3_changes(db) > 0;
}

CacheStats SqliteResultCache::Stats() {
    const auto lease = Acquire();
    sqlite3* db = lease.Get();
    CacheStats stats{};
    {
        Statement select(db,
                         "SELECT COUNT(*), COALESCE(AVG(duration_ms), 0) FROM results "
                         "WHERE created_at + ttl_s > ?1;");
        select.BindInt(1, NowSeconds());
        if (select.Step()) {
            stats.total_cached = static_cast<std::uint64_t>(select.ColumnInt(0));
            stats.avg_duration_ms = select.ColumnDouble(1);
        }
    }
    Statement counters(db, "SELECT name, value FROM counters;");
    while (counters.Step()) {
        const auto name = counters.ColumnText(0);
        const auto value = static_cast<std::uint64_t>(counters.ColumnInt(1));
        if (name == "hits") {
            stats.hits = value;
        } else if (name == "misses") {
            stats.misses = value;
        }
    }
    const auto lookups = stats.hits + stats.misses;
    if (lookups > 0) {
        stats.hit_rate = static_cast<double>(stats.hits) / static_cast<double>(lookups);
    }
    return stats;
}

std::size_t SqliteResultCache::Clear(std::optional<double> older_than_hours) {
    const auto lease = Acquire();
    sqlite3* db = lease.Get();
    if (!older_than_hours) {
        Statement wipe(db, "DELETE FROM results;");
        wipe.Step();
    } else {
        const auto cutoff = NowSeconds() - static_cast<std::int64_t>(std::llround(*older_than_hours * 3600.0));
        Statement prune(db, "DELETE FROM results WHERE created_at < ?1;");
        prune.BindInt(1, cutoff);
        prune.Step();
    }
    const auto deleted = static_cast<std::size_t>(sqlite3_changes(db));
    utils::Log(utils::LogLevel::kInfo, "cache", "cleared entries", {{"deleted", std::to_string(deleted)}});
    return deleted;
}

std::size_t SqliteResultCache::PurgeExpired() {
    const auto lease = Acquire();
    sqlite3* db = lease.Get();
    Statement purge(db, "DELETE FROM results WHERE created_at + ttl_s <= ?1;");
    purge.BindInt(1, NowSeconds());
    purge.Step();
    return static_cast<std::size_t>(sqlite3_changes(db));
}

}  // namespace sandforge::cache
