#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

#include "cache/memory_result_cache.hpp"
#include "cache/sqlite_result_cache.hpp"
#include "core/errors.hpp"

namespace sandforge::cache {
namespace {

using namespace std::chrono_literals;

// Manually advanced wall clock shared with the cache under test.
class FakeClock {
public:
    FakeClock() : now_(std::chrono::system_clock::time_point(std::chrono::seconds(1'700'000'000))) {}

    Clock AsClock() {
        return [this] {
            std::lock_guard<std::mutex> lock(mutex_);
            return now_;
        };
    }

    void Advance(std::chrono::seconds delta) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ += delta;
    }

private:
    std::mutex mutex_;
    std::chrono::system_clock::time_point now_;
};

ExecutionResult Success(int value, std::int64_t duration_ms = 40) {
    ExecutionResult result{};
    result.status = ExecutionStatus::kSuccess;
    result.return_value = value;
    result.stdout_text = "out " + std::to_string(value) + "\n";
    result.duration_ms = duration_ms;
    return result;
}

std::filesystem::path TempDbPath(const std::string& name) {
    const auto dir = std::filesystem::temp_directory_path() /
        ("sandforge_cache_test_" + std::to_string(::getpid()));
    std::filesystem::create_directories(dir);
    const auto path = dir / (name + ".db");
    std::filesystem::remove(path);
    std::filesystem::remove(path.string() + "-wal");
    std::filesystem::remove(path.string() + "-shm");
    return path;
}

struct MemoryBackend {
    static std::unique_ptr<ResultCache> Make(Clock clock, const std::string&) {
        return std::make_unique<MemoryResultCache>(std::move(clock));
    }
};

struct SqliteBackend {
    static std::unique_ptr<ResultCache> Make(Clock clock, const std::string& name) {
        return std::make_unique<SqliteResultCache>(TempDbPath(name), std::move(clock));
    }
};

template <typename Backend>
class ResultCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        cache_ = Backend::Make(clock_.AsClock(), std::string(info->test_suite_name()) + "_" + info->name());
    }

    FakeClock clock_;
    std::unique_ptr<ResultCache> cache_;
};

using Backends = ::testing::Types<MemoryBackend, SqliteBackend>;

class BackendNames {
public:
    template <typename T>
    static std::string GetName(int) {
        if (std::is_same_v<T, MemoryBackend>) {
            return "Memory";
        }
        return "Sqlite";
    }
};

TYPED_TEST_SUITE(ResultCacheTest, Backends, BackendNames);

TYPED_TEST(ResultCacheTest, MissThenHit) {
    EXPECT_FALSE(this->cache_->Get("fp").has_value());
    ASSERT_TRUE(this->cache_->Put("fp", Success(10)));

    const auto hit = this->cache_->Get("fp");
    ASSERT_TRUE(hit.has_value());
    EXPECT_TRUE(hit->cached);
    EXPECT_EQ(hit->status, ExecutionStatus::kSuccess);
    EXPECT_EQ(hit->return_value, 10);
    EXPECT_EQ(hit->stdout_text, "out 10\n");
    EXPECT_LT(hit->duration_ms, 40);
}

TYPED_TEST(ResultCacheTest, RepeatedHitsAreIdentical) {
    ASSERT_TRUE(this->cache_->Put("fp", Success(10)));
    const auto first = this->cache_->Get("fp");
    const auto second = this->cache_->Get("fp");
    ASSERT_TRUE(first && second);
    EXPECT_EQ(first->return_value, second->return_value);
    EXPECT_EQ(first->stdout_text, second->stdout_text);
    EXPECT_EQ(first->stderr_text, second->stderr_text);
    EXPECT_EQ(first->status, second->status);
}

TYPED_TEST(ResultCacheTest, PutIsIdempotentForLiveEntries) {
    ASSERT_TRUE(this->cache_->Put("fp", Success(1)));
    EXPECT_FALSE(this->cache_->Put("fp", Success(2)));
    const auto hit = this->cache_->Get("fp");
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->return_value, 1);
}

TYPED_TEST(ResultCacheTest, ExpiredEntryReadsAsMissAndCanBeReplaced) {
    ASSERT_TRUE(this->cache_->Put("fp", Success(1), 60s));
    this->clock_.Advance(61s);
    EXPECT_FALSE(this->cache_->Get("fp").has_value());
    ASSERT_TRUE(this->cache_->Put("fp", Success(2), 60s));
    const auto hit = this->cache_->Get("fp");
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->return_value, 2);
}

TYPED_TEST(ResultCacheTest, OnlyDeterministicOutcomesAreStored) {
    ExecutionResult failed = Success(0);
    failed.status = ExecutionStatus::kRuntimeError;
    failed.stderr_text = "ZeroDivisionError: division by zero";
    EXPECT_TRUE(this->cache_->Put("runtime", failed));

    for (const auto status : {ExecutionStatus::kTimeout, ExecutionStatus::kMemoryExceeded,
                              ExecutionStatus::kSecurityRejected}) {
        ExecutionResult result = Success(0);
        result.status = status;
        EXPECT_FALSE(this->cache_->Put("other", result));
    }
    EXPECT_FALSE(this->cache_->Get("other").has_value());
    const auto stored = this->cache_->Get("runtime");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->stderr_text, "ZeroDivisionError: division by zero");
}

TYPED_TEST(ResultCacheTest, StatsTrackHitsMissesAndDurations) {
    ASSERT_TRUE(this->cache_->Put("a", Success(1, 100)));
    ASSERT_TRUE(this->cache_->Put("b", Success(2, 300)));
    ASSERT_TRUE(this->cache_->Get("a").has_value());
    ASSERT_TRUE(this->cache_->Get("a").has_value());
    ASSERT_TRUE(this->cache_->Get("b").has_value());
    EXPECT_FALSE(this->cache_->Get("c").has_value());

    const auto stats = this->cache_->Stats();
    EXPECT_EQ(stats.total_cached, 2u);
    EXPECT_EQ(stats.hits, 3u);
    EXPECT_EQ(stats.misses, 1u);
    EXPECT_DOUBLE_EQ(stats.avg_duration_ms, 200.0);
    EXPECT_DOUBLE_EQ(stats.hit_rate, 0.75);
}

TYPED_TEST(ResultCacheTest, PeekReportsHitCountWithoutCountingALookup) {
    ASSERT_TRUE(this->cache_->Put("fp", Success(1)));
    ASSERT_TRUE(this->cache_->Get("fp").has_value());
    ASSERT_TRUE(this->cache_->Get("fp").has_value());
    const auto entry = this->cache_->Peek("fp");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->hit_count, 2u);
    EXPECT_EQ(entry->fingerprint, "fp");
    EXPECT_EQ(this->cache_->Stats().hits, 2u);
}

TYPED_TEST(ResultCacheTest, ClearOlderThanKeepsNewerEntries) {
    ASSERT_TRUE(this->cache_->Put("old-1", Success(1), 72h));
    ASSERT_TRUE(this->cache_->Put("old-2", Success(2), 72h));
    this->clock_.Advance(25h);
    ASSERT_TRUE(this->cache_->Put("new", Success(3), 72h));
    this->clock_.Advance(1h);

    EXPECT_EQ(this->cache_->Clear(24.0), 2u);
    EXPECT_FALSE(this->cache_->Get("old-1").has_value());
    EXPECT_FALSE(this->cache_->Get("old-2").has_value());
    EXPECT_TRUE(this->cache_->Get("new").has_value());
}

TYPED_TEST(ResultCacheTest, ClearWithoutCutoffRemovesEverything) {
    ASSERT_TRUE(this->cache_->Put("a", Success(1)));
    ASSERT_TRUE(this->cache_->Put("b", Success(2)));
    EXPECT_EQ(this->cache_->Clear(), 2u);
    EXPECT_EQ(this->cache_->Stats().total_cached, 0u);
}

TYPED_TEST(ResultCacheTest, PurgeExpiredRemovesOnlyExpired) {
    ASSERT_TRUE(this->cache_->Put("short", Success(1), 10s));
    ASSERT_TRUE(this->cache_->Put("long", Success(2), 1h));
    this->clock_.Advance(11s);
    EXPECT_EQ(this->cache_->PurgeExpired(), 1u);
    EXPECT_TRUE(this->cache_->Get("long").has_value());
}

TYPED_TEST(ResultCacheTest, ConcurrentWritersToOneFingerprintHaveOneWinner) {
    constexpr int kWriters = 8;
    std::atomic<int> winners{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < kWriters; ++i) {
        threads.emplace_back([this, i, &winners] {
            if (this->cache_->Put("shared", Success(i))) {
                winners.fetch_add(1);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(winners.load(), 1);
    const auto hit = this->cache_->Get("shared");
    ASSERT_TRUE(hit.has_value());
    EXPECT_TRUE(hit->return_value.is_number_integer());
}

TYPED_TEST(ResultCacheTest, ConcurrentDisjointWritesAllLand) {
    constexpr int kWriters = 8;
    std::vector<std::thread> threads;
    for (int i = 0; i < kWriters; ++i) {
        threads.emplace_back([this, i] {
            EXPECT_TRUE(this->cache_->Put("fp-" + std::to_string(i), Success(i)));
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    for (int i = 0; i < kWriters; ++i) {
        const auto hit = this->cache_->Get("fp-" + std::to_string(i));
        ASSERT_TRUE(hit.has_value());
        EXPECT_EQ(hit->return_value, i);
    }
}

TEST(SqliteResultCacheTest, EntriesSurviveReopen) {
    const auto path = TempDbPath("reopen");
    {
        SqliteResultCache cache(path);
        ASSERT_TRUE(cache.Put("fp", Success(7)));
        ASSERT_TRUE(cache.Get("fp").has_value());
    }
    SqliteResultCache reopened(path);
    const auto hit = reopened.Get("fp");
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->return_value, 7);
    EXPECT_EQ(reopened.Stats().hits, 2u);
}

TEST(SqliteResultCacheTest, LookupInFlightDoesNotBlockOtherFingerprints) {
    std::promise<void> release;
    const auto released = release.get_future().share();
    std::atomic<std::thread::id> stalled_thread{};
    std::atomic<bool> entered{false};
    std::atomic<bool> released_in_time{false};
    const auto fixed = std::chrono::system_clock::time_point(std::chrono::seconds(1'700'000'000));
    SqliteResultCache cache(TempDbPath("leases"), [&] {
        if (std::this_thread::get_id() == stalled_thread.load()) {
            entered = true;
            released_in_time = released.wait_for(5s) == std::future_status::ready;
        }
        return fixed;
    });

    std::thread stalled([&] {
        stalled_thread = std::this_thread::get_id();
        EXPECT_FALSE(cache.Get("fp-a").has_value());
    });
    for (int i = 0; i < 500 && !entered; ++i) {
        std::this_thread::sleep_for(10ms);
    }
    ASSERT_TRUE(entered);
    EXPECT_TRUE(cache.Put("fp-b", Success(2)));
    const auto hit = cache.Get("fp-b");
    release.set_value();
    stalled.join();

    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->return_value, 2);
    EXPECT_TRUE(released_in_time);
}

TEST(SqliteResultCacheTest, OpenReadTransactionDoesNotBlockWriters) {
    const auto path = TempDbPath("reader");
    SqliteResultCache cache(path);
    ASSERT_TRUE(cache.Put("fp-old", Success(1)));

    sqlite3* reader = nullptr;
    ASSERT_EQ(sqlite3_open(path.string().c_str(), &reader), SQLITE_OK);
    ASSERT_EQ(sqlite3_exec(reader, "BEGIN; SELECT COUNT(*) FROM results;", nullptr, nullptr, nullptr), SQLITE_OK);

    const auto started = std::chrono::steady_clock::now();
    EXPECT_TRUE(cache.Put("fp-new", Success(2)));
    EXPECT_TRUE(cache.Get("fp-new").has_value());
    EXPECT_LT(std::chrono::steady_clock::now() - started, 2s);

    EXPECT_EQ(sqlite3_exec(reader, "COMMIT;", nullptr, nullptr, nullptr), SQLITE_OK);
    sqlite3_close(reader);
}

TEST(SqliteResultCacheTest, UnopenablePathThrowsCacheUnavailable) {
    EXPECT_THROW(SqliteResultCache("/proc/sandforge/cannot/create/cache.db"), CacheUnavailable);
}

}  // namespace
}  // namespace sandforge::cache
