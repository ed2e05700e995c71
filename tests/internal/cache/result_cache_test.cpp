#include "switchyard/internal/cache/result_cache.h"

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "tests/internal/testing/manual_clock.h"

namespace cache = switchyard::internal::cache;
using namespace std::chrono_literals;

namespace {

cache::ResultCacheConfig singleShard(std::size_t capacity) {
  cache::ResultCacheConfig config;
  config.capacity = capacity;
  config.shard_count = 1;
  config.default_ttl = 1000ms;
  return config;
}

cache::CacheKey key(std::string input, std::string handler) {
  return cache::CacheKey{std::move(input), std::move(handler)};
}

} // namespace

// =============================================================================
// Lookups
// =============================================================================

TEST(ResultCache, MissThenHit) {
  switchyard::tests::ManualClock clock;
  cache::ResultCache results(singleShard(4), clock.fn());

  EXPECT_FALSE(results.get(key("audit the system", "SECURITY")).has_value());
  results.put(key("audit the system", "SECURITY"), "clean");
  const auto hit = results.get(key("audit the system", "SECURITY"));
  ASSERT_TRUE(hit.has_value());
  EXPECT_EQ(*hit, "clean");

  const auto stats = results.stats();
  EXPECT_EQ(stats.hits, 1u);
  EXPECT_EQ(stats.misses, 1u);
  EXPECT_EQ(stats.insertions, 1u);
  EXPECT_EQ(stats.size, 1u);
  EXPECT_DOUBLE_EQ(stats.hitRate(), 0.5);
}

TEST(ResultCache, HandlersNeverShareEntries) {
  cache::ResultCache results(singleShard(4));
  results.put(key("audit the system", "SECURITY"), "security says");
  results.put(key("audit the system", "LINTER"), "linter says");

  EXPECT_EQ(*results.get(key("audit the system", "SECURITY")), "security says");
  EXPECT_EQ(*results.get(key("audit the system", "LINTER")), "linter says");
  EXPECT_FALSE(results.get(key("audit the system", "MONITOR")).has_value());
  EXPECT_FALSE(results.get(key("audit the", "SECURITY")).has_value());
}

TEST(ResultCache, FingerprintSeparatesKeyParts) {
  EXPECT_NE(cache::fingerprint(key("ab", "c")), cache::fingerprint(key("a", "bc")));
  EXPECT_EQ(cache::fingerprint(key("ab", "c")), cache::fingerprint(key("ab", "c")));
}

TEST(ResultCache, PutRefreshesExistingEntry) {
  cache::ResultCache results(singleShard(4));
  results.put(key("q", "A"), "old");
  results.put(key("q", "A"), "new");
  EXPECT_EQ(*results.get(key("q", "A")), "new");
  EXPECT_EQ(results.size(), 1u);
  EXPECT_EQ(results.stats().insertions, 1u);
}

TEST(ResultCache, EraseAndClear) {
  cache::ResultCache results(singleShard(4));
  results.put(key("q1", "A"), "1");
  results.put(key("q2", "A"), "2");

  EXPECT_TRUE(results.erase(key("q1", "A")));
  EXPECT_FALSE(results.erase(key("q1", "A")));
  EXPECT_EQ(results.size(), 1u);

  results.clear();
  EXPECT_EQ(results.size(), 0u);
  EXPECT_FALSE(results.get(key("q2", "A")).has_value());
}

// =============================================================================
// Expiry and eviction
// =============================================================================

TEST(ResultCache, EntriesExpireAfterTtl) {
  switchyard::tests::ManualClock clock;
  cache::ResultCache results(singleShard(4), clock.fn());
  results.put(key("q", "A"), "value");
  results.put(key("q", "B"), "value", 5000ms);

  clock.advance(999ms);
  EXPECT_TRUE(results.get(key("q", "A")).has_value());

  clock.advance(1ms);
  EXPECT_FALSE(results.get(key("q", "A")).has_value());
  EXPECT_TRUE(results.get(key("q", "B")).has_value());

  const auto stats = results.stats();
  EXPECT_EQ(stats.expirations, 1u);
  EXPECT_EQ(stats.size, 1u);
}

TEST(ResultCache, NonPositiveTtlStoresNothing) {
  cache::ResultCache results(singleShard(4));
  results.put(key("q", "A"), "value", 0ms);
  results.put(key("q", "B"), "value", -5ms);
  EXPECT_EQ(results.size(), 0u);
}

TEST(ResultCache, EvictsLeastRecentlyUsed) {
  cache::ResultCache results(singleShard(2));
  results.put(key("q1", "A"), "1");
  results.put(key("q2", "A"), "2");

  // Touch q1 so q2 becomes the eviction candidate.
  EXPECT_TRUE(results.get(key("q1", "A")).has_value());
  results.put(key("q3", "A"), "3");

  EXPECT_TRUE(results.get(key("q1", "A")).has_value());
  EXPECT_FALSE(results.get(key("q2", "A")).has_value());
  EXPECT_TRUE(results.get(key("q3", "A")).has_value());
  EXPECT_EQ(results.stats().evictions, 1u);
  EXPECT_EQ(results.size(), 2u);
}

TEST(ResultCache, TotalSizeNeverExceedsCapacity) {
  cache::ResultCacheConfig config;
  config.capacity = 10;
  config.shard_count = 4;
  cache::ResultCache results(config);
  for (int i = 0; i < 200; ++i) {
    results.put(key("query " + std::to_string(i), "A"), "v");
    ASSERT_LE(results.size(), 10u);
  }
}

TEST(ResultCache, ShardsShareOneCapacity) {
  cache::ResultCache results;
  const std::size_t capacity = results.config().capacity;
  ASSERT_GT(results.config().shard_count, 1u);

  for (std::size_t i = 0; i + 1 < capacity; ++i) {
    results.put(key("query " + std::to_string(i), "H"), "v");
  }
  auto stats = results.stats();
  EXPECT_EQ(stats.evictions, 0u);
  EXPECT_EQ(stats.size, capacity - 1);

  results.put(key("query " + std::to_string(capacity - 1), "H"), "v");
  EXPECT_EQ(results.stats().evictions, 0u);
  EXPECT_EQ(results.size(), capacity);
}

TEST(ResultCache, EvictsLeastRecentlyUsedAcrossShards) {
  cache::ResultCacheConfig config;
  config.capacity = 16;
  config.shard_count = 4;
  cache::ResultCache results(config);
  for (int i = 0; i < 16; ++i) {
    results.put(key("query " + std::to_string(i), "H"), "v");
  }
  // Touch the oldest entry so "query 1" becomes the global eviction candidate.
  EXPECT_TRUE(results.get(key("query 0", "H")).has_value());

  results.put(key("query 16", "H"), "v");

  EXPECT_EQ(results.stats().evictions, 1u);
  EXPECT_EQ(results.size(), 16u);
  EXPECT_FALSE(results.get(key("query 1", "H")).has_value());
  EXPECT_TRUE(results.get(key("query 0", "H")).has_value());
  for (int i = 2; i <= 16; ++i) {
    EXPECT_TRUE(results.get(key("query " + std::to_string(i), "H")).has_value()) << i;
  }
}

TEST(ResultCache, ZeroCapacityDisablesCaching) {
  cache::ResultCacheConfig config;
  config.capacity = 0;
  cache::ResultCache results(config);
  results.put(key("q", "A"), "value");
  EXPECT_FALSE(results.get(key("q", "A")).has_value());
  EXPECT_EQ(results.size(), 0u);
  EXPECT_EQ(results.stats().misses, 1u);
}

TEST(ResultCache, ConcurrentAccessKeepsCountsConsistent) {
  cache::ResultCacheConfig config;
  config.capacity = 64;
  config.shard_count = 8;
  cache::ResultCache results(config);

  constexpr int kThreads = 4;
  constexpr int kOps = 500;
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&results, t] {
      for (int i = 0; i < kOps; ++i) {
        const auto k = key("q" + std::to_string(i % 32), "H" + std::to_string(t));
        if (!results.get(k)) {
          results.put(k, "v");
        }
      }
    });
  }
  for (auto &thread : threads) {
    thread.join();
  }

  const auto stats = results.stats();
  EXPECT_EQ(stats.hits + stats.misses, static_cast<std::uint64_t>(kThreads * kOps));
  EXPECT_LE(stats.size, 64u);
}
