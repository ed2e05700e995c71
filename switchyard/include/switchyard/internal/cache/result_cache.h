#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "switchyard/internal/base/clock.h"
#include "switchyard/internal/base/lru_list.h"

namespace switchyard::internal::cache {

/**
 * @brief Configuration for ResultCache.
 */
struct ResultCacheConfig {
  /// Total entry limit across all shards; 0 disables caching.
  std::size_t capacity{100};

  /// Independent lock domains; clamped to [1, capacity]. The capacity bound
  /// is shared by all shards.
  std::size_t shard_count{8};

  /// Lifetime used when put() is called without an explicit ttl.
  std::chrono::milliseconds default_ttl{std::chrono::hours(1)};
};

/**
 * @brief Cache key: normalized request text plus the handler that produced the value.
 *
 * Both parts are compared on lookup, so two handlers can never read each
 * other's entries even if their fingerprints collide.
 */
struct CacheKey {
  std::string normalized_input;
  std::string handler_name;

  bool operator==(const CacheKey &) const = default;
};

/// 64-bit FNV-1a over both key parts with a separator byte between them.
std::uint64_t fingerprint(const CacheKey &key) noexcept;

struct CacheStats {
  std::uint64_t hits{0};
  std::uint64_t misses{0};
  std::uint64_t insertions{0};
  std::uint64_t evictions{0};
  std::uint64_t expirations{0};
  std::size_t size{0};

  [[nodiscard]] double hitRate() const noexcept {
    const auto lookups = hits + misses;
    return lookups == 0 ? 0.0
                        : static_cast<double>(hits) / static_cast<double>(lookups);
  }
};

/**
 * @brief Bounded in-memory cache of successful handler results.
 *
 * Entries leave the cache on TTL expiry, or on insertion into a full cache
 * when they are the least recently used entry across all shards. Only
 * successful values are stored; failures are never cached. Each shard has its
 * own mutex, held only for the map and list update; at most one shard mutex is
 * held at a time.
 */
class ResultCache {
public:
  explicit ResultCache(ResultCacheConfig config = {},
                       base::ClockFn clock = base::steadyClock());
  ~ResultCache();

  ResultCache(const ResultCache &) = delete;
  ResultCache &operator=(const ResultCache &) = delete;

  /// Value for `key`, or nullopt on miss. An expired entry is removed and counts as a miss.
  [[nodiscard]] std::optional<std::string> get(const CacheKey &key);

  /// Insert or refresh an entry. A non-positive ttl stores nothing.
  void put(const CacheKey &key, std::string value,
           std::optional<std::chrono::milliseconds> ttl = std::nullopt);

  /// @return true if an entry was removed.
  bool erase(const CacheKey &key);

  void clear();

  [[nodiscard]] std::size_t size() const;

  [[nodiscard]] CacheStats stats() const;

  [[nodiscard]] const ResultCacheConfig &config() const noexcept { return config_; }

private:
  struct Entry {
    explicit Entry(CacheKey key) : node(std::move(key)) {}

    base::LruNode<CacheKey> node;
    std::string value;
    base::TimePoint expires_at{};
    /// Global use tick; lower means less recently used.
    std::uint64_t last_used{0};
  };

  struct KeyHash {
    std::size_t operator()(const CacheKey &key) const noexcept {
      return static_cast<std::size_t>(fingerprint(key));
    }
  };

  struct Shard {
    std::mutex mutex;
    std::unordered_map<CacheKey, std::unique_ptr<Entry>, KeyHash> entries;
    base::LruList<CacheKey> lru;
  };

  Shard &shardFor(const CacheKey &key) const;
  bool removeLocked(Shard &shard, const CacheKey &key);
  /// Drop the least recently used entry of the whole cache. False if empty.
  bool evictLeastRecent();
  /// Update an existing entry in place. False if `key` is absent.
  bool refresh(Shard &shard, const CacheKey &key, std::string &value,
               base::TimePoint expires_at);
  void touchLocked(Shard &shard, Entry &entry, std::string &value, base::TimePoint expires_at);

  ResultCacheConfig config_;
  base::ClockFn clock_;
  std::vector<std::unique_ptr<Shard>> shards_;

  /// Entries stored plus slots reserved by in-flight insertions.
  std::atomic<std::size_t> count_{0};
  std::atomic<std::uint64_t> tick_{0};

  std::atomic<std::uint64_t> hits_{0};
  std::atomic<std::uint64_t> misses_{0};
  std::atomic<std::uint64_t> insertions_{0};
  std::atomic<std::uint64_t> evictions_{0};
  std::atomic<std::uint64_t> expirations_{0};
};

} // namespace switchyard::internal::cache
