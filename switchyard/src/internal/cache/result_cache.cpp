#include "switchyard/internal/cache/result_cache.h"

#include <algorithm>
#include <utility>

namespace switchyard::internal::cache {

namespace {

constexpr std::uint64_t kFnvOffset = 14695981039346656037ull;
constexpr std::uint64_t kFnvPrime = 1099511628211ull;

std::uint64_t fnvMix(std::uint64_t hash, const std::string &bytes) noexcept {
  for (const char ch : bytes) {
    hash ^= static_cast<unsigned char>(ch);
    hash *= kFnvPrime;
  }
  return hash;
}

} // namespace

std::uint64_t fingerprint(const CacheKey &key) noexcept {
  std::uint64_t hash = fnvMix(kFnvOffset, key.normalized_input);
  hash ^= 0xffu;
  hash *= kFnvPrime;
  return fnvMix(hash, key.handler_name);
}

ResultCache::ResultCache(ResultCacheConfig config, base::ClockFn clock)
    : config_(config), clock_(std::move(clock)) {
  if (config_.capacity == 0) {
    return;
  }
  const std::size_t shard_count =
      std::clamp<std::size_t>(config_.shard_count, 1, config_.capacity);
  shards_.reserve(shard_count);
  for (std::size_t i = 0; i < shard_count; ++i) {
    shards_.push_back(std::make_unique<Shard>());
  }
}

ResultCache::~ResultCache() = default;

ResultCache::Shard &ResultCache::shardFor(const CacheKey &key) const {
  const std::uint64_t hash = fingerprint(key);
  return *shards_[static_cast<std::size_t>((hash >> 32) % shards_.size())];
}

bool ResultCache::removeLocked(Shard &shard, const CacheKey &key) {
  const auto it = shard.entries.find(key);
  if (it == shard.entries.end()) {
    return false;
  }
  shard.lru.erase(&it->second->node);
  shard.entries.erase(it);
  count_.fetch_sub(1, std::memory_order_relaxed);
  return true;
}

bool ResultCache::evictLeastRecent() {
  Shard *oldest = nullptr;
  std::uint64_t oldest_tick = 0;
  for (auto &shard : shards_) {
    std::lock_guard<std::mutex> lock(shard->mutex);
    const auto *node = shard->lru.leastRecent();
    if (node == nullptr) {
      continue;
    }
    const std::uint64_t tick = shard->entries.at(node->key)->last_used;
    if (oldest == nullptr || tick < oldest_tick) {
      oldest = shard.get();
      oldest_tick = tick;
    }
  }
  if (oldest == nullptr) {
    return false;
  }

  std::lock_guard<std::mutex> lock(oldest->mutex);
  const auto *victim = oldest->lru.leastRecent();
  if (victim == nullptr) {
    // Emptied since the scan; let the caller look again.
    return true;
  }
  const CacheKey victim_key = victim->key;
  removeLocked(*oldest, victim_key);
  evictions_.fetch_add(1, std::memory_order_relaxed);
  return true;
}

std::optional<std::string> ResultCache::get(const CacheKey &key) {
  if (shards_.empty()) {
    misses_.fetch_add(1, std::memory_order_relaxed);
    return std::nullopt;
  }
  const base::TimePoint now = clock_();
  Shard &shard = shardFor(key);
  std::lock_guard<std::mutex> lock(shard.mutex);

  const auto it = shard.entries.find(key);
  if (it == shard.entries.end()) {
    misses_.fetch_add(1, std::memory_order_relaxed);
    return std::nullopt;
  }
  Entry &entry = *it->second;
  if (now >= entry.expires_at) {
    shard.lru.erase(&entry.node);
    shard.entries.erase(it);
    count_.fetch_sub(1, std::memory_order_relaxed);
    expirations_.fetch_add(1, std::memory_order_relaxed);
    misses_.fetch_add(1, std::memory_order_relaxed);
    return std::nullopt;
  }
  entry.last_used = tick_.fetch_add(1, std::memory_order_relaxed);
  shard.lru.moveToFront(&entry.node);
  hits_.fetch_add(1, std::memory_order_relaxed);
  return entry.value;
}

void ResultCache::put(const CacheKey &key, std::string value,
                      std::optional<std::chrono::milliseconds> ttl) {
  const std::chrono::milliseconds lifetime = ttl.value_or(config_.default_ttl);
  if (shards_.empty() || lifetime.count() <= 0) {
    return;
  }
  const base::TimePoint expires_at = clock_() + lifetime;
  Shard &shard = shardFor(key);
  if (refresh(shard, key, value, expires_at)) {
    return;
  }

  // Reserve a slot, then make room without holding any shard lock.
  count_.fetch_add(1, std::memory_order_relaxed);
  while (count_.load(std::memory_order_relaxed) > config_.capacity) {
    if (!evictLeastRecent()) {
      break;
    }
  }

  std::lock_guard<std::mutex> lock(shard.mutex);
  if (const auto it = shard.entries.find(key); it != shard.entries.end()) {
    // Another thread inserted the key meanwhile; give the slot back.
    count_.fetch_sub(1, std::memory_order_relaxed);
    touchLocked(shard, *it->second, value, expires_at);
    return;
  }
  auto entry = std::make_unique<Entry>(key);
  entry->value = std::move(value);
  entry->expires_at = expires_at;
  entry->last_used = tick_.fetch_add(1, std::memory_order_relaxed);
  shard.lru.pushFront(&entry->node);
  shard.entries.emplace(key, std::move(entry));
  insertions_.fetch_add(1, std::memory_order_relaxed);
}

bool ResultCache::refresh(Shard &shard, const CacheKey &key, std::string &value,
                          base::TimePoint expires_at) {
  std::lock_guard<std::mutex> lock(shard.mutex);
  const auto it = shard.entries.find(key);
  if (it == shard.entries.end()) {
    return false;
  }
  touchLocked(shard, *it->second, value, expires_at);
  return true;
}

void ResultCache::touchLocked(Shard &shard, Entry &entry, std::string &value,
                              base::TimePoint expires_at) {
  entry.value = std::move(value);
  entry.expires_at = expires_at;
  entry.last_used = tick_.fetch_add(1, std::memory_order_relaxed);
  shard.lru.moveToFront(&entry.node);
}

bool ResultCache::erase(const CacheKey &key) {
  if (shards_.empty()) {
    return false;
  }
  Shard &shard = shardFor(key);
  std::lock_guard<std::mutex> lock(shard.mutex);
  return removeLocked(shard, key);
}

void ResultCache::clear() {
  for (auto &shard : shards_) {
    std::lock_guard<std::mutex> lock(shard->mutex);
    count_.fetch_sub(shard->entries.size(), std::memory_order_relaxed);
    shard->lru.reset();
    shard->entries.clear();
  }
}

std::size_t ResultCache::size() const {
  std::size_t total = 0;
  for (const auto &shard : shards_) {
    std::lock_guard<std::mutex> lock(shard->mutex);
    total += shard->entries.size();
  }
  return total;
}

CacheStats ResultCache::stats() const {
  CacheStats out;
  out.hits = hits_.load(std::memory_order_relaxed);
  out.misses = misses_.load(std::memory_order_relaxed);
  out.insertions = insertions_.load(std::memory_order_relaxed);
  out.evictions = evictions_.load(std::memory_order_relaxed);
  out.expirations = expirations_.load(std::memory_order_relaxed);
  out.size = size();
  return out;
}

} // namespace switchyard::internal::cache
