#pragma once
#include "util/common.h++"
#include "db/db.h++"
#include "models/thread_tree.h++"
#include <atomic>
#include <map>
#include <memory>
#include <shared_mutex>
#include <span>
#include <variant>
#include <tbb/concurrent_hash_map.h>

namespace Skein {

using ConfigOptions = std::map<std::string, std::string, std::less<>>;

struct UnreadCount {
  uint64_t threads = 0, messages = 0;
  auto operator==(const UnreadCount&) const -> bool = default;
};

struct ThreadKey {
  uint64_t thread_id;
  using Value = std::shared_ptr<const ThreadSnapshot>;
  auto operator==(const ThreadKey&) const -> bool = default;
};

struct ThreadTreeKey {
  uint64_t thread_id;
  VisibilityFilter filter;
  MessageOrder order;
  using Value = std::shared_ptr<const ThreadTree>;
  auto operator==(const ThreadTreeKey&) const -> bool = default;
};

struct MessageKey {
  uint64_t message_id;
  using Value = std::shared_ptr<const MessageSnapshot>;
  auto operator==(const MessageKey&) const -> bool = default;
};

struct UnreadCountKey {
  uint64_t user_id;
  std::vector<uint64_t> forum_ids;
  using Value = UnreadCount;
  auto operator==(const UnreadCountKey&) const -> bool = default;

  // Forum ids are sorted and deduplicated so that the same set always makes
  // the same key.
  static auto of(uint64_t user_id, std::span<const uint64_t> forum_ids) -> UnreadCountKey {
    std::vector<uint64_t> ids(forum_ids.begin(), forum_ids.end());
    std::sort(ids.begin(), ids.end());
    ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
    return { user_id, std::move(ids) };
  }
};

struct ConfigKey {
  ConfigScope scope;
  uint64_t owner_id;
  using Value = std::shared_ptr<const ConfigOptions>;
  auto operator==(const ConfigKey&) const -> bool = default;
};

using CacheKey = std::variant<ThreadKey, ThreadTreeKey, MessageKey, UnreadCountKey, ConfigKey>;
using CacheValue = std::variant<
  ThreadKey::Value,
  ThreadTreeKey::Value,
  MessageKey::Value,
  UnreadCountKey::Value,
  ConfigKey::Value
>;

template <typename K> concept CacheKeyType =
  std::is_constructible_v<CacheKey, K> && std::is_constructible_v<CacheValue, typename K::Value>;

namespace CachePattern {
  // Every key derived from one thread's messages.
  struct Thread { uint64_t thread_id; };
  // Unread counts of one user, or of every user.
  struct UnreadCounts { std::optional<uint64_t> user_id; };
}
using CacheKeyPattern = std::variant<CachePattern::Thread, CachePattern::UnreadCounts>;

auto describe(const CacheKey& key) -> std::string;
auto matches(const CacheKeyPattern& pattern, const CacheKey& key) -> bool;

struct CacheStats {
  uint64_t hits, misses, stores, invalidations, discarded;
};

// Process-wide read-through cache. Values are immutable once stored; a
// mutation replaces or removes entries, it never edits them in place.
//
// There is no expiry. Every write path is responsible for invalidating or
// refreshing the keys it affects.
class Cache {
private:
  struct KeyHashCompare {
    static auto hash(const CacheKey& key) -> size_t;
    static auto equal(const CacheKey& a, const CacheKey& b) -> bool { return a == b; }
  };
  using Map = tbb::concurrent_hash_map<CacheKey, CacheValue, KeyHashCompare>;

  Map map;
  // Shared for single-key operations, exclusive for sweeps over the whole map.
  mutable std::shared_mutex sweep_lock;
  // Bumped before every put or invalidation. A fetch only stores what it
  // produced if no bump happened while its producer was running.
  std::atomic<uint64_t> generation = 0;
  mutable std::atomic<uint64_t> hits = 0, misses = 0;
  std::atomic<uint64_t> stores = 0, invalidations = 0, discarded = 0;

  auto lookup(const CacheKey& key) const -> std::optional<CacheValue>;
  auto store_if_current(const CacheKey& key, CacheValue&& value, uint64_t since_generation) -> bool;
  auto store(const CacheKey& key, CacheValue&& value) -> void;

public:
  Cache() = default;
  Cache(const Cache&) = delete;
  auto operator=(const Cache&) = delete;

  template <CacheKeyType K> auto get(const K& key) const -> std::optional<typename K::Value> {
    if (auto v = lookup(key)) return std::get<typename K::Value>(std::move(*v));
    return {};
  }

  // Returns the cached value, or runs `producer` and caches its result. The
  // producer runs without any cache lock held; if it throws, nothing is
  // cached and the exception propagates.
  template <CacheKeyType K, typename Fn> auto fetch(const K& key, Fn&& producer) -> typename K::Value {
    if (auto v = lookup(key)) return std::get<typename K::Value>(std::move(*v));
    const auto since = generation.load(std::memory_order_acquire);
    typename K::Value value = producer();
    store_if_current(key, CacheValue(value), since);
    return value;
  }

  template <CacheKeyType K> auto put(const K& key, typename K::Value value) -> void {
    store(key, CacheValue(std::move(value)));
  }

  auto invalidate(const CacheKey& key) -> bool;
  auto invalidate(const CacheKeyPattern& pattern) -> size_t;
  auto clear() -> void;

  auto size() const -> size_t;
  auto stats() const -> CacheStats;
};

}
