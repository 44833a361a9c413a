#include "cache.h++"
#include <fmt/ranges.h>
#include <xxhash.h>

using std::optional, std::shared_lock, std::shared_mutex, std::string,
    std::unique_lock, std::vector;

namespace Skein {

auto describe(const CacheKey& key) -> string {
  using fmt::operator""_cf;
  return std::visit(overload{
    [](const ThreadKey& k) { return fmt::format("thread:{:x}"_cf, k.thread_id); },
    [](const ThreadTreeKey& k) {
      return fmt::format("thread-tree:{:x}:{}{}{}"_cf, k.thread_id, to_string(k.order),
        k.filter.include_deleted ? ":deleted" : "", k.filter.include_drafts ? ":drafts" : "");
    },
    [](const MessageKey& k) { return fmt::format("message:{:x}"_cf, k.message_id); },
    [](const UnreadCountKey& k) {
      return fmt::format("unread-count:{:x}:{:x}", k.user_id, fmt::join(k.forum_ids, ","));
    },
    [](const ConfigKey& k) { return fmt::format("config:{}:{:x}"_cf, to_string(k.scope), k.owner_id); },
  }, key);
}

auto matches(const CacheKeyPattern& pattern, const CacheKey& key) -> bool {
  return std::visit(overload{
    [&](const CachePattern::Thread& p) {
      return std::visit(overload{
        [&](const ThreadKey& k) { return k.thread_id == p.thread_id; },
        [&](const ThreadTreeKey& k) { return k.thread_id == p.thread_id; },
        [](const MessageKey&) { return false; },
        [](const UnreadCountKey&) { return false; },
        [](const ConfigKey&) { return false; },
      }, key);
    },
    [&](const CachePattern::UnreadCounts& p) {
      return std::visit(overload{
        [](const ThreadKey&) { return false; },
        [](const ThreadTreeKey&) { return false; },
        [](const MessageKey&) { return false; },
        [&](const UnreadCountKey& k) { return !p.user_id || *p.user_id == k.user_id; },
        [](const ConfigKey&) { return false; },
      }, key);
    },
  }, pattern);
}

auto Cache::KeyHashCompare::hash(const CacheKey& key) -> size_t {
  vector<uint64_t> words{ key.index() };
  std::visit(overload{
    [&](const ThreadKey& k) { words.push_back(k.thread_id); },
    [&](const ThreadTreeKey& k) {
      words.push_back(k.thread_id);
      words.push_back(
        (uint64_t)k.filter.include_deleted |
        (uint64_t)k.filter.include_drafts << 1 |
        (uint64_t)k.order << 2
      );
    },
    [&](const MessageKey& k) { words.push_back(k.message_id); },
    [&](const UnreadCountKey& k) {
      words.push_back(k.user_id);
      words.insert(words.end(), k.forum_ids.begin(), k.forum_ids.end());
    },
    [&](const ConfigKey& k) {
      words.push_back((uint64_t)k.scope);
      words.push_back(k.owner_id);
    },
  }, key);
  return (size_t)XXH3_64bits(words.data(), words.size() * sizeof(uint64_t));
}

auto Cache::lookup(const CacheKey& key) const -> optional<CacheValue> {
  shared_lock<shared_mutex> lock(sweep_lock);
  Map::const_accessor acc;
  if (map.find(acc, key)) {
    hits.fetch_add(1, std::memory_order_relaxed);
    return acc->second;
  }
  misses.fetch_add(1, std::memory_order_relaxed);
  return {};
}

auto Cache::store_if_current(const CacheKey& key, CacheValue&& value, uint64_t since_generation) -> bool {
  shared_lock<shared_mutex> lock(sweep_lock);
  Map::accessor acc;
  const bool inserted = map.insert(acc, key);
  if (generation.load(std::memory_order_acquire) != since_generation) {
    // Something was written or invalidated while the producer ran, so the
    // value may already be stale.
    if (inserted) map.erase(acc);
    discarded.fetch_add(1, std::memory_order_relaxed);
    spdlog::debug("Discarding fetched value for {}, cache changed while fetching", describe(key));
    return false;
  }
  acc->second = std::move(value);
  stores.fetch_add(1, std::memory_order_relaxed);
  return true;
}

auto Cache::store(const CacheKey& key, CacheValue&& value) -> void {
  generation.fetch_add(1, std::memory_order_acq_rel);
  shared_lock<shared_mutex> lock(sweep_lock);
  Map::accessor acc;
  map.insert(acc, key);
  acc->second = std::move(value);
  stores.fetch_add(1, std::memory_order_relaxed);
}

auto Cache::invalidate(const CacheKey& key) -> bool {
  generation.fetch_add(1, std::memory_order_acq_rel);
  shared_lock<shared_mutex> lock(sweep_lock);
  const bool erased = map.erase(key);
  if (erased) {
    invalidations.fetch_add(1, std::memory_order_relaxed);
    spdlog::debug("Invalidated {}", describe(key));
  }
  return erased;
}

auto Cache::invalidate(const CacheKeyPattern& pattern) -> size_t {
  generation.fetch_add(1, std::memory_order_acq_rel);
  unique_lock<shared_mutex> lock(sweep_lock);
  vector<CacheKey> doomed;
  for (const auto& [key, value] : map) {
    if (matches(pattern, key)) doomed.push_back(key);
  }
  for (const auto& key : doomed) map.erase(key);
  invalidations.fetch_add(doomed.size(), std::memory_order_relaxed);
  spdlog::debug("Invalidated {:d} cache entries by pattern", doomed.size());
  return doomed.size();
}

auto Cache::clear() -> void {
  generation.fetch_add(1, std::memory_order_acq_rel);
  unique_lock<shared_mutex> lock(sweep_lock);
  invalidations.fetch_add(map.size(), std::memory_order_relaxed);
  map.clear();
  spdlog::info("Cleared cache");
}

auto Cache::size() const -> size_t {
  shared_lock<shared_mutex> lock(sweep_lock);
  return map.size();
}

auto Cache::stats() const -> CacheStats {
  return {
    .hits = hits.load(std::memory_order_relaxed),
    .misses = misses.load(std::memory_order_relaxed),
    .stores = stores.load(std::memory_order_relaxed),
    .invalidations = invalidations.load(std::memory_order_relaxed),
    .discarded = discarded.load(std::memory_order_relaxed)
  };
}

}
