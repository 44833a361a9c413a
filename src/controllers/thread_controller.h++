#pragma once
#include "db/db.h++"
#include "models/thread_tree.h++"
#include "services/cache.h++"
#include "controllers/config_controller.h++"

namespace Skein {

// Read side of threads and messages. Everything returned here comes from
// the cache, populated from the store on a miss.
class ThreadController {
private:
  std::shared_ptr<DB> db;
  std::shared_ptr<Cache> cache;
  std::shared_ptr<ConfigController> config;

public:
  ThreadController(
    std::shared_ptr<DB> db,
    std::shared_ptr<Cache> cache,
    std::shared_ptr<ConfigController> config
  ) : db(db), cache(cache), config(config) {
    assert(db != nullptr);
    assert(cache != nullptr);
    assert(config != nullptr);
  }

  auto thread(uint64_t thread_id) -> ThreadKey::Value;
  auto message(uint64_t message_id) -> MessageKey::Value;

  auto build_tree(
    uint64_t thread_id,
    VisibilityFilter filter = {},
    MessageOrder order = MessageOrder::Ascending
  ) -> ThreadTreeKey::Value;
  // Sibling order comes from the sort_messages option as seen by this user
  // in this forum.
  auto build_tree_for(
    uint64_t thread_id,
    VisibilityFilter filter,
    std::optional<uint64_t> user_id,
    std::optional<uint64_t> forum_id
  ) -> ThreadTreeKey::Value;

  // Reloads a thread from the store after a committed write: the fresh
  // snapshot replaces the cached one, derived trees and the given message
  // snapshots are dropped. Cache failures are logged, not thrown; the
  // write has already happened.
  auto refresh_thread(uint64_t thread_id, std::span<const uint64_t> touched_messages = {}) noexcept -> bool;
};

}
