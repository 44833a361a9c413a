#include "thread_controller.h++"

using std::make_shared, std::optional, std::span;

namespace Skein {

auto ThreadController::thread(uint64_t thread_id) -> ThreadKey::Value {
  return cache->fetch(ThreadKey{thread_id}, [&] {
    auto txn = db->open_read_txn();
    return make_shared<const ThreadSnapshot>(ThreadSnapshot::load(txn, thread_id));
  });
}

auto ThreadController::message(uint64_t message_id) -> MessageKey::Value {
  return cache->fetch(MessageKey{message_id}, [&] {
    auto txn = db->open_read_txn();
    const auto message = txn.get_message(message_id);
    if (!message) throw ApiError("Message does not exist", 404, fmt::format("Message {:x} not found", message_id));
    return make_shared<const MessageSnapshot>(MessageSnapshot::from(message_id, *message));
  });
}

auto ThreadController::build_tree(
  uint64_t thread_id,
  VisibilityFilter filter,
  MessageOrder order
) -> ThreadTreeKey::Value {
  return cache->fetch(ThreadTreeKey{thread_id, filter, order}, [&] {
    return make_shared<const ThreadTree>(Skein::build_tree(thread(thread_id), filter, order));
  });
}

auto ThreadController::build_tree_for(
  uint64_t thread_id,
  VisibilityFilter filter,
  optional<uint64_t> user_id,
  optional<uint64_t> forum_id
) -> ThreadTreeKey::Value {
  const auto sort = config->resolve("sort_messages", user_id, forum_id);
  const auto order = sort == "descending" ? MessageOrder::Descending : MessageOrder::Ascending;
  return build_tree(thread_id, filter, order);
}

auto ThreadController::refresh_thread(uint64_t thread_id, span<const uint64_t> touched_messages) noexcept -> bool {
  try {
    auto txn = db->open_read_txn();
    const auto snapshot = make_shared<const ThreadSnapshot>(ThreadSnapshot::load(txn, thread_id));
    cache->invalidate(CachePattern::Thread{thread_id});
    cache->put(ThreadKey{thread_id}, snapshot);
    for (const auto id : touched_messages) {
      if (const auto m = snapshot->find(id)) cache->put(MessageKey{id}, make_shared<const MessageSnapshot>(*m));
      else cache->invalidate(MessageKey{id});
    }
    return true;
  } catch (const std::exception& e) {
    spdlog::warn("Failed to refresh cache for thread {:x}: {}", thread_id, e.what());
  }
  try {
    cache->invalidate(CachePattern::Thread{thread_id});
    for (const auto id : touched_messages) cache->invalidate(MessageKey{id});
  } catch (const std::exception& e) {
    spdlog::error("Cache for thread {:x} may be stale until its next write: {}", thread_id, e.what());
  }
  return false;
}

}
