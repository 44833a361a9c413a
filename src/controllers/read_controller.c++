#include "read_controller.h++"

using std::span, std::vector;

namespace Skein {

auto ReadController::counts_changed(uint64_t user_id) noexcept -> void {
  try {
    cache->invalidate(CachePattern::UnreadCounts{user_id});
  } catch (const std::exception& e) {
    spdlog::warn("Failed to invalidate unread counts of user {:x}: {}", user_id, e.what());
  }
}

auto ReadController::mark_read(uint64_t user_id, span<const ReadCandidate> messages) -> vector<ReadMarker> {
  vector<ReadMarker> created;
  {
    auto txn = db->open_write_txn();
    for (const auto& candidate : messages) {
      if (candidate.is_read) continue;
      if (!txn.get_message(candidate.message_id)) {
        spdlog::debug("Not marking nonexistent message {:x} read", candidate.message_id);
        continue;
      }
      if (txn.set_read(user_id, candidate.message_id, true)) {
        created.push_back({ user_id, candidate.message_id });
      }
    }
    txn.commit();
  }
  if (!created.empty()) counts_changed(user_id);
  EventPayload ids;
  ids.reserve(created.size());
  for (const auto& m : created) ids.push_back(m.message_id);
  event_bus->dispatch(Event::MessagesMarkedRead, user_id, std::move(ids));
  return created;
}

auto ReadController::mark_read(uint64_t user_id, span<const uint64_t> message_ids) -> vector<ReadMarker> {
  vector<ReadCandidate> candidates;
  candidates.reserve(message_ids.size());
  for (const auto id : message_ids) candidates.push_back({ id, false });
  return mark_read(user_id, candidates);
}

auto ReadController::mark_unread(uint64_t user_id, span<const uint64_t> message_ids) -> uint64_t {
  uint64_t removed = 0;
  {
    auto txn = db->open_write_txn();
    for (const auto id : message_ids) {
      if (txn.set_read(user_id, id, false)) removed++;
    }
    txn.commit();
  }
  spdlog::debug("Marked {:d} messages unread for user {:x}", removed, user_id);
  if (removed) counts_changed(user_id);
  event_bus->dispatch(Event::MessagesMarkedUnread, user_id, EventPayload(message_ids.begin(), message_ids.end()));
  return removed;
}

auto ReadController::is_read(uint64_t user_id, uint64_t message_id) -> bool {
  auto txn = db->open_read_txn();
  return txn.has_user_read_message(user_id, message_id);
}

auto ReadController::hide_thread(uint64_t user_id, uint64_t thread_id) -> bool {
  bool changed;
  {
    auto txn = db->open_write_txn();
    if (!txn.get_thread(thread_id)) throw ApiError("Thread does not exist", 404, fmt::format("Thread {:x} not found", thread_id));
    changed = txn.set_thread_hidden(user_id, thread_id, true);
    txn.commit();
  }
  if (changed) counts_changed(user_id);
  return changed;
}

auto ReadController::unhide_thread(uint64_t user_id, uint64_t thread_id) -> bool {
  bool changed;
  {
    auto txn = db->open_write_txn();
    changed = txn.set_thread_hidden(user_id, thread_id, false);
    txn.commit();
  }
  if (changed) counts_changed(user_id);
  return changed;
}

auto ReadController::count_unread(uint64_t user_id, span<const uint64_t> visible_forum_ids) -> UnreadCount {
  const auto key = UnreadCountKey::of(user_id, visible_forum_ids);
  return cache->fetch(key, [&] {
    UnreadCount count;
    auto txn = db->open_read_txn();
    for (const auto forum_id : key.forum_ids) {
      for (const uint64_t thread_id : txn.list_threads_of_forum(forum_id)) {
        const auto thread = txn.get_thread(thread_id);
        if (!thread || thread->get().archived()) continue;
        if (txn.has_user_hidden_thread(user_id, thread_id)) continue;
        uint64_t unread_here = 0;
        for (const uint64_t message_id : txn.list_messages_of_thread(thread_id)) {
          const auto message = txn.get_message(message_id);
          if (!message || message->get().deleted() || message->get().draft()) continue;
          if (message->get().forum() != forum_id) continue;
          if (txn.has_user_read_message(user_id, message_id)) continue;
          unread_here++;
        }
        count.messages += unread_here;
        if (unread_here) count.threads++;
      }
    }
    spdlog::debug("User {:x} has {:d} unread messages in {:d} threads", user_id, count.messages, count.threads);
    return count;
  });
}

}
