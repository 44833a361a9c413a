#pragma once
#include "db/db.h++"
#include "services/cache.h++"
#include "services/event_bus.h++"

namespace Skein {

// A message id together with what the caller already knows about it.
// Candidates marked is_read are skipped without touching the store.
struct ReadCandidate {
  uint64_t message_id;
  bool is_read = false;
};

struct ReadMarker {
  uint64_t user_id, message_id;
  auto operator==(const ReadMarker&) const -> bool = default;
};

class ReadController {
private:
  std::shared_ptr<DB> db;
  std::shared_ptr<Cache> cache;
  std::shared_ptr<EventBus> event_bus;

  auto counts_changed(uint64_t user_id) noexcept -> void;

public:
  ReadController(
    std::shared_ptr<DB> db,
    std::shared_ptr<Cache> cache,
    std::shared_ptr<EventBus> event_bus = std::make_shared<DummyEventBus>()
  ) : db(db), cache(cache), event_bus(event_bus) {
    assert(db != nullptr);
    assert(cache != nullptr);
    assert(event_bus != nullptr);
  }

  // Returns only the markers this call created. Always broadcasts
  // MessagesMarkedRead with those ids, even when there are none.
  auto mark_read(uint64_t user_id, std::span<const ReadCandidate> messages) -> std::vector<ReadMarker>;
  auto mark_read(uint64_t user_id, std::span<const uint64_t> message_ids) -> std::vector<ReadMarker>;
  // Returns the number of markers removed.
  auto mark_unread(uint64_t user_id, std::span<const uint64_t> message_ids) -> uint64_t;
  auto is_read(uint64_t user_id, uint64_t message_id) -> bool;

  auto hide_thread(uint64_t user_id, uint64_t thread_id) -> bool;
  auto unhide_thread(uint64_t user_id, uint64_t thread_id) -> bool;

  // (unread threads, unread messages) over the given forums, from one read
  // transaction.
  auto count_unread(uint64_t user_id, std::span<const uint64_t> visible_forum_ids) -> UnreadCount;
};

}
