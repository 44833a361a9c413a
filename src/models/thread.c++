#include "thread.h++"

using std::string;

namespace Skein {

auto ThreadSnapshot::find(uint64_t message_id) const -> const MessageSnapshot* {
  const auto it = std::lower_bound(messages.begin(), messages.end(), message_id,
    [](const MessageSnapshot& m, uint64_t id) { return m.id < id; });
  if (it == messages.end() || it->id != message_id) return nullptr;
  return &*it;
}

auto ThreadSnapshot::load(ReadTxn& txn, uint64_t id) -> ThreadSnapshot {
  const auto thread_opt = txn.get_thread(id);
  if (!thread_opt) throw ApiError("Thread does not exist", 404, fmt::format("Thread {:x} not found", id));
  const auto& thread = thread_opt->get();
  ThreadSnapshot s {
    .id = id,
    .forum_id = thread.forum(),
    .root_id = thread.root(),
    .slug = thread.slug() ? thread.slug()->str() : string(),
    .archived = thread.archived(),
    .created_at = thread.created_at(),
    .latest_message = thread.latest_message(),
    .messages = {}
  };
  for (const uint64_t message_id : txn.list_messages_of_thread(id)) {
    if (const auto message = txn.get_message(message_id)) {
      s.messages.push_back(MessageSnapshot::from(message_id, *message));
    } else {
      spdlog::warn("Thread {:x} lists message {:x}, which does not exist", id, message_id);
    }
  }
  std::sort(s.messages.begin(), s.messages.end(),
    [](const MessageSnapshot& a, const MessageSnapshot& b) { return a.id < b.id; });
  return s;
}

}
