#pragma once
#include "util/common.h++"
#include "db/db.h++"
#include "models/message.h++"

namespace Skein {

struct ThreadSnapshot {
  uint64_t id, forum_id, root_id;
  std::string slug;
  bool archived;
  uint64_t created_at, latest_message;
  // sorted by id
  std::vector<MessageSnapshot> messages;

  auto find(uint64_t message_id) const -> const MessageSnapshot*;

  // Throws a 404 ApiError if the thread does not exist.
  static auto load(ReadTxn& txn, uint64_t id) -> ThreadSnapshot;
};

}
