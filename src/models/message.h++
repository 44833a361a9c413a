#pragma once
#include "util/common.h++"
#include "fbs/records.h++"
#include <map>
#include <vector>

namespace Skein {

namespace MessageFlag {
  inline static constexpr std::string_view
    accepted {"accepted"},
    reason {"reason"},
    no_answer {"no-answer"},
    no_answer_admin {"no-answer-admin"};
  inline static constexpr std::string_view yes {"yes"};
}

// An owned copy of a message record. Values of this type are what the cache
// hands out, so they must not point into an LMDB transaction.
struct MessageSnapshot {
  uint64_t id, thread_id, forum_id;
  std::optional<uint64_t> parent_id, author_id;
  std::string author_name, subject, content;
  bool deleted, draft;
  std::map<std::string, std::string, std::less<>> flags;
  std::vector<uint64_t> tags;
  uint32_t upvotes, downvotes;
  uint64_t created_at;
  std::optional<uint64_t> updated_at;

  static auto from(uint64_t id, const Message& message) -> MessageSnapshot;

  auto flag(std::string_view key) const -> std::optional<std::string_view> {
    const auto it = flags.find(key);
    if (it == flags.end()) return {};
    return it->second;
  }
  auto has_flag(std::string_view key) const -> bool {
    return flags.contains(key);
  }
  auto score() const noexcept -> int64_t {
    return (int64_t)upvotes - (int64_t)downvotes;
  }
};

struct NewMessage {
  std::optional<uint64_t> author_id;
  std::string_view author_name, subject, content;
  bool draft = false;
  std::vector<uint64_t> tags;
  std::optional<uint64_t> created_at;
};

struct MessageEdit {
  std::optional<std::string_view> subject, content;
};

}
