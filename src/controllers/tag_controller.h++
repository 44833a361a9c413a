#pragma once
#include "db/db.h++"
#include "services/cache.h++"

namespace Skein {

struct TagSnapshot {
  uint64_t id;
  std::string name;
  std::vector<std::string> synonyms;
  uint64_t created_at;
};

class TagController {
private:
  std::shared_ptr<DB> db;
  std::shared_ptr<Cache> cache;

public:
  TagController(std::shared_ptr<DB> db, std::shared_ptr<Cache> cache) : db(db), cache(cache) {
    assert(db != nullptr);
    assert(cache != nullptr);
  }

  auto create_tag(std::string_view name, std::span<const std::string_view> synonyms = {}) -> uint64_t;
  auto get_tag(uint64_t id) -> TagSnapshot;
  // Matches names and synonyms, ignoring case.
  auto find_tag(std::string_view name) -> std::optional<TagSnapshot>;

  // Moves every message tagged `old_id` over to `new_id`, keeps the old name
  // as a synonym of the new tag and deletes the old tag. Returns the number
  // of messages retagged.
  auto merge_tag(uint64_t old_id, uint64_t new_id) -> uint64_t;
};

}
