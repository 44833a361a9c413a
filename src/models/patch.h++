#pragma once
#include "db/db.h++"
#include <map>
#include <vector>

namespace Skein {
  struct MessagePatch {
    std::optional<std::string_view> subject, content;
    std::optional<bool> deleted, draft;
    // nullopt values remove the flag
    std::map<std::string, std::optional<std::string>, std::less<>> flags;
    std::optional<std::vector<uint64_t>> tags;
    int64_t upvotes_delta = 0, downvotes_delta = 0;
    std::optional<uint64_t> updated_at;
  };

  struct ThreadPatch {
    std::optional<bool> archived;
    std::optional<uint64_t> root, latest_message;
  };

  struct TagPatch {
    std::optional<std::string_view> name;
    std::vector<std::string_view> add_synonyms;
  };

  auto patch_message(flatbuffers::FlatBufferBuilder& fbb, const Message& old, const MessagePatch& patch) -> flatbuffers::Offset<Message>;
  auto patch_thread(flatbuffers::FlatBufferBuilder& fbb, const Thread& old, const ThreadPatch& patch) -> flatbuffers::Offset<Thread>;
  auto patch_tag(flatbuffers::FlatBufferBuilder& fbb, const Tag& old, const TagPatch& patch) -> flatbuffers::Offset<Tag>;
}
