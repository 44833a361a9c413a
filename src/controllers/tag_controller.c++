#include "tag_controller.h++"
#include "models/patch.h++"

using std::optional, std::span, std::string, std::string_view, std::vector,
    flatbuffers::FlatBufferBuilder, flatbuffers::Offset, flatbuffers::String;

namespace Skein {

static auto snapshot_of(uint64_t id, const Tag& tag) -> TagSnapshot {
  TagSnapshot s { .id = id, .name = tag.name()->str(), .synonyms = {}, .created_at = tag.created_at() };
  if (tag.synonyms()) {
    for (const auto syn : *tag.synonyms()) s.synonyms.push_back(syn->str());
  }
  return s;
}

auto TagController::create_tag(string_view name, span<const string_view> synonyms) -> uint64_t {
  if (!non_blank(name)) throw ApiError("Tag name cannot be empty", 400);
  uint64_t id;
  {
    auto txn = db->open_write_txn();
    if (txn.get_tag_id_by_name(name)) {
      throw ApiError(fmt::format("A tag named {} already exists", name), 409);
    }
    for (const auto syn : synonyms) {
      if (!non_blank(syn)) throw ApiError("Tag synonyms cannot be empty", 400);
      if (txn.get_tag_id_by_name(syn)) {
        throw ApiError(fmt::format("A tag named {} already exists", syn), 409);
      }
    }
    FlatBufferBuilder fbb;
    const auto name_s = fbb.CreateString(name);
    vector<Offset<String>> synonym_strs;
    for (const auto syn : synonyms) synonym_strs.push_back(fbb.CreateString(syn));
    const auto synonyms_v = fbb.CreateVector(synonym_strs);
    TagBuilder b(fbb);
    b.add_name(name_s);
    b.add_synonyms(synonyms_v);
    b.add_created_at(now_s());
    fbb.Finish(b.Finish());
    id = txn.create_tag(fbb.GetBufferSpan());
    txn.commit();
  }
  spdlog::debug("Created tag {:x} ({})", id, name);
  return id;
}

auto TagController::get_tag(uint64_t id) -> TagSnapshot {
  auto txn = db->open_read_txn();
  const auto tag = txn.get_tag(id);
  if (!tag) throw ApiError("Tag does not exist", 404, fmt::format("Tag {:x} not found", id));
  return snapshot_of(id, *tag);
}

auto TagController::find_tag(string_view name) -> optional<TagSnapshot> {
  auto txn = db->open_read_txn();
  const auto id = txn.get_tag_id_by_name(name);
  if (!id) return {};
  const auto tag = txn.get_tag(*id);
  if (!tag) {
    spdlog::warn("Tag name {} points to nonexistent tag {:x}", name, *id);
    return {};
  }
  return snapshot_of(*id, *tag);
}

auto TagController::merge_tag(uint64_t old_id, uint64_t new_id) -> uint64_t {
  if (old_id == new_id) throw ApiError("Cannot merge a tag into itself", 409);
  uint64_t retagged;
  {
    auto txn = db->open_write_txn();
    const auto old_tag = txn.get_tag(old_id);
    if (!old_tag) throw ApiError("Tag does not exist", 404, fmt::format("Tag {:x} not found", old_id));
    if (!txn.get_tag(new_id)) throw ApiError("Tag does not exist", 404, fmt::format("Tag {:x} not found", new_id));
    const auto old_snapshot = snapshot_of(old_id, *old_tag);

    const auto message_ids = txn.list_messages_with_tag(old_id).collect();
    retagged = txn.update_messages_where(message_ids, {}, [&](FlatBufferBuilder& fbb, const Message& m) {
      vector<uint64_t> tags;
      if (m.tags()) {
        for (const auto t : *m.tags()) {
          const auto mapped = t == old_id ? new_id : t;
          if (std::find(tags.begin(), tags.end(), mapped) == tags.end()) tags.push_back(mapped);
        }
      }
      fbb.Finish(patch_message(fbb, m, { .tags = tags }));
    });

    txn.delete_tag(old_id);
    vector<string_view> names{ old_snapshot.name };
    names.insert(names.end(), old_snapshot.synonyms.begin(), old_snapshot.synonyms.end());
    FlatBufferBuilder fbb;
    fbb.Finish(patch_tag(fbb, txn.get_tag(new_id)->get(), { .add_synonyms = names }));
    txn.set_tag(new_id, fbb.GetBufferSpan());
    txn.commit();
  }
  spdlog::info("Merged tag {:x} into {:x}, retagging {:d} messages", old_id, new_id, retagged);
  cache->clear();
  return retagged;
}

}
