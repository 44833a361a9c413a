#include "patch.h++"

using flatbuffers::FlatBufferBuilder, flatbuffers::Offset, flatbuffers::String,
    flatbuffers::Vector, std::map, std::optional, std::string, std::string_view,
    std::vector;

namespace Skein {

  static inline auto update_str(
    FlatBufferBuilder& fbb,
    optional<string_view> updated,
    const String* existing
  ) -> Offset<String> {
    if (updated) return fbb.CreateString(*updated);
    return fbb.CreateString(existing);
  }

  static inline auto update_counter(uint32_t old, int64_t delta) -> uint32_t {
    return (uint32_t)std::clamp<int64_t>((int64_t)old + delta, 0, std::numeric_limits<uint32_t>::max());
  }

  static inline auto update_flags(
    FlatBufferBuilder& fbb,
    const map<string, optional<string>, std::less<>>& updated,
    const Vector<Offset<Flag>>* existing
  ) -> Offset<Vector<Offset<Flag>>> {
    map<string_view, string_view> merged;
    if (existing) {
      for (const auto f : *existing) merged.emplace(f->key()->string_view(), f->value() ? f->value()->string_view() : "");
    }
    for (const auto& [k, v] : updated) {
      if (v) merged.insert_or_assign(k, *v);
      else merged.erase(k);
    }
    vector<Offset<Flag>> flags;
    flags.reserve(merged.size());
    for (const auto& [k, v] : merged) {
      const auto key_s = fbb.CreateString(k), value_s = fbb.CreateString(v);
      flags.push_back(CreateFlag(fbb, key_s, value_s));
    }
    return fbb.CreateVectorOfSortedTables(&flags);
  }

  auto patch_message(FlatBufferBuilder& fbb, const Message& old, const MessagePatch& patch) -> Offset<Message> {
    const auto author_name = fbb.CreateString(old.author_name()),
      subject = update_str(fbb, patch.subject, old.subject()),
      content = update_str(fbb, patch.content, old.content());
    const auto flags = update_flags(fbb, patch.flags, old.flags());
    vector<uint64_t> tag_ids;
    if (patch.tags) tag_ids = *patch.tags;
    else if (old.tags()) tag_ids.assign(old.tags()->begin(), old.tags()->end());
    const auto tags = fbb.CreateVector(tag_ids);
    MessageBuilder b(fbb);
    b.add_thread(old.thread());
    b.add_forum(old.forum());
    if (auto p = old.parent()) b.add_parent(*p);
    if (auto a = old.author()) b.add_author(*a);
    b.add_author_name(author_name);
    b.add_subject(subject);
    b.add_content(content);
    b.add_deleted(patch.deleted.value_or(old.deleted()));
    b.add_draft(patch.draft.value_or(old.draft()));
    b.add_flags(flags);
    b.add_tags(tags);
    b.add_upvotes(update_counter(old.upvotes(), patch.upvotes_delta));
    b.add_downvotes(update_counter(old.downvotes(), patch.downvotes_delta));
    b.add_created_at(old.created_at());
    if (auto t = patch.updated_at ? patch.updated_at : old.updated_at()) b.add_updated_at(*t);
    return b.Finish();
  }

  auto patch_thread(FlatBufferBuilder& fbb, const Thread& old, const ThreadPatch& patch) -> Offset<Thread> {
    const auto slug = fbb.CreateString(old.slug());
    ThreadBuilder b(fbb);
    b.add_forum(old.forum());
    b.add_root(patch.root.value_or(old.root()));
    b.add_slug(slug);
    b.add_archived(patch.archived.value_or(old.archived()));
    b.add_created_at(old.created_at());
    b.add_latest_message(patch.latest_message.value_or(old.latest_message()));
    return b.Finish();
  }

  auto patch_tag(FlatBufferBuilder& fbb, const Tag& old, const TagPatch& patch) -> Offset<Tag> {
    vector<string_view> synonym_names;
    if (old.synonyms()) {
      for (const auto s : *old.synonyms()) synonym_names.push_back(s->string_view());
    }
    for (const auto s : patch.add_synonyms) {
      if (std::find(synonym_names.begin(), synonym_names.end(), s) == synonym_names.end()) synonym_names.push_back(s);
    }
    const auto name = update_str(fbb, patch.name, old.name());
    vector<Offset<String>> synonym_strs;
    for (const auto s : synonym_names) synonym_strs.push_back(fbb.CreateString(s));
    const auto synonyms = fbb.CreateVector(synonym_strs);
    TagBuilder b(fbb);
    b.add_name(name);
    b.add_synonyms(synonyms);
    b.add_created_at(old.created_at());
    return b.Finish();
  }
}
