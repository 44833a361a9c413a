#include "message.h++"

namespace Skein {

auto MessageSnapshot::from(uint64_t id, const Message& m) -> MessageSnapshot {
  MessageSnapshot s {
    .id = id,
    .thread_id = m.thread(),
    .forum_id = m.forum(),
    .parent_id = m.parent(),
    .author_id = m.author(),
    .author_name = m.author_name() ? m.author_name()->str() : "",
    .subject = m.subject() ? m.subject()->str() : "",
    .content = m.content() ? m.content()->str() : "",
    .deleted = m.deleted(),
    .draft = m.draft(),
    .flags = {},
    .tags = {},
    .upvotes = m.upvotes(),
    .downvotes = m.downvotes(),
    .created_at = m.created_at(),
    .updated_at = m.updated_at()
  };
  if (m.flags()) {
    for (const auto f : *m.flags()) {
      s.flags.emplace(f->key()->str(), f->value() ? f->value()->str() : "");
    }
  }
  if (m.tags()) s.tags.assign(m.tags()->begin(), m.tags()->end());
  return s;
}

}
