#include "message_controller.h++"
#include "util/lambda_macros.h++"
#include <charconv>

using std::make_shared, std::nullopt, std::optional, std::pair, std::span,
    std::string, std::string_view, std::vector, flatbuffers::FlatBufferBuilder;

namespace Skein {

static inline auto flag_of(const Message& m, string_view key) -> optional<string_view> {
  if (!m.flags()) return {};
  for (const auto f : *m.flags()) {
    if (f->key()->string_view() == key) return f->value() ? f->value()->string_view() : string_view();
  }
  return {};
}

static inline auto has_tags(const Message& m, const vector<uint64_t>& tags) -> bool {
  const auto n = m.tags() ? m.tags()->size() : 0;
  return n == tags.size() && (!n || std::equal(tags.begin(), tags.end(), m.tags()->begin()));
}

static inline auto patcher(MessagePatch patch) -> MessagePatcher {
  return [patch = std::move(patch)](FlatBufferBuilder& fbb, const Message& old) {
    fbb.Finish(patch_message(fbb, old, patch));
  };
}

static inline auto not_found(uint64_t id) -> ApiError {
  return ApiError("Message does not exist", 404, fmt::format("Message {:x} not found", id));
}

static auto slugify(string_view subject) -> string {
  string slug;
  for (const char c : subject) {
    if ((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')) slug.push_back(c);
    else if (c >= 'A' && c <= 'Z') slug.push_back((char)(c - 'A' + 'a'));
    else if (!slug.empty() && slug.back() != '-') slug.push_back('-');
  }
  while (!slug.empty() && slug.back() == '-') slug.pop_back();
  return slug;
}

// Comma-separated hex ids, the same notation ids are logged in.
static auto parse_ids(string_view s) -> vector<uint64_t> {
  vector<uint64_t> ids;
  while (!s.empty()) {
    const auto comma = s.find(',');
    const auto part = s.substr(0, comma);
    uint64_t id;
    const auto [end, err] = std::from_chars(part.data(), part.data() + part.size(), id, 16);
    if (err != std::errc() || end != part.data() + part.size()) {
      throw ApiError(fmt::format("Invalid tag id: {}", part), 400);
    }
    ids.push_back(id);
    if (comma == string_view::npos) break;
    s.remove_prefix(comma + 1);
  }
  return ids;
}

auto parse_subtree_mutation(string_view op, const MutationParams& params) -> SubtreeMutation {
  const auto param = [&](string_view key) -> optional<string_view> {
    const auto it = params.find(key);
    if (it == params.end()) return {};
    return non_blank(it->second);
  };
  if (op == "delete") {
    return SubtreeOp::Delete{ param("reason").transform(λx(string(x))) };
  } else if (op == "restore") {
    return SubtreeOp::Restore{};
  } else if (op == "set-flag") {
    const auto key = param("key");
    if (!key) throw ApiError("set-flag requires a flag key", 400);
    return SubtreeOp::SetFlag{ string(*key), string(param("value").value_or(MessageFlag::yes)) };
  } else if (op == "clear-flag") {
    const auto key = param("key");
    if (!key) throw ApiError("clear-flag requires a flag key", 400);
    return SubtreeOp::ClearFlag{ string(*key) };
  } else if (op == "retag") {
    const auto cascade = param("cascade");
    return SubtreeOp::Retag{
      parse_ids(param("tags").value_or("")),
      cascade == "yes" || cascade == "true"
    };
  }
  throw ApiError(fmt::format("Unknown subtree operation: {}", op), 400);
}

auto MessageController::tag_limits(uint64_t forum_id) -> TagLimits {
  return {
    config->resolve_int("min_tags_per_message", {}, forum_id).value_or(0),
    config->resolve_int("max_tags_per_message", {}, forum_id).value_or(std::numeric_limits<int64_t>::max())
  };
}

auto MessageController::validate_tags(ReadTxn& txn, vector<uint64_t> tags, optional<TagLimits> limits) -> vector<uint64_t> {
  vector<uint64_t> unique;
  for (const auto id : tags) {
    if (std::find(unique.begin(), unique.end(), id) != unique.end()) continue;
    if (!txn.get_tag(id)) throw ApiError("Tag does not exist", 404, fmt::format("Tag {:x} not found", id));
    unique.push_back(id);
  }
  if (limits) {
    const auto [min, max] = *limits;
    if ((int64_t)unique.size() < min) throw ApiError(fmt::format("A message needs at least {:d} tags", min), 400);
    if ((int64_t)unique.size() > max) throw ApiError(fmt::format("A message can have at most {:d} tags", max), 400);
  }
  return unique;
}

auto MessageController::after_write(uint64_t thread_id, span<const uint64_t> touched) noexcept -> void {
  threads->refresh_thread(thread_id, touched);
  try {
    cache->invalidate(CachePattern::UnreadCounts{});
    event_bus->dispatch(Event::ThreadUpdate, thread_id, EventPayload(touched.begin(), touched.end()));
  } catch (const std::exception& e) {
    spdlog::warn("Post-write update for thread {:x} failed: {}", thread_id, e.what());
  }
}

auto MessageController::create_thread(uint64_t forum_id, const NewMessage& root, string_view slug) -> pair<uint64_t, uint64_t> {
  if (!non_blank(root.subject)) throw ApiError("Subject cannot be empty", 400);
  if (!non_blank(root.author_name)) throw ApiError("Author name cannot be empty", 400);
  const auto created_at = root.created_at.value_or(now_s());
  uint64_t thread_id, message_id;
  {
    auto txn = db->open_write_txn();
    const auto tags = validate_tags(txn, root.tags);
    FlatBufferBuilder fbb;
    {
      const auto slug_s = fbb.CreateString(slug.empty() ? slugify(root.subject) : string(slug));
      ThreadBuilder b(fbb);
      b.add_forum(forum_id);
      b.add_slug(slug_s);
      b.add_created_at(created_at);
      b.add_latest_message(created_at);
      fbb.Finish(b.Finish());
    }
    thread_id = txn.create_thread(fbb.GetBufferSpan());
    fbb.Clear();
    {
      const auto author_name_s = fbb.CreateString(root.author_name),
        subject_s = fbb.CreateString(root.subject),
        content_s = fbb.CreateString(root.content);
      const auto tags_v = fbb.CreateVector(tags);
      MessageBuilder b(fbb);
      b.add_thread(thread_id);
      b.add_forum(forum_id);
      if (root.author_id) b.add_author(*root.author_id);
      b.add_author_name(author_name_s);
      b.add_subject(subject_s);
      b.add_content(content_s);
      b.add_draft(root.draft);
      b.add_tags(tags_v);
      b.add_created_at(created_at);
      fbb.Finish(b.Finish());
    }
    message_id = txn.create_message(fbb.GetBufferSpan());
    fbb.Clear();
    fbb.Finish(patch_thread(fbb, txn.get_thread(thread_id)->get(), { .root = message_id }));
    txn.set_thread(thread_id, fbb.GetBufferSpan());
    txn.commit();
  }
  spdlog::debug("Created thread {:x} in forum {:x} with root message {:x}", thread_id, forum_id, message_id);
  const vector<uint64_t> touched{message_id};
  after_write(thread_id, touched);
  return { thread_id, message_id };
}

auto MessageController::create_message(uint64_t thread_id, uint64_t parent_id, const NewMessage& message) -> uint64_t {
  if (!non_blank(message.subject)) throw ApiError("Subject cannot be empty", 400);
  if (!non_blank(message.author_name)) throw ApiError("Author name cannot be empty", 400);
  uint64_t id;
  {
    auto txn = db->open_write_txn();
    const auto thread = txn.get_thread(thread_id);
    if (!thread) throw ApiError("Thread does not exist", 404, fmt::format("Thread {:x} not found", thread_id));
    if (thread->get().archived()) throw ApiError("Cannot reply in an archived thread", 400);
    const auto forum_id = thread->get().forum();
    const auto parent = txn.get_message(parent_id);
    if (!parent || parent->get().thread() != thread_id) {
      throw ApiError("Parent message does not exist", 404,
        fmt::format("Message {:x} not found in thread {:x}", parent_id, thread_id));
    }
    if (parent->get().deleted()) throw ApiError("Cannot reply to a deleted message", 400);
    const auto tags = validate_tags(txn, message.tags);
    FlatBufferBuilder fbb;
    const auto author_name_s = fbb.CreateString(message.author_name),
      subject_s = fbb.CreateString(message.subject),
      content_s = fbb.CreateString(message.content);
    const auto tags_v = fbb.CreateVector(tags);
    MessageBuilder b(fbb);
    b.add_thread(thread_id);
    b.add_forum(forum_id);
    b.add_parent(parent_id);
    if (message.author_id) b.add_author(*message.author_id);
    b.add_author_name(author_name_s);
    b.add_subject(subject_s);
    b.add_content(content_s);
    b.add_draft(message.draft);
    b.add_tags(tags_v);
    b.add_created_at(message.created_at.value_or(now_s()));
    fbb.Finish(b.Finish());
    id = txn.create_message(fbb.GetBufferSpan());
    txn.commit();
  }
  spdlog::debug("Created message {:x} in thread {:x} (reply to {:x})", id, thread_id, parent_id);
  const vector<uint64_t> touched{id};
  after_write(thread_id, touched);
  return id;
}

auto MessageController::update_one(uint64_t id, const MessagePredicate& where, const MessagePatch& patch, Event event) -> bool {
  uint64_t thread_id, changed;
  {
    auto txn = db->open_write_txn();
    const auto message = txn.get_message(id);
    if (!message) throw not_found(id);
    thread_id = message->get().thread();
    changed = txn.update_messages_where(span(&id, 1), where, patcher(patch));
    txn.commit();
  }
  if (!changed) return false;
  const vector<uint64_t> touched{id};
  after_write(thread_id, touched);
  if (event != Event::ThreadUpdate) event_bus->dispatch(event, id);
  return true;
}

auto MessageController::edit_message(uint64_t id, const MessageEdit& edit) -> void {
  if (edit.subject && edit.subject->empty()) throw ApiError("Subject cannot be empty", 400);
  update_one(id, {}, {
    .subject = edit.subject,
    .content = edit.content,
    .updated_at = now_s()
  }, Event::MessageUpdate);
}

auto MessageController::score_message(uint64_t id, int64_t up_delta, int64_t down_delta) -> void {
  if (!up_delta && !down_delta) return;
  update_one(id, {}, { .upvotes_delta = up_delta, .downvotes_delta = down_delta }, Event::MessageRescored);
}

auto MessageController::accept_message(uint64_t id) -> bool {
  return update_one(id,
    [](const Message& m) { return flag_of(m, MessageFlag::accepted) != MessageFlag::yes; },
    { .flags = {{ string(MessageFlag::accepted), string(MessageFlag::yes) }} },
    Event::MessageUpdate
  );
}

auto MessageController::unaccept_message(uint64_t id) -> bool {
  return update_one(id,
    [](const Message& m) { return flag_of(m, MessageFlag::accepted).has_value(); },
    { .flags = {{ string(MessageFlag::accepted), nullopt }} },
    Event::MessageUpdate
  );
}

auto MessageController::apply(WriteTxn& txn, span<const uint64_t> closure, const SubtreeMutation& mutation) -> uint64_t {
  const auto anchor = closure.first(1), descendants = closure.subspan(1);
  const string reason_key(MessageFlag::reason);
  return std::visit(overload{
    [&](const SubtreeOp::Delete& op) -> uint64_t {
      return txn.update_messages_where(anchor,
          [&](const Message& m) { return !m.deleted() || flag_of(m, reason_key) != op.reason; },
          patcher({ .deleted = true, .flags = {{ reason_key, op.reason }} })) +
        txn.update_messages_where(descendants,
          [&](const Message& m) { return !m.deleted() || flag_of(m, reason_key); },
          patcher({ .deleted = true, .flags = {{ reason_key, nullopt }} }));
    },
    [&](const SubtreeOp::Restore&) -> uint64_t {
      return txn.update_messages_where(closure,
        [&](const Message& m) { return m.deleted() || flag_of(m, reason_key); },
        patcher({ .deleted = false, .flags = {{ reason_key, nullopt }} }));
    },
    [&](const SubtreeOp::SetFlag& op) -> uint64_t {
      return txn.update_messages_where(closure,
        [&](const Message& m) { return flag_of(m, op.key) != op.value; },
        patcher({ .flags = {{ op.key, op.value }} }));
    },
    [&](const SubtreeOp::ClearFlag& op) -> uint64_t {
      return txn.update_messages_where(closure,
        [&](const Message& m) { return flag_of(m, op.key).has_value(); },
        patcher({ .flags = {{ op.key, nullopt }} }));
    },
    [&](const SubtreeOp::Retag& op) -> uint64_t {
      auto changed = txn.update_messages_where(anchor,
        [&](const Message& m) { return !has_tags(m, op.tags); },
        patcher({ .tags = op.tags }));
      if (op.cascade) {
        const SubtreeMutation single = SubtreeOp::Retag{ op.tags, false };
        for (const auto& id : descendants) changed += apply(txn, span(&id, 1), single);
      }
      return changed;
    },
  }, mutation);
}

auto MessageController::run_subtree(uint64_t anchor_id, const SubtreeBody& body) -> SubtreeResult {
  SubtreeResult result;
  {
    auto txn = db->open_write_txn();
    const auto anchor = txn.get_message(anchor_id);
    if (!anchor) throw not_found(anchor_id);
    result.thread_id = anchor->get().thread();
    const auto tree = Skein::build_tree(
      make_shared<const ThreadSnapshot>(ThreadSnapshot::load(txn, result.thread_id)),
      VisibilityFilter::everything()
    );
    result.affected = tree.subtree_ids(anchor_id);
    if (result.affected.empty()) throw not_found(anchor_id);
    result.changed = body(txn, result.affected);
    txn.commit();
  }
  spdlog::debug("Subtree of message {:x}: {:d} messages, {:d} changed", anchor_id, result.affected.size(), result.changed);
  if (result.changed) after_write(result.thread_id, result.affected);
  return result;
}

auto MessageController::mutate_subtree(uint64_t anchor_id, const SubtreeMutation& mutation) -> SubtreeResult {
  if (const auto* retag = std::get_if<SubtreeOp::Retag>(&mutation)) {
    const auto forum_id = threads->message(anchor_id)->forum_id;
    const auto limits = tag_limits(forum_id);
    vector<uint64_t> tags;
    {
      auto txn = db->open_read_txn();
      tags = validate_tags(txn, retag->tags, limits);
    }
    const SubtreeMutation validated = SubtreeOp::Retag{ std::move(tags), retag->cascade };
    return run_subtree(anchor_id, [&](WriteTxn& txn, span<const uint64_t> closure) {
      return apply(txn, closure, validated);
    });
  }
  return run_subtree(anchor_id, [&](WriteTxn& txn, span<const uint64_t> closure) {
    return apply(txn, closure, mutation);
  });
}

auto MessageController::flag_no_answer(uint64_t id, optional<string_view> reason, string_view type) -> SubtreeResult {
  if (type != MessageFlag::no_answer && type != MessageFlag::no_answer_admin) {
    throw ApiError(fmt::format("Invalid no-answer type: {}", type), 400);
  }
  const auto reason_s = non_blank(reason).transform(λx(string(x)));
  const string type_s(type), reason_key(MessageFlag::reason), yes(MessageFlag::yes);
  return run_subtree(id, [&](WriteTxn& txn, span<const uint64_t> closure) {
    return txn.update_messages_where(closure.first(1),
        [&](const Message& m) { return flag_of(m, type_s) != yes || flag_of(m, reason_key) != reason_s; },
        patcher({ .flags = {{ type_s, yes }, { reason_key, reason_s }} })) +
      txn.update_messages_where(closure.subspan(1),
        [&](const Message& m) { return flag_of(m, type_s) != yes || flag_of(m, reason_key); },
        patcher({ .flags = {{ type_s, yes }, { reason_key, nullopt }} }));
  });
}

auto MessageController::unflag_no_answer(uint64_t id) -> SubtreeResult {
  const string no_answer(MessageFlag::no_answer), no_answer_admin(MessageFlag::no_answer_admin),
    reason_key(MessageFlag::reason);
  return run_subtree(id, [&](WriteTxn& txn, span<const uint64_t> closure) {
    return txn.update_messages_where(closure.first(1),
        [&](const Message& m) {
          return flag_of(m, no_answer) || flag_of(m, no_answer_admin) || flag_of(m, reason_key);
        },
        patcher({ .flags = {{ no_answer, nullopt }, { no_answer_admin, nullopt }, { reason_key, nullopt }} })) +
      txn.update_messages_where(closure.subspan(1),
        [&](const Message& m) { return flag_of(m, no_answer) || flag_of(m, no_answer_admin); },
        patcher({ .flags = {{ no_answer, nullopt }, { no_answer_admin, nullopt }} }));
  });
}

auto MessageController::set_thread_archived(uint64_t thread_id, bool archived) -> bool {
  {
    auto txn = db->open_write_txn();
    const auto thread = txn.get_thread(thread_id);
    if (!thread) throw ApiError("Thread does not exist", 404, fmt::format("Thread {:x} not found", thread_id));
    if (thread->get().archived() == archived) {
      txn.commit();
      return false;
    }
    FlatBufferBuilder fbb;
    fbb.Finish(patch_thread(fbb, thread->get(), { .archived = archived }));
    txn.set_thread(thread_id, fbb.GetBufferSpan());
    txn.commit();
  }
  spdlog::debug("Thread {:x} archived = {}", thread_id, archived);
  after_write(thread_id, {});
  return true;
}

}
