#include "db/db.h++"
#include <unistd.h>
#include <cctype>

using std::nullopt, std::optional, std::pair, std::runtime_error, std::string,
    std::string_view, std::vector, flatbuffers::FlatBufferBuilder,
    flatbuffers::span, flatbuffers::Verifier, flatbuffers::GetRoot;

#define assert_fmt(CONDITION, ...) if (!(CONDITION)) { spdlog::critical(__VA_ARGS__); throw runtime_error("Assertion failed: " #CONDITION); }

namespace Skein {
  enum Dbi {
    Settings,

    Thread_Thread,
    ThreadsOwned_Forum,
    InvisibleThreads_User,

    Message_Message,
    MessagesOwned_Thread,
    ReadMessages_User,

    Tag_Tag,
    Tag_Name,
    MessagesTagged_Tag,

    ConfigOption_Scope,

    DBI_MAX
  };

  static constexpr unsigned ID_SET = MDB_INTEGERKEY | MDB_DUPSORT | MDB_DUPFIXED | MDB_INTEGERDUP;

  static inline auto db_get(MDB_txn* txn, MDB_dbi dbi, string_view k, MDB_val& v) -> int {
    MDB_val kval { k.length(), const_cast<char*>(k.data()) };
    return mdb_get(txn, dbi, &kval, &v);
  }

  static inline auto db_get(MDB_txn* txn, MDB_dbi dbi, uint64_t k, MDB_val& v) -> int {
    MDB_val kval { sizeof(uint64_t), &k };
    return mdb_get(txn, dbi, &kval, &v);
  }

  static inline auto db_has(MDB_txn* txn, MDB_dbi dbi, uint64_t k, uint64_t v) -> bool {
    MDB_cursor* cur;
    if (mdb_cursor_open(txn, dbi, &cur)) return false;
    MDB_val kval{ sizeof(uint64_t), &k }, vval{ sizeof(uint64_t), &v };
    const bool exists = !mdb_cursor_get(cur, &kval, &vval, MDB_GET_BOTH);
    mdb_cursor_close(cur);
    return exists;
  }

  static inline auto db_put(MDB_txn* txn, MDB_dbi dbi, MDB_val& k, MDB_val& v, unsigned flags = 0) -> void {
    if (auto err = mdb_put(txn, dbi, &k, &v, flags)) throw DBError("Write failed", err);
  }

  static inline auto db_put(MDB_txn* txn, MDB_dbi dbi, string_view k, string_view v, unsigned flags = 0) -> void {
    MDB_val kval{ k.length(), const_cast<char*>(k.data()) };
    MDB_val vval{ v.length(), const_cast<char*>(v.data()) };
    db_put(txn, dbi, kval, vval, flags);
  }

  static inline auto db_put(MDB_txn* txn, MDB_dbi dbi, string_view k, uint64_t v, unsigned flags = 0) -> void {
    MDB_val kval{ k.length(), const_cast<char*>(k.data()) }, vval{ sizeof(uint64_t), &v };
    db_put(txn, dbi, kval, vval, flags);
  }

  static inline auto db_put(MDB_txn* txn, MDB_dbi dbi, uint64_t k, uint64_t v, unsigned flags = 0) -> void {
    MDB_val kval{ sizeof(uint64_t), &k }, vval{ sizeof(uint64_t), &v };
    db_put(txn, dbi, kval, vval, flags);
  }

  static inline auto db_put(MDB_txn* txn, MDB_dbi dbi, uint64_t k, span<uint8_t> span, unsigned flags = 0) -> void {
    MDB_val kval{ sizeof(uint64_t), &k }, vval{ span.size(), span.data() };
    db_put(txn, dbi, kval, vval, flags);
  }

  // Adds `v` to the id set stored under `k`; false if it was already there.
  static inline auto db_add(MDB_txn* txn, MDB_dbi dbi, uint64_t k, uint64_t v) -> bool {
    MDB_val kval{ sizeof(uint64_t), &k }, vval{ sizeof(uint64_t), &v };
    const auto err = mdb_put(txn, dbi, &kval, &vval, MDB_NODUPDATA);
    if (err == MDB_KEYEXIST) return false;
    if (err) throw DBError("Write failed", err);
    return true;
  }

  static inline auto db_del(MDB_txn* txn, MDB_dbi dbi, uint64_t k) -> bool {
    MDB_val kval{ sizeof(uint64_t), &k };
    if (auto err = mdb_del(txn, dbi, &kval, nullptr)) {
      if (err != MDB_NOTFOUND) throw DBError("Delete failed", err);
      return false;
    }
    return true;
  }

  static inline auto db_del(MDB_txn* txn, MDB_dbi dbi, string_view k) -> bool {
    MDB_val kval{ k.length(), const_cast<char*>(k.data()) };
    if (auto err = mdb_del(txn, dbi, &kval, nullptr)) {
      if (err != MDB_NOTFOUND) throw DBError("Delete failed", err);
      return false;
    }
    return true;
  }

  static inline auto db_del(MDB_txn* txn, MDB_dbi dbi, uint64_t k, uint64_t v) -> bool {
    MDB_val kval{ sizeof(uint64_t), &k }, vval{ sizeof(uint64_t), &v };
    if (auto err = mdb_del(txn, dbi, &kval, &vval)) {
      if (err != MDB_NOTFOUND) throw DBError("Delete failed", err);
      return false;
    }
    return true;
  }

  struct MDBCursor {
    MDB_cursor* cur;
    MDBCursor(MDB_txn* txn, MDB_dbi dbi) {
      if (auto err = mdb_cursor_open(txn, dbi, &cur)) {
        throw DBError("Failed to open database cursor", err);
      }
    }
    ~MDBCursor() {
      mdb_cursor_close(cur);
    }
    inline operator MDB_cursor*() {
      return cur;
    }
  };

  // Config option keys are [scope:1][owner:8, big-endian][name], so every
  // option of one (scope, owner) pair is a contiguous key range.
  static inline auto config_prefix(ConfigScope scope, uint64_t owner_id) -> string {
    string key(9, '\0');
    key[0] = static_cast<char>(scope);
    for (int i = 0; i < 8; i++) key[1 + i] = static_cast<char>((owner_id >> (56 - 8 * i)) & 0xff);
    return key;
  }

  static inline auto config_key(ConfigScope scope, uint64_t owner_id, string_view name) -> string {
    auto key = config_prefix(scope, owner_id);
    key.append(name);
    return key;
  }

  // Tag names are looked up case-insensitively.
  static inline auto tag_name_key(string_view name) -> string {
    string key(name);
    std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    return key;
  }

  auto DB::init_env(const char* filename, MDB_txn** txn, bool fast) -> int {
    int err;
    if ((err = mdb_env_create(&env))) return err;
    if ((err = mdb_env_set_maxdbs(env, DBI_MAX))) return err;
    if ((err = mdb_env_set_mapsize(env, map_size))) return err;
    if ((err = mdb_env_open(env, filename, MDB_NOSUBDIR | MDB_NOTLS | (fast ? MDB_NOSYNC : 0), 0600))) return err;
    if ((err = mdb_txn_begin(env, nullptr, 0, txn))) return err;

#   define MK_DBI(NAME, FLAGS) if ((err = mdb_dbi_open(*txn, #NAME, FLAGS | MDB_CREATE, dbis + NAME))) return err;
    MK_DBI(Settings, 0)

    MK_DBI(Thread_Thread, MDB_INTEGERKEY)
    MK_DBI(ThreadsOwned_Forum, ID_SET)
    MK_DBI(InvisibleThreads_User, ID_SET)

    MK_DBI(Message_Message, MDB_INTEGERKEY)
    MK_DBI(MessagesOwned_Thread, ID_SET)
    MK_DBI(ReadMessages_User, ID_SET)

    MK_DBI(Tag_Tag, MDB_INTEGERKEY)
    MK_DBI(Tag_Name, 0)
    MK_DBI(MessagesTagged_Tag, ID_SET)

    MK_DBI(ConfigOption_Scope, 0)
#   undef MK_DBI

    return 0;
  }

  DB::DB(const char* filename, size_t map_size_mb, bool move_fast_and_break_things) :
    map_size(map_size_mb * MiB - (map_size_mb * MiB) % (size_t)sysconf(_SC_PAGESIZE)), env(nullptr) {
    MDB_txn* txn = nullptr;
    int err = init_env(filename, &txn, move_fast_and_break_things);
    if (err) goto die;

    MDB_val val;
    if ((err = db_get(txn, dbis[Settings], SettingsKey::next_id, val))) {
      spdlog::info("Opened database {} for the first time, initializing", filename);
      try {
        db_put(txn, dbis[Settings], SettingsKey::next_id, 1ULL);
        db_put(txn, dbis[Settings], SettingsKey::created_at, now_s());
      } catch (const DBError& e) {
        spdlog::critical("Failed to initialize database {}: {}", filename, e.what());
        err = EIO;
        goto die;
      }
    } else {
      spdlog::debug("Loaded existing database {}", filename);
    }
    if ((err = mdb_txn_commit(txn))) {
      txn = nullptr;
      goto die;
    }
    return;
  die:
    if (txn != nullptr) mdb_txn_abort(txn);
    if (env != nullptr) mdb_env_close(env);
    throw DBError("Failed to open database", err);
  }

  DB::~DB() {
    if (env != nullptr) mdb_env_close(env);
  }

  auto DB::open_read_txn() -> ReadTxnImpl {
    return ReadTxnImpl(*this);
  }

  auto DB::open_write_txn() -> WriteTxn {
    return WriteTxn(*this);
  }

  template <typename T> static inline auto get_fb(const span<uint8_t>& span) -> const T& {
    const auto& root = *GetRoot<T>(span.data());
    Verifier verifier(span.data(), span.size());
    if (!root.Verify(verifier)) {
      throw runtime_error("FlatBuffer verification failed on write");
    }
    return root;
  }

  template <typename T> static inline auto get_fb(const MDB_val& v) -> const T& {
    const auto& root = *GetRoot<T>(v.mv_data);
    Verifier verifier((const uint8_t*)v.mv_data, v.mv_size);
    if (!root.Verify(verifier)) {
      throw runtime_error("FlatBuffer verification failed on read (corrupt data!)");
    }
    return root;
  }

  auto ReadTxn::get_setting_int(string_view key) -> uint64_t {
    MDB_val v;
    if (db_get(txn, db.dbis[Settings], key, v)) return 0;
    return val_as<uint64_t>(v);
  }

  auto ReadTxn::get_thread(uint64_t id) -> OptRef<Thread> {
    MDB_val v;
    if (db_get(txn, db.dbis[Thread_Thread], id, v)) return {};
    return get_fb<Thread>(v);
  }
  auto ReadTxn::list_threads_of_forum(uint64_t forum_id) -> DBIter {
    return dups_of(db.dbis[ThreadsOwned_Forum], txn, forum_id);
  }

  auto ReadTxn::get_message(uint64_t id) -> OptRef<Message> {
    MDB_val v;
    if (db_get(txn, db.dbis[Message_Message], id, v)) return {};
    return get_fb<Message>(v);
  }
  auto ReadTxn::list_messages_of_thread(uint64_t thread_id) -> DBIter {
    return dups_of(db.dbis[MessagesOwned_Thread], txn, thread_id);
  }

  auto ReadTxn::has_user_read_message(uint64_t user_id, uint64_t message_id) -> bool {
    return db_has(txn, db.dbis[ReadMessages_User], user_id, message_id);
  }
  auto ReadTxn::list_read_messages_of_user(uint64_t user_id) -> DBIter {
    return dups_of(db.dbis[ReadMessages_User], txn, user_id);
  }
  auto ReadTxn::has_user_hidden_thread(uint64_t user_id, uint64_t thread_id) -> bool {
    return db_has(txn, db.dbis[InvisibleThreads_User], user_id, thread_id);
  }

  auto ReadTxn::get_tag(uint64_t id) -> OptRef<Tag> {
    MDB_val v;
    if (db_get(txn, db.dbis[Tag_Tag], id, v)) return {};
    return get_fb<Tag>(v);
  }
  auto ReadTxn::get_tag_id_by_name(string_view name) -> optional<uint64_t> {
    MDB_val v;
    if (db_get(txn, db.dbis[Tag_Name], tag_name_key(name), v)) return {};
    return val_as<uint64_t>(v);
  }
  auto ReadTxn::list_messages_with_tag(uint64_t tag_id) -> DBIter {
    return dups_of(db.dbis[MessagesTagged_Tag], txn, tag_id);
  }

  auto ReadTxn::get_config_option(ConfigScope scope, uint64_t owner_id, string_view name) -> optional<string_view> {
    MDB_val v;
    if (db_get(txn, db.dbis[ConfigOption_Scope], config_key(scope, owner_id, name), v)) return {};
    return string_view(static_cast<const char*>(v.mv_data), v.mv_size);
  }
  auto ReadTxn::list_config_options(ConfigScope scope, uint64_t owner_id) -> vector<pair<string_view, string_view>> {
    const auto prefix = config_prefix(scope, owner_id);
    vector<pair<string_view, string_view>> out;
    MDBCursor cur(txn, db.dbis[ConfigOption_Scope]);
    MDB_val k{ prefix.length(), const_cast<char*>(prefix.data()) }, v;
    int err = mdb_cursor_get(cur, &k, &v, MDB_SET_RANGE);
    for (; !err; err = mdb_cursor_get(cur, &k, &v, MDB_NEXT)) {
      const string_view key(static_cast<const char*>(k.mv_data), k.mv_size);
      if (!key.starts_with(prefix)) break;
      out.emplace_back(key.substr(prefix.length()), string_view(static_cast<const char*>(v.mv_data), v.mv_size));
    }
    if (err && err != MDB_NOTFOUND) throw DBError("Failed to list config options", err);
    return out;
  }

  auto WriteTxn::next_id() -> uint64_t {
    MDB_val v;
    if (auto err = db_get(txn, db.dbis[Settings], SettingsKey::next_id, v)) throw DBError("next_id error", err);
    const auto id = val_as<uint64_t>(v);
    db_put(txn, db.dbis[Settings], SettingsKey::next_id, id + 1);
    return id;
  }
  auto WriteTxn::set_setting(string_view key, uint64_t value) -> void {
    db_put(txn, db.dbis[Settings], key, value);
  }

  auto WriteTxn::create_thread(span<uint8_t> span) -> uint64_t {
    const uint64_t id = next_id();
    set_thread(id, span);
    return id;
  }
  auto WriteTxn::set_thread(uint64_t id, span<uint8_t> span) -> void {
    const auto& thread = get_fb<Thread>(span);
    if (const auto old_thread_opt = get_thread(id)) {
      spdlog::debug("Updating thread {:x} (forum {:x})", id, thread.forum());
      assert_fmt(old_thread_opt->get().forum() == thread.forum(), "set_thread: cannot move thread {:x} between forums", id);
    } else {
      spdlog::debug("Creating thread {:x} (forum {:x})", id, thread.forum());
      db_put(txn, db.dbis[ThreadsOwned_Forum], thread.forum(), id);
    }
    db_put(txn, db.dbis[Thread_Thread], id, span);
  }

  auto WriteTxn::index_message_tags(uint64_t id, const Message& message, OptRef<Message> old) -> void {
    vector<uint64_t> before, after;
    if (old && old->get().tags()) before.assign(old->get().tags()->begin(), old->get().tags()->end());
    if (message.tags()) after.assign(message.tags()->begin(), message.tags()->end());
    std::sort(before.begin(), before.end());
    std::sort(after.begin(), after.end());
    for (const auto tag : before) {
      if (!std::binary_search(after.begin(), after.end(), tag)) db_del(txn, db.dbis[MessagesTagged_Tag], tag, id);
    }
    for (const auto tag : after) {
      if (!std::binary_search(before.begin(), before.end(), tag)) {
        assert_fmt(!!get_tag(tag), "set_message: message {:x} references nonexistent tag {:x}", id, tag);
        db_add(txn, db.dbis[MessagesTagged_Tag], tag, id);
      }
    }
  }

  auto WriteTxn::create_message(span<uint8_t> span) -> uint64_t {
    const uint64_t id = next_id();
    set_message(id, span);
    return id;
  }
  auto WriteTxn::set_message(uint64_t id, span<uint8_t> span) -> void {
    const auto& message = get_fb<Message>(span);
    const auto thread_opt = get_thread(message.thread());
    assert_fmt(!!thread_opt, "set_message: message {:x} thread {:x} does not exist", id, message.thread());
    if (const auto parent = message.parent()) {
      assert_fmt(*parent != id, "set_message: message {:x} cannot be its own parent", id);
      const auto parent_opt = get_message(*parent);
      assert_fmt(!!parent_opt, "set_message: message {:x} parent {:x} does not exist", id, *parent);
      assert_fmt(parent_opt->get().thread() == message.thread(),
        "set_message: message {:x} parent {:x} is in a different thread", id, *parent);
    }
    const auto old_opt = get_message(id);
    if (old_opt) {
      const auto& old = old_opt->get();
      spdlog::debug("Updating message {:x} (thread {:x})", id, message.thread());
      assert_fmt(old.thread() == message.thread(), "set_message: cannot move message {:x} between threads", id);
      assert_fmt(old.parent() == message.parent(), "set_message: cannot change parent of message {:x}", id);
      assert_fmt(old.created_at() == message.created_at(), "set_message: cannot change created_at of message {:x}", id);
    } else {
      spdlog::debug("Creating message {:x} (thread {:x}, parent {:x})", id, message.thread(), message.parent().value_or(0));
      db_put(txn, db.dbis[MessagesOwned_Thread], message.thread(), id);
      const auto& thread = thread_opt->get();
      if (message.created_at() > thread.latest_message()) {
        FlatBufferBuilder fbb;
        fbb.Finish(CreateThread(fbb,
          thread.forum(),
          thread.root(),
          fbb.CreateString(thread.slug()),
          thread.archived(),
          thread.created_at(),
          message.created_at()
        ));
        db_put(txn, db.dbis[Thread_Thread], message.thread(), fbb.GetBufferSpan());
      }
    }
    index_message_tags(id, message, old_opt);
    db_put(txn, db.dbis[Message_Message], id, span);
  }

  auto WriteTxn::update_messages_where(
    std::span<const uint64_t> ids,
    const MessagePredicate& where,
    const MessagePatcher& patch
  ) -> uint64_t {
    uint64_t updated = 0;
    FlatBufferBuilder fbb;
    for (const auto id : ids) {
      const auto old_opt = get_message(id);
      if (!old_opt) throw DBError(fmt::format("Cannot update message {:x}", id), MDB_NOTFOUND);
      const auto& old = old_opt->get();
      if (where && !where(old)) continue;
      fbb.Clear();
      patch(fbb, old);
      set_message(id, fbb.GetBufferSpan());
      updated++;
    }
    spdlog::debug("Bulk update touched {:d} of {:d} messages", updated, ids.size());
    return updated;
  }

  auto WriteTxn::set_read(uint64_t user_id, uint64_t message_id, bool read) -> bool {
    if (read) return db_add(txn, db.dbis[ReadMessages_User], user_id, message_id);
    return db_del(txn, db.dbis[ReadMessages_User], user_id, message_id);
  }
  auto WriteTxn::set_thread_hidden(uint64_t user_id, uint64_t thread_id, bool hidden) -> bool {
    if (hidden) return db_add(txn, db.dbis[InvisibleThreads_User], user_id, thread_id);
    return db_del(txn, db.dbis[InvisibleThreads_User], user_id, thread_id);
  }

  auto WriteTxn::create_tag(span<uint8_t> span) -> uint64_t {
    const uint64_t id = next_id();
    set_tag(id, span);
    return id;
  }
  auto WriteTxn::set_tag(uint64_t id, span<uint8_t> span) -> void {
    const auto& tag = get_fb<Tag>(span);
    vector<string_view> names{ tag.name()->string_view() };
    if (tag.synonyms()) {
      for (const auto s : *tag.synonyms()) names.push_back(s->string_view());
    }
    if (const auto old_opt = get_tag(id)) {
      const auto& old = old_opt->get();
      db_del(txn, db.dbis[Tag_Name], tag_name_key(old.name()->string_view()));
      if (old.synonyms()) {
        for (const auto s : *old.synonyms()) db_del(txn, db.dbis[Tag_Name], tag_name_key(s->string_view()));
      }
    }
    for (const auto name : names) {
      const auto existing = get_tag_id_by_name(name);
      assert_fmt(!existing || *existing == id, "set_tag: name {} already belongs to tag {:x}", name, existing.value_or(0));
      db_put(txn, db.dbis[Tag_Name], tag_name_key(name), id);
    }
    db_put(txn, db.dbis[Tag_Tag], id, span);
  }
  auto WriteTxn::delete_tag(uint64_t id) -> bool {
    const auto tag_opt = get_tag(id);
    if (!tag_opt) return false;
    const auto& tag = tag_opt->get();
    assert_fmt(list_messages_with_tag(id).is_done(), "delete_tag: tag {:x} is still in use", id);
    db_del(txn, db.dbis[Tag_Name], tag_name_key(tag.name()->string_view()));
    if (tag.synonyms()) {
      for (const auto s : *tag.synonyms()) db_del(txn, db.dbis[Tag_Name], tag_name_key(s->string_view()));
    }
    db_del(txn, db.dbis[MessagesTagged_Tag], id);
    return db_del(txn, db.dbis[Tag_Tag], id);
  }

  auto WriteTxn::set_config_option(ConfigScope scope, uint64_t owner_id, string_view name, string_view value) -> void {
    spdlog::debug("Setting {} config option {} for {:x}", to_string(scope), name, owner_id);
    db_put(txn, db.dbis[ConfigOption_Scope], config_key(scope, owner_id, name), value);
  }
  auto WriteTxn::delete_config_option(ConfigScope scope, uint64_t owner_id, string_view name) -> bool {
    return db_del(txn, db.dbis[ConfigOption_Scope], config_key(scope, owner_id, name));
  }

  auto WriteTxn::commit() -> void {
    if (auto err = mdb_txn_commit(txn)) {
      committed = true;
      txn = nullptr;
      throw DBError("Failed to commit transaction", err);
    }
    committed = true;
    txn = nullptr;
  }
}
