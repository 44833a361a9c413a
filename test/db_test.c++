#include "test_common.h++"
#include "models/patch.h++"

using namespace flatbuffers;

static inline auto create_thread(WriteTxn& txn, uint64_t forum, uint64_t created_at = now_s()) -> uint64_t {
  FlatBufferBuilder fbb;
  const auto slug_s = fbb.CreateString("test");
  ThreadBuilder thread(fbb);
  thread.add_forum(forum);
  thread.add_slug(slug_s);
  thread.add_created_at(created_at);
  thread.add_latest_message(created_at);
  fbb.Finish(thread.Finish());
  return txn.create_thread(fbb.GetBufferSpan());
}

static inline auto create_message(
  WriteTxn& txn,
  uint64_t thread,
  optional<uint64_t> parent,
  string_view subject,
  vector<uint64_t> tags = {},
  uint64_t created_at = now_s()
) -> uint64_t {
  const auto thread_opt = txn.get_thread(thread);
  FlatBufferBuilder fbb;
  const auto subject_s = fbb.CreateString(subject), author_s = fbb.CreateString("tester");
  const auto tags_v = fbb.CreateVector(tags);
  MessageBuilder message(fbb);
  message.add_thread(thread);
  message.add_forum(thread_opt ? thread_opt->get().forum() : 0);
  if (parent) message.add_parent(*parent);
  message.add_author_name(author_s);
  message.add_subject(subject_s);
  message.add_tags(tags_v);
  message.add_created_at(created_at);
  fbb.Finish(message.Finish());
  return txn.create_message(fbb.GetBufferSpan());
}

static inline auto create_tag(WriteTxn& txn, string_view name) -> uint64_t {
  FlatBufferBuilder fbb;
  const auto name_s = fbb.CreateString(name);
  TagBuilder tag(fbb);
  tag.add_name(name_s);
  tag.add_created_at(now_s());
  fbb.Finish(tag.Finish());
  return txn.create_tag(fbb.GetBufferSpan());
}

TEST_CASE("create DB", "[db]") {
  TempFile file;
  DB db(file.name, 100, true);
  auto txn = db.open_read_txn();
  CHECK(txn.get_setting_int(SettingsKey::next_id) == 1);
  CHECK(txn.get_setting_int(SettingsKey::created_at) > 0);
}

TEST_CASE("ids are shared and monotonic across record types", "[db]") {
  TempFile file;
  DB db(file.name, 100, true);
  uint64_t thread, m1, m2, tag;
  {
    auto txn = db.open_write_txn();
    thread = create_thread(txn, 7);
    m1 = create_message(txn, thread, {}, "first");
    tag = create_tag(txn, "Cats");
    m2 = create_message(txn, thread, m1, "second");
    txn.commit();
  }
  CHECK(thread < m1);
  CHECK(m1 < tag);
  CHECK(tag < m2);
  {
    auto txn = db.open_write_txn();
    CHECK(txn.next_id() == m2 + 1);
    txn.commit();
  }
}

TEST_CASE("messages are indexed by thread and threads by forum", "[db]") {
  TempFile file;
  DB db(file.name, 100, true);
  uint64_t t1, t2, a, b, c;
  {
    auto txn = db.open_write_txn();
    t1 = create_thread(txn, 1);
    t2 = create_thread(txn, 1);
    a = create_message(txn, t1, {}, "a");
    b = create_message(txn, t1, a, "b");
    c = create_message(txn, t2, {}, "c");
    txn.commit();
  }
  auto txn = db.open_read_txn();
  CHECK(txn.list_threads_of_forum(1).collect() == vector<uint64_t>{t1, t2});
  CHECK(txn.list_threads_of_forum(2).collect().empty());
  CHECK(txn.list_messages_of_thread(t1).collect() == vector<uint64_t>{a, b});
  CHECK(txn.list_messages_of_thread(t2).collect() == vector<uint64_t>{c});
  const auto msg = txn.get_message(b);
  REQUIRE(!!msg);
  CHECK(msg->get().subject()->string_view() == "b"sv);
  CHECK(msg->get().parent() == optional(a));
  CHECK(msg->get().forum() == 1);
}

TEST_CASE("a new message advances the thread's latest_message", "[db]") {
  TempFile file;
  DB db(file.name, 100, true);
  uint64_t thread;
  {
    auto txn = db.open_write_txn();
    thread = create_thread(txn, 1, 1000);
    const auto root = create_message(txn, thread, {}, "root", {}, 1000);
    create_message(txn, thread, root, "later", {}, 2000);
    create_message(txn, thread, root, "backdated", {}, 1500);
    txn.commit();
  }
  auto txn = db.open_read_txn();
  CHECK(txn.get_thread(thread)->get().latest_message() == 2000);
  CHECK(txn.get_thread(thread)->get().slug()->string_view() == "test"sv);
}

TEST_CASE("set_message rejects broken parent links", "[db]") {
  TempFile file;
  DB db(file.name, 100, true);
  auto txn = db.open_write_txn();
  const auto t1 = create_thread(txn, 1), t2 = create_thread(txn, 1);
  const auto a = create_message(txn, t1, {}, "a");
  CHECK_THROWS_AS(create_message(txn, t2, a, "wrong thread"), runtime_error);
  CHECK_THROWS_AS(create_message(txn, t1, 9999, "no parent"), runtime_error);
  CHECK_THROWS_AS(create_message(txn, 9999, {}, "no thread"), runtime_error);
  txn.commit();
}

TEST_CASE("update_messages_where only rewrites matching messages", "[db]") {
  TempFile file;
  DB db(file.name, 100, true);
  uint64_t thread, a, b, c;
  {
    auto txn = db.open_write_txn();
    thread = create_thread(txn, 1);
    a = create_message(txn, thread, {}, "a");
    b = create_message(txn, thread, a, "b");
    c = create_message(txn, thread, a, "c");
    txn.commit();
  }
  {
    auto txn = db.open_write_txn();
    const vector<uint64_t> ids{a, b, c};
    const auto changed = txn.update_messages_where(ids,
      [&](const Message& m) { return m.subject()->string_view() != "b"; },
      [](FlatBufferBuilder& fbb, const Message& m) { fbb.Finish(patch_message(fbb, m, { .deleted = true })); }
    );
    CHECK(changed == 2);
    const vector<uint64_t> missing{a, 9999};
    CHECK_THROWS_AS(txn.update_messages_where(missing, {}, [](FlatBufferBuilder& fbb, const Message& m) {
      fbb.Finish(patch_message(fbb, m, {}));
    }), DBError);
    txn.commit();
  }
  auto txn = db.open_read_txn();
  CHECK(txn.get_message(a)->get().deleted());
  CHECK_FALSE(txn.get_message(b)->get().deleted());
  CHECK(txn.get_message(c)->get().deleted());
}

TEST_CASE("read markers and hidden threads are sets", "[db]") {
  TempFile file;
  DB db(file.name, 100, true);
  auto txn = db.open_write_txn();
  CHECK(txn.set_read(1, 100, true));
  CHECK_FALSE(txn.set_read(1, 100, true));
  CHECK(txn.set_read(1, 101, true));
  CHECK(txn.has_user_read_message(1, 100));
  CHECK_FALSE(txn.has_user_read_message(2, 100));
  CHECK(txn.list_read_messages_of_user(1).collect() == vector<uint64_t>{100, 101});
  CHECK(txn.set_read(1, 100, false));
  CHECK_FALSE(txn.set_read(1, 100, false));
  CHECK_FALSE(txn.has_user_read_message(1, 100));

  CHECK(txn.set_thread_hidden(1, 50, true));
  CHECK_FALSE(txn.set_thread_hidden(1, 50, true));
  CHECK(txn.has_user_hidden_thread(1, 50));
  CHECK(txn.set_thread_hidden(1, 50, false));
  CHECK_FALSE(txn.has_user_hidden_thread(1, 50));
  txn.commit();
}

TEST_CASE("tags are indexed by name and by message", "[db]") {
  TempFile file;
  DB db(file.name, 100, true);
  uint64_t cats, dogs, thread, a, b;
  {
    auto txn = db.open_write_txn();
    cats = create_tag(txn, "Cats");
    dogs = create_tag(txn, "dogs");
    CHECK_THROWS_AS(create_tag(txn, "CATS"), runtime_error);
    thread = create_thread(txn, 1);
    a = create_message(txn, thread, {}, "a", {cats});
    b = create_message(txn, thread, a, "b", {cats, dogs});
    txn.commit();
  }
  {
    auto txn = db.open_read_txn();
    CHECK(txn.get_tag_id_by_name("cats") == optional(cats));
    CHECK(txn.get_tag_id_by_name("DOGS") == optional(dogs));
    CHECK_FALSE(txn.get_tag_id_by_name("birds"));
    CHECK(txn.list_messages_with_tag(cats).collect() == vector<uint64_t>{a, b});
    CHECK(txn.list_messages_with_tag(dogs).collect() == vector<uint64_t>{b});
  }
  {
    auto txn = db.open_write_txn();
    const vector<uint64_t> ids{b};
    txn.update_messages_where(ids, {}, [&](FlatBufferBuilder& fbb, const Message& m) {
      fbb.Finish(patch_message(fbb, m, { .tags = vector<uint64_t>{dogs} }));
    });
    CHECK_THROWS_AS(txn.delete_tag(dogs), runtime_error);
    txn.commit();
  }
  auto txn = db.open_read_txn();
  CHECK(txn.list_messages_with_tag(cats).collect() == vector<uint64_t>{a});
  CHECK(txn.list_messages_with_tag(dogs).collect() == vector<uint64_t>{b});
}

TEST_CASE("config options are scoped by owner", "[db]") {
  TempFile file;
  DB db(file.name, 100, true);
  {
    auto txn = db.open_write_txn();
    txn.set_config_option(ConfigScope::Global, 0, "sort_messages", "ascending");
    txn.set_config_option(ConfigScope::Forum, 1, "sort_messages", "descending");
    txn.set_config_option(ConfigScope::Forum, 1, "max_tags_per_message", "3");
    txn.set_config_option(ConfigScope::Forum, 2, "sort_messages", "");
    txn.set_config_option(ConfigScope::User, 1, "sort_messages", "ascending");
    txn.commit();
  }
  {
    auto txn = db.open_read_txn();
    CHECK(txn.get_config_option(ConfigScope::Forum, 1, "sort_messages") == optional("descending"sv));
    CHECK(txn.get_config_option(ConfigScope::Forum, 2, "sort_messages") == optional(""sv));
    CHECK_FALSE(txn.get_config_option(ConfigScope::Forum, 3, "sort_messages"));
    const auto forum1 = txn.list_config_options(ConfigScope::Forum, 1);
    REQUIRE(forum1.size() == 2);
    CHECK(forum1[0] == pair("max_tags_per_message"sv, "3"sv));
    CHECK(forum1[1] == pair("sort_messages"sv, "descending"sv));
    CHECK(txn.list_config_options(ConfigScope::User, 1).size() == 1);
  }
  {
    auto txn = db.open_write_txn();
    CHECK(txn.delete_config_option(ConfigScope::Forum, 1, "sort_messages"));
    CHECK_FALSE(txn.delete_config_option(ConfigScope::Forum, 1, "sort_messages"));
    txn.commit();
  }
  auto txn = db.open_read_txn();
  CHECK(txn.list_config_options(ConfigScope::Forum, 1).size() == 1);
}

TEST_CASE("reopening a database keeps its records", "[db]") {
  TempFile file;
  uint64_t thread;
  {
    DB db(file.name, 100, false);
    auto txn = db.open_write_txn();
    thread = create_thread(txn, 3);
    txn.commit();
  }
  DB db(file.name, 100, false);
  auto txn = db.open_read_txn();
  REQUIRE(!!txn.get_thread(thread));
  CHECK(txn.get_thread(thread)->get().forum() == 3);
  CHECK(txn.get_setting_int(SettingsKey::next_id) == thread + 1);
}
