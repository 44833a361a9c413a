#pragma once
#include "util/common.h++"
#include "util/iter.h++"
#include "fbs/records.h++"
#include <atomic>
#include <span>
#include <utility>
#include <vector>

namespace Skein {

  namespace SettingsKey {
    inline static constexpr std::string_view
      next_id {"next_id"},
      created_at {"created_at"};
  };

  enum class ConfigScope : uint8_t {
    Global, Forum, User
  };

  constexpr auto to_string(ConfigScope scope) -> std::string_view {
    using enum ConfigScope;
    switch (scope) {
      case Global: return "global";
      case Forum: return "forum";
      case User: return "user";
    }
    return "unknown";
  }

  class ReadTxn;
  class ReadTxnImpl;
  class WriteTxn;

  class DBError : public std::runtime_error {
  public:
    DBError(std::string message, int mdb_error) :
      std::runtime_error(message + ": " + std::string(mdb_strerror(mdb_error))) {}
  };

  class DB {
  private:
    size_t map_size;
    MDB_env* env;
    MDB_dbi dbis[32];
    auto init_env(const char* filename, MDB_txn** txn, bool fast) -> int;
  public:
    DB(
      const char* filename,
      size_t map_size_mb = 1024,
      bool move_fast_and_break_things = false
    );
    DB(const DB&) = delete;
    auto operator=(const DB&) = delete;
    DB(DB&&) = delete;
    auto operator=(DB&&) = delete;
    ~DB();

    auto open_read_txn() -> ReadTxnImpl;
    auto open_write_txn() -> WriteTxn;

    friend class ReadTxn;
    friend class ReadTxnImpl;
    friend class WriteTxn;
  };

  class ReadTxn {
  protected:
    DB& db;
    MDB_txn* txn;
    ReadTxn(DB& db) : db(db) {}
  public:
    ReadTxn(const ReadTxn& from) = delete;
    auto operator=(const ReadTxn&) = delete;
    ReadTxn(ReadTxn&& from) : db(from.db), txn(from.txn) { from.txn = nullptr; }
    ReadTxn& operator=(ReadTxn&& from) = delete;
    virtual ~ReadTxn() = default;

    auto get_setting_int(std::string_view key) -> uint64_t;

    auto get_thread(uint64_t id) -> OptRef<Thread>;
    auto list_threads_of_forum(uint64_t forum_id) -> DBIter;

    auto get_message(uint64_t id) -> OptRef<Message>;
    auto list_messages_of_thread(uint64_t thread_id) -> DBIter;

    auto has_user_read_message(uint64_t user_id, uint64_t message_id) -> bool;
    auto list_read_messages_of_user(uint64_t user_id) -> DBIter;
    auto has_user_hidden_thread(uint64_t user_id, uint64_t thread_id) -> bool;

    auto get_tag(uint64_t id) -> OptRef<Tag>;
    auto get_tag_id_by_name(std::string_view name) -> std::optional<uint64_t>;
    auto list_messages_with_tag(uint64_t tag_id) -> DBIter;

    auto get_config_option(ConfigScope scope, uint64_t owner_id, std::string_view name) -> std::optional<std::string_view>;
    auto list_config_options(ConfigScope scope, uint64_t owner_id) -> std::vector<std::pair<std::string_view, std::string_view>>;

    friend class ReadTxnImpl;
  };

  class ReadTxnImpl : public ReadTxn {
  protected:
    ReadTxnImpl(DB& db) : ReadTxn(db) {
      if (auto err = mdb_txn_begin(db.env, nullptr, MDB_RDONLY, &txn)) {
        throw DBError("Failed to open read transaction", err);
      }
    }
  public:
    ReadTxnImpl(ReadTxnImpl&& from) : ReadTxn(std::move(from)) {};
    ~ReadTxnImpl() {
      if (txn != nullptr) mdb_txn_abort(txn);
    }

    friend class DB;
  };

  // Only ids whose current record satisfies the predicate are rewritten.
  using MessagePredicate = std::function<bool (const Message&)>;
  // Must Finish() the builder with the replacement record.
  using MessagePatcher = std::function<void (flatbuffers::FlatBufferBuilder&, const Message&)>;

  class WriteTxn : public ReadTxn {
  private:
    bool committed = false;
    auto index_message_tags(uint64_t id, const Message& message, OptRef<Message> old) -> void;

    WriteTxn(DB& db) : ReadTxn(db) {
      if (auto err = mdb_txn_begin(db.env, nullptr, 0, &txn)) {
        throw DBError("Failed to open write transaction", err);
      }
    };
  public:
    WriteTxn(WriteTxn&& from) : ReadTxn(std::move(from)), committed(from.committed) {
      from.committed = true;
    }
    ~WriteTxn() {
      if (!committed) {
        spdlog::warn("Aborting uncommitted write transaction");
        if (txn != nullptr) mdb_txn_abort(txn);
      }
    }

    auto next_id() -> uint64_t;
    auto set_setting(std::string_view key, uint64_t value) -> void;

    auto create_thread(flatbuffers::span<uint8_t> span) -> uint64_t;
    auto set_thread(uint64_t id, flatbuffers::span<uint8_t> span) -> void;

    auto create_message(flatbuffers::span<uint8_t> span) -> uint64_t;
    auto set_message(uint64_t id, flatbuffers::span<uint8_t> span) -> void;
    auto update_messages_where(
      std::span<const uint64_t> ids,
      const MessagePredicate& where,
      const MessagePatcher& patch
    ) -> uint64_t;

    auto set_read(uint64_t user_id, uint64_t message_id, bool read) -> bool;
    auto set_thread_hidden(uint64_t user_id, uint64_t thread_id, bool hidden) -> bool;

    auto create_tag(flatbuffers::span<uint8_t> span) -> uint64_t;
    auto set_tag(uint64_t id, flatbuffers::span<uint8_t> span) -> void;
    auto delete_tag(uint64_t id) -> bool;

    auto set_config_option(ConfigScope scope, uint64_t owner_id, std::string_view name, std::string_view value) -> void;
    auto delete_config_option(ConfigScope scope, uint64_t owner_id, std::string_view name) -> bool;

    auto commit() -> void;

    friend class DB;
  };
}
