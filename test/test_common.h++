#include "util/common.h++"
#include "db/db.h++"
#include "services/asio_event_bus.h++"
#include "services/cache.h++"
#include "controllers/config_controller.h++"
#include "controllers/message_controller.h++"
#include "controllers/read_controller.h++"
#include "controllers/tag_controller.h++"
#include "controllers/thread_controller.h++"
#include <cstdio>
#include <map>
#include <lmdb.h>
#include <catch2/catch_test_macros.hpp>
#include <static_block.hpp>
#include <spdlog/sinks/ringbuffer_sink.h>

using std::make_shared, std::make_unique, std::nullopt, std::optional,
    std::pair, std::runtime_error, std::shared_ptr, std::string,
    std::string_view, std::vector;
using namespace std::chrono_literals;
using namespace std::literals::string_view_literals;
using namespace Skein;

static_block {
  spdlog::set_level(spdlog::level::debug);
}

struct TempFile {
  char* name;

  TempFile() {
    name = std::tmpnam(nullptr);
  }
  ~TempFile() {
    std::remove(name);
    std::remove(fmt::format("{}-lock", name).c_str());
  }
};

struct TempDB {
  TempFile file;
  MDB_env* env;
  MDB_dbi dbi;

  TempDB(unsigned flags = MDB_DUPSORT) {
    int err = mdb_env_create(&env);
    if (err) throw runtime_error(mdb_strerror(err));
    err = mdb_env_set_maxdbs(env, 1);
    if (err) throw runtime_error(mdb_strerror(err));
    err = mdb_env_set_mapsize(env, 10 * MiB);
    if (err) throw runtime_error(mdb_strerror(err));
    err = mdb_env_open(env, file.name, MDB_NOSUBDIR | MDB_NOSYNC | MDB_NOMEMINIT, 0600);
    if (err) throw runtime_error(mdb_strerror(err));
    MDB_txn* txn;
    err = mdb_txn_begin(env, nullptr, 0, &txn);
    if (err) throw runtime_error(mdb_strerror(err));
    err = mdb_dbi_open(txn, "test", MDB_CREATE | flags, &dbi);
    if (err) throw runtime_error(mdb_strerror(err));
    err = mdb_txn_commit(txn);
    if (err) throw runtime_error(mdb_strerror(err));
  }
  ~TempDB() {
    mdb_env_close(env);
  }
};

// A database, a cache and every controller wired together the way the
// executable wires them. Events go through a real AsioEventBus; call
// `io->poll()` to deliver them.
struct Instance {
  TempFile file;
  shared_ptr<asio::io_context> io = make_shared<asio::io_context>();
  shared_ptr<AsioEventBus> event_bus = make_shared<AsioEventBus>(io);
  shared_ptr<DB> db = make_shared<DB>(file.name, 100, true);
  shared_ptr<Cache> cache = make_shared<Cache>();
  shared_ptr<ConfigController> config = make_shared<ConfigController>(db, cache, event_bus);
  shared_ptr<ThreadController> threads = make_shared<ThreadController>(db, cache, config);
  shared_ptr<MessageController> messages = make_shared<MessageController>(db, cache, threads, config, event_bus);
  shared_ptr<ReadController> reads = make_shared<ReadController>(db, cache, event_bus);
  shared_ptr<TagController> tags = make_shared<TagController>(db, cache);

  auto post(uint64_t thread_id, uint64_t parent_id, string_view subject, uint64_t created_at = 0) -> uint64_t {
    return messages->create_message(thread_id, parent_id, {
      .author_name = "tester",
      .subject = subject,
      .content = "",
      .created_at = created_at ? optional(created_at) : nullopt
    });
  }

  auto start_thread(uint64_t forum_id, string_view subject = "Root", uint64_t created_at = 0) -> pair<uint64_t, uint64_t> {
    return messages->create_thread(forum_id, {
      .author_name = "tester",
      .subject = subject,
      .content = "",
      .created_at = created_at ? optional(created_at) : nullopt
    });
  }
};

// Records every event delivered for one event type.
struct EventLog {
  struct Entry { uint64_t subject; EventPayload payload; };
  vector<Entry> entries;
  EventBus::Subscription sub;

  EventLog(EventBus& bus, Event event)
    : sub(bus.on_event(event, [this](Event, uint64_t subject, const EventPayload& p) {
        entries.push_back({ subject, p });
      })) {}
};

// Keeps the last messages logged at warn or above while in scope.
struct WarningLog {
  shared_ptr<spdlog::sinks::ringbuffer_sink_mt> sink = make_shared<spdlog::sinks::ringbuffer_sink_mt>(64);

  WarningLog() {
    sink->set_level(spdlog::level::warn);
    sink->set_pattern("%v");
    spdlog::default_logger()->sinks().push_back(sink);
  }
  ~WarningLog() {
    auto& sinks = spdlog::default_logger()->sinks();
    sinks.erase(std::remove(sinks.begin(), sinks.end(), sink), sinks.end());
  }

  auto lines() const -> vector<string> { return sink->last_formatted(); }
};
