#include "util/common.h++"
#include "db/db.h++"
#include "services/asio_event_bus.h++"
#include "services/cache.h++"
#include "controllers/config_controller.h++"
#include "controllers/message_controller.h++"
#include "controllers/read_controller.h++"
#include "controllers/thread_controller.h++"
#include <asio.hpp>
#include <optparse.h>
#include <iostream>

using namespace Skein;
using std::make_shared, std::optional, std::runtime_error, std::stoull,
    std::string, std::vector;

static auto parse_id(const string& s) -> uint64_t {
  try {
    size_t end;
    const auto id = stoull(s, &end, 16);
    if (end != s.size()) throw ApiError(fmt::format("Not an id: {}", s), 400);
    return id;
  } catch (const std::logic_error&) {
    throw ApiError(fmt::format("Not an id: {}", s), 400);
  }
}

static auto print_tree(const ThreadTree& tree) -> void {
  fmt::print("thread {:x} ({} messages)\n", tree.thread_id(), tree.size());
  tree.walk([&](const MessageSnapshot& m, const ThreadNode& node) {
    fmt::print(
      "{:{}}{:x} [{}] {}{}{}\n",
      "", node.depth * 2,
      m.id,
      m.score(),
      m.subject,
      m.deleted ? " (deleted)" : "",
      tree.is_orphan(node) ? " (orphan)" : ""
    );
  });
}

int main(int argc, char** argv) {
  auto parser = optparse::OptionParser()
    .version(string(VERSION))
    .usage("%prog [options] tree THREAD_ID\n"
           "       %prog [options] mutate MESSAGE_ID OP [KEY=VALUE...]\n"
           "       %prog [options] config NAME\n"
           "       %prog [options] unread USER_ID FORUM_ID...")
    .description("Inspects and maintains a forum thread database. Ids are hexadecimal.");
  parser.add_option("--db")
    .dest("db")
    .type("FILE.mdb")
    .help("database filename, will be created if it does not exist (default = skein.mdb)")
    .set_default("skein.mdb");
  parser.add_option("-s", "--map-size")
    .dest("map_size")
    .type("INT")
    .help("maximum database size, in MiB (default = 1024)")
    .set_default(1024);
  parser.add_option("--log-level")
    .dest("log_level")
    .help("log level (debug, info, warn, error, critical)")
    .set_default("warn");
  parser.add_option("-u", "--user")
    .dest("user")
    .type("ID")
    .help("resolve options as seen by this user");
  parser.add_option("-f", "--forum")
    .dest("forum")
    .type("ID")
    .help("resolve options as seen in this forum");
  parser.add_option("-a", "--all")
    .dest("all")
    .nargs(0)
    .help("include deleted and draft messages in trees");
  parser.add_option("--descending")
    .dest("descending")
    .nargs(0)
    .help("newest replies first, overriding the sort_messages option");
  parser.add_help_option();

  const optparse::Values options = parser.parse_args(argc, argv);
  const vector<string> args = parser.args();
  spdlog::set_level(spdlog::level::from_str(options["log_level"]));
  if (args.empty()) {
    parser.print_usage(std::cerr);
    return EXIT_FAILURE;
  }

  try {
    const optional<uint64_t>
      user_id = options.is_set_by_user("user") ? optional(parse_id(options["user"])) : std::nullopt,
      forum_id = options.is_set_by_user("forum") ? optional(parse_id(options["forum"])) : std::nullopt;

    auto io = make_shared<asio::io_context>();
    auto event_bus = make_shared<AsioEventBus>(io);
    auto db = make_shared<DB>(options["db"].c_str(), stoull(options["map_size"]));
    auto cache = make_shared<Cache>();
    auto config_c = make_shared<ConfigController>(db, cache, event_bus);
    auto thread_c = make_shared<ThreadController>(db, cache, config_c);
    auto sub = event_bus->on_event(Event::ThreadUpdate, [](Event, uint64_t thread_id, const EventPayload& ids) {
      spdlog::info("Thread {:x} updated, {:d} messages touched", thread_id, ids.size());
    });

    const auto& command = args[0];
    if (command == "tree" && args.size() == 2) {
      const auto thread_id = parse_id(args[1]);
      const VisibilityFilter filter = options.is_set_by_user("all") ? VisibilityFilter::everything() : VisibilityFilter{};
      const auto tree = options.is_set_by_user("descending")
        ? thread_c->build_tree(thread_id, filter, MessageOrder::Descending)
        : thread_c->build_tree_for(thread_id, filter, user_id, forum_id.or_else([&]() -> optional<uint64_t> {
            return thread_c->thread(thread_id)->forum_id;
          }));
      print_tree(*tree);
    } else if (command == "mutate" && args.size() >= 3) {
      MutationParams params;
      for (size_t i = 3; i < args.size(); i++) {
        const auto eq = args[i].find('=');
        if (eq == string::npos) throw ApiError(fmt::format("Expected KEY=VALUE, got {}", args[i]), 400);
        params.emplace(args[i].substr(0, eq), args[i].substr(eq + 1));
      }
      MessageController message_c(db, cache, thread_c, config_c, event_bus);
      const auto result = message_c.mutate_subtree(parse_id(args[1]), parse_subtree_mutation(args[2], params));
      fmt::print("{} of {} messages changed in thread {:x}\n", result.changed, result.affected.size(), result.thread_id);
    } else if (command == "config" && args.size() == 2) {
      if (!ConfigController::is_known_option(args[1])) {
        spdlog::warn("{} is not a built-in option", args[1]);
      }
      const auto value = config_c->resolve(args[1], user_id, forum_id);
      fmt::print("{}\n", value.value_or("(unset)"));
    } else if (command == "unread" && args.size() >= 3) {
      ReadController read_c(db, cache, event_bus);
      vector<uint64_t> forums;
      for (size_t i = 2; i < args.size(); i++) forums.push_back(parse_id(args[i]));
      const auto count = read_c.count_unread(parse_id(args[1]), forums);
      fmt::print("{} unread threads, {} unread messages\n", count.threads, count.messages);
    } else {
      parser.print_usage(std::cerr);
      return EXIT_FAILURE;
    }
    io->poll();
  } catch (const ApiError& e) {
    spdlog::critical("{} ({})", e.what(), e.http_status);
    return EXIT_FAILURE;
  } catch (const runtime_error& e) {
    spdlog::critical("{}", e.what());
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
