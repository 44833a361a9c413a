#pragma once
#include "db/db.h++"
#include "models/message.h++"
#include "models/patch.h++"
#include "models/thread_tree.h++"
#include "services/cache.h++"
#include "services/event_bus.h++"
#include "controllers/config_controller.h++"
#include "controllers/thread_controller.h++"
#include <variant>

namespace Skein {

namespace SubtreeOp {
  // The anchor keeps `reason`; every descendant loses its own.
  struct Delete { std::optional<std::string> reason; };
  struct Restore {};
  struct SetFlag { std::string key, value; };
  struct ClearFlag { std::string key; };
  // With `cascade`, every descendant gets the same tags.
  struct Retag { std::vector<uint64_t> tags; bool cascade = false; };
}

using SubtreeMutation = std::variant<
  SubtreeOp::Delete,
  SubtreeOp::Restore,
  SubtreeOp::SetFlag,
  SubtreeOp::ClearFlag,
  SubtreeOp::Retag
>;

using MutationParams = std::map<std::string, std::string, std::less<>>;

// Accepts the operation names delete, restore, set-flag, clear-flag and
// retag. Throws a 400 ApiError for anything else or for missing parameters.
auto parse_subtree_mutation(std::string_view op, const MutationParams& params = {}) -> SubtreeMutation;

struct SubtreeResult {
  uint64_t thread_id;
  // anchor first
  std::vector<uint64_t> affected;
  uint64_t changed = 0;
};

class MessageController {
private:
  std::shared_ptr<DB> db;
  std::shared_ptr<Cache> cache;
  std::shared_ptr<ThreadController> threads;
  std::shared_ptr<ConfigController> config;
  std::shared_ptr<EventBus> event_bus;

  using SubtreeBody = std::function<uint64_t (WriteTxn&, std::span<const uint64_t>)>;
  using TagLimits = std::pair<int64_t, int64_t>;

  auto tag_limits(uint64_t forum_id) -> TagLimits;
  auto validate_tags(ReadTxn& txn, std::vector<uint64_t> tags, std::optional<TagLimits> limits = {}) -> std::vector<uint64_t>;
  auto apply(WriteTxn& txn, std::span<const uint64_t> closure, const SubtreeMutation& mutation) -> uint64_t;
  auto run_subtree(uint64_t anchor_id, const SubtreeBody& body) -> SubtreeResult;
  auto update_one(uint64_t id, const MessagePredicate& where, const MessagePatch& patch, Event event) -> bool;
  auto after_write(uint64_t thread_id, std::span<const uint64_t> touched) noexcept -> void;

public:
  MessageController(
    std::shared_ptr<DB> db,
    std::shared_ptr<Cache> cache,
    std::shared_ptr<ThreadController> threads,
    std::shared_ptr<ConfigController> config,
    std::shared_ptr<EventBus> event_bus = std::make_shared<DummyEventBus>()
  ) : db(db), cache(cache), threads(threads), config(config), event_bus(event_bus) {
    assert(db != nullptr);
    assert(cache != nullptr);
    assert(threads != nullptr);
    assert(config != nullptr);
    assert(event_bus != nullptr);
  }

  // Returns (thread id, root message id).
  auto create_thread(uint64_t forum_id, const NewMessage& root, std::string_view slug = {}) -> std::pair<uint64_t, uint64_t>;
  auto create_message(uint64_t thread_id, uint64_t parent_id, const NewMessage& message) -> uint64_t;
  auto edit_message(uint64_t id, const MessageEdit& edit) -> void;
  auto score_message(uint64_t id, int64_t up_delta, int64_t down_delta = 0) -> void;
  // False if there was nothing to change.
  auto accept_message(uint64_t id) -> bool;
  auto unaccept_message(uint64_t id) -> bool;

  // Applies one mutation to `anchor_id` and everything below it, in one
  // write transaction. The closure is computed inside that transaction.
  auto mutate_subtree(uint64_t anchor_id, const SubtreeMutation& mutation) -> SubtreeResult;

  auto flag_no_answer(
    uint64_t id,
    std::optional<std::string_view> reason,
    std::string_view type = MessageFlag::no_answer_admin
  ) -> SubtreeResult;
  auto unflag_no_answer(uint64_t id) -> SubtreeResult;

  auto set_thread_archived(uint64_t thread_id, bool archived) -> bool;
};

}
