#pragma once
#include "db/db.h++"
#include "services/cache.h++"
#include "services/event_bus.h++"

namespace Skein {

struct ConfigDefault {
  std::string_view name;
  std::optional<std::string_view> value;
};

// Cascading option lookup: user, then forum, then global, then the built-in
// default. A blank value at any level counts as unset.
class ConfigController {
private:
  std::shared_ptr<DB> db;
  std::shared_ptr<Cache> cache;
  std::shared_ptr<EventBus> event_bus;

  auto lookup(ConfigScope scope, uint64_t owner_id, std::string_view name) -> std::optional<std::string>;

public:
  ConfigController(
    std::shared_ptr<DB> db,
    std::shared_ptr<Cache> cache,
    std::shared_ptr<EventBus> event_bus = std::make_shared<DummyEventBus>()
  ) : db(db), cache(cache), event_bus(event_bus) {
    assert(db != nullptr);
    assert(cache != nullptr);
    assert(event_bus != nullptr);
  }

  static auto defaults() -> std::span<const ConfigDefault>;
  static auto is_known_option(std::string_view name) -> bool;
  static auto default_value(std::string_view name) -> std::optional<std::string_view>;

  // Every option stored for one (scope, owner), read through the cache.
  auto options(ConfigScope scope, uint64_t owner_id) -> ConfigKey::Value;

  auto resolve(
    std::string_view name,
    std::optional<uint64_t> user_id = {},
    std::optional<uint64_t> forum_id = {}
  ) -> std::optional<std::string>;
  auto resolve_int(
    std::string_view name,
    std::optional<uint64_t> user_id = {},
    std::optional<uint64_t> forum_id = {}
  ) -> std::optional<int64_t>;
  auto resolve_bool(
    std::string_view name,
    std::optional<uint64_t> user_id = {},
    std::optional<uint64_t> forum_id = {}
  ) -> std::optional<bool>;

  auto set_option(ConfigScope scope, uint64_t owner_id, std::string_view name, std::string_view value) -> void;
  auto delete_option(ConfigScope scope, uint64_t owner_id, std::string_view name) -> bool;
};

}
