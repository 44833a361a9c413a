#include "config_controller.h++"
#include "util/lambda_macros.h++"
#include <charconv>

using std::make_shared, std::optional, std::span, std::string, std::string_view;

namespace Skein {

static constexpr ConfigDefault config_defaults[] = {
  { "pagination", "50" },
  { "pagination_users", "50" },
  { "pagination_search", "50" },
  { "locked", "no" },
  { "css_ressource", {} },
  { "js_ressource", {} },
  { "sort_threads", "newest-first" },
  { "sort_messages", "ascending" },
  { "standard_view", "nested-view" },
  { "max_tags_per_message", "3" },
  { "min_tags_per_message", "1" },
  { "close_vote_votes", "5" },
  { "close_vote_action_off-topic", "close" },
  { "close_vote_action_not-constructive", "close" },
  { "close_vote_action_illegal", "hide" },
  { "close_vote_action_spam", "hide" },
  { "close_vote_action_duplicate", "close" },
  { "close_vote_action_custom", "close" },
  { "header_start_index", "2" },
  { "editing_enabled", "yes" },
  { "edit_until_has_answer", "yes" },
  { "max_editable_age", "10" },
  { "hide_subjects_unchanged", "yes" },
  { "hide_repeating_tags", "yes" },
  { "max_threads", "150" },
  { "max_messages_per_thread", "50" },
  { "cites_min_age_to_archive", "2" },
  { "accept_value", "15" },
  { "accept_self_value", "15" },
  { "vote_down_value", "-1" },
  { "vote_up_value", "10" },
  { "date_format_index", "%d.%m.%Y %H:%M" },
  { "date_format_index_sameday", "%H:%M" },
  { "date_format_post", "%d.%m.%Y %H:%M" },
  { "date_format_search", "%d.%m.%Y" },
  { "date_format_default", "%d.%m.%Y %H:%M" },
  { "date_format_date", "%d.%m.%Y" },
  { "mail_thread_sort", "ascending" },
  { "subject_black_list", "" },
  { "content_black_list", "" },

  { "search_forum_relevance", "1" },
  { "search_cites_relevance", "0.9" },

  // user preferences
  { "email", {} },
  { "url", {} },
  { "greeting", {} },
  { "farewell", {} },
  { "signature", {} },
  { "autorefresh", "0" },
  { "quote_signature", "no" },
  { "show_unread_notifications_in_title", "no" },
  { "show_unread_pms_in_title", "no" },
  { "show_new_messages_since_last_visit_in_title", "no" },
  { "use_javascript_notifications", "yes" },
  { "notify_on_new_mail", "no" },
  { "notify_on_abonement_activity", "no" },
  { "autosubscribe_on_post", "yes" },
  { "notify_on_flagged", "no" },
  { "notify_on_open_close_vote", "no" },
  { "notify_on_move", "no" },
  { "notify_on_new_thread", "no" },
  { "notify_on_mention", "yes" },
  { "highlighted_users", "" },
  { "highlight_self", "yes" },
  { "inline_answer", "yes" },
  { "quote_by_default", "no" },
  { "delete_read_notifications_on_abonements", "yes" },
  { "delete_read_notifications_on_mention", "yes" },
  { "open_close_default", "open" },
  { "open_close_close_when_read", "no" },
  { "own_css_file", {} },
  { "own_js_file", {} },
  { "own_css", {} },
  { "own_js", {} },
  { "mark_suspicious", "yes" },
  { "page_messages", "yes" },
  { "fold_quotes", "no" },
  { "live_preview", "yes" },
  { "load_messages_via_js", "yes" },
  { "hide_read_threads", "no" },
  { "links_white_list", "" },
  { "notify_on_cite", "yes" },
  { "delete_read_notifications_on_cite", "no" },
  { "max_image_filesize", "2" },
  { "diff_context_lines", {} },
};

static inline auto find_default(string_view name) -> const ConfigDefault* {
  const auto it = std::find_if(std::begin(config_defaults), std::end(config_defaults),
    [name](const ConfigDefault& d) { return d.name == name; });
  return it == std::end(config_defaults) ? nullptr : &*it;
}

auto ConfigController::defaults() -> span<const ConfigDefault> {
  return config_defaults;
}

auto ConfigController::is_known_option(string_view name) -> bool {
  return find_default(name) != nullptr;
}

auto ConfigController::default_value(string_view name) -> optional<string_view> {
  const auto d = find_default(name);
  return d ? non_blank(d->value) : std::nullopt;
}

auto ConfigController::options(ConfigScope scope, uint64_t owner_id) -> ConfigKey::Value {
  return cache->fetch(ConfigKey{scope, owner_id}, [&] {
    auto txn = db->open_read_txn();
    auto opts = make_shared<ConfigOptions>();
    for (const auto& [name, value] : txn.list_config_options(scope, owner_id)) {
      opts->emplace(name, value);
    }
    spdlog::debug("Loaded {:d} {} config options for {:x}", opts->size(), to_string(scope), owner_id);
    return ConfigKey::Value(opts);
  });
}

auto ConfigController::lookup(ConfigScope scope, uint64_t owner_id, string_view name) -> optional<string> {
  const auto opts = options(scope, owner_id);
  const auto it = opts->find(name);
  if (it == opts->end()) return {};
  return non_blank(it->second).transform(λx(string(x)));
}

auto ConfigController::resolve(
  string_view name,
  optional<uint64_t> user_id,
  optional<uint64_t> forum_id
) -> optional<string> {
  if (user_id) {
    if (auto v = lookup(ConfigScope::User, *user_id, name)) return v;
  }
  if (forum_id) {
    if (auto v = lookup(ConfigScope::Forum, *forum_id, name)) return v;
  }
  if (auto v = lookup(ConfigScope::Global, 0, name)) return v;
  return default_value(name).transform(λx(string(x)));
}

auto ConfigController::resolve_int(
  string_view name,
  optional<uint64_t> user_id,
  optional<uint64_t> forum_id
) -> optional<int64_t> {
  const auto s = resolve(name, user_id, forum_id);
  if (!s) return {};
  int64_t n;
  const auto [end, err] = std::from_chars(s->data(), s->data() + s->size(), n);
  if (err != std::errc() || end != s->data() + s->size()) {
    spdlog::warn("Config option {} is not an integer: {}", name, *s);
    return {};
  }
  return n;
}

auto ConfigController::resolve_bool(
  string_view name,
  optional<uint64_t> user_id,
  optional<uint64_t> forum_id
) -> optional<bool> {
  const auto s = resolve(name, user_id, forum_id);
  if (!s) return {};
  if (*s == "yes" || *s == "true" || *s == "1") return true;
  if (*s == "no" || *s == "false" || *s == "0") return false;
  spdlog::warn("Config option {} is not a yes/no value: {}", name, *s);
  return {};
}

auto ConfigController::set_option(ConfigScope scope, uint64_t owner_id, string_view name, string_view value) -> void {
  if (name.empty()) throw ApiError("Option name cannot be empty", 400);
  if (scope == ConfigScope::Global && owner_id) {
    throw ApiError("Global options cannot have an owner", 400, fmt::format("owner {:x}", owner_id));
  }
  if (scope != ConfigScope::Global && !owner_id) {
    throw ApiError(fmt::format("{} options need an owner", to_string(scope)), 400);
  }
  if (!is_known_option(name)) spdlog::info("Setting unrecognized config option {}", name);
  {
    auto txn = db->open_write_txn();
    txn.set_config_option(scope, owner_id, name, value);
    txn.commit();
  }
  cache->invalidate(ConfigKey{scope, owner_id});
  event_bus->dispatch(Event::ConfigUpdate, owner_id);
}

auto ConfigController::delete_option(ConfigScope scope, uint64_t owner_id, string_view name) -> bool {
  bool existed;
  {
    auto txn = db->open_write_txn();
    existed = txn.delete_config_option(scope, owner_id, name);
    txn.commit();
  }
  if (!existed) return false;
  cache->invalidate(ConfigKey{scope, owner_id});
  event_bus->dispatch(Event::ConfigUpdate, owner_id);
  return true;
}

}
