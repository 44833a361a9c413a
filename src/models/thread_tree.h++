#pragma once
#include "models/thread.h++"
#include <memory>
#include <parallel_hashmap/phmap.h>

namespace Skein {

struct VisibilityFilter {
  bool include_deleted = false, include_drafts = false;

  auto admits(const MessageSnapshot& m) const noexcept -> bool {
    return (include_deleted || !m.deleted) && (include_drafts || !m.draft);
  }
  auto operator==(const VisibilityFilter&) const -> bool = default;

  static constexpr auto everything() -> VisibilityFilter { return { true, true }; }
};

enum class MessageOrder : uint8_t {
  Ascending,
  Descending
};

constexpr auto to_string(MessageOrder o) -> std::string_view {
  return o == MessageOrder::Descending ? "desc" : "asc";
}

struct ThreadNode {
  size_t message;
  std::optional<size_t> parent;
  std::vector<size_t> children;
  uint32_t depth = 0;
};

class ThreadTree;

auto build_tree(
  std::shared_ptr<const ThreadSnapshot> thread,
  VisibilityFilter filter = {},
  MessageOrder order = MessageOrder::Ascending
) -> ThreadTree;

// Reply tree of one thread, stored as an arena of nodes that refer to each
// other by index. Nodes point into `source`, which the tree keeps alive.
//
// Every admitted message appears exactly once. A message whose parent is
// missing (or filtered out, or part of a parent cycle) becomes an extra root.
class ThreadTree {
private:
  uint64_t _thread_id;
  std::shared_ptr<const ThreadSnapshot> source;
  std::vector<ThreadNode> nodes;
  std::vector<size_t> roots;
  phmap::flat_hash_map<uint64_t, size_t> index;

  ThreadTree(uint64_t thread_id, std::shared_ptr<const ThreadSnapshot> source)
    : _thread_id(thread_id), source(source) {}
  auto link(VisibilityFilter filter, MessageOrder order) -> void;

  template <typename Fn> auto walk_from(size_t start, Fn&& fn) const -> void {
    std::vector<size_t> stack{start};
    while (!stack.empty()) {
      const auto i = stack.back();
      stack.pop_back();
      fn(message(nodes[i]), nodes[i]);
      const auto& c = nodes[i].children;
      stack.insert(stack.end(), c.rbegin(), c.rend());
    }
  }

public:
  auto thread_id() const noexcept -> uint64_t { return _thread_id; }
  auto thread() const noexcept -> const ThreadSnapshot& { return *source; }
  auto size() const noexcept -> size_t { return nodes.size(); }
  auto empty() const noexcept -> bool { return nodes.empty(); }

  auto message(const ThreadNode& node) const -> const MessageSnapshot& {
    return source->messages[node.message];
  }
  auto node(size_t i) const -> const ThreadNode& { return nodes[i]; }
  auto root_nodes() const -> std::vector<std::reference_wrapper<const ThreadNode>>;
  auto find(uint64_t message_id) const -> const ThreadNode*;
  auto parent_of(const ThreadNode& node) const -> const ThreadNode* {
    return node.parent ? &nodes[*node.parent] : nullptr;
  }
  auto children_of(const ThreadNode& node) const -> std::vector<std::reference_wrapper<const ThreadNode>>;
  auto is_orphan(const ThreadNode& node) const -> bool {
    return !node.parent && message(node).parent_id.has_value();
  }

  // The anchor and all of its transitive replies, anchor first, in the
  // tree's sibling order. Empty if the anchor is not in the tree.
  auto subtree_ids(uint64_t anchor_id) const -> std::vector<uint64_t>;

  // Preorder traversal of the whole forest; fn(const MessageSnapshot&, const ThreadNode&).
  template <typename Fn> auto walk(Fn&& fn) const -> void {
    for (const auto r : roots) walk_from(r, fn);
  }

  friend auto build_tree(
    std::shared_ptr<const ThreadSnapshot> thread,
    VisibilityFilter filter,
    MessageOrder order
  ) -> ThreadTree;
};

// For callers that already hold a flat set of messages; messages that do not
// belong to `thread_id` are ignored.
auto build_tree(
  uint64_t thread_id,
  std::vector<MessageSnapshot> messages,
  VisibilityFilter filter = {},
  MessageOrder order = MessageOrder::Ascending
) -> ThreadTree;

}
