#include "thread_tree.h++"

using std::make_shared, std::optional, std::reference_wrapper, std::shared_ptr,
    std::vector;

namespace Skein {

auto ThreadTree::link(VisibilityFilter filter, MessageOrder order) -> void {
  const auto& messages = source->messages;
  for (size_t i = 0; i < messages.size(); i++) {
    const auto& m = messages[i];
    if (m.thread_id != _thread_id) {
      spdlog::warn("Message {:x} belongs to thread {:x}, not {:x}; leaving it out of the tree", m.id, m.thread_id, _thread_id);
      continue;
    }
    if (!filter.admits(m)) continue;
    if (!index.emplace(m.id, nodes.size()).second) {
      spdlog::warn("Duplicate message {:x} in thread {:x}", m.id, _thread_id);
      continue;
    }
    nodes.push_back({ .message = i, .parent = {}, .children = {} });
  }

  for (size_t i = 0; i < nodes.size(); i++) {
    const auto& m = message(nodes[i]);
    if (!m.parent_id) continue;
    const auto p = index.find(*m.parent_id);
    if (p == index.end() || p->second == i) {
      spdlog::debug("Message {:x} has no visible parent, promoting it to a root", m.id);
      continue;
    }
    nodes[i].parent = p->second;
    nodes[p->second].children.push_back(i);
  }

  // Anything not reachable from a parentless node sits on a parent cycle.
  // Break each cycle at its lowest id so that nothing gets lost.
  vector<bool> reached(nodes.size(), false);
  const auto mark = [&](size_t from) {
    vector<size_t> stack{from};
    while (!stack.empty()) {
      const auto i = stack.back();
      stack.pop_back();
      if (reached[i]) continue;
      reached[i] = true;
      for (const auto c : nodes[i].children) stack.push_back(c);
    }
  };
  for (size_t i = 0; i < nodes.size(); i++) {
    if (!nodes[i].parent) mark(i);
  }
  for (size_t i = 0; i < nodes.size(); i++) {
    if (reached[i]) continue;
    // An unreached node either sits on a cycle or hangs below one. After
    // nodes.size() steps up, `on_cycle` is on the cycle itself.
    size_t on_cycle = i;
    for (size_t step = 0; step < nodes.size(); step++) on_cycle = *nodes[on_cycle].parent;
    size_t lowest = on_cycle;
    for (size_t j = *nodes[on_cycle].parent; j != on_cycle; j = *nodes[j].parent) lowest = std::min(lowest, j);
    const auto& m = message(nodes[lowest]);
    spdlog::warn("Message {:x} in thread {:x} is its own ancestor, promoting it to a root", m.id, _thread_id);
    auto& siblings = nodes[*nodes[lowest].parent].children;
    siblings.erase(std::find(siblings.begin(), siblings.end(), lowest));
    nodes[lowest].parent.reset();
    mark(lowest);
  }

  const auto by_time = [&](size_t a, size_t b) {
    const auto &ma = message(nodes[a]), &mb = message(nodes[b]);
    if (ma.created_at != mb.created_at) {
      return order == MessageOrder::Descending ? ma.created_at > mb.created_at : ma.created_at < mb.created_at;
    }
    return ma.id < mb.id;
  };
  for (size_t i = 0; i < nodes.size(); i++) {
    if (nodes[i].parent) continue;
    roots.push_back(i);
  }
  std::sort(roots.begin(), roots.end(), [&](size_t a, size_t b) {
    const auto pa = message(nodes[a]).parent_id.value_or(0), pb = message(nodes[b]).parent_id.value_or(0);
    if (pa != pb) return pa < pb;
    return by_time(a, b);
  });
  for (auto& n : nodes) std::sort(n.children.begin(), n.children.end(), by_time);

  for (const auto r : roots) {
    vector<size_t> stack{r};
    while (!stack.empty()) {
      const auto i = stack.back();
      stack.pop_back();
      for (const auto c : nodes[i].children) {
        nodes[c].depth = nodes[i].depth + 1;
        stack.push_back(c);
      }
    }
  }
}

auto ThreadTree::root_nodes() const -> vector<reference_wrapper<const ThreadNode>> {
  vector<reference_wrapper<const ThreadNode>> out;
  out.reserve(roots.size());
  for (const auto r : roots) out.push_back(std::cref(nodes[r]));
  return out;
}

auto ThreadTree::children_of(const ThreadNode& node) const -> vector<reference_wrapper<const ThreadNode>> {
  vector<reference_wrapper<const ThreadNode>> out;
  out.reserve(node.children.size());
  for (const auto c : node.children) out.push_back(std::cref(nodes[c]));
  return out;
}

auto ThreadTree::find(uint64_t message_id) const -> const ThreadNode* {
  const auto it = index.find(message_id);
  if (it == index.end()) return nullptr;
  return &nodes[it->second];
}

auto ThreadTree::subtree_ids(uint64_t anchor_id) const -> vector<uint64_t> {
  vector<uint64_t> out;
  const auto it = index.find(anchor_id);
  if (it == index.end()) return out;
  walk_from(it->second, [&](const MessageSnapshot& m, const ThreadNode&) { out.push_back(m.id); });
  return out;
}

auto build_tree(
  shared_ptr<const ThreadSnapshot> thread,
  VisibilityFilter filter,
  MessageOrder order
) -> ThreadTree {
  ThreadTree tree(thread->id, thread);
  tree.link(filter, order);
  spdlog::debug("Built tree for thread {:x}: {:d} nodes, {:d} roots", thread->id, tree.nodes.size(), tree.roots.size());
  return tree;
}

auto build_tree(
  uint64_t thread_id,
  vector<MessageSnapshot> messages,
  VisibilityFilter filter,
  MessageOrder order
) -> ThreadTree {
  std::sort(messages.begin(), messages.end(), [](const MessageSnapshot& a, const MessageSnapshot& b) { return a.id < b.id; });
  auto thread = make_shared<ThreadSnapshot>();
  thread->id = thread_id;
  thread->messages = std::move(messages);
  return build_tree(thread, filter, order);
}

}
