#include "test_common.h++"
#include "models/thread_tree.h++"

static constexpr uint64_t THREAD = 0x100;

static auto msg(uint64_t id, optional<uint64_t> parent, uint64_t created_at, bool deleted = false) -> MessageSnapshot {
  return {
    .id = id,
    .thread_id = THREAD,
    .forum_id = 1,
    .parent_id = parent,
    .author_id = {},
    .author_name = "tester",
    .subject = fmt::format("message {:x}", id),
    .content = "",
    .deleted = deleted,
    .draft = false,
    .flags = {},
    .tags = {},
    .upvotes = 0,
    .downvotes = 0,
    .created_at = created_at,
    .updated_at = {}
  };
}

// Flattens a tree into (id, depth) pairs in preorder.
static auto shape(const ThreadTree& tree) -> vector<pair<uint64_t, uint32_t>> {
  vector<pair<uint64_t, uint32_t>> out;
  tree.walk([&](const MessageSnapshot& m, const ThreadNode& n) { out.emplace_back(m.id, n.depth); });
  return out;
}

TEST_CASE("build a simple tree", "[thread_tree]") {
  const auto tree = build_tree(THREAD, {
    msg(1, {}, 100),
    msg(2, 1, 200),
    msg(3, 2, 300),
    msg(4, 1, 150),
  });
  REQUIRE(tree.size() == 4);
  REQUIRE(tree.root_nodes().size() == 1);
  CHECK(tree.message(tree.root_nodes()[0]).id == 1);
  CHECK(shape(tree) == vector<pair<uint64_t, uint32_t>>{{1, 0}, {4, 1}, {2, 1}, {3, 2}});

  const auto* three = tree.find(3);
  REQUIRE(three != nullptr);
  const auto* two = tree.parent_of(*three);
  REQUIRE(two != nullptr);
  CHECK(tree.message(*two).id == 2);
  CHECK(tree.children_of(*two).size() == 1);
  CHECK_FALSE(tree.is_orphan(*three));
  CHECK(tree.find(99) == nullptr);
}

TEST_CASE("every child's parent is in the tree", "[thread_tree]") {
  vector<MessageSnapshot> messages{ msg(1, {}, 100) };
  for (uint64_t id = 2; id <= 40; id++) messages.push_back(msg(id, id / 2, 100 + id));
  const auto tree = build_tree(THREAD, messages);
  CHECK(tree.size() == 40);
  size_t visited = 0;
  tree.walk([&](const MessageSnapshot& m, const ThreadNode& n) {
    visited++;
    if (const auto* p = tree.parent_of(n)) {
      CHECK(m.parent_id == optional(tree.message(*p).id));
      CHECK(n.depth == p->depth + 1);
    } else {
      CHECK(n.depth == 0);
    }
  });
  CHECK(visited == 40);
}

TEST_CASE("sibling order follows creation time", "[thread_tree]") {
  const vector<MessageSnapshot> messages{
    msg(1, {}, 100),
    msg(2, 1, 300),
    msg(3, 1, 200),
    msg(4, 1, 200),
    msg(5, 1, 400),
  };
  SECTION("ascending") {
    const auto tree = build_tree(THREAD, messages, {}, MessageOrder::Ascending);
    CHECK(shape(tree) == vector<pair<uint64_t, uint32_t>>{{1, 0}, {3, 1}, {4, 1}, {2, 1}, {5, 1}});
  }
  SECTION("descending, ties still broken by id") {
    const auto tree = build_tree(THREAD, messages, {}, MessageOrder::Descending);
    CHECK(shape(tree) == vector<pair<uint64_t, uint32_t>>{{1, 0}, {5, 1}, {2, 1}, {3, 1}, {4, 1}});
  }
}

TEST_CASE("orphans become extra roots", "[thread_tree]") {
  const auto tree = build_tree(THREAD, {
    msg(1, {}, 100),
    msg(2, 1, 200),
    msg(5, 4, 300),
    msg(6, 5, 400),
  });
  CHECK(tree.size() == 4);
  const auto roots = tree.root_nodes();
  REQUIRE(roots.size() == 2);
  CHECK(tree.message(roots[0]).id == 1);
  CHECK(tree.message(roots[1]).id == 5);
  CHECK(tree.is_orphan(roots[1]));
  CHECK_FALSE(tree.is_orphan(roots[0]));
  CHECK(shape(tree) == vector<pair<uint64_t, uint32_t>>{{1, 0}, {2, 1}, {5, 0}, {6, 1}});
}

TEST_CASE("filtering out a parent orphans its replies", "[thread_tree]") {
  const vector<MessageSnapshot> messages{
    msg(1, {}, 100),
    msg(2, 1, 200, true),
    msg(3, 2, 300),
  };
  const auto visible = build_tree(THREAD, messages);
  CHECK(visible.size() == 2);
  CHECK(visible.find(2) == nullptr);
  REQUIRE(visible.find(3) != nullptr);
  CHECK(visible.is_orphan(*visible.find(3)));

  const auto everything = build_tree(THREAD, messages, VisibilityFilter::everything());
  CHECK(everything.size() == 3);
  CHECK(everything.root_nodes().size() == 1);
  CHECK(everything.find(3)->depth == 2);
}

TEST_CASE("parent cycles are broken without losing messages", "[thread_tree]") {
  const auto tree = build_tree(THREAD, {
    msg(1, {}, 100),
    msg(2, 3, 200),
    msg(3, 4, 300),
    msg(4, 2, 400),
    msg(5, 5, 500),
  });
  CHECK(tree.size() == 5);
  const auto roots = tree.root_nodes();
  REQUIRE(roots.size() == 3);
  CHECK(tree.message(roots[0]).id == 1);
  CHECK(shape(tree) == vector<pair<uint64_t, uint32_t>>{{1, 0}, {2, 0}, {4, 1}, {3, 2}, {5, 0}});
}

TEST_CASE("a reply below a parent cycle keeps its parent", "[thread_tree]") {
  const auto tree = build_tree(THREAD, {
    msg(1, {}, 100),
    msg(2, 5, 200),
    msg(5, 6, 500),
    msg(6, 5, 600),
  });
  CHECK(tree.size() == 4);
  REQUIRE(tree.find(2) != nullptr);
  const auto* parent = tree.parent_of(*tree.find(2));
  REQUIRE(parent != nullptr);
  CHECK(tree.message(*parent).id == 5);
  CHECK_FALSE(tree.is_orphan(*tree.find(2)));
  CHECK(tree.is_orphan(*tree.find(5)));
  CHECK(shape(tree) == vector<pair<uint64_t, uint32_t>>{{1, 0}, {5, 0}, {2, 1}, {6, 1}});
}

TEST_CASE("messages from other threads and duplicates are left out", "[thread_tree]") {
  auto stray = msg(7, 1, 150);
  stray.thread_id = THREAD + 1;
  const auto tree = build_tree(THREAD, { msg(1, {}, 100), msg(2, 1, 200), msg(2, 1, 200), stray });
  CHECK(tree.size() == 2);
  CHECK(tree.find(7) == nullptr);
}

TEST_CASE("the same messages always make the same tree", "[thread_tree]") {
  vector<MessageSnapshot> messages{ msg(1, {}, 100) };
  for (uint64_t id = 2; id <= 30; id++) messages.push_back(msg(id, 1 + (id * 7) % (id - 1), 1000 - (id % 5) * 10));
  auto shuffled = messages;
  std::reverse(shuffled.begin(), shuffled.end());
  std::rotate(shuffled.begin(), shuffled.begin() + 11, shuffled.end());
  const auto a = build_tree(THREAD, messages), b = build_tree(THREAD, shuffled);
  CHECK(shape(a) == shape(b));
  CHECK(a.size() == 30);
}

TEST_CASE("subtree_ids lists an anchor and every descendant", "[thread_tree]") {
  const auto tree = build_tree(THREAD, {
    msg(1, {}, 100),
    msg(2, 1, 200),
    msg(3, 2, 300),
    msg(4, 2, 250),
    msg(5, 4, 500),
    msg(6, 1, 600),
  });
  CHECK(tree.subtree_ids(2) == vector<uint64_t>{2, 4, 5, 3});
  CHECK(tree.subtree_ids(6) == vector<uint64_t>{6});
  CHECK(tree.subtree_ids(1).size() == 6);
  CHECK(tree.subtree_ids(1).front() == 1);
  CHECK(tree.subtree_ids(42).empty());
}

TEST_CASE("an empty thread makes an empty tree", "[thread_tree]") {
  const auto tree = build_tree(THREAD, vector<MessageSnapshot>{});
  CHECK(tree.empty());
  CHECK(tree.root_nodes().empty());
  CHECK(tree.subtree_ids(1).empty());
}
