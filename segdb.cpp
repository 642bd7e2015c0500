// Copyright 2025 segdb contributors

#include "global.hpp"

#include "segdb.hpp"

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <utility>
#include <variant>
#include <vector>

#include "assert.hpp"
#include "segdb_common.hpp"
#include "segdb_internal.hpp"

namespace {

using segdb::detail::child;
using segdb::detail::match_kind;
using segdb::detail::node_index;
using segdb::detail::segment;

constexpr auto half_radix =
    static_cast<std::uint8_t>(segdb::detail::tree_radix / 2);

}  // namespace

namespace segdb {

db::get_result db::get(key_view search_key) const {
  if (SEGDB_DETAIL_UNLIKELY(nodes.empty())) return {};

  auto current{detail::root_index};
  auto remaining_key{search_key};

  while (true) {
    const auto &n = nodes[current];
    const auto m = n.locate(remaining_key);
    switch (m.kind) {
      case match_kind::VALUE:
        return *std::get_if<value>(&n.get_child(m.index));
      case match_kind::PREFIX:
        remaining_key = m.remainder;
        current = n.get_child_node(m.index);
        break;
      case match_kind::SEPARATOR:
        current = n.get_child_node(m.index);
        break;
      case match_kind::NONE:
      case match_kind::DIVERGENT:
        return {};
    }
  }
}

void db::put(key_view insert_key, value v) {
  detail::check_key_value_sizes(insert_key, v);

  // Arena slots below this size are linked into the tree. Restructurings
  // allocate all their nodes before linking any, so on an exception only
  // the slots past it need dropping.
  auto linked_nodes = nodes.size();
  try {
    insert(insert_key, std::move(v), linked_nodes);
  } catch (...) {
    drop_nodes_past(linked_nodes);
    throw;
  }
}

void db::insert(key_view insert_key, value v, std::size_t &linked_nodes) {
  if (SEGDB_DETAIL_UNLIKELY(nodes.empty())) {
    const auto root = allocate_node();
    SEGDB_DETAIL_ASSERT(root == detail::root_index);
#ifdef SEGDB_DETAIL_WITH_STATS
    const auto value_size = v.size();
#endif  // SEGDB_DETAIL_WITH_STATS
    auto [s, c] = make_mapping(insert_key, std::move(v));
    nodes[root].insert_entry(0, s, std::move(c));
#ifdef SEGDB_DETAIL_WITH_STATS
    account_value_added(value_size);
#endif  // SEGDB_DETAIL_WITH_STATS
    return;
  }

  auto current{detail::root_index};
  auto remaining_key{insert_key};

  while (true) {
    auto &n = nodes[current];
    const auto m = n.locate(remaining_key);
    switch (m.kind) {
      case match_kind::VALUE: {
        auto &old_value = *std::get_if<value>(&n.get_child(m.index));
#ifdef SEGDB_DETAIL_WITH_STATS
        account_value_replaced(old_value.size(), v.size());
#endif  // SEGDB_DETAIL_WITH_STATS
        old_value = std::move(v);
        return;
      }
      case match_kind::PREFIX:
        remaining_key = m.remainder;
        current = n.get_child_node(m.index);
        break;
      case match_kind::SEPARATOR: {
        const auto separator_child = n.get_child_node(m.index);
        // Use the free slot here before descending into a full node, so
        // that the level grows in width before it grows in depth.
        if (nodes[separator_child].is_full() && !n.is_full()) {
          split_separator_child(current, m.index);
          linked_nodes = nodes.size();
          break;
        }
        current = separator_child;
        break;
      }
      case match_kind::DIVERGENT:
        split_divergent(current, m.index, remaining_key, std::move(v));
        return;
      case match_kind::NONE: {
        if (SEGDB_DETAIL_UNLIKELY(n.is_full())) {
          push_down(current);
          linked_nodes = nodes.size();
          break;
        }
#ifdef SEGDB_DETAIL_WITH_STATS
        const auto value_size = v.size();
#endif  // SEGDB_DETAIL_WITH_STATS
        auto [s, c] = make_mapping(remaining_key, std::move(v));
        n.insert_entry(m.index, s, std::move(c));
#ifdef SEGDB_DETAIL_WITH_STATS
        account_value_added(value_size);
#endif  // SEGDB_DETAIL_WITH_STATS
        return;
      }
    }
  }
}

void db::drop_nodes_past(std::size_t size) noexcept {
  while (nodes.size() > size) nodes.pop_back();
}

detail::node_index db::allocate_node() {
  if (SEGDB_DETAIL_UNLIKELY(nodes.size() >=
                            std::numeric_limits<node_index>::max())) {
    throw std::length_error("Node arena is full");
  }
  nodes.emplace_back();
  return static_cast<node_index>(nodes.size() - 1);
}

std::pair<segment, child> db::make_mapping(key_view k, value v) {
  constexpr auto slot = detail::max_segment_length;
  // The last fragment must stay non-empty for a non-empty key, so a key of
  // exactly n slots unfolds into n - 1 prefix nodes.
  const auto prefix_levels = k.empty() ? 0 : (k.size() - 1) / slot;

  segment s{k.subspan(prefix_levels * slot), false};
  child c{std::move(v)};

  for (auto level = prefix_levels; level > 0; --level) {
    const auto chain_node = allocate_node();
    nodes[chain_node].insert_entry(0, s, std::move(c));
    s = segment{k.subspan((level - 1) * slot, slot), false};
    c = chain_node;
  }

  return {s, std::move(c)};
}

void db::split_divergent(detail::node_index n, std::uint8_t i,
                         key_view remaining_key, value v) {
  // Copy: the entry is overwritten below.
  const auto old_segment = nodes[n].get_segment(i);
  const auto old_fragment = old_segment.bytes();
  const auto shared = detail::shared_length(old_fragment, remaining_key);

  // Same first byte, so at least one byte is shared.
  SEGDB_DETAIL_ASSERT(shared > 0);
  SEGDB_DETAIL_ASSERT(shared <= old_fragment.size());

#ifdef SEGDB_DETAIL_WITH_STATS
  const auto value_size = v.size();
#endif  // SEGDB_DETAIL_WITH_STATS
  auto [new_segment, new_child] =
      make_mapping(remaining_key.subspan(shared), std::move(v));
  const auto split = allocate_node();

  auto &parent = nodes[n];
  auto &split_node = nodes[split];
  const segment old_tail{old_fragment.subspan(shared), false};

  SEGDB_DETAIL_ASSERT(old_tail.get_class() != new_segment.get_class());

  if (old_tail.get_class() < new_segment.get_class()) {
    split_node.insert_entry(0, old_tail, std::move(parent.get_child(i)));
    split_node.insert_entry(1, new_segment, std::move(new_child));
  } else {
    split_node.insert_entry(0, new_segment, std::move(new_child));
    split_node.insert_entry(1, old_tail, std::move(parent.get_child(i)));
  }
  parent.set_entry(i, segment{old_fragment.first(shared), false}, split);

#ifdef SEGDB_DETAIL_WITH_STATS
  account_value_added(value_size);
  ++prefix_splits;
#endif  // SEGDB_DETAIL_WITH_STATS
}

void db::push_down(detail::node_index n) {
  SEGDB_DETAIL_ASSERT(nodes[n].is_full());

  const auto lower = allocate_node();
  const auto upper = allocate_node();

  auto &full_node = nodes[n];
  full_node.move_entries_to(half_radix, nodes[upper]);
  full_node.move_entries_to(0, nodes[lower]);

  const auto lower_class = nodes[lower].get_segment(0).get_class();
  const auto upper_class = nodes[upper].get_segment(0).get_class();
  full_node.insert_entry(0, segment::separator_for(lower_class), lower);
  full_node.insert_entry(1, segment::separator_for(upper_class), upper);

#ifdef SEGDB_DETAIL_WITH_STATS
  ++push_downs;
#endif  // SEGDB_DETAIL_WITH_STATS
}

void db::split_separator_child(detail::node_index parent, std::uint8_t i) {
  SEGDB_DETAIL_ASSERT(!nodes[parent].is_full());
  SEGDB_DETAIL_ASSERT(nodes[parent].get_segment(i).is_separator());

  const auto full_child = nodes[parent].get_child_node(i);
  SEGDB_DETAIL_ASSERT(nodes[full_child].is_full());

  const auto sibling = allocate_node();
  nodes[full_child].move_entries_to(half_radix, nodes[sibling]);

  const auto sibling_class = nodes[sibling].get_segment(0).get_class();
  nodes[parent].insert_entry(static_cast<std::uint8_t>(i + 1),
                             segment::separator_for(sibling_class), sibling);

#ifdef SEGDB_DETAIL_WITH_STATS
  ++separator_splits;
#endif  // SEGDB_DETAIL_WITH_STATS
}

void db::check_invariants() const {
  if (nodes.empty()) return;

  struct pending_node {
    node_index index;
    // Separator subtrees must keep to the class range of their entry.
    detail::key_class lower;
    detail::key_class upper;
  };

  std::vector<bool> reached(nodes.size(), false);
  std::size_t reached_count = 0;
  std::vector<pending_node> pending{
      {detail::root_index, detail::empty_key_class, detail::key_class_limit}};

  while (!pending.empty()) {
    const auto p = pending.back();
    pending.pop_back();

    if (p.index >= nodes.size())
      throw invariant_violation("Child index outside of the node arena");
    if (reached[p.index])
      throw invariant_violation("Node reachable through two entries");
    reached[p.index] = true;
    ++reached_count;

    const auto &n = nodes[p.index];
    if (n.is_empty() && p.index != detail::root_index)
      throw invariant_violation("Empty non-root node");

    for (std::uint8_t i = 0; i < n.size(); ++i) {
      const auto &s = n.get_segment(i);
      const auto cls = s.get_class();

      if (s.length() > detail::max_segment_length)
        throw invariant_violation("Segment longer than its slot");
      if (i > 0 &&
          n.get_segment(static_cast<std::uint8_t>(i - 1)).get_class() >= cls)
        throw invariant_violation("Node segments not in increasing order");
      if (cls < p.lower || cls >= p.upper)
        throw invariant_violation("Segment outside of its separator range");

      const auto *const subtree = std::get_if<node_index>(&n.get_child(i));
      if (s.is_separator()) {
        if (subtree == nullptr)
          throw invariant_violation("Separator without a subtree");
        if (s.length() > 1)
          throw invariant_violation("Separator longer than one byte");
        const auto upper =
            (i + 1 < n.size())
                ? n.get_segment(static_cast<std::uint8_t>(i + 1)).get_class()
                : p.upper;
        pending.push_back({*subtree, cls, upper});
      } else if (subtree != nullptr) {
        if (s.length() == 0)
          throw invariant_violation("Prefix subtree with an empty segment");
        pending.push_back(
            {*subtree, detail::empty_key_class, detail::key_class_limit});
      }
    }
  }

  if (reached_count != nodes.size())
    throw invariant_violation("Node unreachable from the root");
}

void db::dump(std::ostream &os) const {
  os << "segdb::db dump, nodes: " << nodes.size();
#ifdef SEGDB_DETAIL_WITH_STATS
  os << ", values: " << value_count
     << ", memory use: " << get_current_memory_use()
     << ", prefix splits: " << prefix_splits
     << ", push downs: " << push_downs
     << ", separator splits: " << separator_splits;
#endif  // SEGDB_DETAIL_WITH_STATS
  os << '\n';
  if (nodes.empty()) {
    os << "empty tree\n";
    return;
  }

  struct pending_node {
    node_index index;
    unsigned depth;
  };

  // Depth first, entries in order. The depth grows with key length, so the
  // walk keeps its own stack.
  std::vector<pending_node> pending{{detail::root_index, 0}};
  while (!pending.empty()) {
    const auto p = pending.back();
    pending.pop_back();

    const auto &current = nodes[p.index];
    os << "level " << p.depth << " #" << p.index << ' ';
    current.dump(os);
    for (auto i = current.size(); i > 0; --i) {
      const auto *const subtree = std::get_if<node_index>(
          &current.get_child(static_cast<std::uint8_t>(i - 1)));
      if (subtree != nullptr) pending.push_back({*subtree, p.depth + 1});
    }
  }
}

}  // namespace segdb
