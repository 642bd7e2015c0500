// Copyright 2025 segdb contributors
#ifndef SEGDB_DETAIL_SEGDB_HPP
#define SEGDB_DETAIL_SEGDB_HPP

#include "global.hpp"

// IWYU pragma: no_include <__fwd/ostream.h>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <iosfwd>  // IWYU pragma: keep
#include <optional>
#include <string_view>
#include <utility>

#include "segdb_common.hpp"
#include "segdb_internal.hpp"

namespace segdb {

// A sorted map from byte-array keys to byte-array values, stored as a tree
// of key segments. Not thread-safe; see mutex_db for the synchronized
// version.
//
// Every node holds up to detail::tree_radix entries ordered by the first
// byte of their segment. An entry is one of:
// - a value: the path to it spells exactly one key;
// - a prefix subtree: the segment starts every key below it, and lookups
//   continue with the key past the segment;
// - a separator subtree: holds the node's entries for a range of first
//   bytes, at the same key position. Separators let a node take more
//   distinct first bytes than it has slots.
//
// Lookups are strict: a key resolves only if the consumed segments spell it
// exactly. Nodes live in an arena and refer to each other by index.
class db final {
 public:
  using get_result = std::optional<value>;

  // Creation and destruction
  db() = default;

  ~db() noexcept = default;

  db(const db &) = delete;
  db(db &&) = delete;
  db &operator=(const db &) = delete;
  db &operator=(db &&) = delete;

  // Querying. Returns a copy of the value, or std::nullopt if the key was
  // never put.
  [[nodiscard]] get_result get(key_view search_key) const;

  [[nodiscard]] get_result get(std::string_view search_key) const {
    return get(to_key_view(search_key));
  }

  [[nodiscard]] bool empty() const noexcept { return nodes.empty(); }

  // Modifying. Inserts the mapping or replaces the value of an existing
  // key, releasing the old value.
  //
  // Throws std::length_error if the key or the value is longer than
  // key_size_type or value_size_type can express, leaving the tree
  // unchanged. Allocation failure propagates as std::bad_alloc, leaving
  // every stored mapping in place and the structure consistent; nodes the
  // failed put allocated are released.
  void put(key_view insert_key, value v);

  void put(std::string_view insert_key, value v) {
    put(to_key_view(insert_key), std::move(v));
  }

  // Walks the whole tree and throws invariant_violation on the first
  // structural defect found.
  void check_invariants() const;

  // Stats

#ifdef SEGDB_DETAIL_WITH_STATS

  [[nodiscard]] std::size_t get_node_count() const noexcept {
    return nodes.size();
  }

  [[nodiscard]] std::uint64_t get_value_count() const noexcept {
    return value_count;
  }

  // Return current memory use by tree nodes and values in bytes.
  [[nodiscard]] std::size_t get_current_memory_use() const noexcept {
    return nodes.size() * sizeof(detail::node) + value_bytes;
  }

  // Number of entries turned into a prefix subtree to take a key diverging
  // from them.
  [[nodiscard]] std::uint64_t get_prefix_splits() const noexcept {
    return prefix_splits;
  }

  // Number of full nodes whose entries were moved down into two separator
  // subtrees.
  [[nodiscard]] std::uint64_t get_push_downs() const noexcept {
    return push_downs;
  }

  // Number of full separator subtrees split in two inside their parent.
  [[nodiscard]] std::uint64_t get_separator_splits() const noexcept {
    return separator_splits;
  }

#endif  // SEGDB_DETAIL_WITH_STATS

  // Debugging
  [[gnu::cold]] SEGDB_DETAIL_NOINLINE void dump(std::ostream &os) const;

 private:
  void insert(key_view insert_key, value v, std::size_t &linked_nodes);

  // Release the arena slots from size onwards.
  void drop_nodes_past(std::size_t size) noexcept;

  [[nodiscard]] detail::node_index allocate_node();

  // Build the entry mapping k to v. A key longer than a segment slot is
  // unfolded into a chain of single-entry prefix nodes.
  [[nodiscard]] std::pair<detail::segment, detail::child> make_mapping(
      key_view k, value v);

  // Replace the entry i of node n, which shares its first byte with
  // remaining_key without matching it, by a prefix subtree on their common
  // prefix holding both the old entry and the new mapping.
  void split_divergent(detail::node_index n, std::uint8_t i,
                       key_view remaining_key, value v);

  // Move all entries of the full node n into two new separator subtrees,
  // the lower and the upper half.
  void push_down(detail::node_index n);

  // Split the full separator subtree at entry i of parent in two, adding
  // the upper half as a new separator entry of parent.
  void split_separator_child(detail::node_index parent, std::uint8_t i);

#ifdef SEGDB_DETAIL_WITH_STATS

  void account_value_replaced(std::size_t old_size,
                              std::size_t new_size) noexcept {
    value_bytes = value_bytes - old_size + new_size;
  }

  void account_value_added(std::size_t size) noexcept {
    ++value_count;
    value_bytes += size;
  }

#endif  // SEGDB_DETAIL_WITH_STATS

  // Node arena. The root is slot detail::root_index; the tree is empty
  // while the arena is. std::deque keeps references to existing nodes
  // valid while new ones are appended.
  std::deque<detail::node> nodes;

#ifdef SEGDB_DETAIL_WITH_STATS

  std::uint64_t value_count{0};
  std::size_t value_bytes{0};

  std::uint64_t prefix_splits{0};
  std::uint64_t push_downs{0};
  std::uint64_t separator_splits{0};

#endif  // SEGDB_DETAIL_WITH_STATS
};

}  // namespace segdb

#endif  // SEGDB_DETAIL_SEGDB_HPP
