// Copyright 2025 segdb contributors

#include "global.hpp"

#include "segdb_internal.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <utility>
#include <variant>

#include "assert.hpp"
#include "segdb_common.hpp"

namespace segdb::detail {

void segment::dump(std::ostream &os) const {
  os << (is_separator() ? "separator(" : "segment(") << length() << ")";
  if (length() > 0) {
    os << ":";
    for (const auto b : bytes()) dump_byte(os, b);
  }
}

match_result node::locate(key_view remaining_key) const noexcept {
  const auto key_cls = class_of(remaining_key);

  // First entry ordering after the key class.
  const auto *const first = segments.data();
  const auto *const last = first + children_count;
  const auto *const after = std::upper_bound(
      first, last, key_cls,
      [](key_class c, const segment &s) noexcept { return c < s.get_class(); });

  if (after == first) return {match_kind::NONE, 0, remaining_key};

  const auto i = static_cast<std::uint8_t>(after - first - 1);
  const auto &s = segments[i];
  if (s.is_separator()) return {match_kind::SEPARATOR, i, remaining_key};

  if (s.get_class() < key_cls)
    return {match_kind::NONE, static_cast<std::uint8_t>(i + 1), remaining_key};

  const auto fragment = s.bytes();
  if (std::holds_alternative<value>(children[i])) {
    if (compare(fragment, remaining_key) == 0)
      return {match_kind::VALUE, i, remaining_key};
    return {match_kind::DIVERGENT, i, remaining_key};
  }

  // A prefix subtree consumes its segment only if the key really
  // continues it. Sharing the first byte is not enough.
  if (starts_with(remaining_key, fragment))
    return {match_kind::PREFIX, i, remaining_key.subspan(fragment.size())};
  return {match_kind::DIVERGENT, i, remaining_key};
}

void node::insert_entry(std::uint8_t i, segment s, child &&c) noexcept {
  SEGDB_DETAIL_ASSERT(!is_full());
  SEGDB_DETAIL_ASSERT(i <= children_count);
  SEGDB_DETAIL_ASSERT(i == 0 || segments[i - 1].get_class() < s.get_class());
  SEGDB_DETAIL_ASSERT(i == children_count ||
                      s.get_class() < segments[i].get_class());

  for (auto j = children_count; j > i; --j) {
    segments[j] = segments[j - 1];
    children[j] = std::move(children[j - 1]);
  }
  segments[i] = s;
  children[i] = std::move(c);
  ++children_count;
}

void node::set_entry(std::uint8_t i, segment s, child &&c) noexcept {
  SEGDB_DETAIL_ASSERT(i < children_count);
  SEGDB_DETAIL_ASSERT(s.get_class() == segments[i].get_class());

  segments[i] = s;
  children[i] = std::move(c);
}

void node::move_entries_to(std::uint8_t first, node &target) noexcept {
  SEGDB_DETAIL_ASSERT(target.is_empty());
  SEGDB_DETAIL_ASSERT(first <= children_count);

  for (auto i = first; i < children_count; ++i) {
    const auto j = static_cast<std::uint8_t>(i - first);
    target.segments[j] = segments[i];
    target.children[j] = std::move(children[i]);
    segments[i] = segment{};
    children[i] = child{};
  }
  target.children_count = static_cast<std::uint8_t>(children_count - first);
  children_count = first;
}

void node::dump(std::ostream &os) const {
  os << "node, entries: " << static_cast<unsigned>(children_count) << '\n';
  for (std::uint8_t i = 0; i < children_count; ++i) {
    os << "  [" << static_cast<unsigned>(i) << "] ";
    segments[i].dump(os);
    if (const auto *const v = std::get_if<value>(&children[i])) {
      os << ", ";
      dump_val(os, *v);
    } else {
      os << " -> node " << get_child_node(i);
    }
    os << '\n';
  }
}

}  // namespace segdb::detail
