// Copyright 2025 segdb contributors
#ifndef SEGDB_DETAIL_SEGDB_INTERNAL_HPP
#define SEGDB_DETAIL_SEGDB_INTERNAL_HPP

//
// CAUTION: [global.hpp] MUST BE THE FIRST INCLUDE IN ALL SOURCE AND
// HEADER FILES !!!
//
#include "global.hpp"  // IWYU pragma: keep

// IWYU pragma: no_include <__fwd/ostream.h>

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <iosfwd>  // IWYU pragma: keep
#include <limits>
#include <type_traits>
#include <utility>
#include <variant>

#include "assert.hpp"
#include "segdb_common.hpp"

namespace segdb::detail {

/// The segment block of a node is sized to one cache line.
inline constexpr std::size_t cache_line_size = 128;

/// The maximum number of (segment, child) entries in a node.
inline constexpr std::size_t tree_radix = 16;

/// Each segment occupies a fixed slot: one header byte followed by the
/// segment bytes.
inline constexpr std::size_t segment_slot_size = cache_line_size / tree_radix;

/// Longest key fragment one segment can hold. Longer keys are unfolded
/// into a chain of nodes, one slot's worth of bytes per level.
inline constexpr std::size_t max_segment_length = segment_slot_size - 1;

static_assert(tree_radix >= 2);
static_assert(tree_radix <= std::numeric_limits<std::uint8_t>::max());
static_assert(max_segment_length > 0);

/// Arena position of a node. Nodes are never freed before the tree, so
/// an index stays valid for the lifetime of its db.
using node_index = std::uint32_t;

/// The root node always lives in the first arena slot.
inline constexpr node_index root_index = 0;

/// The ordering class of a byte string: its first byte, with the empty
/// string in a class of its own ordered before every byte. Entries of one
/// node have pairwise distinct, strictly increasing classes.
using key_class = std::uint16_t;

inline constexpr key_class empty_key_class = 0;

/// One past the largest class.
inline constexpr key_class key_class_limit = 257;

[[nodiscard, gnu::pure]] constexpr key_class class_of(key_view k) noexcept {
  return k.empty() ? empty_key_class
                   : static_cast<key_class>(std::to_integer<unsigned>(k[0]) +
                                            1U);
}

//
// Key segment comparator
//

/// Return the number of leading bytes shared by \a a and \a b.
[[nodiscard, gnu::pure]] inline std::size_t shared_length(
    key_view a, key_view b) noexcept {
  const auto limit = std::min(a.size(), b.size());
  std::size_t i = 0;
  while (i < limit && a[i] == b[i]) ++i;
  return i;
}

/// Lexicographic comparison of two byte arrays. A strict prefix orders
/// first.
///
/// \return Negative, zero, or positive if \a a is LT, EQ, or GT \a b.
[[nodiscard, gnu::pure]] inline int compare(key_view a, key_view b) noexcept {
  const auto shared = std::min(a.size(), b.size());
  if (shared > 0) {
    const auto result = std::memcmp(a.data(), b.data(), shared);
    if (result != 0) return result;
  }
  if (a.size() == b.size()) return 0;
  return a.size() < b.size() ? -1 : 1;
}

[[nodiscard, gnu::pure]] inline bool starts_with(key_view k,
                                                 key_view prefix) noexcept {
  return prefix.size() <= k.size() &&
         shared_length(k, prefix) == prefix.size();
}

/// A key fragment stored inline in a node.
///
/// The header byte holds the fragment length in its low bits. Its high
/// bit marks a separator: a one-byte (or empty) lower bound on the key
/// class rather than a fragment of any key.
class [[nodiscard]] segment final {
 public:
  constexpr segment() noexcept = default;

  segment(key_view fragment, bool separator) noexcept {
    SEGDB_DETAIL_ASSERT(fragment.size() <= max_segment_length);
    SEGDB_DETAIL_ASSERT(!separator || fragment.size() <= 1);

    data[0] = static_cast<std::byte>(fragment.size()) |
              (separator ? separator_flag : std::byte{0});
    if (!fragment.empty())
      std::memcpy(&data[1], fragment.data(), fragment.size());
  }

  /// Make the separator whose lower bound is class \a c.
  [[nodiscard]] static segment separator_for(key_class c) noexcept {
    SEGDB_DETAIL_ASSERT(c < key_class_limit);

    if (c == empty_key_class) return segment{key_view{}, true};
    const auto first_byte = static_cast<std::byte>(c - 1U);
    return segment{key_view{&first_byte, 1}, true};
  }

  [[nodiscard, gnu::pure]] constexpr std::size_t length() const noexcept {
    return std::to_integer<std::size_t>(data[0] & ~separator_flag);
  }

  [[nodiscard, gnu::pure]] constexpr bool is_separator() const noexcept {
    return (data[0] & separator_flag) != std::byte{0};
  }

  /// The fragment bytes. The view is into this object.
  [[nodiscard, gnu::pure]] key_view bytes() const noexcept {
    return key_view{&data[1], length()};
  }

  [[nodiscard, gnu::pure]] key_class get_class() const noexcept {
    return class_of(bytes());
  }

  [[gnu::cold]] SEGDB_DETAIL_NOINLINE void dump(std::ostream &os) const;

 private:
  static constexpr std::byte separator_flag{0x80};

  std::array<std::byte, segment_slot_size> data{};
};

static_assert(sizeof(segment) == segment_slot_size);
static_assert(std::is_trivially_copyable_v<segment>);

/// What a segment leads to: an owned value, or the arena index of a
/// subtree. Whether the subtree consumes the segment bytes (a prefix
/// subtree) or not (a separator subtree) is recorded in the segment.
using child = std::variant<value, node_index>;

enum class match_kind : std::uint8_t {
  /// No entry relates to the key; `index` is the sorted insertion slot.
  NONE,
  /// A value entry whose segment equals the remaining key.
  VALUE,
  /// A prefix subtree whose segment starts the remaining key.
  PREFIX,
  /// A separator subtree whose class range covers the remaining key.
  SEPARATOR,
  /// An entry of the same class as the remaining key that matches
  /// neither as a value nor as a prefix.
  DIVERGENT,
};

/// Outcome of searching a node for a remaining key.
struct [[nodiscard]] match_result final {
  match_kind kind;
  /// The matched entry, or for match_kind::NONE the insertion slot.
  std::uint8_t index;
  /// For match_kind::PREFIX the key past the matched segment, otherwise
  /// the searched key.
  key_view remainder;
};

/// A bounded, radix-ary array of (segment, child) entries in strictly
/// increasing class order.
class [[nodiscard]] node final {
 public:
  [[nodiscard, gnu::pure]] constexpr std::uint8_t size() const noexcept {
    return children_count;
  }

  [[nodiscard, gnu::pure]] constexpr bool is_full() const noexcept {
    return children_count == tree_radix;
  }

  [[nodiscard, gnu::pure]] constexpr bool is_empty() const noexcept {
    return children_count == 0;
  }

  [[nodiscard]] const segment &get_segment(std::uint8_t i) const noexcept {
    SEGDB_DETAIL_ASSERT(i < children_count);
    return segments[i];
  }

  [[nodiscard]] child &get_child(std::uint8_t i) noexcept {
    SEGDB_DETAIL_ASSERT(i < children_count);
    return children[i];
  }

  [[nodiscard]] const child &get_child(std::uint8_t i) const noexcept {
    SEGDB_DETAIL_ASSERT(i < children_count);
    return children[i];
  }

  [[nodiscard]] node_index get_child_node(std::uint8_t i) const noexcept {
    SEGDB_DETAIL_ASSERT(i < children_count);
    SEGDB_DETAIL_ASSERT(std::holds_alternative<node_index>(children[i]));
    return *std::get_if<node_index>(&children[i]);
  }

  /// Find the entry governing \a remaining_key. Binary search for the
  /// last entry whose class does not exceed the key class.
  [[nodiscard]] match_result locate(key_view remaining_key) const noexcept;

  /// Insert an entry at \a i, shifting the later entries up by one.
  /// The node must not be full and \a s must sort at \a i.
  void insert_entry(std::uint8_t i, segment s, child &&c) noexcept;

  /// Replace the entry at \a i.
  void set_entry(std::uint8_t i, segment s, child &&c) noexcept;

  /// Move the entries from \a first onwards into the empty node
  /// \a target, keeping their order.
  void move_entries_to(std::uint8_t first, node &target) noexcept;

  [[gnu::cold]] SEGDB_DETAIL_NOINLINE void dump(std::ostream &os) const;

 private:
  std::array<segment, tree_radix> segments{};
  std::array<child, tree_radix> children{};
  std::uint8_t children_count{0};
};

static_assert(std::is_nothrow_move_constructible_v<child>);
static_assert(std::is_nothrow_move_assignable_v<child>);

}  // namespace segdb::detail

#endif  // SEGDB_DETAIL_SEGDB_INTERNAL_HPP
