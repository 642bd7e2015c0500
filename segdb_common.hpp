// Copyright 2025 segdb contributors
#ifndef SEGDB_DETAIL_SEGDB_COMMON_HPP
#define SEGDB_DETAIL_SEGDB_COMMON_HPP

// Should be the first include
#include "global.hpp"  // IWYU pragma: keep

// IWYU pragma: no_include <__fwd/ostream.h>

#include <cstddef>
#include <cstdint>
#include <iosfwd>  // IWYU pragma: keep
#include <limits>
#include <span>
#include <stdexcept>
#include <string_view>
#include <vector>

namespace segdb {

class db;
class mutex_db;

/// Keys are passed as non-owning pointers to memory with associated
/// length (std::span). Any contiguous byte sequence may be a key,
/// including the empty one.
using key_view = std::span<const std::byte>;

/// Non-owning view of a value.
using value_view = std::span<const std::byte>;

/// Values are owned byte arrays. Ownership moves into the tree on put()
/// and get() hands back an independent copy.
using value = std::vector<std::byte>;

/// A type alias determining the maximum size of a key that may be
/// stored in the tree.
using key_size_type = std::uint32_t;

/// A type alias determining the maximum size of a value that may be
/// stored in the tree.
using value_size_type = std::uint32_t;

/// Thrown by every mutex_db operation once a writer has left the
/// exclusive critical section by an exception, since the tree may have
/// been abandoned half-restructured.
class poisoned_error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/// Thrown by check_invariants() when the tree structure is corrupt. This
/// is a defect in segdb, never a lookup outcome.
class invariant_violation : public std::logic_error {
 public:
  using std::logic_error::logic_error;
};

/// View the bytes of a character string as a key.
[[nodiscard]] inline key_view to_key_view(std::string_view s) noexcept {
  return std::as_bytes(std::span{s.data(), s.size()});
}

/// Make an owned value from the bytes of a character string.
[[nodiscard]] inline value to_value(std::string_view s) {
  const auto bytes = to_key_view(s);
  return value{bytes.begin(), bytes.end()};
}

namespace detail {

/// Throw std::length_error if a key or a value cannot be represented
/// by key_size_type or value_size_type.
inline void check_key_value_sizes(key_view k, value_view v) {
  if (SEGDB_DETAIL_UNLIKELY(k.size_bytes() >
                            std::numeric_limits<key_size_type>::max())) {
    throw std::length_error("Key length must fit in std::uint32_t");
  }
  if (SEGDB_DETAIL_UNLIKELY(v.size_bytes() >
                            std::numeric_limits<value_size_type>::max())) {
    throw std::length_error("Value length must fit in std::uint32_t");
  }
}

/// Dump a byte as a two-digit hexadecimal number.
[[gnu::cold]] void dump_byte(std::ostream &os, std::byte byte);

/// Dump the key as a sequence of bytes.
[[gnu::cold]] void dump_key(std::ostream &os, key_view key);

/// Dump the value as a sequence of bytes.
[[gnu::cold]] void dump_val(std::ostream &os, value_view v);

}  // namespace detail

}  // namespace segdb

#endif  // SEGDB_DETAIL_SEGDB_COMMON_HPP
