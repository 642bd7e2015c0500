// Copyright 2025 segdb contributors
#ifndef SEGDB_DETAIL_MUTEX_SEGDB_HPP
#define SEGDB_DETAIL_MUTEX_SEGDB_HPP

#include "global.hpp"

// IWYU pragma: no_include <__fwd/ostream.h>

#include <cstddef>
#include <cstdint>
#include <iosfwd>  // IWYU pragma: keep
#include <mutex>
#include <shared_mutex>
#include <string_view>
#include <utility>

#include "segdb.hpp"
#include "segdb_common.hpp"

namespace segdb {

// A segment tree synchronized with a single reader/writer lock. Any number
// of get() calls run concurrently; put() runs alone. Every operation is
// linearizable through the lock.
//
// If a put() leaves by an exception while holding the lock, the tree is
// poisoned: every later get(), empty() or put() throws poisoned_error.
class mutex_db final {
 public:
  using get_result = db::get_result;

  // Querying
  [[nodiscard]] get_result get(key_view search_key) const {
    const std::shared_lock guard{mutex};
    throw_if_poisoned();
    return db_.get(search_key);
  }

  [[nodiscard]] get_result get(std::string_view search_key) const {
    return get(to_key_view(search_key));
  }

  [[nodiscard]] bool empty() const {
    const std::shared_lock guard{mutex};
    throw_if_poisoned();
    return db_.empty();
  }

  // Modifying
  void put(key_view insert_key, value v) {
    // Rejecting an oversized key or value does not touch the tree and must
    // not poison it.
    detail::check_key_value_sizes(insert_key, v);

    const std::lock_guard guard{mutex};
    throw_if_poisoned();
    try {
      db_.put(insert_key, std::move(v));
    } catch (...) {
      poisoned = true;
      throw;
    }
  }

  void put(std::string_view insert_key, value v) {
    put(to_key_view(insert_key), std::move(v));
  }

  [[nodiscard]] bool is_poisoned() const {
    const std::shared_lock guard{mutex};
    return poisoned;
  }

  void check_invariants() const {
    const std::shared_lock guard{mutex};
    db_.check_invariants();
  }

  // Stats

#ifdef SEGDB_DETAIL_WITH_STATS

  [[nodiscard]] auto get_node_count() const {
    const std::shared_lock guard{mutex};
    return db_.get_node_count();
  }

  [[nodiscard]] auto get_value_count() const {
    const std::shared_lock guard{mutex};
    return db_.get_value_count();
  }

  [[nodiscard]] auto get_current_memory_use() const {
    const std::shared_lock guard{mutex};
    return db_.get_current_memory_use();
  }

  [[nodiscard]] auto get_prefix_splits() const {
    const std::shared_lock guard{mutex};
    return db_.get_prefix_splits();
  }

  [[nodiscard]] auto get_push_downs() const {
    const std::shared_lock guard{mutex};
    return db_.get_push_downs();
  }

  [[nodiscard]] auto get_separator_splits() const {
    const std::shared_lock guard{mutex};
    return db_.get_separator_splits();
  }

#endif  // SEGDB_DETAIL_WITH_STATS

  // Debugging
  [[gnu::cold]] SEGDB_DETAIL_NOINLINE void dump(std::ostream &os) const {
    const std::shared_lock guard{mutex};
    db_.dump(os);
  }

 private:
  // Callers must hold the lock in either mode.
  void throw_if_poisoned() const {
    if (SEGDB_DETAIL_UNLIKELY(poisoned)) {
      throw poisoned_error(
          "segdb::mutex_db: a writer failed while holding the lock");
    }
  }

  db db_;

  mutable std::shared_mutex mutex;

  // Written only under the exclusive lock.
  bool poisoned{false};
};

}  // namespace segdb

#endif  // SEGDB_DETAIL_MUTEX_SEGDB_HPP
