// Copyright 2025 segdb contributors
#ifndef SEGDB_DETAIL_ASSERT_HPP
#define SEGDB_DETAIL_ASSERT_HPP

// Should be the first include
#include "global.hpp"  // IWYU pragma: keep

#include <cstdlib>
#include <iostream>
#include <sstream>
#include <thread>

namespace segdb::detail {

[[noreturn, gnu::cold]] SEGDB_DETAIL_NOINLINE inline void assert_failure(
    const char *file, int line, const char *func,
    const char *condition) noexcept {
  // Format the whole message first so that concurrent failures do not
  // interleave on std::cerr.
  std::ostringstream buf;
  buf << "Assertion \"" << condition << "\" failed at " << file << ':' << line
      << ", function \"" << func << "\", thread "
      << std::this_thread::get_id() << '\n';
  std::cerr << buf.str() << std::flush;
  std::abort();
}

}  // namespace segdb::detail

#ifndef NDEBUG

#define SEGDB_DETAIL_ASSERT(condition)                                       \
  SEGDB_DETAIL_UNLIKELY(!(condition))                                        \
  ? segdb::detail::assert_failure(__FILE__, __LINE__, __func__, #condition) \
  : ((void)0)

#else  // #ifndef NDEBUG

#define SEGDB_DETAIL_ASSERT(condition) ((void)0)

#endif  // #ifndef NDEBUG

#endif  // SEGDB_DETAIL_ASSERT_HPP
