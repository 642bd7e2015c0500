// Copyright 2025 segdb contributors
#ifndef SEGDB_DETAIL_GLOBAL_HPP
#define SEGDB_DETAIL_GLOBAL_HPP

// Compiler and platform definitions shared by every source file. Should be the
// first include everywhere.

#if defined(__clang__)
#define SEGDB_DETAIL_CLANG
#elif defined(__GNUC__)
#define SEGDB_DETAIL_GCC
#elif defined(_MSC_VER)
#define SEGDB_DETAIL_MSVC
#endif

#ifndef SEGDB_DETAIL_MSVC
#define SEGDB_DETAIL_UNLIKELY(x) __builtin_expect(x, 0)
#define SEGDB_DETAIL_NOINLINE __attribute__((noinline))
#else
#define SEGDB_DETAIL_UNLIKELY(x) (!!(x))
#define SEGDB_DETAIL_NOINLINE __declspec(noinline)
#endif

#define SEGDB_DETAIL_DO_PRAGMA(x) _Pragma(#x)

#if defined(SEGDB_DETAIL_CLANG)
#define SEGDB_DETAIL_DISABLE_CLANG_WARNING(x) \
  SEGDB_DETAIL_DO_PRAGMA(clang diagnostic push) \
  SEGDB_DETAIL_DO_PRAGMA(clang diagnostic ignored x)
#define SEGDB_DETAIL_RESTORE_CLANG_WARNINGS() \
  SEGDB_DETAIL_DO_PRAGMA(clang diagnostic pop)
#else
#define SEGDB_DETAIL_DISABLE_CLANG_WARNING(x)
#define SEGDB_DETAIL_RESTORE_CLANG_WARNINGS()
#endif

#if defined(SEGDB_DETAIL_GCC)
#define SEGDB_DETAIL_DISABLE_GCC_WARNING(x) \
  SEGDB_DETAIL_DO_PRAGMA(GCC diagnostic push) \
  SEGDB_DETAIL_DO_PRAGMA(GCC diagnostic ignored x)
#define SEGDB_DETAIL_RESTORE_GCC_WARNINGS() \
  SEGDB_DETAIL_DO_PRAGMA(GCC diagnostic pop)
#else
#define SEGDB_DETAIL_DISABLE_GCC_WARNING(x)
#define SEGDB_DETAIL_RESTORE_GCC_WARNINGS()
#endif

#if defined(SEGDB_DETAIL_MSVC)
#define SEGDB_DETAIL_DISABLE_MSVC_WARNING(x) \
  SEGDB_DETAIL_DO_PRAGMA(warning(push))     \
  SEGDB_DETAIL_DO_PRAGMA(warning(disable : x))
#define SEGDB_DETAIL_RESTORE_MSVC_WARNINGS() \
  SEGDB_DETAIL_DO_PRAGMA(warning(pop))
#else
#define SEGDB_DETAIL_DISABLE_MSVC_WARNING(x)
#define SEGDB_DETAIL_RESTORE_MSVC_WARNINGS()
#endif

#endif  // SEGDB_DETAIL_GLOBAL_HPP
