// Copyright 2025 segdb contributors

// Should be the first include
#include "global.hpp"  // IWYU pragma: keep

// IWYU pragma: no_include "gtest/gtest.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <random>
#include <set>

#include <gtest/gtest.h>

#include "db_test_utils.hpp"
#include "gtest_utils.hpp"
#include "mutex_segdb.hpp"
#include "segdb.hpp"
#include "segdb_common.hpp"

namespace {

using segdb::test::key_bytes;

// Draws keys from a small alphabet so that they often share prefixes, are
// prefixes of each other, or repeat.
class key_generator final {
 public:
  key_generator(std::uint32_t seed, std::size_t max_length,
                bool full_byte_range) noexcept
      : random{seed},
        length{0, max_length},
        narrow_byte{0, narrow_alphabet.size() - 1},
        wide_byte{0, 255},
        full_range{full_byte_range} {}

  [[nodiscard]] key_bytes next_key() {
    key_bytes result(length(random));
    for (auto &b : result) {
      b = full_range ? static_cast<std::byte>(wide_byte(random))
                     : narrow_alphabet[narrow_byte(random)];
    }
    return result;
  }

  [[nodiscard]] segdb::value next_value() {
    segdb::value result(length(random));
    for (auto &b : result) b = static_cast<std::byte>(wide_byte(random));
    return result;
  }

 private:
  static constexpr std::array<std::byte, 5> narrow_alphabet{
      std::byte{0x00}, std::byte{'a'}, std::byte{'b'}, std::byte{'c'},
      std::byte{0xFF}};

  std::mt19937 random;
  std::uniform_int_distribution<std::size_t> length;
  std::uniform_int_distribution<std::size_t> narrow_byte;
  std::uniform_int_distribution<unsigned> wide_byte;
  const bool full_range;
};

template <class Db>
class SegDBRandomTest : public ::testing::Test {
 public:
  using Test::Test;

 protected:
  // Put random mappings, checking the tree against the oracle as it grows
  // and looking up random keys that were never put.
  static void run(std::uint32_t seed, std::size_t max_key_length,
                  bool full_byte_range, std::size_t count) {
    segdb::test::tree_verifier<Db> verifier;
    key_generator keys{seed, max_key_length, full_byte_range};
    std::set<key_bytes> inserted;

    for (std::size_t i = 0; i < count; ++i) {
      const auto k = keys.next_key();
      verifier.insert(segdb::key_view{k}, keys.next_value());
      inserted.insert(k);

      const auto unseen = keys.next_key();
      if (!inserted.contains(unseen))
        verifier.check_absent_keys({segdb::key_view{unseen}});

      if (i % 64 == 0) verifier.check_present_values();
    }
    verifier.check_present_values();
#ifdef SEGDB_DETAIL_WITH_STATS
    verifier.assert_value_count();
#endif  // SEGDB_DETAIL_WITH_STATS
  }
};

using SegDBTypes = ::testing::Types<segdb::db, segdb::mutex_db>;

SEGDB_TYPED_TEST_SUITE(SegDBRandomTest, SegDBTypes)

SEGDB_START_TYPED_TESTS()

TYPED_TEST(SegDBRandomTest, ShortKeysNarrowAlphabet) {
  for (std::uint32_t seed = 1; seed <= 4; ++seed)
    TestFixture::run(seed, 4, false, 500);
}

TYPED_TEST(SegDBRandomTest, LongKeysNarrowAlphabet) {
  for (std::uint32_t seed = 11; seed <= 13; ++seed)
    TestFixture::run(seed, 24, false, 800);
}

TYPED_TEST(SegDBRandomTest, FullByteRange) {
  for (std::uint32_t seed = 21; seed <= 23; ++seed)
    TestFixture::run(seed, 12, true, 1500);
}

SEGDB_END_TESTS()

}  // namespace
