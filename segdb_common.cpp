// Copyright 2025 segdb contributors

#include "global.hpp"

#include "segdb_common.hpp"

#include <cstddef>
#include <iomanip>
#include <iostream>

namespace segdb::detail {

void dump_byte(std::ostream &os, std::byte byte) {
  os << ' ' << std::hex << std::setfill('0') << std::setw(2)
     << static_cast<unsigned>(byte) << std::dec;
}

void dump_key(std::ostream &os, key_view key) {
  os << "key(" << key.size_bytes() << "):";
  for (const auto b : key) dump_byte(os, b);
}

void dump_val(std::ostream &os, value_view v) {
  os << "value(" << v.size_bytes() << "):";
  for (const auto b : v) dump_byte(os, b);
}

}  // namespace segdb::detail
