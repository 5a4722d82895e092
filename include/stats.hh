#pragma once

#include <cstdint>

namespace uniqdir {

inline namespace detail_v1 {

struct index_stats_t {
  uint64_t scanned = 0;  // regular files found
  uint64_t indexed = 0;  // files with an identity key
  uint64_t skipped = 0;  // files that failed to hash

  inline index_stats_t &operator+=(const index_stats_t &rhs) noexcept {
    scanned += rhs.scanned;
    indexed += rhs.indexed;
    skipped += rhs.skipped;
    return *this;
  }
};

}  // namespace detail_v1

}  // namespace uniqdir
