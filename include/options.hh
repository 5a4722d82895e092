#pragma once

#include <cstdint>
#include <string>

#include "config.hh"

namespace uniqdir {

inline namespace detail_v1 {

enum class cmp_t {
  by_name,    // identity key is the filename
  by_content  // identity key is the content hash
};

struct options_t {
  cmp_t mode = cmp_t::by_name;
  // name mode only, content mode always reads symlinked files
  bool follow_symlinks = false;
  std::string hash_algo{default_hash_algo};
  uint64_t chunk_size = chunk_sz;
  uint32_t max_thread = default_max_thread;
  bool verbose = false;
};

}  // namespace detail_v1

}  // namespace uniqdir
