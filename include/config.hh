#pragma once

#include <string_view>

namespace uniqdir {

// 8KiB
constexpr auto chunk_sz = 8192UL;

constexpr std::string_view default_hash_algo = "md5";

constexpr auto default_max_thread = 4U;
constexpr auto max_thread_lim = 256U;

// presentation
constexpr auto preview_cap = 50UL;
constexpr auto column_width = 32UL;

}  // namespace uniqdir
