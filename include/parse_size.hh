#pragma once

#include <cstdint>
#include <string_view>

namespace utils {

/**
 * @brief parse a size string such as "8192", "64KiB", "1MB" or "512Kb"
 *
 * unit prefixes K M G T P E are case-insensitive, "i" selects powers of
 * 1024, a trailing "b" counts bits instead of bytes
 *
 * @throws std::invalid_argument if not a valid size string
 * @throws std::out_of_range if the size does not fit in 64 bits
 */
uint64_t parse_size(std::string_view size_str);

}  // namespace utils
