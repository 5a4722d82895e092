#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include "config.hh"

namespace uniqdir {

inline namespace detail_v1 {

// name of the xxhash backend, every other name goes to libcrypto
constexpr std::string_view xxh128_algo = "xxh128";

/**
 * @brief check that a digest algorithm is supported
 *
 * @param algo "xxh128" or any digest name known to libcrypto (md5, sha256...)
 * @throws std::invalid_argument if unsupported
 */
void check_hash_algo(std::string_view algo);

/**
 * @brief content fingerprint of a file, read sequentially in chunks
 *
 * @param path file to hash
 * @param chunk_size bytes read per chunk, must be > 0
 * @param algo digest algorithm, see check_hash_algo
 * @return lowercase hexadecimal digest
 * @throws read_error if the file cannot be opened or read
 */
std::string hash_file(const std::filesystem::path &path,
                      const uint64_t chunk_size = chunk_sz,
                      std::string_view algo = default_hash_algo);

/**
 * @brief lowercase hexadecimal representation of raw digest bytes
 */
std::string to_hex(const unsigned char *data, const uint64_t size);

}  // namespace detail_v1

}  // namespace uniqdir
