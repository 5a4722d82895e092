#include "hasher.hh"

#include <openssl/evp.h>
#include <xxhash.h>

#include <cerrno>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <vector>

#include "errors.hh"

namespace uniqdir {

inline namespace detail_v1 {

namespace {

// RAII wrapper for xxhash library.
class xxh_hasher_t {
  XXH3_state_t *_state;

 public:
  xxh_hasher_t() {
    _state = XXH3_createState();
    if (_state == nullptr) {
      throw std::runtime_error("XXH3_createState failed");
    }
    if (XXH3_128bits_reset(_state) == XXH_ERROR) {
      XXH3_freeState(_state);
      throw std::runtime_error("XXH3_128bits_reset failed");
    }
  }
  ~xxh_hasher_t() noexcept {
    if (_state != nullptr) {
      XXH3_freeState(_state);
    }
  }

  xxh_hasher_t(const xxh_hasher_t &rhs) = delete;
  xxh_hasher_t(xxh_hasher_t &&rhs) = delete;
  xxh_hasher_t &operator=(const xxh_hasher_t &rhs) = delete;
  xxh_hasher_t &operator=(xxh_hasher_t &&rhs) = delete;

  void update(const char *data, const uint64_t size) {
    if (XXH3_128bits_update(_state, data, size) == XXH_ERROR) {
      throw std::runtime_error("XXH3_128bits_update failed");
    }
  }
  std::string hex_digest() {
    XXH128_canonical_t canon;
    XXH128_canonicalFromHash(&canon, XXH3_128bits_digest(_state));
    return to_hex(canon.digest, sizeof(canon.digest));
  }
};

// RAII wrapper for libcrypto digest context.
class evp_hasher_t {
  EVP_MD_CTX *_ctx;

 public:
  explicit evp_hasher_t(const EVP_MD *md) {
    _ctx = EVP_MD_CTX_new();
    if (_ctx == nullptr) {
      throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(_ctx, md, nullptr) != 1) {
      EVP_MD_CTX_free(_ctx);
      throw std::runtime_error("EVP_DigestInit_ex failed");
    }
  }
  ~evp_hasher_t() noexcept {
    if (_ctx != nullptr) {
      EVP_MD_CTX_free(_ctx);
    }
  }

  evp_hasher_t(const evp_hasher_t &rhs) = delete;
  evp_hasher_t(evp_hasher_t &&rhs) = delete;
  evp_hasher_t &operator=(const evp_hasher_t &rhs) = delete;
  evp_hasher_t &operator=(evp_hasher_t &&rhs) = delete;

  void update(const char *data, const uint64_t size) {
    if (EVP_DigestUpdate(_ctx, data, size) != 1) {
      throw std::runtime_error("EVP_DigestUpdate failed");
    }
  }
  std::string hex_digest() {
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;
    if (EVP_DigestFinal_ex(_ctx, md, &md_len) != 1) {
      throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    return to_hex(md, md_len);
  }
};

const EVP_MD *get_md(std::string_view algo) {
  return EVP_get_digestbyname(std::string(algo).c_str());
}

std::error_code last_error() {
  return errno != 0 ? std::error_code(errno, std::generic_category())
                    : std::make_error_code(std::errc::io_error);
}

template <typename Hasher>
std::string hash_stream(const std::filesystem::path &path,
                        const uint64_t chunk_size, Hasher &hasher) {
  errno = 0;
  std::ifstream file_stream(path, std::ios::binary);
  if (!file_stream.is_open()) {
    throw read_error(path, last_error());
  }
  std::vector<char> buf(chunk_size);
  while (true) {
    errno = 0;
    file_stream.read(buf.data(), (std::streamsize)chunk_size);
    const auto read_len = file_stream.gcount();
    if (file_stream.bad()) {
      throw read_error(path, last_error());
    }
    if (read_len > 0) {
      hasher.update(buf.data(), (uint64_t)read_len);
    }
    if (file_stream.eof()) {
      break;
    }
  }
  return hasher.hex_digest();
}

}  // namespace

std::string to_hex(const unsigned char *data, const uint64_t size) {
  constexpr char digits[] = "0123456789abcdef";
  std::string hex;
  hex.reserve(size * 2);
  for (auto i = 0UL; i < size; ++i) {
    hex += digits[data[i] >> 4];
    hex += digits[data[i] & 0x0f];
  }
  return hex;
}

void check_hash_algo(std::string_view algo) {
  if (algo == xxh128_algo) {
    return;
  }
  if (get_md(algo) == nullptr) {
    throw std::invalid_argument("invalid hash algorithm: " +
                                std::string(algo));
  }
}

std::string hash_file(const std::filesystem::path &path,
                      const uint64_t chunk_size, std::string_view algo) {
  if (chunk_size == 0) {
    throw std::invalid_argument("chunk size must be > 0");
  }
  if (algo == xxh128_algo) {
    xxh_hasher_t hasher;
    return hash_stream(path, chunk_size, hasher);
  }
  const EVP_MD *md = get_md(algo);
  if (md == nullptr) {
    throw std::invalid_argument("invalid hash algorithm: " +
                                std::string(algo));
  }
  evp_hasher_t hasher(md);
  return hash_stream(path, chunk_size, hasher);
}

}  // namespace detail_v1

}  // namespace uniqdir
