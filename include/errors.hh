#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>

namespace uniqdir {

inline namespace detail_v1 {

/**
 * @brief a compared directory does not exist or is not a directory
 */
class invalid_root_error : public std::runtime_error {
  std::filesystem::path _path;

 public:
  inline invalid_root_error(const std::filesystem::path &path,
                            const std::string &what)
      : std::runtime_error(what), _path(path) {}

  inline const std::filesystem::path &path() const noexcept { return _path; }
};

/**
 * @brief a file could not be opened or read while hashing,
 * the file is excluded from content comparison
 */
class read_error : public std::runtime_error {
  std::filesystem::path _path;
  std::error_code _code;

 public:
  inline read_error(const std::filesystem::path &path, std::error_code code)
      : std::runtime_error("read error: " + path.string() + " - " +
                           code.message()),
        _path(path),
        _code(code) {}

  inline const std::filesystem::path &path() const noexcept { return _path; }
  inline std::error_code code() const noexcept { return _code; }
};

/**
 * @brief fewer than two usable directories left to compare
 */
class too_few_roots_error : public std::invalid_argument {
 public:
  using std::invalid_argument::invalid_argument;
};

}  // namespace detail_v1

}  // namespace uniqdir
