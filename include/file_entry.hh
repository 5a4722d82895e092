#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <utility>

namespace uniqdir {

inline namespace detail_v1 {

class file_entry_t {
  std::size_t _root_idx = 0;
  std::filesystem::path _path;
  std::filesystem::path _rel_path;

 public:
  template <typename Tp>
  inline file_entry_t(const std::size_t root_idx, Tp &&path,
                      const std::filesystem::path &root)
      : _root_idx(root_idx),
        _path(std::forward<Tp>(path)),
        _rel_path(_path.lexically_relative(root)) {}

  inline file_entry_t(const file_entry_t &rhs) = default;
  inline file_entry_t(file_entry_t &&rhs) = default;
  inline file_entry_t &operator=(const file_entry_t &rhs) = default;
  inline file_entry_t &operator=(file_entry_t &&rhs) = default;

  inline std::size_t root_idx() const noexcept { return _root_idx; }
  inline const std::filesystem::path &path() const noexcept { return _path; }
  // path below the compared directory
  inline const std::filesystem::path &rel_path() const noexcept {
    return _rel_path;
  }
  inline std::string name() const { return _path.filename().string(); }
};

}  // namespace detail_v1

}  // namespace uniqdir
