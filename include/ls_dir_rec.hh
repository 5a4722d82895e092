#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <vector>

#include "file_entry.hh"

#include <boost/asio/thread_pool.hpp>

namespace uniqdir {

inline namespace detail_v1 {

/**
 * @brief hidden entries are the ones whose own name starts with a dot,
 * ancestors are not inspected
 */
inline bool is_hidden(const std::filesystem::path &path) {
  const auto name = path.filename().native();
  return !name.empty() && name.front() == '.';
}

/**
 * @brief list one directory, post subdirectories back to the pool
 *
 * @param dir directory path
 * @param root compared directory dir belongs to
 * @param root_idx index of root
 * @param follow_symlinks include symlinked files, symlinked directories
 * are never followed
 * @param[out] file_list file list
 * @param mtx mutex for protecting file_list
 * @param pool thread pool for recursive calls
 */
void ls_dir_rec(const std::filesystem::path dir,
                const std::filesystem::path &root, const std::size_t root_idx,
                const bool follow_symlinks,
                std::vector<file_entry_t> &file_list, std::mutex &mtx,
                boost::asio::thread_pool &pool);

/**
 * @brief list a compared directory recursively, skipping hidden entries
 *
 * @param root canonical directory path
 * @param root_idx index of root, carried by every entry
 * @param follow_symlinks include symlinked files
 * @param max_thread maximum number of threads to use
 * @return file list sorted by path
 * @throws invalid_root_error if root is missing or not a directory
 */
std::vector<file_entry_t> scan_root(const std::filesystem::path &root,
                                    const std::size_t root_idx,
                                    const bool follow_symlinks,
                                    const uint32_t max_thread);

}  // namespace detail_v1

}  // namespace uniqdir
