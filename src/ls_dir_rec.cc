#include "ls_dir_rec.hh"

#include <algorithm>
#include <boost/asio.hpp>
#include <functional>
#include <iostream>
#include <iterator>
#include <system_error>

#include "errors.hh"
#include "oss.hh"

namespace uniqdir {

inline namespace detail_v1 {

void ls_dir_rec(const std::filesystem::path dir,
                const std::filesystem::path &root, const std::size_t root_idx,
                const bool follow_symlinks,
                std::vector<file_entry_t> &file_list, std::mutex &mtx,
                boost::asio::thread_pool &pool) {
  std::vector<file_entry_t> file_list_tmp;
  try {
    for (const auto &dir_entry : std::filesystem::directory_iterator(dir)) {
      if (is_hidden(dir_entry.path())) {
        // hidden, skip along with its subtree
        continue;

      } else if (dir_entry.is_symlink()) {
        // symlink, only files and only on request
        std::error_code ec;
        if (follow_symlinks && dir_entry.is_regular_file(ec)) {
          file_list_tmp.emplace_back(root_idx, dir_entry.path(), root);
        } else if (follow_symlinks && !dir_entry.is_directory(ec)) {
          oss(std::cerr) << "[warn] skip symlink: " << dir_entry.path()
                         << '\n';
        }

      } else if (dir_entry.is_directory()) {
        // directory, recursive call
        boost::asio::post(pool,
                          std::bind(ls_dir_rec, dir_entry.path(),
                                    std::cref(root), root_idx, follow_symlinks,
                                    std::ref(file_list), std::ref(mtx),
                                    std::ref(pool)));

      } else if (dir_entry.is_regular_file()) {
        // regular file, add to list
        file_list_tmp.emplace_back(root_idx, dir_entry.path(), root);

      } else {
        // other file type, skip
        oss(std::cerr) << "[warn] skip unsupport file: " << dir_entry.path()
                       << '\n';
      }
    }
  } catch (std::filesystem::filesystem_error &e) {
    // error iterate directory, skip
    oss(std::cerr) << "[warn] skip directory: " << dir << " - "
                   << e.code().message() << '\n';
  }

  // append to global list
  if (!file_list_tmp.empty()) {
    std::lock_guard lk(mtx);
    file_list.insert(file_list.end(),
                     std::make_move_iterator(file_list_tmp.begin()),
                     std::make_move_iterator(file_list_tmp.end()));
  }
}

std::vector<file_entry_t> scan_root(const std::filesystem::path &root,
                                    const std::size_t root_idx,
                                    const bool follow_symlinks,
                                    const uint32_t max_thread) {
  std::error_code ec;
  if (!std::filesystem::is_directory(root, ec)) {
    throw invalid_root_error(
        root, "'" + root.string() + "' is not a directory or does not exist");
  }

  std::vector<file_entry_t> file_list;
  {
    boost::asio::thread_pool pool(max_thread);
    std::mutex mtx;
    boost::asio::post(pool, std::bind(ls_dir_rec, root, std::cref(root),
                                      root_idx, follow_symlinks,
                                      std::ref(file_list), std::ref(mtx),
                                      std::ref(pool)));
    pool.join();
  }

  // job scheduling decides the merge order, sort for reproducible output
  std::sort(file_list.begin(), file_list.end(),
            [](const auto &lhs, const auto &rhs) {
              return lhs.path() < rhs.path();
            });
  return file_list;
}

}  // namespace detail_v1

}  // namespace uniqdir
