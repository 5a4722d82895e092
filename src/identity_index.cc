#include "identity_index.hh"

#include <algorithm>
#include <boost/asio.hpp>
#include <boost/asio/thread_pool.hpp>
#include <exception>
#include <iostream>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>

#include "errors.hh"
#include "hasher.hh"
#include "ls_dir_rec.hh"
#include "oss.hh"
#include "timer.hh"

namespace uniqdir {

inline namespace detail_v1 {

identity_index_t::identity_index_t(const cmp_t mode,
                                   std::vector<std::filesystem::path> roots,
                                   std::vector<partial_index_t> partials)
    : _mode(mode), _roots(std::move(roots)), _entries(_roots.size()) {
  // fold in root order so bucket contents do not depend on scan order
  std::sort(partials.begin(), partials.end(),
            [](const auto &lhs, const auto &rhs) {
              return lhs.root_idx < rhs.root_idx;
            });
  std::vector<bool> merged(_roots.size(), false);
  for (auto &partial : partials) {
    if (partial.root_idx >= _roots.size()) {
      throw std::invalid_argument("partial index of unknown root: " +
                                  std::to_string(partial.root_idx));
    }
    if (merged[partial.root_idx]) {
      throw std::invalid_argument("root indexed twice: " +
                                  _roots[partial.root_idx].string());
    }
    merged[partial.root_idx] = true;
    for (const auto &keyed : partial.entries) {
      _buckets[keyed.key].add(partial.root_idx, keyed.entry.path());
    }
    _entries[partial.root_idx] = std::move(partial.entries);
    _stats += partial.stats;
  }
}

const bucket_t *identity_index_t::find(const std::string &key) const {
  auto it = _buckets.find(key);
  return it == _buckets.end() ? nullptr : &it->second;
}

std::size_t identity_index_t::dir_count(const std::string &key) const {
  const auto *bucket = find(key);
  return bucket == nullptr ? 0 : bucket->dir_count();
}

partial_index_t index_root(const std::filesystem::path &root,
                           const std::size_t root_idx, const options_t &opt) {
  timer_t timer;
  if (opt.verbose) {
    oss(std::cerr) << "[log] list files: " << root << '\n';
  }
  // content is read through links, symlinked files always take part
  const auto follow_symlinks =
      opt.follow_symlinks || opt.mode == cmp_t::by_content;
  auto file_list = scan_root(root, root_idx, follow_symlinks, opt.max_thread);
  if (opt.verbose) {
    oss(std::cerr) << "[log] file count: " << file_list.size() << '\n'
                   << "[log] elapsed: " << timer.time().count() << "ms\n";
  }

  partial_index_t partial;
  partial.root_idx = root_idx;
  partial.stats.scanned = file_list.size();

  if (opt.mode == cmp_t::by_name) {
    partial.entries.reserve(file_list.size());
    for (auto &file : file_list) {
      auto name = file.name();
      partial.entries.push_back({std::move(file), std::move(name)});
    }
    partial.stats.indexed = partial.entries.size();
    return partial;
  }

  // hash files, one job per file, each job owns its result slot
  std::vector<std::optional<std::string>> keys(file_list.size());
  std::exception_ptr fatal;
  {
    boost::asio::thread_pool pool(opt.max_thread);
    std::mutex mtx;
    for (auto i = 0UL; i < file_list.size(); ++i) {
      boost::asio::post(pool, [&, i]() {
        try {
          keys[i] = hash_file(file_list[i].path(), opt.chunk_size,
                              opt.hash_algo);
        } catch (const read_error &e) {
          // unreadable, exclude from comparison
          oss(std::cerr) << "[warn] could not read " << e.path() << ": "
                         << e.code().message() << '\n';
        } catch (const std::exception &) {
          std::lock_guard lk(mtx);
          if (!fatal) {
            fatal = std::current_exception();
          }
        }
      });
    }
    pool.join();
  }
  if (fatal) {
    std::rethrow_exception(fatal);
  }

  for (auto i = 0UL; i < file_list.size(); ++i) {
    if (keys[i]) {
      partial.entries.push_back({std::move(file_list[i]), std::move(*keys[i])});
    } else {
      ++partial.stats.skipped;
    }
  }
  partial.stats.indexed = partial.entries.size();
  if (opt.verbose) {
    oss(std::cerr) << "[log] hashed: " << partial.stats.indexed
                   << ", skipped: " << partial.stats.skipped << '\n'
                   << "[log] elapsed: " << timer.time().count() << "ms\n";
  }
  return partial;
}

identity_index_t build_index(const std::vector<std::filesystem::path> &roots,
                             const options_t &opt) {
  std::vector<partial_index_t> partials;
  partials.reserve(roots.size());
  for (auto i = 0UL; i < roots.size(); ++i) {
    partials.push_back(index_root(roots[i], i, opt));
  }
  return identity_index_t(opt.mode, roots, std::move(partials));
}

identity_index_t build_index(const std::vector<std::filesystem::path> &roots,
                             const options_t &opt,
                             std::vector<std::filesystem::path> &invalid_roots) {
  std::vector<std::filesystem::path> kept;
  std::vector<partial_index_t> partials;
  partials.reserve(roots.size());
  for (const auto &root : roots) {
    try {
      partials.push_back(index_root(root, kept.size(), opt));
      kept.push_back(root);
    } catch (const invalid_root_error &e) {
      // gone since it was resolved, compare the rest
      std::cerr << "[err] " << e.what() << std::endl;
      invalid_roots.push_back(root);
    }
  }
  return identity_index_t(opt.mode, std::move(kept), std::move(partials));
}

}  // namespace detail_v1

}  // namespace uniqdir
