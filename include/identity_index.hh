#pragma once

#include <cstddef>
#include <filesystem>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "file_entry.hh"
#include "options.hh"
#include "stats.hh"

namespace uniqdir {

inline namespace detail_v1 {

struct occurrence_t {
  std::size_t root_idx;
  std::filesystem::path path;
};

// every occurrence of one identity key
class bucket_t {
  std::vector<occurrence_t> _occurrences;
  std::set<std::size_t> _roots;

 public:
  inline void add(const std::size_t root_idx,
                  const std::filesystem::path &path) {
    _occurrences.push_back({root_idx, path});
    _roots.insert(root_idx);
  }

  inline const std::vector<occurrence_t> &occurrences() const noexcept {
    return _occurrences;
  }
  inline const std::set<std::size_t> &roots() const noexcept { return _roots; }
  // number of distinct compared directories holding the key
  inline std::size_t dir_count() const noexcept { return _roots.size(); }
};

struct keyed_entry_t {
  file_entry_t entry;
  std::string key;
};

/**
 * @brief keyed files of a single compared directory, built independently
 * of every other directory
 */
struct partial_index_t {
  std::size_t root_idx = 0;
  std::vector<keyed_entry_t> entries;
  index_stats_t stats;
};

/**
 * @brief identity key -> occurrences across all compared directories,
 * folded from per-directory partial indices and read-only afterwards
 */
class identity_index_t {
  cmp_t _mode;
  std::vector<std::filesystem::path> _roots;
  std::unordered_map<std::string, bucket_t> _buckets;
  // keyed entries per root, sorted by path
  std::vector<std::vector<keyed_entry_t>> _entries;
  index_stats_t _stats;

 public:
  /**
   * @param mode comparison mode the keys were computed with
   * @param roots compared directories, indexed by root_idx
   * @param partials one partial index per root, in any order
   * @throws std::invalid_argument if a partial refers to an unknown root
   */
  identity_index_t(const cmp_t mode, std::vector<std::filesystem::path> roots,
                   std::vector<partial_index_t> partials);

  identity_index_t(const identity_index_t &) = delete;
  identity_index_t(identity_index_t &&) = default;
  identity_index_t &operator=(const identity_index_t &) = delete;
  identity_index_t &operator=(identity_index_t &&) = default;

  /**
   * @return bucket of key, nullptr if no indexed file has it
   */
  const bucket_t *find(const std::string &key) const;
  // 0 if key is unknown
  std::size_t dir_count(const std::string &key) const;

  inline cmp_t mode() const noexcept { return _mode; }
  inline const std::vector<std::filesystem::path> &roots() const noexcept {
    return _roots;
  }
  inline const std::unordered_map<std::string, bucket_t> &buckets()
      const noexcept {
    return _buckets;
  }
  inline const std::vector<keyed_entry_t> &entries(
      const std::size_t root_idx) const {
    return _entries.at(root_idx);
  }
  inline const index_stats_t &stats() const noexcept { return _stats; }
};

/**
 * @brief scan one compared directory and compute the identity key of each
 * file, content hashing runs on a thread pool,
 * files that fail to hash are reported and left out
 *
 * @param root canonical directory path
 * @param root_idx index of root
 * @param opt comparison options
 * @throws invalid_root_error if root is missing or not a directory
 */
partial_index_t index_root(const std::filesystem::path &root,
                           const std::size_t root_idx, const options_t &opt);

/**
 * @brief index every compared directory and fold the results
 *
 * @param roots canonical directory paths
 * @param opt comparison options
 * @throws invalid_root_error if a root is missing or not a directory
 */
identity_index_t build_index(const std::vector<std::filesystem::path> &roots,
                             const options_t &opt);

/**
 * @brief index every compared directory that can still be scanned,
 * a root failing with invalid_root_error is reported and dropped,
 * the remaining roots are renumbered in order
 *
 * @param roots canonical directory paths
 * @param opt comparison options
 * @param[out] invalid_roots roots that were dropped
 */
identity_index_t build_index(const std::vector<std::filesystem::path> &roots,
                             const options_t &opt,
                             std::vector<std::filesystem::path> &invalid_roots);

}  // namespace detail_v1

}  // namespace uniqdir
