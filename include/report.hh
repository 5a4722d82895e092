#pragma once

#include <cstddef>
#include <filesystem>
#include <ostream>
#include <span>
#include <string>
#include <vector>

#include "config.hh"
#include "options.hh"
#include "stats.hh"

namespace uniqdir {

inline namespace detail_v1 {

// entries unique to one compared directory, ascending
struct unique_set_t {
  std::filesystem::path dir;
  std::vector<std::string> entries;
};

// leading part of a unique set, and how many entries were left out
struct preview_t {
  std::span<const std::string> shown;
  std::size_t remaining = 0;
};

class report_t {
  cmp_t _mode;
  std::vector<unique_set_t> _sets;
  index_stats_t _stats;

 public:
  /**
   * @param mode comparison mode of the run
   * @param sets one set per compared directory, in root order,
   * entries are sorted here
   * @param stats index statistics of the run
   */
  report_t(const cmp_t mode, std::vector<unique_set_t> sets,
           const index_stats_t &stats);

  inline cmp_t mode() const noexcept { return _mode; }
  inline const std::vector<unique_set_t> &sets() const noexcept {
    return _sets;
  }
  inline const index_stats_t &stats() const noexcept { return _stats; }

  /**
   * @return set of dir, nullptr if dir was not compared
   */
  const unique_set_t *find(const std::filesystem::path &dir) const;
  // total unique entries over all directories
  std::size_t total() const noexcept;
};

preview_t preview(const unique_set_t &set, const std::size_t cap = preview_cap);

/**
 * @brief per-directory list view, at most cap entries per directory
 * followed by the remaining count
 */
void print_list(std::ostream &os, const report_t &report,
                const std::size_t cap = preview_cap);

/**
 * @brief side-by-side view, one column per directory,
 * entries longer than width are cut, count cells widen their column
 */
void print_columns(std::ostream &os, const report_t &report,
                   const std::size_t cap = preview_cap,
                   const std::size_t width = column_width);

}  // namespace detail_v1

}  // namespace uniqdir
