#pragma once

#include <filesystem>
#include <vector>

#include "options.hh"
#include "report.hh"

namespace uniqdir {

inline namespace detail_v1 {

struct compare_result_t {
  report_t report;
  // arguments that are missing or not directories
  std::vector<std::filesystem::path> invalid_roots;
};

/**
 * @brief resolve directories to canonical paths, invalid ones are reported
 * and collected, duplicates are dropped keeping the first occurrence
 *
 * @param dirs directories as given
 * @param[out] invalid_roots arguments that could not be used
 * @return canonical paths in argument order
 */
std::vector<std::filesystem::path> resolve_roots(
    const std::vector<std::filesystem::path> &dirs,
    std::vector<std::filesystem::path> &invalid_roots);

/**
 * @brief list files unique to each directory
 *
 * @param dirs directories to compare
 * @param opt comparison options
 * @throws too_few_roots_error if fewer than 2 usable directories remain
 * @throws std::invalid_argument on an unsupported hash algorithm or
 * zero chunk size / thread count
 */
compare_result_t compare(const std::vector<std::filesystem::path> &dirs,
                         const options_t &opt = {});

}  // namespace detail_v1

}  // namespace uniqdir
