#include "uniq_dir.hh"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "errors.hh"
#include "hasher.hh"
#include "identity_index.hh"
#include "oss.hh"
#include "resolver.hh"
#include "timer.hh"

namespace uniqdir {

inline namespace detail_v1 {

std::vector<std::filesystem::path> resolve_roots(
    const std::vector<std::filesystem::path> &dirs,
    std::vector<std::filesystem::path> &invalid_roots) {
  std::vector<std::filesystem::path> roots;
  for (const auto &dir : dirs) {
    std::error_code ec;
    auto root = std::filesystem::canonical(dir, ec);
    if (ec || !std::filesystem::is_directory(root, ec)) {
      std::cerr << "[err] '" << dir.string()
                << "' is not a directory or does not exist" << std::endl;
      invalid_roots.push_back(dir);
      continue;
    }
    if (std::find(roots.begin(), roots.end(), root) != roots.end()) {
      std::cerr << "[warn] skip duplicate directory: " << dir << " -> "
                << root << std::endl;
      continue;
    }
    roots.push_back(std::move(root));
  }
  return roots;
}

compare_result_t compare(const std::vector<std::filesystem::path> &dirs,
                         const options_t &opt) {
  if (opt.mode == cmp_t::by_content) {
    check_hash_algo(opt.hash_algo);
    if (opt.chunk_size == 0) {
      throw std::invalid_argument("chunk size must be > 0");
    }
  }
  if (opt.max_thread == 0) {
    throw std::invalid_argument("thread count must be > 0");
  }

  std::vector<std::filesystem::path> invalid_roots;
  auto roots = resolve_roots(dirs, invalid_roots);
  if (roots.size() < 2) {
    throw too_few_roots_error(
        "at least 2 directories are required to compare, got " +
        std::to_string(roots.size()));
  }

  timer_t timer;
  auto index = build_index(roots, opt, invalid_roots);
  if (index.roots().size() < 2) {
    throw too_few_roots_error(
        "at least 2 directories are required to compare, got " +
        std::to_string(index.roots().size()));
  }
  if (opt.verbose) {
    std::cerr << "[log] indexed files: " << index.stats().indexed << '\n'
              << "[log] distinct keys: " << index.buckets().size() << '\n'
              << "[log] elapsed: " << timer.time().count() << "ms"
              << std::endl;
  }
  auto report = resolve(index);
  if (opt.verbose) {
    std::cerr << "[log] unique files: " << report.total() << '\n'
              << "[log] elapsed: " << timer.time().count() << "ms"
              << std::endl;
  }
  return {std::move(report), std::move(invalid_roots)};
}

}  // namespace detail_v1

}  // namespace uniqdir
