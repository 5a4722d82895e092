#include "resolver.hh"

#include <set>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace uniqdir {

inline namespace detail_v1 {

namespace {

std::vector<unique_set_t> empty_sets(const identity_index_t &index) {
  std::vector<unique_set_t> sets;
  sets.reserve(index.roots().size());
  for (const auto &root : index.roots()) {
    sets.push_back({root, {}});
  }
  return sets;
}

}  // namespace

report_t resolve_by_name(const identity_index_t &index) {
  // a name found twice inside one directory is still listed once
  std::vector<std::set<std::string>> names(index.roots().size());
  for (const auto &[key, bucket] : index.buckets()) {
    if (bucket.dir_count() == 1) {
      names[*bucket.roots().begin()].insert(key);
    }
  }

  auto sets = empty_sets(index);
  for (auto i = 0UL; i < sets.size(); ++i) {
    sets[i].entries.assign(names[i].begin(), names[i].end());
  }
  return report_t(cmp_t::by_name, std::move(sets), index.stats());
}

report_t resolve_by_content(const identity_index_t &index) {
  // paths whose content is seen in more than one directory
  std::unordered_set<std::string> seen_in_multiple;
  for (const auto &[key, bucket] : index.buckets()) {
    if (bucket.dir_count() > 1) {
      for (const auto &occurrence : bucket.occurrences()) {
        seen_in_multiple.insert(occurrence.path.native());
      }
    }
  }

  auto sets = empty_sets(index);
  for (auto i = 0UL; i < sets.size(); ++i) {
    for (const auto &[entry, key] : index.entries(i)) {
      if (seen_in_multiple.contains(entry.path().native())) {
        continue;
      }
      // double-check the content is not duplicated under another name
      if (index.dir_count(key) == 1) {
        sets[i].entries.push_back(entry.rel_path().generic_string());
      }
    }
  }
  return report_t(cmp_t::by_content, std::move(sets), index.stats());
}

report_t resolve(const identity_index_t &index) {
  return index.mode() == cmp_t::by_content ? resolve_by_content(index)
                                           : resolve_by_name(index);
}

}  // namespace detail_v1

}  // namespace uniqdir
