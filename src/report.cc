#include "report.hh"

#include <algorithm>
#include <iomanip>
#include <utility>

namespace uniqdir {

inline namespace detail_v1 {

namespace {

const char *mode_suffix(const cmp_t mode) noexcept {
  return mode == cmp_t::by_content ? " by content" : "";
}

std::string fit(const std::string &str, const std::size_t width) {
  if (str.size() <= width) {
    return str;
  }
  if (width < 4) {
    return str.substr(0, width);
  }
  return str.substr(0, width - 3) + "...";
}

}  // namespace

report_t::report_t(const cmp_t mode, std::vector<unique_set_t> sets,
                   const index_stats_t &stats)
    : _mode(mode), _sets(std::move(sets)), _stats(stats) {
  for (auto &set : _sets) {
    std::sort(set.entries.begin(), set.entries.end());
  }
}

const unique_set_t *report_t::find(const std::filesystem::path &dir) const {
  auto it = std::find_if(_sets.begin(), _sets.end(),
                         [&](const auto &set) { return set.dir == dir; });
  return it == _sets.end() ? nullptr : &(*it);
}

std::size_t report_t::total() const noexcept {
  std::size_t count = 0;
  for (const auto &set : _sets) {
    count += set.entries.size();
  }
  return count;
}

preview_t preview(const unique_set_t &set, const std::size_t cap) {
  const auto shown = std::min(cap, set.entries.size());
  return {std::span<const std::string>(set.entries.data(), shown),
          set.entries.size() - shown};
}

void print_list(std::ostream &os, const report_t &report,
                const std::size_t cap) {
  const auto *suffix = mode_suffix(report.mode());
  os << "Files unique to each directory ("
     << (report.mode() == cmp_t::by_content ? "by content" : "by filename")
     << "):\n\n";
  for (const auto &set : report.sets()) {
    if (set.entries.empty()) {
      os << set.dir.string() << "/  (no unique files" << suffix << ")\n\n";
      continue;
    }
    os << set.dir.string() << "/  (" << set.entries.size() << " unique files"
       << suffix << ")\n";
    const auto [shown, remaining] = preview(set, cap);
    for (const auto &entry : shown) {
      os << "   - " << entry << '\n';
    }
    if (remaining > 0) {
      os << "   ... and " << remaining << " more\n";
    }
    os << '\n';
  }
  if (report.stats().skipped > 0) {
    os << "(" << report.stats().skipped
       << " unreadable files excluded from comparison)\n";
  }
}

void print_columns(std::ostream &os, const report_t &report,
                   const std::size_t cap, const std::size_t width) {
  const auto &sets = report.sets();
  const auto flags = os.flags();
  std::vector<preview_t> previews;
  std::vector<std::string> totals;
  std::vector<std::string> remains;
  std::vector<std::size_t> widths;
  std::size_t rows = 0;
  bool truncated = false;
  for (const auto &set : sets) {
    const auto &pv = previews.emplace_back(preview(set, cap));
    rows = std::max(rows, pv.shown.size());
    truncated = truncated || pv.remaining > 0;
    totals.push_back("(" + std::to_string(set.entries.size()) + " unique" +
                     mode_suffix(report.mode()) + ")");
    remains.push_back(pv.remaining > 0 ? "... and " +
                                             std::to_string(pv.remaining) +
                                             " more"
                                       : std::string());
    // count cells are never cut, the column grows to hold them
    widths.push_back(
        std::max({width, totals.back().size(), remains.back().size()}));
  }

  // cut marks cells that may be shortened to the column width
  auto print_row = [&](auto &&cell, const bool cut) {
    for (auto i = 0UL; i < sets.size(); ++i) {
      if (i != 0) {
        os << " | ";
      }
      os << std::left << std::setw((int)widths[i])
         << (cut ? fit(cell(i), widths[i]) : cell(i));
    }
    os << '\n';
  };

  print_row(
      [&](std::size_t i) {
        auto name = sets[i].dir.filename().string();
        return name.empty() ? sets[i].dir.string() : name;
      },
      true);
  print_row([&](std::size_t i) { return totals[i]; }, false);
  print_row([&](std::size_t i) { return std::string(widths[i], '-'); }, false);
  for (auto row = 0UL; row < rows; ++row) {
    print_row(
        [&](std::size_t i) {
          const auto &shown = previews[i].shown;
          return row < shown.size() ? shown[row] : std::string();
        },
        true);
  }
  if (truncated) {
    print_row([&](std::size_t i) { return remains[i]; }, false);
  }
  os.flags(flags);
  if (report.stats().skipped > 0) {
    os << "(" << report.stats().skipped
       << " unreadable files excluded from comparison)\n";
  }
}

}  // namespace detail_v1

}  // namespace uniqdir
