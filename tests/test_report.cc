#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include "report.hh"

using namespace uniqdir;

namespace {

std::vector<std::string> numbered(const int count) {
  std::vector<std::string> entries;
  for (int i = 0; i < count; ++i) {
    // zero padded so sorting keeps numeric order
    auto num = std::to_string(i);
    entries.push_back("file" + std::string(3 - num.size(), '0') + num);
  }
  return entries;
}

}  // namespace

TEST(Report, EntriesAreSorted) {
  report_t report(cmp_t::by_name,
                  {{"/x", {"b", "c", "a"}}, {"/y", {}}}, index_stats_t{});
  EXPECT_EQ(report.sets()[0].entries, (std::vector<std::string>{"a", "b", "c"}));
  EXPECT_EQ(report.total(), 3U);
  ASSERT_NE(report.find("/y"), nullptr);
  EXPECT_EQ(report.find("/z"), nullptr);
}

TEST(Report, PreviewKeepsTrueTotal) {
  unique_set_t set{"/x", numbered(120)};
  auto pv = preview(set);
  EXPECT_EQ(pv.shown.size(), 50U);
  EXPECT_EQ(pv.remaining, 70U);
  EXPECT_EQ(pv.shown.front(), "file000");
  EXPECT_EQ(pv.shown.back(), "file049");
  EXPECT_EQ(set.entries.size(), 120U);

  auto small = preview(set, 200);
  EXPECT_EQ(small.shown.size(), 120U);
  EXPECT_EQ(small.remaining, 0U);
}

TEST(Report, PrintListByName) {
  report_t report(cmp_t::by_name, {{"/x", {"b.txt"}}, {"/y", {}}},
                  index_stats_t{});
  std::ostringstream os;
  print_list(os, report);
  EXPECT_EQ(os.str(),
            "Files unique to each directory (by filename):\n\n"
            "/x/  (1 unique files)\n"
            "   - b.txt\n"
            "\n"
            "/y/  (no unique files)\n"
            "\n");
}

TEST(Report, PrintListTruncates) {
  index_stats_t stats;
  stats.skipped = 2;
  report_t report(cmp_t::by_content, {{"/x", numbered(53)}}, stats);
  std::ostringstream os;
  print_list(os, report);
  const auto out = os.str();
  EXPECT_NE(out.find("(by content)"), std::string::npos);
  EXPECT_NE(out.find("/x/  (53 unique files by content)\n"), std::string::npos);
  EXPECT_NE(out.find("   - file049\n"), std::string::npos);
  EXPECT_EQ(out.find("file050"), std::string::npos);
  EXPECT_NE(out.find("   ... and 3 more\n"), std::string::npos);
  EXPECT_NE(out.find("(2 unreadable files excluded from comparison)"),
            std::string::npos);
}

TEST(Report, PrintColumns) {
  report_t report(cmp_t::by_name,
                  {{"/p/left", {"a", "a-very-long-file-name.txt"}},
                   {"/p/right", {"z"}}},
                  index_stats_t{});
  std::ostringstream os;
  print_columns(os, report, 50, 10);
  std::istringstream is(os.str());
  std::vector<std::string> lines;
  for (std::string line; std::getline(is, line);) {
    lines.push_back(line);
  }
  ASSERT_EQ(lines.size(), 5U);
  EXPECT_EQ(lines[0], "left       | right     ");
  EXPECT_EQ(lines[1], "(2 unique) | (1 unique)");
  EXPECT_EQ(lines[2], "---------- | ----------");
  EXPECT_EQ(lines[3], "a          | z         ");
  EXPECT_EQ(lines[4], "a-very-... |           ");
}

TEST(Report, PrintColumnsTruncates) {
  report_t report(cmp_t::by_name, {{"/l", numbered(4)}, {"/r", {}}},
                  index_stats_t{});
  std::ostringstream os;
  print_columns(os, report, 2, 12);
  EXPECT_NE(os.str().find("... and 2 more"), std::string::npos);
  EXPECT_EQ(os.str().find("file002"), std::string::npos);
}

TEST(Report, PrintColumnsKeepsCountsInNarrowColumns) {
  report_t report(cmp_t::by_content, {{"/l", numbered(120)},
                   {"/r", {"a-name-longer-than-the-column.txt"}}},
                  index_stats_t{});
  std::ostringstream os;
  print_columns(os, report, 50, 4);
  const auto out = os.str();
  EXPECT_NE(out.find("(120 unique by content)"), std::string::npos);
  EXPECT_NE(out.find("(1 unique by content)"), std::string::npos);
  EXPECT_NE(out.find("... and 70 more"), std::string::npos);
  // entries are still cut to the column width
  EXPECT_NE(out.find("file000"), std::string::npos);
  EXPECT_NE(out.find("a-name-longer-than..."), std::string::npos);
  EXPECT_EQ(out.find("a-name-longer-than-the-column.txt"), std::string::npos);
}
