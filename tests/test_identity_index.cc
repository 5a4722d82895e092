#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "errors.hh"
#include "hasher.hh"
#include "identity_index.hh"
#include "tmp_tree.hh"

namespace fs = std::filesystem;
using namespace uniqdir;

class IdentityIndexTest : public ::testing::Test {
 protected:
  test::tmp_tree_t tree;
  fs::path dir_a, dir_b;

  void SetUp() override {
    dir_a = tree.mkdir("a");
    dir_b = tree.mkdir("b");
    tree.write("a/a.txt", "X");
    tree.write("a/b.txt", "Y");
    tree.write("a/sub/a.txt", "W");
    tree.write("b/a.txt", "X");
    tree.write("b/c.txt", "Z");
  }

  options_t opt(const cmp_t mode) const {
    options_t o;
    o.mode = mode;
    return o;
  }
};

TEST_F(IdentityIndexTest, ByNameKeysAreFilenames) {
  auto index = build_index({dir_a, dir_b}, opt(cmp_t::by_name));
  EXPECT_EQ(index.mode(), cmp_t::by_name);
  EXPECT_EQ(index.buckets().size(), 3U);

  const auto *bucket = index.find("a.txt");
  ASSERT_NE(bucket, nullptr);
  EXPECT_EQ(bucket->occurrences().size(), 3U);
  EXPECT_EQ(bucket->roots(), (std::set<std::size_t>{0, 1}));
  EXPECT_EQ(index.dir_count("a.txt"), 2U);
  EXPECT_EQ(index.dir_count("b.txt"), 1U);
  EXPECT_EQ(index.dir_count("c.txt"), 1U);
  EXPECT_EQ(index.dir_count("missing"), 0U);
  EXPECT_EQ(index.find("missing"), nullptr);

  EXPECT_EQ(index.stats().scanned, 5U);
  EXPECT_EQ(index.stats().indexed, 5U);
  EXPECT_EQ(index.stats().skipped, 0U);
  EXPECT_EQ(index.entries(0).size(), 3U);
  EXPECT_EQ(index.entries(1).size(), 2U);
}

TEST_F(IdentityIndexTest, NamesAreCaseSensitive) {
  tree.write("b/B.TXT", "Y");
  auto index = build_index({dir_a, dir_b}, opt(cmp_t::by_name));
  EXPECT_EQ(index.dir_count("b.txt"), 1U);
  EXPECT_EQ(index.dir_count("B.TXT"), 1U);
}

TEST_F(IdentityIndexTest, ByContentKeysAreHashes) {
  auto index = build_index({dir_a, dir_b}, opt(cmp_t::by_content));
  EXPECT_EQ(index.buckets().size(), 4U);

  const auto x = hash_file(dir_a / "a.txt");
  const auto *bucket = index.find(x);
  ASSERT_NE(bucket, nullptr);
  ASSERT_EQ(bucket->occurrences().size(), 2U);
  // folded in root order
  EXPECT_EQ(bucket->occurrences()[0].root_idx, 0U);
  EXPECT_EQ(bucket->occurrences()[0].path, dir_a / "a.txt");
  EXPECT_EQ(bucket->occurrences()[1].root_idx, 1U);
  EXPECT_EQ(bucket->occurrences()[1].path, dir_b / "a.txt");
  EXPECT_EQ(index.dir_count(hash_file(dir_a / "sub/a.txt")), 1U);
  EXPECT_EQ(index.find("a.txt"), nullptr);
}

TEST_F(IdentityIndexTest, FollowedSymlinksAreHashedThroughTheLink) {
  fs::create_symlink(tree.root() / "nowhere", dir_b / "dangling.txt");
  fs::create_symlink(dir_a / "b.txt", dir_b / "linked.txt");
  auto o = opt(cmp_t::by_content);
  o.follow_symlinks = true;
  auto index = build_index({dir_a, dir_b}, o);
  // the dangling link is not a file and is never listed
  EXPECT_EQ(index.stats().scanned, 6U);
  EXPECT_EQ(index.stats().indexed, 6U);
  EXPECT_EQ(index.dir_count(hash_file(dir_a / "b.txt")), 2U);
}

TEST_F(IdentityIndexTest, UnreadableFilesAreExcluded) {
  auto locked = tree.write("b/locked.txt", "Y");
  fs::permissions(locked, fs::perms::none);
  if (std::ifstream(locked).is_open()) {
    fs::permissions(locked, fs::perms::owner_all);
    GTEST_SKIP() << "permissions are not enforced for this user";
  }
  auto index = build_index({dir_a, dir_b}, opt(cmp_t::by_content));
  fs::permissions(locked, fs::perms::owner_all);

  EXPECT_EQ(index.stats().scanned, 6U);
  EXPECT_EQ(index.stats().indexed, 5U);
  EXPECT_EQ(index.stats().skipped, 1U);
  EXPECT_EQ(index.entries(1).size(), 2U);
  // same content as a/b.txt, but never counted as a duplicate
  EXPECT_EQ(index.dir_count(hash_file(dir_a / "b.txt")), 1U);
}

TEST_F(IdentityIndexTest, FailedReadsAreExcludedForAnyUser) {
  // a regular file whose first page is unmapped, reads fail with EIO
  const fs::path mem = "/proc/self/mem";
  if (!fs::is_regular_file(mem)) {
    GTEST_SKIP() << "no " << mem;
  }
  fs::create_symlink(mem, dir_b / "mem.bin");
  auto index = build_index({dir_a, dir_b}, opt(cmp_t::by_content));

  EXPECT_EQ(index.stats().scanned, 6U);
  EXPECT_EQ(index.stats().indexed, 5U);
  EXPECT_EQ(index.stats().skipped, 1U);
  for (const auto &keyed : index.entries(1)) {
    EXPECT_NE(keyed.entry.name(), "mem.bin");
  }
}

TEST_F(IdentityIndexTest, ParallelHashingMatchesSerial) {
  for (int i = 0; i < 40; ++i) {
    tree.write("a/many/f" + std::to_string(i), std::to_string(i % 7));
  }
  auto serial = opt(cmp_t::by_content);
  serial.max_thread = 1;
  auto parallel = opt(cmp_t::by_content);
  parallel.max_thread = 8;
  auto lhs = build_index({dir_a, dir_b}, serial);
  auto rhs = build_index({dir_a, dir_b}, parallel);
  ASSERT_EQ(lhs.entries(0).size(), rhs.entries(0).size());
  for (auto i = 0UL; i < lhs.entries(0).size(); ++i) {
    EXPECT_EQ(lhs.entries(0)[i].entry.path(), rhs.entries(0)[i].entry.path());
    EXPECT_EQ(lhs.entries(0)[i].key, rhs.entries(0)[i].key);
  }
  EXPECT_EQ(lhs.buckets().size(), rhs.buckets().size());
}

TEST_F(IdentityIndexTest, FoldOfPartials) {
  auto o = opt(cmp_t::by_name);
  std::vector<partial_index_t> partials;
  // order of partials does not matter
  partials.push_back(index_root(dir_b, 1, o));
  partials.push_back(index_root(dir_a, 0, o));
  identity_index_t index(cmp_t::by_name, {dir_a, dir_b}, std::move(partials));
  const auto *bucket = index.find("a.txt");
  ASSERT_NE(bucket, nullptr);
  EXPECT_EQ(bucket->occurrences().front().root_idx, 0U);
  EXPECT_EQ(index.stats().scanned, 5U);
}

TEST_F(IdentityIndexTest, FoldRejectsBadPartials) {
  auto o = opt(cmp_t::by_name);
  std::vector<partial_index_t> unknown;
  unknown.push_back(index_root(dir_a, 2, o));
  EXPECT_THROW(identity_index_t(cmp_t::by_name, {dir_a, dir_b},
                                std::move(unknown)),
               std::invalid_argument);

  std::vector<partial_index_t> twice;
  twice.push_back(index_root(dir_a, 0, o));
  twice.push_back(index_root(dir_a, 0, o));
  EXPECT_THROW(identity_index_t(cmp_t::by_name, {dir_a, dir_b},
                                std::move(twice)),
               std::invalid_argument);
}

TEST_F(IdentityIndexTest, InvalidRootPropagates) {
  EXPECT_THROW(build_index({dir_a, tree.root() / "missing"},
                           opt(cmp_t::by_name)),
               invalid_root_error);
}

TEST_F(IdentityIndexTest, VanishedRootIsDroppedAndRenumbered) {
  const auto missing = tree.root() / "missing";
  std::vector<fs::path> invalid;
  auto index = build_index({dir_a, missing, dir_b}, opt(cmp_t::by_name),
                           invalid);
  EXPECT_EQ(invalid, std::vector<fs::path>{missing});
  EXPECT_EQ(index.roots(), (std::vector<fs::path>{dir_a, dir_b}));
  EXPECT_EQ(index.entries(1).size(), 2U);
  const auto *bucket = index.find("c.txt");
  ASSERT_NE(bucket, nullptr);
  EXPECT_EQ(bucket->roots(), std::set<std::size_t>{1});
}

TEST_F(IdentityIndexTest, AllRootsVanished) {
  std::vector<fs::path> invalid;
  auto index = build_index({tree.root() / "x", tree.root() / "y"},
                           opt(cmp_t::by_content), invalid);
  EXPECT_TRUE(index.roots().empty());
  EXPECT_EQ(invalid.size(), 2U);
  EXPECT_TRUE(index.buckets().empty());
}
