#include "arbor/file_mode.hpp"
#include "arbor/tree_iterator.hpp"
#include "tree_fixtures.hpp"
#include <gtest/gtest.h>
#include <string>

using namespace arbor;
using namespace arbor::testing;

namespace {

int cmp(const std::string &a, uint32_t a_mode, const std::string &b,
        uint32_t b_mode) {
  return compare_paths(reinterpret_cast<const uint8_t *>(a.data()), a.size(),
                       a_mode, reinterpret_cast<const uint8_t *>(b.data()),
                       b.size(), b_mode);
}

constexpr uint32_t TREE_MODE = file_mode::TREE;
constexpr uint32_t FILE_MODE = file_mode::REGULAR_FILE;

} // namespace

// ============================================================================
// compare_paths
// ============================================================================

TEST(ComparePaths, DotSlashZeroOrder) {
  // "A" is a tree holding "c"; "A.c" and "A0c" are files at the same level.
  EXPECT_EQ(cmp("A.c", FILE_MODE, "A", TREE_MODE), -1);
  EXPECT_EQ(cmp("A", TREE_MODE, "A0c", FILE_MODE), -1);
  EXPECT_EQ(cmp("A.c", FILE_MODE, "A0c", FILE_MODE), -1);

  // Full paths once descended into A.
  EXPECT_EQ(cmp("A.c", FILE_MODE, "A/c", FILE_MODE), -1);
  EXPECT_EQ(cmp("A/c", FILE_MODE, "A0c", FILE_MODE), -1);
}

TEST(ComparePaths, IsAntisymmetric) {
  EXPECT_EQ(cmp("A", TREE_MODE, "A.c", FILE_MODE), 1);
  EXPECT_EQ(cmp("A0c", FILE_MODE, "A", TREE_MODE), 1);
}

TEST(ComparePaths, EqualPathsEqualModes) {
  EXPECT_EQ(cmp("same", FILE_MODE, "same", FILE_MODE), 0);
  EXPECT_EQ(cmp("same", TREE_MODE, "same", TREE_MODE), 0);
  EXPECT_EQ(cmp("", FILE_MODE, "", FILE_MODE), 0);
}

TEST(ComparePaths, FileSortsBeforeTreeOfSameName) {
  // Both run out: '\0' against '/'.
  EXPECT_EQ(cmp("a", FILE_MODE, "a", TREE_MODE), -1);
  EXPECT_EQ(cmp("a", TREE_MODE, "a", FILE_MODE), 1);
  // Symlinks and gitlinks are not trees either.
  EXPECT_EQ(cmp("a", file_mode::SYMLINK, "a", TREE_MODE), -1);
  EXPECT_EQ(cmp("a", file_mode::GITLINK, "a", TREE_MODE), -1);
}

TEST(ComparePaths, TreeMatchesItsOwnChildPrefix) {
  // A tree "sub" compared to a flattened "sub/x": the tree's implied '/'
  // equals the real one, so the walker sees a descend case, not a mismatch.
  EXPECT_EQ(cmp("sub", TREE_MODE, "sub/x", FILE_MODE), 0);
  EXPECT_EQ(cmp("sub/x", FILE_MODE, "sub", TREE_MODE), 0);
  // A file "sub" does not.
  EXPECT_EQ(cmp("sub", FILE_MODE, "sub/x", FILE_MODE), -1);
}

TEST(ComparePaths, ResultIsNormalizedSign) {
  EXPECT_EQ(cmp("a", FILE_MODE, "z", FILE_MODE), -1);
  EXPECT_EQ(cmp("z", FILE_MODE, "a", FILE_MODE), 1);
  // Bytes are compared unsigned.
  EXPECT_EQ(cmp("\xff", FILE_MODE, "a", FILE_MODE), 1);
}

TEST(ComparePaths, StartOffsetSkipsKnownPrefix) {
  // Differences before start are ignored by contract.
  const std::string a = "xx/b";
  const std::string b = "yy/a";
  EXPECT_EQ(compare_paths(reinterpret_cast<const uint8_t *>(a.data()),
                          a.size(), FILE_MODE,
                          reinterpret_cast<const uint8_t *>(b.data()),
                          b.size(), FILE_MODE, 3),
            1);
}

// ============================================================================
// TreeIterator::path_compare
// ============================================================================

TEST(PathCompare, IteratorsAcrossTrees) {
  FlatTreeIterator t1({{"A.c", FILE_MODE, id_of_byte(1)},
                       {"A", TREE_MODE, id_of_byte(2)},
                       {"A0c", FILE_MODE, id_of_byte(3)}});
  FlatTreeIterator t2({{"A", TREE_MODE, id_of_byte(9)}});

  EXPECT_EQ(t1.path_compare(t2), -1); // A.c < A/
  t1.next(1);
  EXPECT_EQ(t1.path_compare(t2), 0);  // A/ == A/
  t1.next(1);
  EXPECT_EQ(t1.path_compare(t2), 1);  // A0c > A/
}

TEST(PathCompare, ExplicitOtherModeOverridesIteratorMode) {
  FlatTreeIterator a({{"x", FILE_MODE, id_of_byte(1)}});
  FlatTreeIterator b({{"x", FILE_MODE, id_of_byte(1)}});
  EXPECT_EQ(a.path_compare(b), 0);
  EXPECT_EQ(a.path_compare(b, TREE_MODE), -1);
}

TEST(PathCompare, MatchedParentsGiveSameAnswer) {
  auto trees = std::make_shared<FlatTrees>();
  (*trees)[id_of_byte(0x10)] = {{"a", FILE_MODE, id_of_byte(1)},
                                {"b", FILE_MODE, id_of_byte(2)}};
  (*trees)[id_of_byte(0x20)] = {{"b", FILE_MODE, id_of_byte(2)},
                                {"c", FILE_MODE, id_of_byte(3)}};

  FlatTreeIterator root1({{"dir", TREE_MODE, id_of_byte(0x10)}}, {}, trees);
  FlatTreeIterator root2({{"dir", TREE_MODE, id_of_byte(0x20)}}, {}, trees);

  MemoryObjectDatabase db;
  WindowCursor curs;
  auto c1 = root1.create_subtree_iterator(db, curs);
  auto c2 = root2.create_subtree_iterator(db, curs);

  const int unmatched = c1->path_compare(*c2);

  // A walker that found both roots equal points them at the same iterator.
  root1.set_matches(&root1);
  root2.set_matches(&root1);
  EXPECT_EQ(c1->path_compare(*c2), unmatched);
  EXPECT_EQ(unmatched, -1); // dir/a < dir/b

  c1->next(1);
  EXPECT_EQ(c1->path_compare(*c2), 0); // dir/b == dir/b
  c2->next(1);
  EXPECT_EQ(c1->path_compare(*c2), -1); // dir/b < dir/c
}

TEST(PathCompare, NullMatchesDoesNotSkipPrefix) {
  auto trees = std::make_shared<FlatTrees>();
  (*trees)[id_of_byte(0x10)] = {{"same", FILE_MODE, id_of_byte(1)}};

  FlatTreeIterator root1({{"aaa", TREE_MODE, id_of_byte(0x10)}}, {}, trees);
  FlatTreeIterator root2({{"bbb", TREE_MODE, id_of_byte(0x10)}}, {}, trees);

  MemoryObjectDatabase db;
  WindowCursor curs;
  auto c1 = root1.create_subtree_iterator(db, curs);
  auto c2 = root2.create_subtree_iterator(db, curs);

  // Neither parent was matched; the differing parent names must count.
  EXPECT_EQ(c1->path_compare(*c2), -1);
  EXPECT_EQ(c2->path_compare(*c1), 1);
}
