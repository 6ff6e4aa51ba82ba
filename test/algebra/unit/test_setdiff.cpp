/***
 * Name: test_setdiff
 * Purpose: Verify setdiff/setdiff_inplace ordering, multiple arguments and aliasing.
 */
#include <gtest/gtest.h>
#include <functional>
#include <set>
#include <unordered_set>
#include <vector>
#include "setalg/algebra/SetDiff.h"
#include "setalg/algebra/Union.h"
#include "setalg/range/StepRange.h"

using namespace setalg;

TEST(SetDiff, SequenceKeepsOrder) {
  const std::vector<int> a{1, 3, 4, 5};
  const std::vector<int> b{1, 2, 4, 6};
  EXPECT_EQ(setdiff(a, b), (std::vector<int>{3, 5}));
}

TEST(SetDiff, SequenceDropsDuplicates) {
  const std::vector<int> a{5, 1, 5, 2};
  EXPECT_EQ(setdiff(a, std::vector<int>{2}), (std::vector<int>{5, 1}));
  EXPECT_EQ(setdiff(a), unite(a));
}

TEST(SetDiff, SetWithSeveralArguments) {
  const std::set<int> s{1, 2, 3, 4, 5};
  EXPECT_EQ(setdiff(s, std::vector<int>{2}, StepRange<int>(3, 1, 10)), (std::set<int>{1}));
  EXPECT_EQ(s.size(), 5u);
}

TEST(SetDiff, InexactProbesRemoveNothing) {
  const std::set<int> s{1, 2};
  EXPECT_EQ(setdiff(s, std::vector<double>{1.5, 2.0}), (std::set<int>{1}));
}

TEST(SetDiff, SelfIsEmpty) {
  const std::set<int> s{1, 2};
  EXPECT_TRUE(setdiff(s, s).empty());
  std::unordered_set<int> u{1, 2};
  setdiff_inplace(u, u);
  EXPECT_TRUE(u.empty());
  std::vector<int> v{1, 2, 2};
  setdiff_inplace(v, v);
  EXPECT_TRUE(v.empty());
}

TEST(SetDiff, InplaceOnSequence) {
  std::vector<int> v{5, 1, 5, 2, 3};
  setdiff_inplace(v, std::set<int>{2});
  EXPECT_EQ(v, (std::vector<int>{5, 1, 3}));
}

TEST(SetDiff, NoArgumentsIsCopy) {
  std::set<int> s{4};
  setdiff_inplace(s);
  EXPECT_EQ(s, (std::set<int>{4}));
  EXPECT_EQ(setdiff(s), s);
}

TEST(SetDiff, ResultKeepsTheSourceComparator) {
  const std::set<int, std::greater<>> s{1, 2, 3};
  const auto out = setdiff(s, std::vector<int>{2});
  EXPECT_EQ(out, (std::set<int, std::greater<>>{3, 1}));
  EXPECT_EQ(*out.begin(), 3);
}
