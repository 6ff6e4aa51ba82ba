/***
 * Name: test_ordering
 * Purpose: Verify the containment partial order on set-like collections.
 */
#include <gtest/gtest.h>
#include <set>
#include <unordered_set>
#include <vector>
#include "setalg/algebra/Ordering.h"

using namespace setalg;

TEST(Ordering, EqualityIgnoresSetTemplate) {
  EXPECT_TRUE(set_equal(std::set<int>{1, 2}, std::unordered_set<int>{2, 1}));
  EXPECT_FALSE(set_equal(std::set<int>{1, 2}, std::set<int>{1}));
}

TEST(Ordering, StrictAndNonStrict) {
  const std::set<int> one{1};
  const std::set<int> two{1, 2};
  EXPECT_TRUE(set_less(one, two));
  EXPECT_FALSE(set_less(two, two));
  EXPECT_TRUE(set_less_equal(two, two));
  EXPECT_FALSE(set_less_equal(two, one));
}

TEST(Ordering, IncomparableSets) {
  const std::set<int> a{1};
  const std::set<int> b{2};
  EXPECT_FALSE(set_less(a, b));
  EXPECT_FALSE(set_less(b, a));
  EXPECT_FALSE(set_equal(a, b));
}

TEST(Ordering, FunctionObjectsOnAChain) {
  const std::vector<std::set<int>> chain{{}, {1}, {1, 2}, {1, 2, 3}};
  const ProperSubsetOrder less;
  const SubsetOrder lessEqual;
  for (std::size_t i = 1; i < chain.size(); ++i) {
    EXPECT_TRUE(less(chain[i - 1], chain[i]));
    EXPECT_TRUE(lessEqual(chain[i - 1], chain[i]));
    EXPECT_FALSE(less(chain[i], chain[i - 1]));
  }
}
