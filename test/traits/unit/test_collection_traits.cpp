/***
 * Name: test_collection_traits
 * Purpose: Verify compile-time classification of collection kinds.
 */
#include <gtest/gtest.h>
#include <deque>
#include <forward_list>
#include <list>
#include <map>
#include <type_traits>
#include <set>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include "setalg/range/StepRange.h"
#include "setalg/traits/Collection.h"
#include "setalg/traits/Promote.h"

using namespace setalg;

namespace {
// Sorted vector wrapper that declares fast membership through the trait.
struct SortedInts {
  std::vector<int> data;
  auto begin() const { return data.begin(); }
  auto end() const { return data.end(); }
  std::size_t size() const { return data.size(); }
};
} // namespace

namespace setalg {
template <>
struct HasFastIn<SortedInts> : std::true_type {};
} // namespace setalg

TEST(CollectionTraits, SetLikeKinds) {
  EXPECT_TRUE(SetLike<std::set<int>>);
  EXPECT_TRUE(SetLike<std::unordered_set<int>>);
  EXPECT_TRUE(SetLike<const std::set<int>&>);
  EXPECT_FALSE(SetLike<std::multiset<int>>);
  EXPECT_FALSE(SetLike<std::vector<int>>);
  EXPECT_FALSE((SetLike<std::map<int, int>>));
}

TEST(CollectionTraits, MappingLikeKinds) {
  EXPECT_TRUE((MappingLike<std::map<int, int>>));
  EXPECT_TRUE((MappingLike<std::unordered_map<int, double>>));
  EXPECT_FALSE((MappingLike<std::multimap<int, int>>));
  EXPECT_FALSE(MappingLike<std::set<int>>);
}

TEST(CollectionTraits, Sequences) {
  EXPECT_TRUE(MutableSequence<std::vector<int>>);
  EXPECT_TRUE(MutableSequence<std::deque<int>>);
  EXPECT_TRUE(MutableSequence<std::list<int>>);
  EXPECT_TRUE(Sequence<StepRange<int>>);
  EXPECT_FALSE(MutableSequence<StepRange<int>>);
  EXPECT_TRUE(Collection<std::forward_list<int>>);
  EXPECT_FALSE(HasLength<std::forward_list<int>>);
  EXPECT_TRUE(HasLength<std::list<int>>);
}

TEST(CollectionTraits, FastMembership) {
  EXPECT_TRUE(hasFastIn<std::set<int>>());
  EXPECT_TRUE((hasFastIn<std::map<int, int>>()));
  EXPECT_TRUE(hasFastIn<StepRange<long>>());
  EXPECT_FALSE(hasFastIn<std::vector<int>>());
  EXPECT_FALSE(hasFastIn<std::list<int>>());
  const SortedInts sorted{{1, 2, 3}};
  EXPECT_TRUE(hasFastIn(sorted));
}

TEST(CollectionTraits, EmptyMutableKeepsKindAndRebindsElement) {
  const auto fromSet = emptyMutable<double>(std::set<int>{1, 2});
  static_assert(std::is_same_v<decltype(fromSet), const std::set<double>>);
  EXPECT_TRUE(fromSet.empty());

  const auto fromList = emptyMutable<long>(std::list<int>{1});
  static_assert(std::is_same_v<decltype(fromList), const std::vector<long>>);
  EXPECT_TRUE(fromList.empty());

  const auto fromRange = emptyMutable<int>(StepRange<int>(0, 2, 10));
  static_assert(std::is_same_v<decltype(fromRange), const std::vector<int>>);
}
