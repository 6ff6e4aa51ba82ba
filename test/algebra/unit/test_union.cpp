/***
 * Name: test_union
 * Purpose: Verify unite/unite_inplace output kinds, ordering, bounds and aliasing.
 */
#include <gtest/gtest.h>
#include <cstdint>
#include <list>
#include <ranges>
#include <set>
#include <type_traits>
#include <unordered_set>
#include <vector>
#include "setalg/algebra/Union.h"
#include "setalg/exceptions/conversion_error.h"
#include "setalg/range/StepRange.h"

using namespace setalg;

TEST(Union, SequenceKeepsFirstOccurrenceOrder) {
  const std::vector<int> a{3, 1, 2};
  const std::vector<int> b{1, 4};
  EXPECT_EQ(unite(a, b), (std::vector<int>{3, 1, 2, 4}));
}

TEST(Union, SetFirstArgumentGivesSet) {
  const std::set<int> a{1, 2};
  const std::vector<int> b{2, 3};
  const auto u = unite(a, b);
  EXPECT_TRUE((std::is_same_v<std::remove_const_t<decltype(u)>, std::set<int>>));
  EXPECT_EQ(u, (std::set<int>{1, 2, 3}));
}

TEST(Union, PromotesElementType) {
  const std::vector<int> a{1, 2};
  const std::vector<double> b{2.5};
  const auto u = unite(a, b);
  EXPECT_TRUE((std::is_same_v<std::remove_const_t<decltype(u)>, std::vector<double>>));
  EXPECT_EQ(u, (std::vector<double>{1.0, 2.0, 2.5}));
}

TEST(Union, MixedKindsAndManyArguments) {
  const std::vector<int> a{9};
  const std::list<int> b{1, 9, 2};
  const StepRange<int> c(2, 1, 4);
  EXPECT_EQ(unite(a, b, c), (std::vector<int>{9, 1, 2, 3, 4}));
}

TEST(Union, SingleArgument) {
  const std::set<int> s{1, 2};
  EXPECT_EQ(unite(s), s);
  const std::vector<int> v{2, 2, 1, 2};
  EXPECT_EQ(unite(v), (std::vector<int>{2, 1}));
  EXPECT_TRUE(unite(std::vector<int>{}).empty());
}

TEST(Union, InplaceSelfIsIdentity) {
  std::set<int> s{1, 2, 3};
  unite_inplace(s, s);
  EXPECT_EQ(s, (std::set<int>{1, 2, 3}));
  std::vector<int> v{1, 1, 2};
  unite_inplace(v, v);
  EXPECT_EQ(v, (std::vector<int>{1, 2}));
}

TEST(Union, InplaceCopyOfItselfIsIdentity) {
  const std::set<int> a{4, 5, 6};
  std::set<int> copy = a;
  EXPECT_EQ(unite_inplace(copy, a), a);
}

TEST(Union, BoolSetStopsGrowingAtTwo) {
  int visits = 0;
  auto values = std::views::iota(0, 1000) | std::views::transform([&visits](int i) {
    ++visits;
    return i % 2 == 0;
  });
  std::set<bool> dst;
  unite_inplace(dst, values);
  EXPECT_EQ(dst.size(), 2u);
  EXPECT_EQ(visits, 2);
}

TEST(Union, ByteSetStopsAtEveryValue) {
  std::unordered_set<std::uint8_t> dst;
  const StepRange<int> values(0, 1, 10000);
  unite_inplace(dst, values);
  EXPECT_EQ(dst.size(), 256u);
}

TEST(Union, Commutative) {
  const std::set<int> a{1, 2, 3};
  const std::set<int> b{3, 4};
  EXPECT_EQ(unite(a, b), unite(b, a));
}

TEST(Union, CopyIntoOverwrites) {
  std::set<int> dst{7, 8};
  const std::vector<int> src{1, 2, 2};
  copy_into(dst, src);
  EXPECT_EQ(dst, (std::set<int>{1, 2}));
  copy_into(dst, dst);
  EXPECT_EQ(dst, (std::set<int>{1, 2}));
}

TEST(Union, InplaceRejectsElementsTheDestinationCannotHold) {
  std::vector<int> v{1};
  EXPECT_THROW(unite_inplace(v, std::vector<double>{2.5}), exceptions::ConversionError);
  std::set<std::int8_t> small{1};
  EXPECT_THROW(unite_inplace(small, std::vector<int>{300}), exceptions::ConversionError);
  std::set<int> s{1};
  unite_inplace(s, std::vector<double>{2.0});
  EXPECT_EQ(s, (std::set<int>{1, 2}));
  std::vector<float> f;
  unite_inplace(f, std::vector<double>{0.1});
  ASSERT_EQ(f.size(), 1u);
  EXPECT_FLOAT_EQ(f[0], 0.1f);
}
