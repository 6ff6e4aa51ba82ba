/***
 * Name: test_parse_int64
 * Purpose: Verify strict int64 parsing and the view helpers it is built on.
 */
#include <gtest/gtest.h>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include "setalg/support/parse.h"
#include "setalg/support/parse_util.h"

using setalg::support::ParseInt64Strict;

TEST(ParseInt64, PlainAndSigned) {
  int64_t v = 0;
  ASSERT_TRUE(ParseInt64Strict("42", v));
  EXPECT_EQ(v, 42);
  ASSERT_TRUE(ParseInt64Strict("-7", v));
  EXPECT_EQ(v, -7);
  ASSERT_TRUE(ParseInt64Strict("+0", v));
  EXPECT_EQ(v, 0);
  ASSERT_TRUE(ParseInt64Strict("  12  ", v));
  EXPECT_EQ(v, 12);
}

TEST(ParseInt64, Extremes) {
  int64_t v = 0;
  ASSERT_TRUE(ParseInt64Strict("9223372036854775807", v));
  EXPECT_EQ(v, std::numeric_limits<int64_t>::max());
  ASSERT_TRUE(ParseInt64Strict("-9223372036854775808", v));
  EXPECT_EQ(v, std::numeric_limits<int64_t>::min());
}

TEST(ParseInt64, Overflow) {
  int64_t v = 5;
  std::string err;
  EXPECT_FALSE(ParseInt64Strict("9223372036854775808", v, &err));
  EXPECT_EQ(err, "integer overflow");
  EXPECT_FALSE(ParseInt64Strict("-9223372036854775809", v, &err));
  EXPECT_EQ(err, "integer overflow");
}

TEST(ParseInt64, Malformed) {
  int64_t v = 0;
  std::string err;
  EXPECT_FALSE(ParseInt64Strict("", v, &err));
  EXPECT_EQ(err, "invalid integer literal");
  EXPECT_FALSE(ParseInt64Strict("-", v, &err));
  EXPECT_EQ(err, "invalid integer literal");
  EXPECT_FALSE(ParseInt64Strict("12x", v, &err));
  EXPECT_EQ(err, "invalid character in integer literal");
  EXPECT_FALSE(ParseInt64Strict("1 2", v, &err));
  EXPECT_EQ(err, "unexpected characters after integer literal");
  EXPECT_FALSE(ParseInt64Strict("x", v));
}

TEST(ParseUtil, TrimAndSign) {
  const std::string_view text = setalg::support::TrimSpaces(" \t-5 \n");
  EXPECT_EQ(text, "-5");
  bool negative = false;
  EXPECT_EQ(setalg::support::StripSign(text, negative), "5");
  EXPECT_TRUE(negative);
  EXPECT_EQ(setalg::support::StripSign("+7", negative), "7");
  EXPECT_FALSE(negative);
  EXPECT_TRUE(setalg::support::TrimSpaces("   ").empty());
}

TEST(ParseUtil, SplitFields) {
  const auto fields = setalg::support::SplitFields(" 1, 2 ,,3 ", ',');
  ASSERT_EQ(fields.size(), 4u);
  EXPECT_EQ(fields[0], "1");
  EXPECT_EQ(fields[1], "2");
  EXPECT_EQ(fields[2], "");
  EXPECT_EQ(fields[3], "3");
  EXPECT_TRUE(setalg::support::SplitFields("  ", ':').empty());
  EXPECT_EQ(setalg::support::SplitFields("0:2:10", ':').size(), 3u);
}

TEST(ParseUtil, DigitsAgainstLimit) {
  uint64_t value = 0;
  std::string err;
  EXPECT_TRUE(setalg::support::ParseDigitsStrict("255", 255, value, &err));
  EXPECT_EQ(value, 255U);
  EXPECT_FALSE(setalg::support::ParseDigitsStrict("256", 255, value, &err));
  EXPECT_EQ(err, "integer overflow");
  EXPECT_FALSE(setalg::support::ParseDigitsStrict("  ", 255, value, &err));
  EXPECT_EQ(err, "missing digits in integer literal");
}
