/***
 * Name: test_parse_u64
 * Purpose: Validate strict unsigned literal parsing used by configuration.
 */
#include <gtest/gtest.h>

#include <cstdint>
#include <string>

#include "stackscope/support/parse.h"
#include "stackscope/support/parse_util.h"

using namespace stackscope::support;

TEST(ParseU64, AcceptsPlainAndPaddedDigits) {
  std::uint64_t v = 0;
  ASSERT_TRUE(ParseU64LiteralStrict("42", v));
  EXPECT_EQ(v, 42u);
  ASSERT_TRUE(ParseU64LiteralStrict("  +17  ", v));
  EXPECT_EQ(v, 17u);
  ASSERT_TRUE(ParseU64LiteralStrict("18446744073709551615", v));
  EXPECT_EQ(v, UINT64_MAX);
}

TEST(ParseU64, RejectsBadInput) {
  std::uint64_t v = 7;
  std::string err;
  EXPECT_FALSE(ParseU64LiteralStrict("", v, &err));
  EXPECT_EQ(err, "invalid integer literal");
  EXPECT_FALSE(ParseU64LiteralStrict("-3", v, &err));
  EXPECT_EQ(err, "negative value not allowed");
  EXPECT_FALSE(ParseU64LiteralStrict("12x", v, &err));
  EXPECT_EQ(err, "invalid character in integer literal");
  EXPECT_FALSE(ParseU64LiteralStrict("12 34", v, &err));
  EXPECT_EQ(err, "trailing characters after integer literal");
  EXPECT_FALSE(ParseU64LiteralStrict("18446744073709551616", v, &err));
  EXPECT_EQ(err, "integer overflow");
  EXPECT_EQ(v, 7u);  // untouched on failure
}

TEST(ParseUtil, TrimAndSign) {
  std::string_view text = " \t-9";
  TrimLeadingSpaces(text);
  EXPECT_EQ(text, "-9");
  bool neg = false;
  EXPECT_TRUE(ConsumeSign(text, neg));
  EXPECT_TRUE(neg);
  EXPECT_EQ(text, "9");
}
