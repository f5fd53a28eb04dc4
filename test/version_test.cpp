/**
 * @file version_test.cpp
 * @brief Tests for version string parsing and ordering.
 */

#include "termwidth/version.h"

#include "termwidth/error.h"

#include <gtest/gtest.h>

using namespace termwidth;

// =============================================================================
// Parsing
// =============================================================================

TEST(VersionParse, FullVersion) {
  EXPECT_EQ(parse_version("9.0.0"), (VersionValue{9, 0, 0}));
  EXPECT_EQ(parse_version("15.1.0"), (VersionValue{15, 1, 0}));
}

TEST(VersionParse, PartialVersion) {
  EXPECT_EQ(parse_version("8.0"), (VersionValue{8, 0}));
  EXPECT_EQ(parse_version("1"), (VersionValue{1}));
}

TEST(VersionParse, LeadingZerosAreNumeric) {
  EXPECT_EQ(parse_version("09.00.01"), (VersionValue{9, 0, 1}));
}

TEST(VersionParse, MalformedThrows) {
  for (const char* bad : {"", ".", "1.", ".1", "1..2", "a.b.c", "9.0.0-beta", " 9.0", "latest",
                          "auto", "-1", "1.2.x"}) {
    EXPECT_THROW(parse_version(bad), TermwidthException) << "input: '" << bad << "'";
    EXPECT_FALSE(try_parse_version(bad).has_value()) << "input: '" << bad << "'";
  }
}

TEST(VersionParse, MalformedCarriesErrorCode) {
  try {
    parse_version("x.y");
    FAIL() << "Expected TermwidthException";
  } catch (const TermwidthException& e) {
    EXPECT_EQ(e.code(), ErrorCode::MALFORMED_VERSION);
    EXPECT_EQ(e.error().context, "x.y");
  }
}

TEST(VersionParse, ComponentOverflowIsMalformed) {
  EXPECT_TRUE(try_parse_version("4294967295").has_value());
  EXPECT_FALSE(try_parse_version("4294967296").has_value());
  EXPECT_FALSE(try_parse_version("1.99999999999999999999").has_value());
}

TEST(VersionFormat, JoinsWithDots) {
  EXPECT_EQ(format_version({12, 1, 0}), "12.1.0");
  EXPECT_EQ(format_version({7}), "7");
  EXPECT_EQ(format_version({}), "");
}

// =============================================================================
// Ordering
// =============================================================================

TEST(VersionOrder, NumericNotLexical) {
  EXPECT_GT(compare_versions(parse_version("10.0.0"), parse_version("9.0.0")), 0);
  EXPECT_LT(compare_versions(parse_version("9.0.0"), parse_version("10.0.0")), 0);
  EXPECT_GT(compare_versions(parse_version("12.1.0"), parse_version("12.0.0")), 0);
}

TEST(VersionOrder, Equal) {
  EXPECT_EQ(compare_versions(parse_version("6.3.0"), parse_version("6.3.0")), 0);
}

TEST(VersionOrder, PrefixSortsFirst) {
  EXPECT_LT(compare_versions(parse_version("8.0"), parse_version("8.0.0")), 0);
  EXPECT_GT(compare_versions(parse_version("8.0.0"), parse_version("8.0")), 0);
}

TEST(VersionAtMost, PadsMissingComponentsWithZero) {
  EXPECT_TRUE(version_at_most(parse_version("8.0.0"), parse_version("8.0")));
  EXPECT_TRUE(version_at_most(parse_version("8.0.0"), parse_version("8")));
  EXPECT_FALSE(version_at_most(parse_version("8.0.1"), parse_version("8.0")));
}

TEST(VersionAtMost, Ordering) {
  EXPECT_TRUE(version_at_most(parse_version("4.1.0"), parse_version("4.9.9")));
  EXPECT_FALSE(version_at_most(parse_version("5.0.0"), parse_version("4.9.9")));
  EXPECT_TRUE(version_at_most(parse_version("9.0.0"), parse_version("10")));
  EXPECT_FALSE(version_at_most(parse_version("4.1.0"), parse_version("1")));
}
