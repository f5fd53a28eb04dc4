/**
 * @file interval_table_test.cpp
 * @brief Tests for interval binary search and table validation.
 */

#include "termwidth/interval_table.h"

#include <gtest/gtest.h>

using namespace termwidth;

class IntervalTableTest : public ::testing::Test {
protected:
  static constexpr Interval kTwo[] = {{10, 20}, {30, 40}};
};

// =============================================================================
// Binary search
// =============================================================================

TEST_F(IntervalTableTest, MembershipAtBoundaries) {
  IntervalTable table(kTwo);

  EXPECT_FALSE(table.contains(9));
  EXPECT_TRUE(table.contains(10));
  EXPECT_TRUE(table.contains(20));
  EXPECT_FALSE(table.contains(21));
  EXPECT_FALSE(table.contains(29));
  EXPECT_TRUE(table.contains(30));
  EXPECT_FALSE(table.contains(41));
}

TEST_F(IntervalTableTest, InteriorPoints) {
  IntervalTable table(kTwo);
  EXPECT_TRUE(table.contains(15));
  EXPECT_TRUE(table.contains(35));
  EXPECT_TRUE(table.contains(40));
  EXPECT_FALSE(table.contains(25));
}

TEST_F(IntervalTableTest, OutsideRangeShortCircuits) {
  IntervalTable table(kTwo);
  EXPECT_FALSE(table.contains(0));
  EXPECT_FALSE(table.contains(0x10FFFF));
  EXPECT_FALSE(table.contains(0xFFFFFFFF));
}

TEST_F(IntervalTableTest, EmptyTableContainsNothing) {
  IntervalTable table;
  EXPECT_TRUE(table.empty());
  EXPECT_FALSE(table.contains(0));
  EXPECT_FALSE(table.contains(10));
}

TEST_F(IntervalTableTest, SingleInterval) {
  static constexpr Interval one[] = {{5, 5}};
  IntervalTable table(one);
  EXPECT_FALSE(table.contains(4));
  EXPECT_TRUE(table.contains(5));
  EXPECT_FALSE(table.contains(6));
}

TEST_F(IntervalTableTest, LargeTableAgreesWithLinearScan) {
  // Intervals [i*10, i*10+4] for i in 0..99
  Interval data[100];
  for (uint32_t i = 0; i < 100; ++i) {
    data[i] = {i * 10, i * 10 + 4};
  }
  IntervalTable table(data, 100);

  for (uint32_t cp = 0; cp < 1010; ++cp) {
    bool expected = (cp % 10) <= 4 && cp < 1000;
    EXPECT_EQ(table.contains(cp), expected) << "cp=" << cp;
  }
}

TEST_F(IntervalTableTest, FreeFunctionMatchesView) {
  EXPECT_TRUE(bisearch(12, kTwo, 2));
  EXPECT_FALSE(bisearch(25, kTwo, 2));
  EXPECT_FALSE(bisearch(12, kTwo, 0));
}

// =============================================================================
// Validation helpers
// =============================================================================

TEST_F(IntervalTableTest, ValidTable) {
  EXPECT_TRUE(IntervalTable(kTwo).is_valid());
  EXPECT_TRUE(IntervalTable().is_valid());
}

TEST_F(IntervalTableTest, OverlappingTableIsInvalid) {
  static constexpr Interval overlap[] = {{10, 20}, {20, 30}};
  EXPECT_FALSE(IntervalTable(overlap).is_valid());
}

TEST_F(IntervalTableTest, UnsortedTableIsInvalid) {
  static constexpr Interval unsorted[] = {{30, 40}, {10, 20}};
  EXPECT_FALSE(IntervalTable(unsorted).is_valid());
}

TEST_F(IntervalTableTest, ReversedIntervalIsInvalid) {
  static constexpr Interval reversed[] = {{20, 10}};
  EXPECT_FALSE(IntervalTable(reversed).is_valid());
}
