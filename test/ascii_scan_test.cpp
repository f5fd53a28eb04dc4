/**
 * @file ascii_scan_test.cpp
 * @brief Tests for the vectorized printable-ASCII prefix scan.
 */

#include "termwidth/ascii_scan.h"

#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace termwidth;

namespace {

size_t scalar_prefix(const std::u32string& text) {
  size_t i = 0;
  while (i < text.size() && text[i] >= PRINTABLE_ASCII_FIRST && text[i] <= PRINTABLE_ASCII_LAST)
    ++i;
  return i;
}

size_t byte_prefix(const std::string& text, const AsciiStops& stops = {}) {
  return printable_ascii_prefix(reinterpret_cast<const uint8_t*>(text.data()), text.size(), stops);
}

// '#', '*' and the digits, as for the built-in tables.
AsciiStops key_stops() {
  AsciiStops stops;
  stops.add('#');
  stops.add('*');
  for (uint32_t cp = '0'; cp <= '9'; ++cp)
    stops.add(cp);
  return stops;
}

} // namespace

TEST(AsciiScanTest, Empty) {
  EXPECT_EQ(printable_ascii_prefix(static_cast<const char32_t*>(nullptr), 0), 0u);
  EXPECT_EQ(byte_prefix(""), 0u);
}

TEST(AsciiScanTest, AllPrintable) {
  std::u32string text(200, U'x');
  EXPECT_EQ(printable_ascii_prefix(text.data(), text.size()), 200u);
  EXPECT_EQ(byte_prefix(std::string(200, 'x')), 200u);
}

TEST(AsciiScanTest, Boundaries) {
  std::u32string text = U" ~";
  EXPECT_EQ(printable_ascii_prefix(text.data(), text.size()), 2u);

  text = U"ab\x7F";
  EXPECT_EQ(printable_ascii_prefix(text.data(), text.size()), 2u);

  text = U"ab\x1F";
  EXPECT_EQ(printable_ascii_prefix(text.data(), text.size()), 2u);
}

TEST(AsciiScanTest, StopsAtEveryPosition) {
  // Place a non-ASCII code point at each offset across several vector widths
  for (size_t len = 1; len < 80; ++len) {
    for (size_t stop = 0; stop < len; ++stop) {
      std::u32string text(len, U'a');
      text[stop] = U'一';
      ASSERT_EQ(printable_ascii_prefix(text.data(), text.size()), stop)
          << "len=" << len << " stop=" << stop;

      std::string bytes(len, 'a');
      bytes[stop] = '\x1b';
      ASSERT_EQ(byte_prefix(bytes), stop) << "len=" << len << " stop=" << stop;
    }
  }
}

TEST(AsciiScanTest, HighBytesStopScan) {
  EXPECT_EQ(byte_prefix("abc\xE4\xB8\x80"), 3u);
  EXPECT_EQ(byte_prefix("\xC3\xA9"), 0u);
}

TEST(AsciiScanTest, LargeCodePointsAreNotAscii) {
  std::u32string text = U"abc";
  text.push_back(static_cast<char32_t>(0x80000020));
  text += U"def";
  EXPECT_EQ(printable_ascii_prefix(text.data(), text.size()), 3u);
}

TEST(AsciiScanTest, MatchesScalar) {
  std::u32string text = U"The quick brown fox jumps over the lazy dog, again and again!";
  text += U"étude";
  EXPECT_EQ(printable_ascii_prefix(text.data(), text.size()), scalar_prefix(text));
}

// =============================================================================
// Stop ranges
// =============================================================================

TEST(AsciiStopsTest, AdjacentCodePointsMerge) {
  AsciiStops stops = key_stops();
  ASSERT_EQ(stops.count, 3u);
  EXPECT_EQ(stops.ranges[2].start, 0x30u);
  EXPECT_EQ(stops.ranges[2].end, 0x39u);
  EXPECT_TRUE(stops.contains('#'));
  EXPECT_TRUE(stops.contains('7'));
  EXPECT_FALSE(stops.contains('+'));
}

TEST(AsciiStopsTest, FullSetRejectsNewRange) {
  AsciiStops stops;
  for (size_t i = 0; i < AsciiStops::MAX_RANGES; ++i) {
    ASSERT_TRUE(stops.add(static_cast<uint32_t>(0x41 + 2 * i)));
  }
  EXPECT_FALSE(stops.add(0x60));
  // Extending the last range still fits
  EXPECT_TRUE(stops.add(static_cast<uint32_t>(0x41 + 2 * (AsciiStops::MAX_RANGES - 1) + 1)));
  EXPECT_EQ(stops.count, AsciiStops::MAX_RANGES);
}

TEST(AsciiScanTest, StopRangesEndRun) {
  AsciiStops stops = key_stops();
  std::u32string text = U"abc#def";
  EXPECT_EQ(printable_ascii_prefix(text.data(), text.size(), stops), 3u);
  EXPECT_EQ(printable_ascii_prefix(text.data(), text.size()), 7u);
  EXPECT_EQ(byte_prefix("room 101", stops), 5u);
  EXPECT_EQ(byte_prefix("*", stops), 0u);
}

TEST(AsciiScanTest, StopRangesAtEveryPosition) {
  AsciiStops stops = key_stops();
  const char keys[] = {'#', '*', '0', '9'};
  for (char key : keys) {
    for (size_t len = 1; len < 80; ++len) {
      for (size_t stop = 0; stop < len; ++stop) {
        std::u32string text(len, U'a');
        text[stop] = static_cast<char32_t>(key);
        ASSERT_EQ(printable_ascii_prefix(text.data(), text.size(), stops), stop)
            << "key=" << key << " len=" << len << " stop=" << stop;

        std::string bytes(len, 'a');
        bytes[stop] = key;
        ASSERT_EQ(byte_prefix(bytes, stops), stop)
            << "key=" << key << " len=" << len << " stop=" << stop;
      }
    }
  }
}
