/**
 * @file utf8_test.cpp
 * @brief Tests for UTF-8 decoding.
 */

#include "termwidth/utf8.h"

#include <gtest/gtest.h>

using namespace termwidth;

class Utf8Test : public ::testing::Test {};

// =============================================================================
// UTF-8 Decode Tests
// =============================================================================

TEST_F(Utf8Test, DecodeAscii) {
  uint32_t cp;
  std::string_view str = "AB";

  EXPECT_EQ(utf8_decode(str, 0, cp), 1u);
  EXPECT_EQ(cp, 0x41u);

  EXPECT_EQ(utf8_decode(str, 1, cp), 1u);
  EXPECT_EQ(cp, 0x42u);
}

TEST_F(Utf8Test, DecodeMultibyte) {
  uint32_t cp;

  // ñ (U+00F1) is C3 B1
  EXPECT_EQ(utf8_decode("\xC3\xB1", 0, cp), 2u);
  EXPECT_EQ(cp, 0x00F1u);

  // 一 (U+4E00) is E4 B8 80
  EXPECT_EQ(utf8_decode("\xE4\xB8\x80", 0, cp), 3u);
  EXPECT_EQ(cp, 0x4E00u);

  // 😀 (U+1F600) is F0 9F 98 80
  EXPECT_EQ(utf8_decode("\xF0\x9F\x98\x80", 0, cp), 4u);
  EXPECT_EQ(cp, 0x1F600u);
}

TEST_F(Utf8Test, DecodeAtEnd) {
  uint32_t cp;
  EXPECT_EQ(utf8_decode("", 0, cp), 0u);
  EXPECT_EQ(utf8_decode("A", 1, cp), 0u);
}

TEST_F(Utf8Test, DecodeStrayContinuation) {
  uint32_t cp;
  EXPECT_EQ(utf8_decode("\x80", 0, cp), 1u);
  EXPECT_EQ(cp, REPLACEMENT_CHARACTER);
}

TEST_F(Utf8Test, DecodeInvalidLeadByte) {
  uint32_t cp;
  EXPECT_EQ(utf8_decode("\xFF", 0, cp), 1u);
  EXPECT_EQ(cp, REPLACEMENT_CHARACTER);
}

TEST_F(Utf8Test, DecodeTruncatedSequence) {
  uint32_t cp;
  // Lead byte of a three-byte sequence with a single continuation:
  // the whole truncated prefix becomes one replacement
  EXPECT_EQ(utf8_decode("\xE4\xB8", 0, cp), 2u);
  EXPECT_EQ(cp, REPLACEMENT_CHARACTER);

  EXPECT_EQ(utf8_decode("\xF0\x9F\x98", 0, cp), 3u);
  EXPECT_EQ(cp, REPLACEMENT_CHARACTER);

  EXPECT_EQ(utf8_decode("\xF0\x9F\x98" "A", 0, cp), 3u);
  EXPECT_EQ(cp, REPLACEMENT_CHARACTER);
}

TEST_F(Utf8Test, DecodeBrokenContinuation) {
  uint32_t cp;
  EXPECT_EQ(utf8_decode("\xE4" "A" "\x80", 0, cp), 1u);
  EXPECT_EQ(cp, REPLACEMENT_CHARACTER);
}

TEST_F(Utf8Test, DecodeOverlong) {
  uint32_t cp;
  // '/' encoded in two bytes: C0 is never a lead byte
  EXPECT_EQ(utf8_decode("\xC0\xAF", 0, cp), 1u);
  EXPECT_EQ(cp, REPLACEMENT_CHARACTER);

  EXPECT_EQ(utf8_decode("\xC1\xBF", 0, cp), 1u);
  EXPECT_EQ(cp, REPLACEMENT_CHARACTER);

  // E0 and F0 restrict the second byte to rule out overlong forms
  EXPECT_EQ(utf8_decode("\xE0\x80\x80", 0, cp), 1u);
  EXPECT_EQ(cp, REPLACEMENT_CHARACTER);

  EXPECT_EQ(utf8_decode("\xF0\x80\x80\x80", 0, cp), 1u);
  EXPECT_EQ(cp, REPLACEMENT_CHARACTER);
}

TEST_F(Utf8Test, DecodeSurrogate) {
  uint32_t cp;
  EXPECT_EQ(utf8_decode("\xED\xA0\x80", 0, cp), 1u);
  EXPECT_EQ(cp, REPLACEMENT_CHARACTER);
}

TEST_F(Utf8Test, DecodeRangeEdges) {
  uint32_t cp;
  EXPECT_EQ(utf8_decode("\xE0\xA0\x80", 0, cp), 3u);
  EXPECT_EQ(cp, 0x0800u);

  EXPECT_EQ(utf8_decode("\xED\x9F\xBF", 0, cp), 3u);
  EXPECT_EQ(cp, 0xD7FFu);

  EXPECT_EQ(utf8_decode("\xF0\x90\x80\x80", 0, cp), 4u);
  EXPECT_EQ(cp, 0x10000u);

  EXPECT_EQ(utf8_decode("\xF4\x8F\xBF\xBF", 0, cp), 4u);
  EXPECT_EQ(cp, 0x10FFFFu);
}

TEST_F(Utf8Test, DecodeBeyondUnicode) {
  uint32_t cp;
  EXPECT_EQ(utf8_decode("\xF4\x90\x80\x80", 0, cp), 1u);
  EXPECT_EQ(cp, REPLACEMENT_CHARACTER);

  EXPECT_EQ(utf8_decode("\xF5\x80\x80\x80", 0, cp), 1u);
  EXPECT_EQ(cp, REPLACEMENT_CHARACTER);
}

// =============================================================================
// Conversion
// =============================================================================

TEST_F(Utf8Test, ToUtf32) {
  EXPECT_EQ(utf8_to_utf32("a\xE4\xB8\x80" "b"), U"a一b");
  EXPECT_EQ(utf8_to_utf32(""), U"");
}

TEST_F(Utf8Test, ToUtf32ReplacesInvalidBytes) {
  std::u32string out = utf8_to_utf32("a\xFF" "b");
  ASSERT_EQ(out.size(), 3u);
  EXPECT_EQ(out[1], static_cast<char32_t>(REPLACEMENT_CHARACTER));
}

TEST_F(Utf8Test, ToUtf32MaximalSubparts) {
  const char32_t fffd = static_cast<char32_t>(REPLACEMENT_CHARACTER);
  // A surrogate encoding has no valid prefix longer than its lead byte
  EXPECT_EQ(utf8_to_utf32("\xED\xA0\x80"), std::u32string(3, fffd));
  // A truncated sequence is one replacement
  EXPECT_EQ(utf8_to_utf32("\xE4\xB8" "a"), std::u32string({fffd, U'a'}));
  EXPECT_EQ(utf8_to_utf32("\xE4" "A" "\x80"), std::u32string({fffd, U'A', fffd}));
}
