/**
 * @file width_test.cpp
 * @brief Tests for code point and string width classification.
 */

#include "termwidth/width.h"

#include "test_helpers.h"

#include <gtest/gtest.h>
#include <limits>

using namespace termwidth;

// Classifier over the built-in tables that ignores the process environment.
class WidthTest : public ::testing::Test {
protected:
  CapturingOptions capture;
  WidthClassifier classifier{TableStore::builtin(), capture.options()};
};

// =============================================================================
// Single code points
// =============================================================================

TEST_F(WidthTest, PrintableAsciiIsOne) {
  for (uint32_t cp = 0x20; cp <= 0x7E; ++cp) {
    if (cp == '#' || cp == '*' || (cp >= '0' && cp <= '9'))
      continue;
    EXPECT_EQ(classifier.width_of(cp), 1) << "cp=" << cp;
  }
}

TEST_F(WidthTest, ControlCharactersUnprintableInEveryVersion) {
  for (const auto& version : classifier.supported_versions()) {
    for (uint32_t cp : {0x00u, 0x07u, 0x0Au, 0x1Bu, 0x1Fu, 0x7Fu, 0x80u, 0x9Fu}) {
      EXPECT_EQ(classifier.width_of(cp, version), -1) << version << " cp=" << cp;
    }
  }
}

TEST_F(WidthTest, OutOfRangeUnprintable) {
  EXPECT_EQ(classifier.width_of(0x110000), -1);
  EXPECT_EQ(classifier.width_of(0xFFFFFFFF), -1);
  EXPECT_EQ(classifier.width_of(0x10FFFF), 1);
}

TEST_F(WidthTest, ZeroWidthCharacters) {
  EXPECT_EQ(classifier.width_of(0x0301), 0); // combining acute accent
  EXPECT_EQ(classifier.width_of(0x200B), 0); // zero width space
  EXPECT_EQ(classifier.width_of(0x1160), 0); // Hangul jungseong filler
  EXPECT_EQ(classifier.width_of(0xE0001), 0);
}

TEST_F(WidthTest, VariationSelectorsAreZero) {
  for (uint32_t cp = 0xFE00; cp <= 0xFE0F; ++cp) {
    for (const auto& version : classifier.supported_versions()) {
      EXPECT_EQ(classifier.width_of(cp, version), 0) << version << " cp=" << cp;
    }
  }
}

TEST_F(WidthTest, WideCharacters) {
  EXPECT_EQ(classifier.width_of(0x4E00), 2);  // CJK ideograph
  EXPECT_EQ(classifier.width_of(0x1100), 2);  // Hangul choseong
  EXPECT_EQ(classifier.width_of(0x3000), 2);  // ideographic space
  EXPECT_EQ(classifier.width_of(0xFF01), 2);  // fullwidth exclamation
  EXPECT_EQ(classifier.width_of(0x20000), 2); // CJK extension B
}

TEST_F(WidthTest, AmbiguousAndOtherCharactersAreOne) {
  EXPECT_EQ(classifier.width_of(0x00AD), 1);  // soft hyphen
  EXPECT_EQ(classifier.width_of(0x00E9), 1);  // e acute
  EXPECT_EQ(classifier.width_of(0x2E3B), 1);  // three-em dash
  EXPECT_EQ(classifier.width_of(0x1F1E6), 1); // regional indicator
}

TEST_F(WidthTest, VersionDependentEmoji) {
  EXPECT_EQ(classifier.width_of(0x1F600, "8.0.0"), 1);
  EXPECT_EQ(classifier.width_of(0x1F600, "9.0.0"), 2);
  EXPECT_EQ(classifier.width_of(0x1F6D5, "11.0.0"), 1);
  EXPECT_EQ(classifier.width_of(0x1F6D5, "12.0.0"), 2);
  EXPECT_EQ(classifier.width_of(0x1B000, "5.2.0"), 1);
  EXPECT_EQ(classifier.width_of(0x1B000, "6.0.0"), 2);
}

TEST_F(WidthTest, VersionDependentZeroWidth) {
  EXPECT_EQ(classifier.width_of(0x16FE4, "12.1.0"), 1);
  EXPECT_EQ(classifier.width_of(0x16FE4, "13.0.0"), 0);
}

TEST_F(WidthTest, StableCharactersAgreeAcrossVersions) {
  for (const auto& version : classifier.supported_versions()) {
    EXPECT_EQ(classifier.width_of(0x4E00, version), 2) << version;
    EXPECT_EQ(classifier.width_of(0x0301, version), 0) << version;
    EXPECT_EQ(classifier.width_of('A', version), 1) << version;
  }
}

TEST_F(WidthTest, AutoHonoursOverride) {
  capture.source->set("8.0.0");
  EXPECT_EQ(classifier.width_of(0x1F600), 1);
  capture.source->set(std::nullopt);
  EXPECT_EQ(classifier.width_of(0x1F600), 2);
}

TEST_F(WidthTest, EmojiPresentationKeysAreWide) {
  EXPECT_EQ(classifier.width_of('#'), 2);
  EXPECT_EQ(classifier.width_of('*'), 2);
  EXPECT_EQ(classifier.width_of(0x2764), 2); // heavy black heart
  EXPECT_EQ(classifier.width_of(0x00A9), 2); // copyright sign
  for (uint32_t cp = '0'; cp <= '9'; ++cp) {
    EXPECT_EQ(classifier.width_of(cp), 2) << "cp=" << cp;
  }
}

TEST_F(WidthTest, EmojiPresentationKeysInEveryVersion) {
  for (const auto& version : classifier.supported_versions()) {
    EXPECT_EQ(classifier.width_of('#', version), 2) << version;
    EXPECT_EQ(classifier.width_of(0x2764, version), 2) << version;
  }
}

// =============================================================================
// Strings
// =============================================================================

TEST_F(WidthTest, EmptyString) {
  EXPECT_EQ(classifier.string_width(U""), 0);
  EXPECT_EQ(classifier.utf8_width(""), 0);
}

TEST_F(WidthTest, AsciiString) {
  EXPECT_EQ(classifier.string_width(U"hello, world"), 12);
  EXPECT_EQ(classifier.utf8_width("hello, world"), 12);
}

TEST_F(WidthTest, WideString) {
  EXPECT_EQ(classifier.string_width(U"コンニチハ"), 10);
  EXPECT_EQ(classifier.utf8_width("コンニチハ"), 10);
}

TEST_F(WidthTest, CombiningSequence) {
  EXPECT_EQ(classifier.string_width(U"é"), 1);
  EXPECT_EQ(classifier.utf8_width("cafe\xCC\x81"), 4);
}

TEST_F(WidthTest, MixedString) {
  EXPECT_EQ(classifier.utf8_width("abc\xE4\xB8\x80xyz"), 8); // abc + U+4E00 + xyz
}

TEST_F(WidthTest, ControlCharacterShortCircuits) {
  EXPECT_EQ(classifier.string_width(U"abc\x1b[0m"), -1);
  EXPECT_EQ(classifier.utf8_width("abc\x1b[0m"), -1);
  EXPECT_EQ(classifier.utf8_width("line\n"), -1);
  EXPECT_EQ(classifier.string_width(std::u32string(1, U'\0')), -1);
}

TEST_F(WidthTest, ControlAmongWideCharactersShortCircuits) {
  std::u32string text = U"一二三";
  text.push_back(U'\x07');
  text += U"四五";
  EXPECT_EQ(classifier.string_width(text), -1);
  EXPECT_EQ(classifier.string_width(text, 3), 6);
}

TEST_F(WidthTest, ZeroLimitIsZero) {
  EXPECT_EQ(classifier.string_width(U"\x1b", 0), 0);
  EXPECT_EQ(classifier.utf8_width("\xE4\xB8\x80", 0), 0);
}

TEST_F(WidthTest, LimitCountsCodePoints) {
  std::u32string text = U"ab一cd";
  EXPECT_EQ(classifier.string_width(text, 0), 0);
  EXPECT_EQ(classifier.string_width(text, 2), 2);
  EXPECT_EQ(classifier.string_width(text, 3), 4);
  EXPECT_EQ(classifier.string_width(text, 100), 6);

  EXPECT_EQ(classifier.utf8_width("ab\xE4\xB8\x80" "cd", 3), 4);
  EXPECT_EQ(classifier.utf8_width("ab\xE4\xB8\x80" "cd", 2), 2);
}

TEST_F(WidthTest, LimitExcludesLaterControl) {
  EXPECT_EQ(classifier.string_width(U"abc\x1b", 3), 3);
  EXPECT_EQ(classifier.utf8_width("abc\x1b", 3), 3);
  EXPECT_EQ(classifier.string_width(U"abc\x1b", 4), -1);
}

TEST_F(WidthTest, StringMatchesSumOfCodePoints) {
  std::u32string text = U"á一 　！z\U0001F600";
  int expected = 0;
  for (char32_t c : text) {
    expected += classifier.width_of(static_cast<uint32_t>(c), "latest");
  }
  EXPECT_EQ(classifier.string_width(text, std::nullopt, "latest"), expected);
}

TEST_F(WidthTest, VersionResolvedOncePerString) {
  classifier.string_width(U"\U0001F600\U0001F600\U0001F600", std::nullopt, "4.9.9");
  EXPECT_EQ(capture.warnings.error_count(), 1u);
}

TEST_F(WidthTest, ResolvedVersionClassifiesIdentically) {
  for (const char* token : {"auto", "latest", "1", "4.9.9", "8.0", "9", "12.1.0", "99"}) {
    std::string resolved = classifier.resolve(token);
    for (uint32_t cp : {0x41u, 0x0301u, 0x4E00u, 0x1B000u, 0x1F600u, 0x1F6D5u, 0x16FE4u}) {
      EXPECT_EQ(classifier.width_of(cp, resolved), classifier.width_of(cp, token))
          << token << " cp=" << cp;
    }
  }
}

TEST_F(WidthTest, StringVersionSelection) {
  EXPECT_EQ(classifier.string_width(U"\U0001F600", std::nullopt, "8.0.0"), 1);
  EXPECT_EQ(classifier.string_width(U"\U0001F600", std::nullopt, "9.0.0"), 2);
}

TEST_F(WidthTest, MalformedVersionThrows) {
  EXPECT_THROW(classifier.string_width(U"abc", std::nullopt, "abc"), TermwidthException);
  EXPECT_THROW(classifier.width_of('a', "1.x"), TermwidthException);
}

// =============================================================================
// Emoji presentation keys in strings
// =============================================================================

TEST_F(WidthTest, EmojiPresentationKeyStrings) {
  EXPECT_EQ(classifier.string_width(U"#"), 2);
  EXPECT_EQ(classifier.utf8_width("#"), 2);
  EXPECT_EQ(classifier.string_width(U"\u2764"), 2);
  EXPECT_EQ(classifier.utf8_width("\xE2\x9D\xA4"), 2);
}

TEST_F(WidthTest, TrailingVariationSelectorAddsNothing) {
  EXPECT_EQ(classifier.string_width(U"#\uFE0F"), 2);
  EXPECT_EQ(classifier.string_width(U"\u2764\uFE0F"), 2);
  EXPECT_EQ(classifier.utf8_width("\xE2\x9D\xA4\xEF\xB8\x8F"), 2);
  EXPECT_EQ(classifier.string_width(U"A\uFE0F"), 1);
  EXPECT_EQ(classifier.string_width(U"\uFE0F"), 0);
}

TEST_F(WidthTest, AsciiRunStopsAtEmojiPresentationKeys) {
  EXPECT_EQ(classifier.string_width(U"abc#def"), 8);
  EXPECT_EQ(classifier.utf8_width("abc#def"), 8);
  EXPECT_EQ(classifier.utf8_width("room 101"), 11);
  EXPECT_EQ(classifier.string_width(U"a*b"), 4);
}

TEST_F(WidthTest, DigitsInLongAsciiText) {
  // Long enough to cross several SIMD blocks before the digit.
  std::string text(100, 'x');
  text += "7";
  text += std::string(100, 'y');
  EXPECT_EQ(classifier.utf8_width(text), 202);

  std::u32string wide(100, U'x');
  wide += U"7";
  wide += std::u32string(100, U'y');
  EXPECT_EQ(classifier.string_width(wide), 202);
}

TEST_F(WidthTest, StringWidthIsSumOfWidthOf) {
  for (std::u32string text : {std::u32string(U"#1*"), std::u32string(U"x=42;"),
                              std::u32string(U"\u00A9 2024 \u2764\uFE0F")}) {
    int expected = 0;
    for (char32_t c : text) {
      expected += classifier.width_of(static_cast<uint32_t>(c));
    }
    EXPECT_EQ(classifier.string_width(text), expected);
  }
}

TEST_F(WidthTest, LimitAppliesToEmojiPresentationKeys) {
  EXPECT_EQ(classifier.string_width(U"#\uFE0F", 1), 2);
  EXPECT_EQ(classifier.utf8_width("#\xEF\xB8\x8F", 1), 2);
  EXPECT_EQ(classifier.utf8_width("ab12", 3), 4);
}

TEST(SaturateWidth, ClampsToIntRange) {
  EXPECT_EQ(saturate_width(0), 0);
  EXPECT_EQ(saturate_width(12), 12);
  const int64_t int_max = std::numeric_limits<int>::max();
  EXPECT_EQ(saturate_width(int_max), std::numeric_limits<int>::max());
  EXPECT_EQ(saturate_width(int_max + 1), std::numeric_limits<int>::max());
  // Two cells for every code point of a string longer than INT_MAX / 2
  EXPECT_EQ(saturate_width(int64_t{2} * (int_max / 2 + 1)), std::numeric_limits<int>::max());
}

// =============================================================================
// Ill-formed UTF-8
// =============================================================================

TEST_F(WidthTest, TruncatedSequenceIsOneReplacement) {
  EXPECT_EQ(classifier.utf8_width("\xE4\xB8"), 1);
  EXPECT_EQ(classifier.utf8_width("ab\xF0\x9F\x98"), 3);
}

TEST_F(WidthTest, SurrogateBytesAreReplacedIndividually) {
  EXPECT_EQ(classifier.utf8_width("\xED\xA0\x80"), 3);
  EXPECT_EQ(classifier.utf8_width("\xC0\xAF"), 2);
}

// =============================================================================
// Custom tables
// =============================================================================

TEST(WidthCustomTables, UsesSuppliedTables) {
  TableStore store = test_tables::make_store();
  CapturingOptions capture;
  WidthClassifier classifier(store, capture.options());

  EXPECT_EQ(classifier.width_of(0x2500, "4.1.0"), 1);
  EXPECT_EQ(classifier.width_of(0x2500, "5.0.0"), 2);
  EXPECT_EQ(classifier.string_width(U"──", std::nullopt, "5.0.0"), 4);
  EXPECT_EQ(classifier.width_of('#'), 2);
  EXPECT_EQ(classifier.string_width(U"a#b"), 4);
  EXPECT_EQ(classifier.string_width(U"#\uFE0F"), 2);
}

TEST(WidthCustomTables, AsciiFastPathRespectsTables) {
  std::vector<VersionTables> versions;
  versions.emplace_back("1.0.0", test_tables::kZeroDigits, test_tables::kWide);
  TableStore store(std::move(versions));
  WidthClassifier classifier(store, ResolverOptions{});

  EXPECT_EQ(classifier.width_of('5'), 0);
  EXPECT_EQ(classifier.string_width(U"a1b2c3"), 3);
  EXPECT_EQ(classifier.utf8_width("a1b2c3"), 3);
}

TEST(WidthCustomTables, ManyAsciiExceptionsDisableFastPath) {
  // Every other lowercase letter is wide: more ranges than the scan holds.
  static constexpr Interval wide[] = {{'a', 'a'}, {'c', 'c'}, {'e', 'e'}, {'g', 'g'}, {'i', 'i'},
                                      {'k', 'k'}, {'m', 'm'}, {'o', 'o'}, {'q', 'q'}};
  std::vector<VersionTables> versions;
  versions.emplace_back("1.0.0", test_tables::kZero, wide);
  TableStore store(std::move(versions));
  WidthClassifier classifier(store, ResolverOptions{});

  EXPECT_FALSE(store.version_tables("1.0.0").ascii_fast_path);
  EXPECT_EQ(classifier.string_width(U"abcdefghijklmnopq"), 26);
  EXPECT_EQ(classifier.utf8_width("abcdefghijklmnopq"), 26);
}

// =============================================================================
// classify_codepoint
// =============================================================================

TEST(ClassifyCodepoint, RuleOrder) {
  static constexpr Interval zero[] = {{0x2764, 0x2764}};
  static constexpr Interval overrides[] = {{0x23, 0x23}, {0x2764, 0x2764}};
  VersionTables tables("1.0.0", zero, test_tables::kWide);

  // zero-width table wins over the emoji override
  EXPECT_EQ(classify_codepoint(0x2764, tables, IntervalTable(overrides)), 0);
  EXPECT_EQ(classify_codepoint(0x23, tables, IntervalTable(overrides)), 2);
  EXPECT_EQ(classify_codepoint(0x23, tables, IntervalTable()), 1);
  EXPECT_EQ(classify_codepoint(0xFE0F, tables, IntervalTable(overrides)), 0);
  EXPECT_EQ(classify_codepoint(0x1B, tables, IntervalTable(overrides)), -1);
}

// =============================================================================
// Process-wide defaults
// =============================================================================

TEST(WidthDefaults, FreeFunctionsUseBuiltinTables) {
  EXPECT_EQ(width_of(0x4E00, "latest"), 2);
  EXPECT_EQ(width_of(0x1B, "latest"), -1);
  EXPECT_EQ(string_width(U"ab", std::nullopt, "latest"), 2);
  EXPECT_EQ(utf8_width("\xE4\xB8\x80", std::nullopt, "latest"), 2);
  EXPECT_EQ(resolve("latest"), TableStore::builtin().latest());
  EXPECT_EQ(&supported_versions(), &TableStore::builtin().supported_versions());
}
