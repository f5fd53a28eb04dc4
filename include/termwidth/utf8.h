/**
 * @file utf8.h
 * @brief UTF-8 decoding for width measurement of byte strings.
 *
 * Invalid input never fails. Ill-formed input is replaced following the
 * "maximal subpart" practice of Unicode section 3.9: the longest prefix of
 * a well-formed sequence, or else a single byte, becomes one U+FFFD
 * REPLACEMENT CHARACTER, which measures one cell.
 */

#ifndef TERMWIDTH_UTF8_H
#define TERMWIDTH_UTF8_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace termwidth {

constexpr uint32_t REPLACEMENT_CHARACTER = 0xFFFD;

/**
 * @brief Decode one code point from @p str starting at byte @p pos.
 *
 * Lead bytes C0, C1 and F5..FF are never valid. The second byte range
 * depends on the lead byte, which excludes overlong forms, surrogates
 * (U+D800..U+DFFF) and values above U+10FFFF. Any of these decodes to
 * U+FFFD and consumes only the bytes up to the first offending one.
 *
 * @param str The UTF-8 string
 * @param pos Starting byte position
 * @param[out] codepoint The decoded code point
 * @return Bytes consumed: 1-4, or 0 if @p pos is at or past the end
 */
size_t utf8_decode(std::string_view str, size_t pos, uint32_t& codepoint);

/**
 * @brief Decode a whole UTF-8 string to UTF-32.
 */
std::u32string utf8_to_utf32(std::string_view str);

} // namespace termwidth

#endif // TERMWIDTH_UTF8_H
