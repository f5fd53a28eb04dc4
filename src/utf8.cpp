/**
 * @file utf8.cpp
 * @brief Implementation of UTF-8 decoding.
 */

#include "termwidth/utf8.h"

namespace termwidth {

namespace {

// Shape of a well-formed sequence, keyed by its lead byte.
struct SequenceShape {
  size_t length;       // total bytes, 0 for a byte that cannot start a sequence
  uint8_t payload;     // bits of the lead byte that carry the code point
  uint8_t second_min;  // allowed range of the byte after the lead
  uint8_t second_max;
};

constexpr uint8_t CONTINUATION_MIN = 0x80;
constexpr uint8_t CONTINUATION_MAX = 0xBF;

// Table 3-7, Well-Formed UTF-8 Byte Sequences
SequenceShape shape_of(uint8_t lead) {
  if (lead < 0x80)
    return {1, 0x7F, 0, 0};
  if (lead >= 0xC2 && lead <= 0xDF)
    return {2, 0x1F, CONTINUATION_MIN, CONTINUATION_MAX};
  if (lead == 0xE0)
    return {3, 0x0F, 0xA0, CONTINUATION_MAX};
  if (lead == 0xED)
    return {3, 0x0F, CONTINUATION_MIN, 0x9F};
  if (lead >= 0xE1 && lead <= 0xEF)
    return {3, 0x0F, CONTINUATION_MIN, CONTINUATION_MAX};
  if (lead == 0xF0)
    return {4, 0x07, 0x90, CONTINUATION_MAX};
  if (lead >= 0xF1 && lead <= 0xF3)
    return {4, 0x07, CONTINUATION_MIN, CONTINUATION_MAX};
  if (lead == 0xF4)
    return {4, 0x07, CONTINUATION_MIN, 0x8F};
  return {0, 0, 0, 0};
}

} // namespace

size_t utf8_decode(std::string_view str, size_t pos, uint32_t& codepoint) {
  if (pos >= str.size()) {
    codepoint = REPLACEMENT_CHARACTER;
    return 0;
  }

  const uint8_t lead = static_cast<uint8_t>(str[pos]);
  const SequenceShape shape = shape_of(lead);
  if (shape.length == 0) {
    codepoint = REPLACEMENT_CHARACTER;
    return 1;
  }

  uint32_t cp = lead & shape.payload;
  for (size_t i = 1; i < shape.length; ++i) {
    if (pos + i >= str.size()) {
      codepoint = REPLACEMENT_CHARACTER;
      return i;
    }
    const uint8_t next = static_cast<uint8_t>(str[pos + i]);
    const uint8_t min = i == 1 ? shape.second_min : CONTINUATION_MIN;
    const uint8_t max = i == 1 ? shape.second_max : CONTINUATION_MAX;
    if (next < min || next > max) {
      codepoint = REPLACEMENT_CHARACTER;
      return i;
    }
    cp = (cp << 6) | (next & 0x3F);
  }

  codepoint = cp;
  return shape.length;
}

std::u32string utf8_to_utf32(std::string_view str) {
  std::u32string out;
  out.reserve(str.size());

  size_t pos = 0;
  while (pos < str.size()) {
    uint32_t cp;
    pos += utf8_decode(str, pos, cp);
    out.push_back(static_cast<char32_t>(cp));
  }
  return out;
}

} // namespace termwidth
