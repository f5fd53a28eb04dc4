/**
 * @file ascii_scan.cpp
 * @brief Highway implementation of the printable ASCII prefix scans.
 */

#include "termwidth/ascii_scan.h"

#include <cstring>

#undef HWY_TARGET_INCLUDE
#include "hwy/highway.h"

namespace termwidth {

namespace hn = hwy::HWY_NAMESPACE;

namespace {

// Code points are copied into an aligned block before loading: char32_t
// and uint32_t are distinct types and may not alias.
constexpr size_t CODEPOINT_BLOCK = 16;
constexpr size_t BYTE_BLOCK = 64;

static_assert(sizeof(char32_t) == sizeof(uint32_t), "char32_t must be 32 bits");

inline bool is_run_character(uint32_t c, const AsciiStops& stops) {
  return c >= PRINTABLE_ASCII_FIRST && c <= PRINTABLE_ASCII_LAST && !stops.contains(c);
}

// Lanes of vec that end a run: outside printable ASCII, or inside a stop range.
template <class D, class V>
HWY_ATTR hn::Mask<D> run_breaks(D d, V vec, const AsciiStops& stops) {
  using T = hn::TFromD<D>;
  auto breaks = hn::Or(hn::Lt(vec, hn::Set(d, static_cast<T>(PRINTABLE_ASCII_FIRST))),
                       hn::Gt(vec, hn::Set(d, static_cast<T>(PRINTABLE_ASCII_LAST))));
  for (size_t k = 0; k < stops.count; ++k) {
    const auto in_range = hn::And(hn::Ge(vec, hn::Set(d, static_cast<T>(stops.ranges[k].start))),
                                  hn::Le(vec, hn::Set(d, static_cast<T>(stops.ranges[k].end))));
    breaks = hn::Or(breaks, in_range);
  }
  return breaks;
}

HWY_ATTR size_t scan_codepoints(const char32_t* data, size_t len, const AsciiStops& stops) {
  const hn::CappedTag<uint32_t, CODEPOINT_BLOCK> d;
  const size_t N = hn::Lanes(d);

  HWY_ALIGN uint32_t block[CODEPOINT_BLOCK];
  size_t i = 0;
  for (; i + CODEPOINT_BLOCK <= len; i += CODEPOINT_BLOCK) {
    std::memcpy(block, data + i, sizeof(block));
    for (size_t j = 0; j < CODEPOINT_BLOCK; j += N) {
      const intptr_t idx = hn::FindFirstTrue(d, run_breaks(d, hn::Load(d, block + j), stops));
      if (idx >= 0) {
        return i + j + static_cast<size_t>(idx);
      }
    }
  }

  for (; i < len; ++i) {
    if (!is_run_character(static_cast<uint32_t>(data[i]), stops))
      return i;
  }
  return len;
}

HWY_ATTR size_t scan_bytes(const uint8_t* data, size_t len, const AsciiStops& stops) {
  const hn::CappedTag<uint8_t, BYTE_BLOCK> d;
  const size_t N = hn::Lanes(d);

  size_t i = 0;
  for (; i + N <= len; i += N) {
    const intptr_t idx = hn::FindFirstTrue(d, run_breaks(d, hn::LoadU(d, data + i), stops));
    if (idx >= 0) {
      return i + static_cast<size_t>(idx);
    }
  }

  for (; i < len; ++i) {
    if (!is_run_character(data[i], stops))
      return i;
  }
  return len;
}

} // namespace

bool AsciiStops::add(uint32_t cp) {
  if (count > 0 && ranges[count - 1].end + 1 == cp) {
    ranges[count - 1].end = cp;
    return true;
  }
  if (count == MAX_RANGES) {
    return false;
  }
  ranges[count++] = Interval{cp, cp};
  return true;
}

size_t printable_ascii_prefix(const char32_t* data, size_t len, const AsciiStops& stops) {
  return scan_codepoints(data, len, stops);
}

size_t printable_ascii_prefix(const uint8_t* data, size_t len, const AsciiStops& stops) {
  return scan_bytes(data, len, stops);
}

} // namespace termwidth
