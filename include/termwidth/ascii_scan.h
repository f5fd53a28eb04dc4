/**
 * @file ascii_scan.h
 * @brief SIMD scan for runs of one-cell printable ASCII.
 *
 * Most printable ASCII (U+0020..U+007E) is one cell wide, so string
 * measurement can count such runs without a table lookup per character.
 * The few printable ASCII code points that are not one cell wide in a
 * given table set (the emoji presentation keys '#', '*' and the digits,
 * for the built-in tables) are passed to the scan as an AsciiStops set and
 * end the run. The scans are vectorized with Google Highway.
 */

#ifndef TERMWIDTH_ASCII_SCAN_H
#define TERMWIDTH_ASCII_SCAN_H

#include "termwidth/interval_table.h"

#include <cstddef>
#include <cstdint>

namespace termwidth {

constexpr uint32_t PRINTABLE_ASCII_FIRST = 0x20;
constexpr uint32_t PRINTABLE_ASCII_LAST = 0x7E;

/**
 * @brief Printable ASCII ranges at which a scan stops.
 *
 * Each range costs one compare pair per vector, so the set is small and
 * fixed in size. Table sets needing more ranges do not use the scan.
 */
struct AsciiStops {
  static constexpr size_t MAX_RANGES = 8;

  Interval ranges[MAX_RANGES] = {};
  size_t count = 0;

  /// Append @p cp, extending the last range when adjacent.
  /// @return false if the set is full.
  bool add(uint32_t cp);

  bool contains(uint32_t cp) const { return bisearch(cp, ranges, count); }
};

/// Number of leading code points of @p data that are printable ASCII and
/// not in @p stops.
size_t printable_ascii_prefix(const char32_t* data, size_t len, const AsciiStops& stops = {});

/// Number of leading bytes of @p data that are printable ASCII and not in
/// @p stops.
size_t printable_ascii_prefix(const uint8_t* data, size_t len, const AsciiStops& stops = {});

} // namespace termwidth

#endif // TERMWIDTH_ASCII_SCAN_H
