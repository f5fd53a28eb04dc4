/**
 * @file width.h
 * @brief Terminal cell width of Unicode code points and strings.
 *
 * Widths follow the POSIX wcwidth()/wcswidth() conventions:
 *
 * - -1 for C0 and C1 control characters (U+0000..U+001F, U+007F..U+009F)
 *   and for values outside the Unicode range; these have no defined width
 * - 0 for combining marks, format characters, Hangul medial vowels and
 *   final consonants, and variation selectors
 * - 2 for East Asian Wide and Fullwidth characters, and for characters
 *   with an emoji presentation override ('#', the digits, U+2764, ...)
 * - 1 for everything else, including East Asian Ambiguous characters
 *
 * Which characters are zero width or wide depends on the Unicode version;
 * every call takes a version token understood by VersionResolver
 * ("auto" by default).
 *
 * @see WidthClassifier for explicit tables and resolver options
 * @see width_of() and string_width() for the process-wide defaults
 */

#ifndef TERMWIDTH_WIDTH_H
#define TERMWIDTH_WIDTH_H

#include "termwidth/table_store.h"
#include "termwidth/version_resolver.h"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace termwidth {

constexpr int WIDTH_UNPRINTABLE = -1;

constexpr uint32_t MAX_CODEPOINT = 0x10FFFF;

/// Clamp a 64-bit width sum to the int range returned by string widths.
inline int saturate_width(int64_t width) {
  return width > std::numeric_limits<int>::max() ? std::numeric_limits<int>::max()
                                                 : static_cast<int>(width);
}

/**
 * @brief Classify one code point against already-resolved tables.
 *
 * Rules, first match wins: control or out of range (-1), zero-width table
 * (0), wide table (2), variation selector block U+FE00..U+FE0F (0),
 * emoji presentation override table (2), otherwise 1.
 */
int classify_codepoint(uint32_t cp, const VersionTables& tables,
                       const IntervalTable& emoji_overrides);

/**
 * @brief Width lookups bound to one TableStore and resolver configuration.
 *
 * All member functions are const and the classifier holds no mutable
 * state, so one instance may be shared across threads.
 */
class WidthClassifier {
public:
  /// Built-in tables, UNICODE_VERSION override, no warning callback.
  WidthClassifier();

  explicit WidthClassifier(const TableStore& store,
                           ResolverOptions options = ResolverOptions::from_environment());

  /**
   * @brief Width of a single code point.
   * @return -1, 0, 1 or 2
   */
  int width_of(uint32_t cp, std::string_view version = AUTO_VERSION) const;

  /**
   * @brief Width of the first @p limit code points of @p text.
   *
   * The version is resolved once per call. Returns -1 as soon as an
   * unprintable code point is met. An empty text, or a limit of 0,
   * measures 0. Otherwise the result is the sum of width_of() over the
   * measured code points, clamped to INT_MAX.
   */
  int string_width(std::u32string_view text, std::optional<size_t> limit = std::nullopt,
                   std::string_view version = AUTO_VERSION) const;

  /**
   * @brief string_width() over UTF-8 input; @p limit counts code points.
   */
  int utf8_width(std::string_view text, std::optional<size_t> limit = std::nullopt,
                 std::string_view version = AUTO_VERSION) const;

  /// string_width() against tables that were already resolved.
  int measure(std::u32string_view text, std::optional<size_t> limit,
              const VersionTables& tables) const;

  /// utf8_width() against tables that were already resolved.
  int measure_utf8(std::string_view text, std::optional<size_t> limit,
                   const VersionTables& tables) const;

  std::string resolve(std::string_view token) const { return resolver_.resolve(token); }

  const std::vector<std::string>& supported_versions() const {
    return store_.supported_versions();
  }

  const VersionTables& tables(std::string_view token) const {
    return store_.version_tables(resolver_.resolve_index(token));
  }

  const TableStore& store() const { return store_; }
  const VersionResolver& resolver() const { return resolver_; }

private:
  const TableStore& store_;
  VersionResolver resolver_;
};

//-----------------------------------------------------------------------------
// Process-wide defaults
//
// These use the built-in tables, read UNICODE_VERSION for "auto", and write
// version advisories to std::cerr.
//-----------------------------------------------------------------------------

const WidthClassifier& default_classifier();

int width_of(uint32_t cp, std::string_view version = AUTO_VERSION);

int string_width(std::u32string_view text, std::optional<size_t> limit = std::nullopt,
                 std::string_view version = AUTO_VERSION);

int utf8_width(std::string_view text, std::optional<size_t> limit = std::nullopt,
               std::string_view version = AUTO_VERSION);

std::string resolve(std::string_view token);

const std::vector<std::string>& supported_versions();

} // namespace termwidth

#endif // TERMWIDTH_WIDTH_H
