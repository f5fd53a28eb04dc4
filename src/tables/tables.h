/**
 * @file tables.h
 * @brief Declarations for the generated Unicode width data.
 *
 * Internal to the library. TableStore::builtin() is the only consumer.
 */

#ifndef TERMWIDTH_TABLES_H
#define TERMWIDTH_TABLES_H

#include "termwidth/interval_table.h"

#include <cstddef>
#include <string_view>

namespace termwidth {
namespace tables {

struct GeneratedTable {
  std::string_view version;
  const Interval* intervals;
  size_t size;
};

// Zero-width characters: combining marks, format controls, Hangul medial
// vowels and final consonants.
extern const GeneratedTable kZeroWidthTables[];
extern const size_t kZeroWidthTableCount;

// East Asian Wide (W) and Fullwidth (F) characters.
extern const GeneratedTable kWideEastAsianTables[];
extern const size_t kWideEastAsianTableCount;

// Narrow characters that take emoji presentation (two cells) when followed
// by VARIATION SELECTOR-16. Version independent.
extern const Interval kEmojiPresentationOverrides[];
extern const size_t kEmojiPresentationOverrideCount;

} // namespace tables
} // namespace termwidth

#endif // TERMWIDTH_TABLES_H
