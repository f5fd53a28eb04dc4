/**
 * @file table_store.cpp
 * @brief TableStore construction, validation and lookup.
 */

#include "termwidth/table_store.h"

#include "tables/tables.h"
#include "termwidth/ascii_scan.h"
#include "termwidth/error.h"

#include <algorithm>

namespace termwidth {

namespace {

void validate_table(const VersionTables& entry, TableCategory category) {
  if (!entry.table(category).is_valid()) {
    throw TermwidthException(ErrorCode::INVALID_TABLE,
                             std::string(table_category_to_string(category)) +
                                 " table is not sorted and disjoint",
                             entry.version);
  }
}

// Printable ASCII code points that classify to something other than 1.
bool collect_ascii_stops(const VersionTables& entry, const IntervalTable& emoji_overrides,
                         AsciiStops& stops) {
  stops = AsciiStops();
  for (uint32_t cp = PRINTABLE_ASCII_FIRST; cp <= PRINTABLE_ASCII_LAST; ++cp) {
    if (entry.zero_width.contains(cp) || entry.wide_eastasian.contains(cp) ||
        emoji_overrides.contains(cp)) {
      if (!stops.add(cp))
        return false;
    }
  }
  return true;
}

std::vector<VersionTables> builtin_versions() {
  using namespace tables;

  if (kZeroWidthTableCount != kWideEastAsianTableCount) {
    throw TermwidthException(
        Diagnostic(ErrorCode::INTERNAL_ERROR, ErrorSeverity::FATAL,
                   "generated zero-width and wide tables cover different versions"));
  }

  std::vector<VersionTables> versions;
  versions.reserve(kZeroWidthTableCount);
  for (size_t i = 0; i < kZeroWidthTableCount; ++i) {
    const GeneratedTable& zero = kZeroWidthTables[i];
    const GeneratedTable& wide = kWideEastAsianTables[i];
    if (zero.version != wide.version) {
      throw TermwidthException(Diagnostic(ErrorCode::INTERNAL_ERROR, ErrorSeverity::FATAL,
                                          "generated tables are not aligned by version",
                                          std::string(zero.version)));
    }
    versions.emplace_back(std::string(zero.version), IntervalTable(zero.intervals, zero.size),
                          IntervalTable(wide.intervals, wide.size));
  }
  return versions;
}

} // namespace

const char* table_category_to_string(TableCategory category) {
  switch (category) {
  case TableCategory::ZERO_WIDTH:
    return "zero_width";
  case TableCategory::WIDE_EASTASIAN:
    return "wide_eastasian";
  }
  return "unknown";
}

TableStore::TableStore(std::vector<VersionTables> versions, IntervalTable emoji_overrides)
    : versions_(std::move(versions)), emoji_overrides_(emoji_overrides) {
  if (versions_.empty()) {
    throw TermwidthException(Diagnostic(ErrorCode::EMPTY_TABLE_STORE, ErrorSeverity::FATAL,
                                        "table store requires at least one Unicode version"));
  }

  if (!emoji_overrides_.is_valid()) {
    throw TermwidthException(ErrorCode::INVALID_TABLE,
                             "emoji presentation table is not sorted and disjoint");
  }

  for (auto& entry : versions_) {
    entry.value = parse_version(entry.version);
    validate_table(entry, TableCategory::ZERO_WIDTH);
    validate_table(entry, TableCategory::WIDE_EASTASIAN);
    entry.ascii_fast_path = collect_ascii_stops(entry, emoji_overrides_, entry.ascii_stops);
  }

  std::stable_sort(versions_.begin(), versions_.end(),
                   [](const VersionTables& a, const VersionTables& b) {
                     return compare_versions(a.value, b.value) < 0;
                   });

  names_.reserve(versions_.size());
  for (size_t i = 0; i < versions_.size(); ++i) {
    if (i > 0 && compare_versions(versions_[i - 1].value, versions_[i].value) == 0) {
      throw TermwidthException(ErrorCode::DUPLICATE_VERSION,
                               "Unicode version supplied more than once", versions_[i].version);
    }
    names_.push_back(versions_[i].version);
  }
}

const TableStore& TableStore::builtin() {
  static const TableStore store(
      builtin_versions(),
      IntervalTable(tables::kEmojiPresentationOverrides, tables::kEmojiPresentationOverrideCount));
  return store;
}

size_t TableStore::index_of(std::string_view version) const {
  for (size_t i = 0; i < names_.size(); ++i) {
    if (names_[i] == version)
      return i;
  }
  return names_.size();
}

const VersionTables& TableStore::version_tables(std::string_view version) const {
  size_t index = index_of(version);
  if (index == size()) {
    throw TermwidthException(ErrorCode::UNKNOWN_TABLE_VERSION,
                             "no width tables for this Unicode version", std::string(version));
  }
  return versions_[index];
}

const IntervalTable& TableStore::tables_for(std::string_view version,
                                            TableCategory category) const {
  return version_tables(version).table(category);
}

} // namespace termwidth
