/**
 * @file table_store.h
 * @brief Version-indexed store of width interval tables.
 *
 * The store maps each supported Unicode version to its zero-width and
 * East Asian wide tables, and holds the version-independent table of
 * narrow code points that become wide under emoji presentation.
 *
 * A TableStore is immutable once constructed. Any number of threads may
 * query the same store concurrently without synchronization.
 */

#ifndef TERMWIDTH_TABLE_STORE_H
#define TERMWIDTH_TABLE_STORE_H

#include "termwidth/ascii_scan.h"
#include "termwidth/interval_table.h"
#include "termwidth/version.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace termwidth {

enum class TableCategory { ZERO_WIDTH, WIDE_EASTASIAN };

const char* table_category_to_string(TableCategory category);

/**
 * @brief The pair of interval tables for one Unicode version.
 */
struct VersionTables {
  std::string version;
  IntervalTable zero_width;
  IntervalTable wide_eastasian;

  /// Set by TableStore: printable ASCII code points that are not one cell
  /// wide under these tables and the store's emoji overrides.
  AsciiStops ascii_stops;

  /// Set by TableStore: false when ascii_stops could not hold every such
  /// code point, in which case strings are measured without the scan.
  bool ascii_fast_path = false;

  /// Parsed form of @ref version, set by TableStore.
  VersionValue value;

  VersionTables() = default;
  VersionTables(std::string v, IntervalTable zero, IntervalTable wide)
      : version(std::move(v)), zero_width(zero), wide_eastasian(wide) {}

  const IntervalTable& table(TableCategory category) const {
    return category == TableCategory::ZERO_WIDTH ? zero_width : wide_eastasian;
  }
};

class TableStore {
public:
  /**
   * @brief Build a store from per-version tables.
   *
   * Versions may be given in any order; they are sorted by version
   * ordering.
   *
   * @throws TermwidthException with EMPTY_TABLE_STORE if @p versions is
   *         empty, MALFORMED_VERSION for an unparsable version string,
   *         DUPLICATE_VERSION if two entries parse to the same version, or
   *         INVALID_TABLE if any table is unsorted or overlapping.
   */
  TableStore(std::vector<VersionTables> versions, IntervalTable emoji_overrides = {});

  /**
   * @brief The store built from the generated Unicode data.
   *
   * Built on first use; the reference stays valid for the life of the
   * process.
   */
  static const TableStore& builtin();

  /// Supported versions in ascending version order. Never empty.
  const std::vector<std::string>& supported_versions() const { return names_; }

  /// @throws TermwidthException with UNKNOWN_TABLE_VERSION.
  const IntervalTable& tables_for(std::string_view version, TableCategory category) const;

  /// @throws TermwidthException with UNKNOWN_TABLE_VERSION.
  const VersionTables& version_tables(std::string_view version) const;

  /// Tables by position in supported_versions(); @p index must be < size().
  const VersionTables& version_tables(size_t index) const { return versions_[index]; }

  /// Position of @p version in supported_versions(), or size() if absent.
  size_t index_of(std::string_view version) const;

  bool contains(std::string_view version) const { return index_of(version) != size(); }

  size_t size() const { return versions_.size(); }

  const IntervalTable& emoji_overrides() const { return emoji_overrides_; }

  const std::string& earliest() const { return names_.front(); }
  const std::string& latest() const { return names_.back(); }

private:
  std::vector<VersionTables> versions_;
  std::vector<std::string> names_;
  IntervalTable emoji_overrides_;
};

} // namespace termwidth

#endif // TERMWIDTH_TABLE_STORE_H
