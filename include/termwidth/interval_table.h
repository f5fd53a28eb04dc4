/**
 * @file interval_table.h
 * @brief Sorted code point interval tables and their binary search.
 *
 * An interval table is an ascending list of disjoint, inclusive
 * [start, end] code point ranges that share one width classification.
 * Tables are produced offline and are only read at runtime, so
 * IntervalTable is a non-owning view: the underlying array must outlive
 * every IntervalTable that refers to it. The generated tables have static
 * storage duration, which makes the built-in views valid for the whole
 * process.
 */

#ifndef TERMWIDTH_INTERVAL_TABLE_H
#define TERMWIDTH_INTERVAL_TABLE_H

#include <cstddef>
#include <cstdint>

namespace termwidth {

/// Inclusive code point range.
struct Interval {
  uint32_t start;
  uint32_t end;
};

/**
 * @brief Binary search for @p cp in a sorted, non-overlapping interval array.
 *
 * Queries outside [table[0].start, table[size-1].end] return false without
 * searching. Ordering is not re-checked here; TableStore validates tables
 * when they are registered.
 *
 * @return true if some interval contains @p cp.
 */
inline bool bisearch(uint32_t cp, const Interval* table, size_t size) {
  if (size == 0 || cp < table[0].start || cp > table[size - 1].end) {
    return false;
  }

  size_t lbound = 0;
  size_t ubound = size - 1;
  while (lbound <= ubound) {
    size_t mid = lbound + (ubound - lbound) / 2;
    if (cp > table[mid].end) {
      lbound = mid + 1;
    } else if (cp < table[mid].start) {
      if (mid == 0)
        return false;
      ubound = mid - 1;
    } else {
      return true;
    }
  }
  return false;
}

/**
 * @brief Read-only view over an interval array.
 */
class IntervalTable {
public:
  IntervalTable() : data_(nullptr), size_(0) {}
  IntervalTable(const Interval* data, size_t size) : data_(data), size_(size) {}

  template <size_t N>
  IntervalTable(const Interval (&data)[N]) : data_(data), size_(N) {}

  bool contains(uint32_t cp) const { return bisearch(cp, data_, size_); }

  /// True if the intervals are ascending, each with start <= end, and disjoint.
  bool is_valid() const;

  const Interval* data() const { return data_; }
  size_t size() const { return size_; }
  bool empty() const { return size_ == 0; }

  const Interval* begin() const { return data_; }
  const Interval* end() const { return data_ + size_; }

  const Interval& operator[](size_t i) const { return data_[i]; }

private:
  const Interval* data_;
  size_t size_;
};

} // namespace termwidth

#endif // TERMWIDTH_INTERVAL_TABLE_H
