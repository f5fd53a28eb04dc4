/**
 * @file interval_table.cpp
 * @brief Interval table validation helpers.
 */

#include "termwidth/interval_table.h"

namespace termwidth {

bool IntervalTable::is_valid() const {
  for (size_t i = 0; i < size_; ++i) {
    if (data_[i].start > data_[i].end)
      return false;
    if (i > 0 && data_[i].start <= data_[i - 1].end)
      return false;
  }
  return true;
}

} // namespace termwidth
