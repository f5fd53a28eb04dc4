/**
 * Test helpers for termwidth unit tests.
 *
 * Provides a small synthetic table store, independent of the generated
 * Unicode data, and a resolver configuration that records advisories.
 */

#ifndef TERMWIDTH_TEST_HELPERS_H
#define TERMWIDTH_TEST_HELPERS_H

#include "termwidth/error.h"
#include "termwidth/table_store.h"
#include "termwidth/version_resolver.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace test_tables {

using termwidth::Interval;

// Every version shares the same shape so tests can reason about any of them;
// 5.0.0 additionally widens U+2000..U+2FFF.
inline constexpr Interval kZero[] = {{0x0300, 0x036F}, {0x200B, 0x200F}};
inline constexpr Interval kWide[] = {{0x1100, 0x115F}, {0x4E00, 0x9FFF}};
inline constexpr Interval kWideV5[] = {{0x1100, 0x115F}, {0x2000, 0x2FFF}, {0x4E00, 0x9FFF}};
inline constexpr Interval kOverrides[] = {{0x0023, 0x0023}, {0x2764, 0x2764}};

// Zero-width table that swallows the ASCII digits.
inline constexpr Interval kZeroDigits[] = {{0x0030, 0x0039}};

/// Versions 4.1.0, 5.0.0, 8.0.0 and 10.0.0, supplied out of order.
inline termwidth::TableStore make_store() {
  std::vector<termwidth::VersionTables> versions;
  versions.emplace_back("10.0.0", kZero, kWide);
  versions.emplace_back("4.1.0", kZero, kWide);
  versions.emplace_back("8.0.0", kZero, kWide);
  versions.emplace_back("5.0.0", kZero, kWideV5);
  return termwidth::TableStore(std::move(versions), kOverrides);
}

} // namespace test_tables

/**
 * Resolver options with an in-memory override source and a collector that
 * records every advisory.
 */
struct CapturingOptions {
  std::shared_ptr<termwidth::FixedOverrideSource> source =
      std::make_shared<termwidth::FixedOverrideSource>();
  termwidth::ErrorCollector warnings;

  termwidth::ResolverOptions options() {
    termwidth::ResolverOptions opts;
    opts.override_source = source;
    opts.warning_callback = termwidth::collect_into(warnings);
    return opts;
  }

  bool has_warning(termwidth::ErrorCode code) const {
    for (const auto& w : warnings.errors()) {
      if (w.code == code)
        return true;
    }
    return false;
  }
};

#endif // TERMWIDTH_TEST_HELPERS_H
