/**
 * @file width_cache.h
 * @brief Memoizing front end for WidthClassifier.
 *
 * CachedWidthClassifier keeps the resolved version per token and the width
 * per (code point, token) in bounded LRU caches. The wrapped classifier is
 * untouched, so results are identical with or without the cache.
 *
 * ## Cache keys and "auto"
 *
 * "auto" depends on the override source, which may change between calls.
 * Keys are therefore built from VersionResolver::expand_auto(): "auto" is
 * replaced by the override value (or "latest") read at call time, so a
 * changed override never returns a stale entry.
 *
 * ## Advisories
 *
 * Version advisories are raised when a token is first resolved. A token
 * served from the cache does not raise them again.
 */

#ifndef TERMWIDTH_WIDTH_CACHE_H
#define TERMWIDTH_WIDTH_CACHE_H

#include "termwidth/lru_cache.h"
#include "termwidth/width.h"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace termwidth {

/**
 * @brief Options for configuring CachedWidthClassifier.
 */
struct CacheOptions {
  /// Disable to pass every call straight to the classifier.
  bool enabled = true;

  /// Maximum number of memoized (code point, version) widths.
  size_t capacity = 1000;

  /// Maximum number of memoized version tokens.
  size_t resolve_capacity = 8;
};

struct WidthCacheKey {
  uint32_t codepoint;
  std::string version;

  bool operator==(const WidthCacheKey& other) const {
    return codepoint == other.codepoint && version == other.version;
  }
};

struct WidthCacheKeyHash {
  size_t operator()(const WidthCacheKey& key) const {
    size_t h = std::hash<std::string>()(key.version);
    return h ^ (std::hash<uint32_t>()(key.codepoint) + 0x9e3779b9 + (h << 6) + (h >> 2));
  }
};

class CachedWidthClassifier {
public:
  /// @p classifier must outlive the cache.
  explicit CachedWidthClassifier(const WidthClassifier& classifier, CacheOptions options = {});

  int width_of(uint32_t cp, std::string_view version = AUTO_VERSION);

  /// Strings are not cached; only the version resolution is.
  int string_width(std::u32string_view text, std::optional<size_t> limit = std::nullopt,
                   std::string_view version = AUTO_VERSION);

  int utf8_width(std::string_view text, std::optional<size_t> limit = std::nullopt,
                 std::string_view version = AUTO_VERSION);

  std::string resolve(std::string_view token);

  /// Width cache hits and misses since construction or the last clear().
  size_t hits() const { return hits_.load(std::memory_order_relaxed); }
  size_t misses() const { return misses_.load(std::memory_order_relaxed); }

  size_t cached_widths() const { return widths_.size(); }
  size_t cached_versions() const { return versions_.size(); }

  void clear();

  const WidthClassifier& classifier() const { return classifier_; }
  const CacheOptions& options() const { return options_; }

private:
  const VersionTables& resolve_tables(std::string_view token);

  const WidthClassifier& classifier_;
  CacheOptions options_;
  LruCache<std::string, size_t> versions_;
  LruCache<WidthCacheKey, int, WidthCacheKeyHash> widths_;
  std::atomic<size_t> hits_{0};
  std::atomic<size_t> misses_{0};
};

} // namespace termwidth

#endif // TERMWIDTH_WIDTH_CACHE_H
