/**
 * @file width_cache.cpp
 * @brief Implementation of CachedWidthClassifier.
 */

#include "termwidth/width_cache.h"

namespace termwidth {

CachedWidthClassifier::CachedWidthClassifier(const WidthClassifier& classifier,
                                             CacheOptions options)
    : classifier_(classifier), options_(options),
      versions_(options.enabled ? options.resolve_capacity : 0),
      widths_(options.enabled ? options.capacity : 0) {}

const VersionTables& CachedWidthClassifier::resolve_tables(std::string_view token) {
  const VersionResolver& resolver = classifier_.resolver();
  std::string key = resolver.expand_auto(token);

  if (auto index = versions_.get(key)) {
    return classifier_.store().version_tables(*index);
  }

  size_t index = resolver.resolve_index(key);
  versions_.put(key, index);
  return classifier_.store().version_tables(index);
}

int CachedWidthClassifier::width_of(uint32_t cp, std::string_view version) {
  if (!options_.enabled) {
    return classifier_.width_of(cp, version);
  }

  WidthCacheKey key{cp, classifier_.resolver().expand_auto(version)};
  if (auto width = widths_.get(key)) {
    hits_.fetch_add(1, std::memory_order_relaxed);
    return *width;
  }

  misses_.fetch_add(1, std::memory_order_relaxed);
  int width =
      classify_codepoint(cp, resolve_tables(key.version), classifier_.store().emoji_overrides());
  widths_.put(key, width);
  return width;
}

int CachedWidthClassifier::string_width(std::u32string_view text, std::optional<size_t> limit,
                                        std::string_view version) {
  if (!options_.enabled) {
    return classifier_.string_width(text, limit, version);
  }
  return classifier_.measure(text, limit, resolve_tables(version));
}

int CachedWidthClassifier::utf8_width(std::string_view text, std::optional<size_t> limit,
                                      std::string_view version) {
  if (!options_.enabled) {
    return classifier_.utf8_width(text, limit, version);
  }
  return classifier_.measure_utf8(text, limit, resolve_tables(version));
}

std::string CachedWidthClassifier::resolve(std::string_view token) {
  if (!options_.enabled) {
    return classifier_.resolve(token);
  }
  return resolve_tables(token).version;
}

void CachedWidthClassifier::clear() {
  versions_.clear();
  widths_.clear();
  hits_.store(0, std::memory_order_relaxed);
  misses_.store(0, std::memory_order_relaxed);
}

} // namespace termwidth
