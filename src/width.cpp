/**
 * @file width.cpp
 * @brief Width classification of code points and strings.
 */

#include "termwidth/width.h"

#include "termwidth/ascii_scan.h"
#include "termwidth/utf8.h"

#include <algorithm>
#include <iostream>
#include <utility>

namespace termwidth {

namespace {

constexpr uint32_t C0_END = 0x20;         // U+0000..U+001F
constexpr uint32_t C1_FIRST = 0x7F;       // DELETE, then the C1 controls
constexpr uint32_t C1_END = 0xA0;         // U+007F..U+009F
constexpr uint32_t VARIATION_SELECTOR_FIRST = 0xFE00;
constexpr uint32_t VARIATION_SELECTOR_LAST = 0xFE0F;

} // namespace

int classify_codepoint(uint32_t cp, const VersionTables& tables,
                       const IntervalTable& emoji_overrides) {
  if (cp < C0_END || (cp >= C1_FIRST && cp < C1_END) || cp > MAX_CODEPOINT) {
    return WIDTH_UNPRINTABLE;
  }

  if (tables.zero_width.contains(cp)) {
    return 0;
  }

  if (tables.wide_eastasian.contains(cp)) {
    return 2;
  }

  if (cp >= VARIATION_SELECTOR_FIRST && cp <= VARIATION_SELECTOR_LAST) {
    return 0;
  }

  if (emoji_overrides.contains(cp)) {
    return 2;
  }

  return 1;
}

//-----------------------------------------------------------------------------
// WidthClassifier
//-----------------------------------------------------------------------------

WidthClassifier::WidthClassifier() : WidthClassifier(TableStore::builtin()) {}

WidthClassifier::WidthClassifier(const TableStore& store, ResolverOptions options)
    : store_(store), resolver_(store, std::move(options)) {}

int WidthClassifier::width_of(uint32_t cp, std::string_view version) const {
  return classify_codepoint(cp, tables(version), store_.emoji_overrides());
}

int WidthClassifier::string_width(std::u32string_view text, std::optional<size_t> limit,
                                  std::string_view version) const {
  return measure(text, limit, tables(version));
}

int WidthClassifier::utf8_width(std::string_view text, std::optional<size_t> limit,
                                std::string_view version) const {
  return measure_utf8(text, limit, tables(version));
}

int WidthClassifier::measure(std::u32string_view text, std::optional<size_t> limit,
                             const VersionTables& tables) const {
  const size_t end = limit ? std::min(*limit, text.size()) : text.size();
  const IntervalTable& overrides = store_.emoji_overrides();

  int64_t width = 0;
  size_t i = 0;
  while (i < end) {
    if (tables.ascii_fast_path) {
      const size_t run = printable_ascii_prefix(text.data() + i, end - i, tables.ascii_stops);
      width += static_cast<int64_t>(run);
      i += run;
      if (i == end)
        break;
    }

    const int w = classify_codepoint(static_cast<uint32_t>(text[i]), tables, overrides);
    if (w < 0) {
      return WIDTH_UNPRINTABLE;
    }
    width += w;
    ++i;
  }
  return saturate_width(width);
}

int WidthClassifier::measure_utf8(std::string_view text, std::optional<size_t> limit,
                                  const VersionTables& tables) const {
  const size_t max_codepoints = limit ? *limit : text.size();
  const IntervalTable& overrides = store_.emoji_overrides();
  const auto* bytes = reinterpret_cast<const uint8_t*>(text.data());

  int64_t width = 0;
  size_t pos = 0;
  size_t count = 0;
  while (pos < text.size() && count < max_codepoints) {
    if (tables.ascii_fast_path) {
      size_t run = printable_ascii_prefix(bytes + pos, text.size() - pos, tables.ascii_stops);
      run = std::min(run, max_codepoints - count);
      width += static_cast<int64_t>(run);
      pos += run;
      count += run;
      if (pos == text.size() || count == max_codepoints)
        break;
    }

    uint32_t cp;
    const size_t len = utf8_decode(text, pos, cp);
    const int w = classify_codepoint(cp, tables, overrides);
    if (w < 0) {
      return WIDTH_UNPRINTABLE;
    }
    width += w;
    pos += len;
    ++count;
  }
  return saturate_width(width);
}

//-----------------------------------------------------------------------------
// Process-wide defaults
//-----------------------------------------------------------------------------

const WidthClassifier& default_classifier() {
  static const WidthClassifier classifier = [] {
    ResolverOptions options = ResolverOptions::from_environment();
    options.warning_callback = [](const Diagnostic& diagnostic) {
      std::cerr << "termwidth: " << diagnostic.to_string() << "\n";
    };
    return WidthClassifier(TableStore::builtin(), std::move(options));
  }();
  return classifier;
}

int width_of(uint32_t cp, std::string_view version) {
  return default_classifier().width_of(cp, version);
}

int string_width(std::u32string_view text, std::optional<size_t> limit,
                 std::string_view version) {
  return default_classifier().string_width(text, limit, version);
}

int utf8_width(std::string_view text, std::optional<size_t> limit, std::string_view version) {
  return default_classifier().utf8_width(text, limit, version);
}

std::string resolve(std::string_view token) { return default_classifier().resolve(token); }

const std::vector<std::string>& supported_versions() {
  return default_classifier().supported_versions();
}

} // namespace termwidth
