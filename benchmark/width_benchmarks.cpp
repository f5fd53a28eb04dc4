#include <benchmark/benchmark.h>
#include "termwidth.h"
#include <string>

using termwidth::CachedWidthClassifier;
using termwidth::ResolverOptions;
using termwidth::TableStore;
using termwidth::WidthClassifier;

// Classifier independent of UNICODE_VERSION and without warnings
static const WidthClassifier& bench_classifier() {
  static const WidthClassifier classifier(TableStore::builtin(), ResolverOptions{});
  return classifier;
}

// Repeat a sample until the string reaches at least `bytes` bytes
static std::string repeat_to(const std::string& sample, size_t bytes) {
  std::string out;
  out.reserve(bytes + sample.size());
  while (out.size() < bytes) {
    out += sample;
  }
  return out;
}

// ============================================================================
// BENCHMARK: Single code point classification
// ============================================================================

static void BM_WidthOf(benchmark::State& state, uint32_t cp) {
  const WidthClassifier& classifier = bench_classifier();
  for (auto _ : state) {
    benchmark::DoNotOptimize(classifier.width_of(cp, "latest"));
  }
}
BENCHMARK_CAPTURE(BM_WidthOf, ascii, uint32_t{'a'});
BENCHMARK_CAPTURE(BM_WidthOf, combining, uint32_t{0x0301});
BENCHMARK_CAPTURE(BM_WidthOf, cjk, uint32_t{0x4E00});
BENCHMARK_CAPTURE(BM_WidthOf, emoji, uint32_t{0x1F600});
BENCHMARK_CAPTURE(BM_WidthOf, unassigned, uint32_t{0x10FFFF});

// Resolves the version on each call; compare with BM_WidthOf
static void BM_WidthOf_Partial(benchmark::State& state) {
  const WidthClassifier& classifier = bench_classifier();
  for (auto _ : state) {
    benchmark::DoNotOptimize(classifier.width_of(0x4E00, "9.0"));
  }
}
BENCHMARK(BM_WidthOf_Partial);

static void BM_CachedWidthOf(benchmark::State& state) {
  CachedWidthClassifier cached(bench_classifier());
  for (auto _ : state) {
    benchmark::DoNotOptimize(cached.width_of(0x1F600, "9.0"));
  }
  state.counters["Hits"] = static_cast<double>(cached.hits());
}
BENCHMARK(BM_CachedWidthOf);

// ============================================================================
// BENCHMARK: String width
// ============================================================================

static void BM_Utf8Width(benchmark::State& state, const std::string& sample) {
  const WidthClassifier& classifier = bench_classifier();
  std::string text = repeat_to(sample, static_cast<size_t>(state.range(0)));

  for (auto _ : state) {
    benchmark::DoNotOptimize(classifier.utf8_width(text, std::nullopt, "latest"));
  }
  state.SetBytesProcessed(static_cast<int64_t>(text.size() * state.iterations()));
}
BENCHMARK_CAPTURE(BM_Utf8Width, ascii, std::string("The quick brown fox jumps over the lazy dog. "))
    ->Range(64, 64 << 10);
BENCHMARK_CAPTURE(BM_Utf8Width, cjk, std::string("\xE6\x97\xA5\xE6\x9C\xAC\xE8\xAA\x9E"))
    ->Range(64, 64 << 10);
BENCHMARK_CAPTURE(BM_Utf8Width, mixed,
                  std::string("status: \xE2\x9C\x94 ok \xF0\x9F\x98\x80 caf\xC3\xA9 "))
    ->Range(64, 64 << 10);

static void BM_StringWidth_Ascii(benchmark::State& state) {
  const WidthClassifier& classifier = bench_classifier();
  std::u32string text(static_cast<size_t>(state.range(0)), U'x');

  for (auto _ : state) {
    benchmark::DoNotOptimize(classifier.string_width(text, std::nullopt, "latest"));
  }
  state.SetItemsProcessed(static_cast<int64_t>(text.size() * state.iterations()));
}
BENCHMARK(BM_StringWidth_Ascii)->Range(64, 64 << 10);

// Scalar classification of the same text, without the ASCII fast path
static void BM_StringWidth_PerCodePoint(benchmark::State& state) {
  const WidthClassifier& classifier = bench_classifier();
  const termwidth::VersionTables& tables = classifier.tables("latest");
  const termwidth::IntervalTable& overrides = classifier.store().emoji_overrides();
  std::u32string text(static_cast<size_t>(state.range(0)), U'x');

  for (auto _ : state) {
    int width = 0;
    for (char32_t c : text) {
      width += termwidth::classify_codepoint(static_cast<uint32_t>(c), tables, overrides);
    }
    benchmark::DoNotOptimize(width);
  }
  state.SetItemsProcessed(static_cast<int64_t>(text.size() * state.iterations()));
}
BENCHMARK(BM_StringWidth_PerCodePoint)->Range(64, 64 << 10);
