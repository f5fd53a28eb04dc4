#include <benchmark/benchmark.h>
#include "termwidth.h"
#include <memory>
#include <string>

using termwidth::FixedOverrideSource;
using termwidth::ResolverOptions;
using termwidth::TableStore;
using termwidth::VersionResolver;

// ============================================================================
// BENCHMARK: Version token resolution
// ============================================================================

static void BM_Resolve(benchmark::State& state, const std::string& token) {
  VersionResolver resolver(TableStore::builtin());
  for (auto _ : state) {
    benchmark::DoNotOptimize(resolver.resolve_index(token));
  }
}
BENCHMARK_CAPTURE(BM_Resolve, latest, std::string("latest"));
BENCHMARK_CAPTURE(BM_Resolve, exact_newest, std::string("15.1.0"));
BENCHMARK_CAPTURE(BM_Resolve, exact_oldest, std::string("4.1.0"));
BENCHMARK_CAPTURE(BM_Resolve, partial, std::string("8.0"));
BENCHMARK_CAPTURE(BM_Resolve, below_range, std::string("1"));

static void BM_Resolve_AutoOverride(benchmark::State& state) {
  ResolverOptions options;
  options.override_source = std::make_shared<FixedOverrideSource>(std::string("12.0"));
  VersionResolver resolver(TableStore::builtin(), options);
  for (auto _ : state) {
    benchmark::DoNotOptimize(resolver.resolve_index("auto"));
  }
}
BENCHMARK(BM_Resolve_AutoOverride);

static void BM_Resolve_Cached(benchmark::State& state) {
  termwidth::WidthClassifier classifier(TableStore::builtin(), ResolverOptions{});
  termwidth::CachedWidthClassifier cached(classifier);
  for (auto _ : state) {
    benchmark::DoNotOptimize(cached.resolve("8.0"));
  }
}
BENCHMARK(BM_Resolve_Cached);

static void BM_ParseVersion(benchmark::State& state) {
  for (auto _ : state) {
    benchmark::DoNotOptimize(termwidth::parse_version("12.1.0"));
  }
}
BENCHMARK(BM_ParseVersion);
