/**
 * @file width_cache_test.cpp
 * @brief Tests for the memoizing width classifier.
 */

#include "termwidth/width_cache.h"

#include "test_helpers.h"

#include <gtest/gtest.h>

using namespace termwidth;

class WidthCacheTest : public ::testing::Test {
protected:
  CapturingOptions capture;
  WidthClassifier classifier{TableStore::builtin(), capture.options()};
};

TEST_F(WidthCacheTest, MatchesUncachedClassifier) {
  CachedWidthClassifier cached(classifier);
  for (uint32_t cp : {0x41u, 0x1Bu, 0x0301u, 0x4E00u, 0x1F600u, 0x110000u}) {
    EXPECT_EQ(cached.width_of(cp, "latest"), classifier.width_of(cp, "latest")) << cp;
    EXPECT_EQ(cached.width_of(cp, "8.0.0"), classifier.width_of(cp, "8.0.0")) << cp;
  }
  EXPECT_EQ(cached.utf8_width("コンニチハ"), 10);
  EXPECT_EQ(cached.string_width(U"#\uFE0F"), 2);
  EXPECT_EQ(cached.string_width(U"ab\x1b"), -1);
}

TEST_F(WidthCacheTest, CountsHitsAndMisses) {
  CachedWidthClassifier cached(classifier);
  cached.width_of(0x4E00, "latest");
  cached.width_of(0x4E00, "latest");
  cached.width_of(0x4E00, "latest");
  cached.width_of(0x4E00, "9.0.0");

  EXPECT_EQ(cached.misses(), 2u);
  EXPECT_EQ(cached.hits(), 2u);
  EXPECT_EQ(cached.cached_widths(), 2u);
}

TEST_F(WidthCacheTest, CapacityBoundsEntries) {
  CacheOptions options;
  options.capacity = 4;
  CachedWidthClassifier cached(classifier, options);
  for (uint32_t cp = 0x41; cp < 0x51; ++cp) {
    cached.width_of(cp, "latest");
  }
  EXPECT_EQ(cached.cached_widths(), 4u);
}

TEST_F(WidthCacheTest, OverrideChangeIsHonoured) {
  CachedWidthClassifier cached(classifier);
  capture.source->set("8.0.0");
  EXPECT_EQ(cached.width_of(0x1F600), 1);
  EXPECT_EQ(cached.resolve("auto"), "8.0.0");

  capture.source->set("9.0.0");
  EXPECT_EQ(cached.width_of(0x1F600), 2);
  EXPECT_EQ(cached.resolve("auto"), "9.0.0");

  capture.source->set(std::nullopt);
  EXPECT_EQ(cached.resolve("auto"), TableStore::builtin().latest());
}

TEST_F(WidthCacheTest, AdvisoriesRaisedOnFirstResolution) {
  CachedWidthClassifier cached(classifier);
  EXPECT_EQ(cached.resolve("4.9.9"), "4.1.0");
  EXPECT_EQ(cached.resolve("4.9.9"), "4.1.0");
  EXPECT_EQ(cached.width_of('a', "4.9.9"), 1);
  EXPECT_EQ(capture.warnings.error_count(), 1u);
  EXPECT_EQ(cached.cached_versions(), 1u);
}

TEST_F(WidthCacheTest, MalformedVersionNotCached) {
  CachedWidthClassifier cached(classifier);
  EXPECT_THROW(cached.width_of('a', "bogus"), TermwidthException);
  EXPECT_THROW(cached.width_of('a', "bogus"), TermwidthException);
  EXPECT_EQ(cached.cached_versions(), 0u);
  EXPECT_EQ(cached.cached_widths(), 0u);
}

TEST_F(WidthCacheTest, DisabledPassesThrough) {
  CacheOptions options;
  options.enabled = false;
  CachedWidthClassifier cached(classifier, options);

  EXPECT_EQ(cached.width_of(0x4E00), 2);
  EXPECT_EQ(cached.width_of(0x4E00), 2);
  EXPECT_EQ(cached.resolve("8.0"), "8.0.0");
  EXPECT_EQ(cached.hits(), 0u);
  EXPECT_EQ(cached.misses(), 0u);
  EXPECT_EQ(cached.cached_widths(), 0u);
  EXPECT_EQ(cached.cached_versions(), 0u);
}

TEST_F(WidthCacheTest, ClearResetsState) {
  CachedWidthClassifier cached(classifier);
  cached.width_of(0x41, "latest");
  cached.width_of(0x41, "latest");
  cached.clear();

  EXPECT_EQ(cached.hits(), 0u);
  EXPECT_EQ(cached.misses(), 0u);
  EXPECT_EQ(cached.cached_widths(), 0u);
  EXPECT_EQ(cached.cached_versions(), 0u);
}
