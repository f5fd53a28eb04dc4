/**
 * @file version_resolver_test.cpp
 * @brief Tests for Unicode version token resolution.
 */

#include "termwidth/version_resolver.h"

#include "test_helpers.h"

#include <cstdlib>
#include <gtest/gtest.h>

using namespace termwidth;

class VersionResolverTest : public ::testing::Test {
protected:
  TableStore store = test_tables::make_store();
  CapturingOptions capture;

  VersionResolver make_resolver() { return VersionResolver(store, capture.options()); }
};

// =============================================================================
// Explicit tokens
// =============================================================================

TEST_F(VersionResolverTest, LatestIsNewest) {
  VersionResolver resolver = make_resolver();
  EXPECT_EQ(resolver.resolve("latest"), "10.0.0");
  EXPECT_EQ(resolver.resolve_index("latest"), 3u);
  EXPECT_FALSE(capture.warnings.has_errors());
}

TEST_F(VersionResolverTest, ExactMatchIsSilent) {
  VersionResolver resolver = make_resolver();
  for (const auto& version : store.supported_versions()) {
    EXPECT_EQ(resolver.resolve(version), version);
  }
  EXPECT_FALSE(capture.warnings.has_errors());
}

TEST_F(VersionResolverTest, BetweenVersionsUsesNearestLower) {
  VersionResolver resolver = make_resolver();
  EXPECT_EQ(resolver.resolve("4.9.9"), "4.1.0");
  EXPECT_EQ(resolver.resolve("7.0.0"), "5.0.0");
  EXPECT_EQ(resolver.resolve("9.9"), "8.0.0");

  ASSERT_EQ(capture.warnings.error_count(), 3u);
  const Diagnostic& first = capture.warnings.errors()[0];
  EXPECT_EQ(first.code, ErrorCode::VERSION_SUBSTITUTED);
  EXPECT_EQ(first.severity, ErrorSeverity::WARNING);
  EXPECT_EQ(first.context, "4.9.9");
  EXPECT_NE(first.message.find("4.1.0"), std::string::npos);
}

TEST_F(VersionResolverTest, PartialVersionMatchesPaddedVersion) {
  VersionResolver resolver = make_resolver();
  EXPECT_EQ(resolver.resolve("8.0"), "8.0.0");
  EXPECT_EQ(resolver.resolve("10"), "10.0.0");
  // Different spelling of a supported version is still reported.
  EXPECT_TRUE(capture.has_warning(ErrorCode::VERSION_SUBSTITUTED));
}

TEST_F(VersionResolverTest, NumericOrderingNotLexical) {
  VersionResolver resolver = make_resolver();
  // Lexically "9.0.0" > "10.0.0"; numerically 9 falls below 10.
  EXPECT_EQ(resolver.resolve("9.0.0"), "8.0.0");
}

TEST_F(VersionResolverTest, BelowRangeFallsBackToEarliest) {
  VersionResolver resolver = make_resolver();
  EXPECT_EQ(resolver.resolve("1"), "4.1.0");
  EXPECT_EQ(resolver.resolve("4.0.9"), "4.1.0");

  ASSERT_EQ(capture.warnings.error_count(), 2u);
  EXPECT_EQ(capture.warnings.errors()[0].code, ErrorCode::VERSION_BELOW_RANGE);
  EXPECT_NE(capture.warnings.errors()[0].message.find("lower than any available"),
            std::string::npos);
}

TEST_F(VersionResolverTest, AboveRangeUsesLatest) {
  VersionResolver resolver = make_resolver();
  EXPECT_EQ(resolver.resolve("99"), "10.0.0");
  EXPECT_TRUE(capture.has_warning(ErrorCode::VERSION_SUBSTITUTED));
}

TEST_F(VersionResolverTest, MalformedTokenThrows) {
  VersionResolver resolver = make_resolver();
  for (const char* bad : {"", "newest", "9.x", "9..0", "v9"}) {
    try {
      resolver.resolve(bad);
      FAIL() << "Expected TermwidthException for '" << bad << "'";
    } catch (const TermwidthException& e) {
      EXPECT_EQ(e.code(), ErrorCode::MALFORMED_VERSION);
    }
  }
}

TEST_F(VersionResolverTest, ResolutionIsIdempotent) {
  VersionResolver resolver = make_resolver();
  for (const char* token : {"latest", "auto", "1", "4.9.9", "8.0", "99", "5.0.0"}) {
    std::string once = resolver.resolve(token);
    EXPECT_EQ(resolver.resolve(once), once) << token;
  }
}

TEST_F(VersionResolverTest, NoCallbackIsSilent) {
  VersionResolver resolver(store);
  EXPECT_EQ(resolver.resolve("4.9.9"), "4.1.0");
  EXPECT_EQ(resolver.resolve("auto"), "10.0.0");
}

// =============================================================================
// "auto" and override sources
// =============================================================================

TEST_F(VersionResolverTest, AutoWithoutOverrideIsLatest) {
  VersionResolver resolver = make_resolver();
  EXPECT_EQ(resolver.resolve("auto"), "10.0.0");
  EXPECT_EQ(resolver.expand_auto("auto"), "latest");
}

TEST_F(VersionResolverTest, AutoFollowsOverride) {
  VersionResolver resolver = make_resolver();
  capture.source->set("5.0.0");
  EXPECT_EQ(resolver.resolve("auto"), "5.0.0");
  EXPECT_FALSE(capture.warnings.has_errors());

  capture.source->set("8.0");
  EXPECT_EQ(resolver.resolve("auto"), "8.0.0");
  EXPECT_TRUE(capture.has_warning(ErrorCode::VERSION_SUBSTITUTED));
}

TEST_F(VersionResolverTest, OverrideIsReadOnEveryCall) {
  VersionResolver resolver = make_resolver();
  capture.source->set("4.1.0");
  EXPECT_EQ(resolver.resolve("auto"), "4.1.0");
  capture.source->set(std::nullopt);
  EXPECT_EQ(resolver.resolve("auto"), "10.0.0");
}

TEST_F(VersionResolverTest, OverrideOnlyAffectsAuto) {
  VersionResolver resolver = make_resolver();
  capture.source->set("4.1.0");
  EXPECT_EQ(resolver.resolve("latest"), "10.0.0");
  EXPECT_EQ(resolver.resolve("8.0.0"), "8.0.0");
  EXPECT_EQ(resolver.expand_auto("8.0.0"), "8.0.0");
}

TEST_F(VersionResolverTest, MalformedOverrideThrows) {
  VersionResolver resolver = make_resolver();
  capture.source->set("not-a-version");
  EXPECT_THROW(resolver.resolve("auto"), TermwidthException);

  capture.source->set("auto");
  EXPECT_THROW(resolver.resolve("auto"), TermwidthException);
}

TEST_F(VersionResolverTest, ExpandAutoAgreesWithResolve) {
  VersionResolver resolver = make_resolver();
  for (const char* value : {"5.0.0", "9", "1"}) {
    capture.source->set(std::string(value));
    EXPECT_EQ(resolver.resolve(resolver.expand_auto("auto")), resolver.resolve("auto"));
  }
}

// =============================================================================
// Environment override
// =============================================================================

class EnvironmentOverrideTest : public ::testing::Test {
protected:
  static constexpr const char* kVariable = "TERMWIDTH_TEST_UNICODE_VERSION";

  void TearDown() override { unsetenv(kVariable); }
};

TEST_F(EnvironmentOverrideTest, UnsetIsAbsent) {
  unsetenv(kVariable);
  EnvironmentOverrideSource source(kVariable);
  EXPECT_FALSE(source.value().has_value());
}

TEST_F(EnvironmentOverrideTest, EmptyIsAbsent) {
  setenv(kVariable, "", 1);
  EnvironmentOverrideSource source(kVariable);
  EXPECT_FALSE(source.value().has_value());
}

TEST_F(EnvironmentOverrideTest, ValueIsReturned) {
  setenv(kVariable, "8.0.0", 1);
  EnvironmentOverrideSource source(kVariable);
  ASSERT_TRUE(source.value().has_value());
  EXPECT_EQ(*source.value(), "8.0.0");
}

TEST_F(EnvironmentOverrideTest, ResolverReadsVariable) {
  TableStore store = test_tables::make_store();
  ResolverOptions options;
  options.override_source = std::make_shared<EnvironmentOverrideSource>(kVariable);
  VersionResolver resolver(store, options);

  EXPECT_EQ(resolver.resolve("auto"), "10.0.0");
  setenv(kVariable, "5.0.0", 1);
  EXPECT_EQ(resolver.resolve("auto"), "5.0.0");
  setenv(kVariable, "", 1);
  EXPECT_EQ(resolver.resolve("auto"), "10.0.0");
}

TEST(ResolverOptionsTest, FromEnvironmentReadsUnicodeVersion) {
  ResolverOptions options = ResolverOptions::from_environment();
  auto source = std::dynamic_pointer_cast<const EnvironmentOverrideSource>(options.override_source);
  ASSERT_NE(source, nullptr);
  EXPECT_EQ(source->variable(), "UNICODE_VERSION");
  EXPECT_FALSE(options.warning_callback);
}
