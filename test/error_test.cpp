/**
 * @file error_test.cpp
 * @brief Tests for diagnostics, the error collector and exceptions.
 */

#include "termwidth/error.h"

#include <gtest/gtest.h>

using namespace termwidth;

TEST(ErrorTest, CodeNames) {
  EXPECT_STREQ(error_code_to_string(ErrorCode::NONE), "NONE");
  EXPECT_STREQ(error_code_to_string(ErrorCode::MALFORMED_VERSION), "MALFORMED_VERSION");
  EXPECT_STREQ(error_code_to_string(ErrorCode::VERSION_SUBSTITUTED), "VERSION_SUBSTITUTED");
  EXPECT_STREQ(error_code_to_string(ErrorCode::VERSION_BELOW_RANGE), "VERSION_BELOW_RANGE");
  EXPECT_STREQ(error_code_to_string(ErrorCode::UNKNOWN_TABLE_VERSION), "UNKNOWN_TABLE_VERSION");
  EXPECT_STREQ(error_code_to_string(ErrorCode::INTERNAL_ERROR), "INTERNAL_ERROR");
}

TEST(ErrorTest, SeverityNames) {
  EXPECT_STREQ(error_severity_to_string(ErrorSeverity::WARNING), "WARNING");
  EXPECT_STREQ(error_severity_to_string(ErrorSeverity::ERROR), "ERROR");
  EXPECT_STREQ(error_severity_to_string(ErrorSeverity::FATAL), "FATAL");
}

TEST(ErrorTest, DiagnosticToString) {
  Diagnostic d(ErrorCode::VERSION_SUBSTITUTED, ErrorSeverity::WARNING,
               "Unicode version 8.1 not found, using 8.0.0", "8.1");
  std::string text = d.to_string();
  EXPECT_NE(text.find("[WARNING]"), std::string::npos);
  EXPECT_NE(text.find("VERSION_SUBSTITUTED"), std::string::npos);
  EXPECT_NE(text.find("using 8.0.0"), std::string::npos);
  EXPECT_NE(text.find("'8.1'"), std::string::npos);
}

TEST(ErrorTest, DiagnosticWithoutContext) {
  Diagnostic d(ErrorCode::EMPTY_TABLE_STORE, ErrorSeverity::FATAL, "no tables");
  EXPECT_EQ(d.to_string().find("input"), std::string::npos);
}

// =============================================================================
// ErrorCollector
// =============================================================================

TEST(ErrorCollectorTest, StartsEmpty) {
  ErrorCollector collector;
  EXPECT_FALSE(collector.has_errors());
  EXPECT_FALSE(collector.has_fatal_errors());
  EXPECT_EQ(collector.summary(), "No errors");
}

TEST(ErrorCollectorTest, TracksFatal) {
  ErrorCollector collector;
  collector.add_error(ErrorCode::VERSION_BELOW_RANGE, ErrorSeverity::WARNING, "low", "1");
  EXPECT_TRUE(collector.has_errors());
  EXPECT_FALSE(collector.has_fatal_errors());

  collector.add_error(ErrorCode::EMPTY_TABLE_STORE, ErrorSeverity::FATAL, "empty");
  EXPECT_TRUE(collector.has_fatal_errors());
  EXPECT_EQ(collector.error_count(), 2u);

  collector.clear();
  EXPECT_FALSE(collector.has_errors());
  EXPECT_FALSE(collector.has_fatal_errors());
}

TEST(ErrorCollectorTest, SummaryCountsSeverities) {
  ErrorCollector collector;
  collector.add_error(ErrorCode::VERSION_SUBSTITUTED, ErrorSeverity::WARNING, "a");
  collector.add_error(ErrorCode::VERSION_SUBSTITUTED, ErrorSeverity::WARNING, "b");
  collector.add_error(ErrorCode::MALFORMED_VERSION, ErrorSeverity::ERROR, "c");

  std::string summary = collector.summary();
  EXPECT_NE(summary.find("Total diagnostics: 3"), std::string::npos);
  EXPECT_NE(summary.find("Warnings: 2"), std::string::npos);
  EXPECT_NE(summary.find("Errors: 1"), std::string::npos);
  EXPECT_NE(summary.find("Fatal: 0"), std::string::npos);
}

TEST(ErrorCollectorTest, CollectIntoCallback) {
  ErrorCollector collector;
  WarningCallback callback = collect_into(collector);
  callback(Diagnostic(ErrorCode::VERSION_SUBSTITUTED, ErrorSeverity::WARNING, "msg", "9.1"));
  ASSERT_EQ(collector.error_count(), 1u);
  EXPECT_EQ(collector.errors()[0].context, "9.1");
}

// =============================================================================
// TermwidthException
// =============================================================================

TEST(TermwidthExceptionTest, CarriesDiagnostic) {
  TermwidthException e(ErrorCode::MALFORMED_VERSION, "bad version", "x.y");
  EXPECT_EQ(e.code(), ErrorCode::MALFORMED_VERSION);
  EXPECT_EQ(e.error().severity, ErrorSeverity::ERROR);
  EXPECT_EQ(e.error().context, "x.y");
  EXPECT_STREQ(e.what(), "bad version");
}

TEST(TermwidthExceptionTest, IsRuntimeError) {
  try {
    throw TermwidthException(ErrorCode::INTERNAL_ERROR, "boom");
  } catch (const std::runtime_error& e) {
    EXPECT_STREQ(e.what(), "boom");
  }
}
