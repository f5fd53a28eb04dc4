/**
 * @file error.cpp
 * @brief Diagnostic formatting and error collection.
 */

#include "termwidth/error.h"

#include <sstream>

namespace termwidth {

const char* error_code_to_string(ErrorCode code) {
  switch (code) {
  case ErrorCode::NONE:
    return "NONE";
  case ErrorCode::MALFORMED_VERSION:
    return "MALFORMED_VERSION";
  case ErrorCode::VERSION_SUBSTITUTED:
    return "VERSION_SUBSTITUTED";
  case ErrorCode::VERSION_BELOW_RANGE:
    return "VERSION_BELOW_RANGE";
  case ErrorCode::UNKNOWN_TABLE_VERSION:
    return "UNKNOWN_TABLE_VERSION";
  case ErrorCode::EMPTY_TABLE_STORE:
    return "EMPTY_TABLE_STORE";
  case ErrorCode::INVALID_TABLE:
    return "INVALID_TABLE";
  case ErrorCode::DUPLICATE_VERSION:
    return "DUPLICATE_VERSION";
  case ErrorCode::INTERNAL_ERROR:
    return "INTERNAL_ERROR";
  }
  return "UNKNOWN";
}

const char* error_severity_to_string(ErrorSeverity severity) {
  switch (severity) {
  case ErrorSeverity::WARNING:
    return "WARNING";
  case ErrorSeverity::ERROR:
    return "ERROR";
  case ErrorSeverity::FATAL:
    return "FATAL";
  }
  return "UNKNOWN";
}

std::string Diagnostic::to_string() const {
  std::ostringstream ss;
  ss << "[" << error_severity_to_string(severity) << "] " << error_code_to_string(code) << ": "
     << message;

  if (!context.empty()) {
    ss << " (input: '" << context << "')";
  }

  return ss.str();
}

std::string ErrorCollector::summary() const {
  if (errors_.empty()) {
    return "No errors";
  }

  std::ostringstream ss;
  size_t warnings = 0, errors = 0, fatal = 0;

  for (const auto& err : errors_) {
    switch (err.severity) {
    case ErrorSeverity::WARNING:
      warnings++;
      break;
    case ErrorSeverity::ERROR:
      errors++;
      break;
    case ErrorSeverity::FATAL:
      fatal++;
      break;
    }
  }

  ss << "Total diagnostics: " << errors_.size() << " (Warnings: " << warnings
     << ", Errors: " << errors << ", Fatal: " << fatal << ")";

  ss << "\n\nDetails:\n";
  for (const auto& err : errors_) {
    ss << err.to_string() << "\n";
  }

  return ss.str();
}

WarningCallback collect_into(ErrorCollector& collector) {
  return [&collector](const Diagnostic& diagnostic) { collector.add_error(diagnostic); };
}

} // namespace termwidth
