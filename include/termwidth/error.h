/**
 * @file error.h
 * @brief Error codes, diagnostics and exceptions for termwidth.
 *
 * Width classification itself never fails: an unprintable code point is
 * reported as a width of -1, which is an ordinary result. The types in this
 * header cover the remaining cases:
 *
 * - Advisories (WARNING severity) raised while resolving a Unicode version,
 *   such as a requested version being substituted by the nearest supported
 *   one. These are delivered to a WarningCallback and never interrupt the
 *   caller.
 * - Contract violations (ERROR/FATAL severity), such as a malformed version
 *   token or an invalid table set. These are thrown as TermwidthException.
 */

#ifndef TERMWIDTH_ERROR_H
#define TERMWIDTH_ERROR_H

#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace termwidth {

enum class ErrorCode {
  NONE = 0,

  // Version resolution
  MALFORMED_VERSION,     // Version token is not dotted non-negative integers
  VERSION_SUBSTITUTED,   // Requested version replaced by nearest supported one (warning)
  VERSION_BELOW_RANGE,   // Requested version predates every supported version (warning)

  // Table store
  UNKNOWN_TABLE_VERSION, // tables_for() called with a version that is not a key
  EMPTY_TABLE_STORE,     // Table store constructed without any versions
  INVALID_TABLE,         // Interval table is unsorted or has overlapping intervals
  DUPLICATE_VERSION,     // Same version supplied twice to a table store

  INTERNAL_ERROR
};

enum class ErrorSeverity {
  WARNING, // Advisory, execution continues with a substituted value
  ERROR,   // Contract violation by the caller
  FATAL    // Library cannot operate (e.g. no tables)
};

/**
 * @brief A single advisory or error raised by the library.
 */
struct Diagnostic {
  ErrorCode code;
  ErrorSeverity severity;

  std::string message; // Human-readable description
  std::string context; // Offending input, e.g. the requested version token

  Diagnostic(ErrorCode c, ErrorSeverity s, std::string msg, std::string ctx = "")
      : code(c), severity(s), message(std::move(msg)), context(std::move(ctx)) {}

  std::string to_string() const;
};

/**
 * @brief Callback receiving advisory diagnostics.
 *
 * Invoked synchronously from the thread that triggered the advisory.
 */
using WarningCallback = std::function<void(const Diagnostic&)>;

/**
 * @brief Accumulates diagnostics, e.g. all advisories raised over a batch
 * of width computations.
 *
 * Not synchronized; give each thread its own collector.
 */
class ErrorCollector {
public:
  ErrorCollector() : has_fatal_(false) {}

  void add_error(const Diagnostic& error) {
    errors_.push_back(error);
    if (error.severity == ErrorSeverity::FATAL) {
      has_fatal_ = true;
    }
  }

  void add_error(ErrorCode code, ErrorSeverity severity, const std::string& message,
                 const std::string& context = "") {
    add_error(Diagnostic(code, severity, message, context));
  }

  bool has_errors() const { return !errors_.empty(); }
  bool has_fatal_errors() const { return has_fatal_; }
  size_t error_count() const { return errors_.size(); }
  const std::vector<Diagnostic>& errors() const { return errors_; }

  std::string summary() const;

  void clear() {
    errors_.clear();
    has_fatal_ = false;
  }

private:
  std::vector<Diagnostic> errors_;
  bool has_fatal_;
};

/**
 * @brief Returns a WarningCallback that appends every diagnostic to
 * @p collector. The collector must outlive the callback.
 */
WarningCallback collect_into(ErrorCollector& collector);

/**
 * @brief Exception thrown for contract violations.
 */
class TermwidthException : public std::runtime_error {
public:
  explicit TermwidthException(const Diagnostic& error)
      : std::runtime_error(error.message), error_(error) {}

  TermwidthException(ErrorCode code, const std::string& message, const std::string& context = "")
      : TermwidthException(Diagnostic(code, ErrorSeverity::ERROR, message, context)) {}

  const Diagnostic& error() const { return error_; }
  ErrorCode code() const { return error_.code; }

private:
  Diagnostic error_;
};

const char* error_code_to_string(ErrorCode code);
const char* error_severity_to_string(ErrorSeverity severity);

} // namespace termwidth

#endif // TERMWIDTH_ERROR_H
