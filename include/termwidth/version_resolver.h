/**
 * @file version_resolver.h
 * @brief Maps requested Unicode version tokens to supported table versions.
 *
 * ## Tokens
 *
 * - "latest" selects the newest supported version.
 * - "auto" consults the configured OverrideSource (by default the
 *   UNICODE_VERSION environment variable); when no override is present it
 *   behaves as "latest".
 * - Anything else is parsed as a dotted version. The newest supported
 *   version that is not newer than the request is selected; missing
 *   trailing components count as zero, so "8.0" selects "8.0.0". A request
 *   older than every supported version selects the earliest one.
 *
 * Whenever the selected version differs textually from the request, an
 * advisory Diagnostic is passed to the warning callback. Resolution never
 * fails for well-formed tokens; a malformed token throws
 * TermwidthException with ErrorCode::MALFORMED_VERSION.
 *
 * ## Thread Safety
 *
 * resolve() is const and keeps no state of its own. It is safe to call
 * concurrently provided the OverrideSource and warning callback are.
 */

#ifndef TERMWIDTH_VERSION_RESOLVER_H
#define TERMWIDTH_VERSION_RESOLVER_H

#include "termwidth/error.h"
#include "termwidth/table_store.h"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace termwidth {

/// Token selecting the newest supported version.
constexpr std::string_view LATEST_VERSION = "latest";

/// Token deferring to the override source, then to "latest".
constexpr std::string_view AUTO_VERSION = "auto";

/// Environment variable read by EnvironmentOverrideSource by default.
constexpr const char* DEFAULT_VERSION_VARIABLE = "UNICODE_VERSION";

/**
 * @brief Provider of the optional process-wide version override.
 */
class OverrideSource {
public:
  virtual ~OverrideSource() = default;

  /// The override token, or std::nullopt when none is configured.
  virtual std::optional<std::string> value() const = 0;
};

/**
 * @brief Reads the override from an environment variable on every call.
 *
 * An unset or empty variable means no override.
 */
class EnvironmentOverrideSource : public OverrideSource {
public:
  explicit EnvironmentOverrideSource(std::string variable = DEFAULT_VERSION_VARIABLE)
      : variable_(std::move(variable)) {}

  std::optional<std::string> value() const override;

  const std::string& variable() const { return variable_; }

private:
  std::string variable_;
};

/**
 * @brief Override held in memory, for tests and embedding applications.
 *
 * set() is not synchronized with concurrent value() calls.
 */
class FixedOverrideSource : public OverrideSource {
public:
  FixedOverrideSource() = default;
  explicit FixedOverrideSource(std::optional<std::string> value) : value_(std::move(value)) {}

  std::optional<std::string> value() const override { return value_; }

  void set(std::optional<std::string> value) { value_ = std::move(value); }

private:
  std::optional<std::string> value_;
};

/**
 * @brief Resolver configuration.
 */
struct ResolverOptions {
  /// Source consulted by "auto". Null means an override is never present.
  std::shared_ptr<const OverrideSource> override_source;

  /// Receives VERSION_SUBSTITUTED and VERSION_BELOW_RANGE advisories.
  WarningCallback warning_callback;

  /// Options reading UNICODE_VERSION, with no warning callback.
  static ResolverOptions from_environment();
};

class VersionResolver {
public:
  explicit VersionResolver(const TableStore& store, ResolverOptions options = {});

  /// Resolve @p token to a key of store().supported_versions().
  std::string resolve(std::string_view token) const;

  /// Same as resolve(), returning the index into the store.
  size_t resolve_index(std::string_view token) const;

  /**
   * @brief Replace "auto" by the current override value, or by "latest"
   * when there is none. Other tokens are returned unchanged.
   *
   * resolve(expand_auto(t)) == resolve(t) for every token, which makes the
   * expanded token suitable as a cache key.
   */
  std::string expand_auto(std::string_view token) const;

  const TableStore& store() const { return store_; }
  const ResolverOptions& options() const { return options_; }

private:
  size_t resolve_explicit(std::string_view token) const;
  void warn(ErrorCode code, const std::string& message, std::string_view token) const;

  const TableStore& store_;
  ResolverOptions options_;
};

} // namespace termwidth

#endif // TERMWIDTH_VERSION_RESOLVER_H
