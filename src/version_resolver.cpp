/**
 * @file version_resolver.cpp
 * @brief Unicode version token resolution.
 */

#include "termwidth/version_resolver.h"

#include <cstdlib>

namespace termwidth {

//-----------------------------------------------------------------------------
// Override sources
//-----------------------------------------------------------------------------

std::optional<std::string> EnvironmentOverrideSource::value() const {
  const char* env = std::getenv(variable_.c_str());
  if (env != nullptr && env[0] != '\0') {
    return std::string(env);
  }
  return std::nullopt;
}

ResolverOptions ResolverOptions::from_environment() {
  ResolverOptions options;
  options.override_source = std::make_shared<EnvironmentOverrideSource>();
  return options;
}

//-----------------------------------------------------------------------------
// VersionResolver
//-----------------------------------------------------------------------------

VersionResolver::VersionResolver(const TableStore& store, ResolverOptions options)
    : store_(store), options_(std::move(options)) {}

void VersionResolver::warn(ErrorCode code, const std::string& message,
                           std::string_view token) const {
  if (options_.warning_callback) {
    options_.warning_callback(
        Diagnostic(code, ErrorSeverity::WARNING, message, std::string(token)));
  }
}

std::string VersionResolver::expand_auto(std::string_view token) const {
  if (token != AUTO_VERSION) {
    return std::string(token);
  }
  if (options_.override_source) {
    if (auto value = options_.override_source->value()) {
      return *value;
    }
  }
  return std::string(LATEST_VERSION);
}

std::string VersionResolver::resolve(std::string_view token) const {
  return store_.supported_versions()[resolve_index(token)];
}

size_t VersionResolver::resolve_index(std::string_view token) const {
  if (token == AUTO_VERSION) {
    return resolve_explicit(expand_auto(token));
  }
  return resolve_explicit(token);
}

size_t VersionResolver::resolve_explicit(std::string_view token) const {
  const size_t count = store_.size();

  if (token == LATEST_VERSION) {
    return count - 1;
  }

  // An override value of "auto" names no version and is rejected here.
  VersionValue requested = parse_version(token);

  for (size_t i = count; i-- > 0;) {
    const VersionTables& candidate = store_.version_tables(i);
    if (version_at_most(candidate.value, requested)) {
      if (candidate.version != token) {
        warn(ErrorCode::VERSION_SUBSTITUTED,
             "Unicode version " + std::string(token) + " not found, using " + candidate.version,
             token);
      }
      return i;
    }
  }

  warn(ErrorCode::VERSION_BELOW_RANGE,
       "Unicode version " + std::string(token) +
           " is lower than any available version, using " + store_.earliest(),
       token);
  return 0;
}

} // namespace termwidth
