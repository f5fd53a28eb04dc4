/**
 * @file version.h
 * @brief Parsing and ordering of dotted Unicode version strings.
 *
 * A version string "a.b.c" is parsed into the integer tuple (a, b, c).
 * Versions are ordered by lexicographic tuple comparison, so "10.0.0"
 * sorts after "9.0.0" even though it sorts before it as text.
 */

#ifndef TERMWIDTH_VERSION_H
#define TERMWIDTH_VERSION_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace termwidth {

using VersionValue = std::vector<uint32_t>;

/**
 * @brief Parse a dotted version string.
 *
 * Accepts one or more non-empty runs of ASCII digits separated by single
 * dots. Each component must fit in 32 bits.
 *
 * @throws TermwidthException with ErrorCode::MALFORMED_VERSION otherwise.
 */
VersionValue parse_version(std::string_view text);

/// Non-throwing variant of parse_version().
std::optional<VersionValue> try_parse_version(std::string_view text);

/// Joins the components with '.'.
std::string format_version(const VersionValue& value);

/**
 * @brief Three-way tuple comparison.
 *
 * A tuple that is a strict prefix of another compares less, so
 * (8, 0) < (8, 0, 0).
 *
 * @return negative, zero or positive.
 */
int compare_versions(const VersionValue& a, const VersionValue& b);

/**
 * @brief True if @p candidate is not newer than @p requested, treating
 * missing trailing components as zero.
 *
 * Used when matching a possibly partial request against supported
 * versions: "8.0" and "8" both admit "8.0.0".
 */
bool version_at_most(const VersionValue& candidate, const VersionValue& requested);

} // namespace termwidth

#endif // TERMWIDTH_VERSION_H
