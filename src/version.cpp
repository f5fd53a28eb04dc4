/**
 * @file version.cpp
 * @brief Dotted version string parsing and comparison.
 */

#include "termwidth/version.h"

#include "termwidth/error.h"

#include <algorithm>
#include <limits>
#include <sstream>

namespace termwidth {

std::optional<VersionValue> try_parse_version(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }

  VersionValue value;
  uint64_t component = 0;
  bool have_digit = false;

  for (char c : text) {
    if (c == '.') {
      if (!have_digit)
        return std::nullopt; // empty component: "", ".1", "1..2", "1."
      value.push_back(static_cast<uint32_t>(component));
      component = 0;
      have_digit = false;
    } else if (c >= '0' && c <= '9') {
      component = component * 10 + static_cast<uint64_t>(c - '0');
      if (component > std::numeric_limits<uint32_t>::max())
        return std::nullopt;
      have_digit = true;
    } else {
      return std::nullopt;
    }
  }

  if (!have_digit)
    return std::nullopt;
  value.push_back(static_cast<uint32_t>(component));
  return value;
}

VersionValue parse_version(std::string_view text) {
  auto value = try_parse_version(text);
  if (!value) {
    throw TermwidthException(ErrorCode::MALFORMED_VERSION,
                             "Unicode version must be dotted non-negative integers, such as "
                             "'9.0.0'",
                             std::string(text));
  }
  return *value;
}

std::string format_version(const VersionValue& value) {
  std::ostringstream ss;
  for (size_t i = 0; i < value.size(); ++i) {
    if (i > 0)
      ss << '.';
    ss << value[i];
  }
  return ss.str();
}

int compare_versions(const VersionValue& a, const VersionValue& b) {
  size_t n = std::min(a.size(), b.size());
  for (size_t i = 0; i < n; ++i) {
    if (a[i] != b[i])
      return a[i] < b[i] ? -1 : 1;
  }
  if (a.size() == b.size())
    return 0;
  return a.size() < b.size() ? -1 : 1;
}

bool version_at_most(const VersionValue& candidate, const VersionValue& requested) {
  size_t n = std::max(candidate.size(), requested.size());
  for (size_t i = 0; i < n; ++i) {
    uint32_t c = i < candidate.size() ? candidate[i] : 0;
    uint32_t r = i < requested.size() ? requested[i] : 0;
    if (c != r)
      return c < r;
  }
  return true;
}

} // namespace termwidth
