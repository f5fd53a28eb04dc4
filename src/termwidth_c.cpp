/**
 * @file termwidth_c.cpp
 * @brief C API wrapper implementation for the termwidth library.
 */

#include "termwidth_c.h"

#include "termwidth.h"

#include <cstring>
#include <exception>
#include <new>
#include <optional>
#include <string>

namespace {

termwidth_error_t to_c_error(termwidth::ErrorCode code) {
  switch (code) {
  case termwidth::ErrorCode::NONE:
    return TERMWIDTH_OK;
  case termwidth::ErrorCode::MALFORMED_VERSION:
    return TERMWIDTH_ERROR_MALFORMED_VERSION;
  case termwidth::ErrorCode::UNKNOWN_TABLE_VERSION:
    return TERMWIDTH_ERROR_UNKNOWN_TABLE_VERSION;
  case termwidth::ErrorCode::INVALID_TABLE:
  case termwidth::ErrorCode::EMPTY_TABLE_STORE:
  case termwidth::ErrorCode::DUPLICATE_VERSION:
    return TERMWIDTH_ERROR_INVALID_TABLE;
  default:
    return TERMWIDTH_ERROR_INTERNAL;
  }
}

std::string_view version_or_auto(const char* version) {
  return version ? std::string_view(version) : termwidth::AUTO_VERSION;
}

std::optional<size_t> to_limit(size_t limit) {
  if (limit == TERMWIDTH_NO_LIMIT)
    return std::nullopt;
  return limit;
}

// Runs fn, translating exceptions into error codes.
template <typename Fn> termwidth_error_t guarded(Fn&& fn) {
  try {
    fn();
    return TERMWIDTH_OK;
  } catch (const termwidth::TermwidthException& e) {
    return to_c_error(e.code());
  } catch (const std::bad_alloc&) {
    return TERMWIDTH_ERROR_OUT_OF_MEMORY;
  } catch (const std::exception&) {
    return TERMWIDTH_ERROR_INTERNAL;
  }
}

} // namespace

const char* termwidth_version(void) {
  return TERMWIDTH_VERSION_STRING;
}

const char* termwidth_error_string(termwidth_error_t error) {
  switch (error) {
  case TERMWIDTH_OK:
    return "No error";
  case TERMWIDTH_ERROR_MALFORMED_VERSION:
    return "Malformed Unicode version";
  case TERMWIDTH_ERROR_UNKNOWN_TABLE_VERSION:
    return "Unknown table version";
  case TERMWIDTH_ERROR_INVALID_TABLE:
    return "Invalid width table";
  case TERMWIDTH_ERROR_INTERNAL:
    return "Internal error";
  case TERMWIDTH_ERROR_NULL_POINTER:
    return "Null pointer";
  case TERMWIDTH_ERROR_BUFFER_TOO_SMALL:
    return "Buffer too small";
  case TERMWIDTH_ERROR_OUT_OF_MEMORY:
    return "Out of memory";
  case TERMWIDTH_ERROR_INVALID_ARGUMENT:
    return "Invalid argument";
  default:
    return "Unknown error";
  }
}

termwidth_error_t termwidth_width(uint32_t codepoint, const char* version, int* width) {
  if (!width)
    return TERMWIDTH_ERROR_NULL_POINTER;

  return guarded([&] { *width = termwidth::width_of(codepoint, version_or_auto(version)); });
}

termwidth_error_t termwidth_u32_width(const uint32_t* text, size_t length, size_t limit,
                                      const char* version, int* width) {
  if (!width || (!text && length > 0))
    return TERMWIDTH_ERROR_NULL_POINTER;

  return guarded([&] {
    std::u32string buffer(text, text + length);
    *width = termwidth::string_width(buffer, to_limit(limit), version_or_auto(version));
  });
}

termwidth_error_t termwidth_utf8_width(const char* text, size_t length, size_t limit,
                                       const char* version, int* width) {
  if (!width || (!text && length > 0))
    return TERMWIDTH_ERROR_NULL_POINTER;

  return guarded([&] {
    *width = termwidth::utf8_width(std::string_view(text, length), to_limit(limit),
                                   version_or_auto(version));
  });
}

termwidth_error_t termwidth_resolve(const char* token, char* out, size_t out_size) {
  if (!out)
    return TERMWIDTH_ERROR_NULL_POINTER;
  if (out_size == 0)
    return TERMWIDTH_ERROR_INVALID_ARGUMENT;

  std::string resolved;
  termwidth_error_t err = guarded([&] { resolved = termwidth::resolve(version_or_auto(token)); });
  if (err != TERMWIDTH_OK)
    return err;

  if (resolved.size() + 1 > out_size)
    return TERMWIDTH_ERROR_BUFFER_TOO_SMALL;

  std::memcpy(out, resolved.c_str(), resolved.size() + 1);
  return TERMWIDTH_OK;
}

size_t termwidth_supported_version_count(void) {
  try {
    return termwidth::supported_versions().size();
  } catch (const std::exception&) {
    return 0;
  }
}

const char* termwidth_supported_version(size_t index) {
  try {
    const auto& versions = termwidth::supported_versions();
    if (index >= versions.size())
      return nullptr;
    return versions[index].c_str();
  } catch (const std::exception&) {
    return nullptr;
  }
}
