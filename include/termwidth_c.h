/**
 * @file termwidth_c.h
 * @brief C API for the termwidth library.
 *
 * All functions use the process-wide default classifier: built-in tables,
 * the UNICODE_VERSION environment variable for "auto", and version
 * advisories written to stderr. A NULL version argument means "auto".
 *
 * Widths are returned through an out parameter; the return value is an
 * error code. A width of -1 is a normal result (unprintable input), not an
 * error.
 */

#ifndef TERMWIDTH_C_H
#define TERMWIDTH_C_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

#define TERMWIDTH_NO_LIMIT ((size_t)-1)

const char* termwidth_version(void);

typedef enum termwidth_error {
  TERMWIDTH_OK = 0,
  TERMWIDTH_ERROR_MALFORMED_VERSION = 1,
  TERMWIDTH_ERROR_UNKNOWN_TABLE_VERSION = 2,
  TERMWIDTH_ERROR_INVALID_TABLE = 3,
  TERMWIDTH_ERROR_INTERNAL = 15,
  TERMWIDTH_ERROR_NULL_POINTER = 100,
  TERMWIDTH_ERROR_BUFFER_TOO_SMALL = 101,
  TERMWIDTH_ERROR_OUT_OF_MEMORY = 102,
  TERMWIDTH_ERROR_INVALID_ARGUMENT = 103
} termwidth_error_t;

const char* termwidth_error_string(termwidth_error_t error);

/* Width of one code point: -1, 0, 1 or 2. */
termwidth_error_t termwidth_width(uint32_t codepoint, const char* version, int* width);

/* Width of the first `limit` code points of a UTF-32 string. */
termwidth_error_t termwidth_u32_width(const uint32_t* text, size_t length, size_t limit,
                                      const char* version, int* width);

/* Width of the first `limit` code points of a UTF-8 string of `length` bytes. */
termwidth_error_t termwidth_utf8_width(const char* text, size_t length, size_t limit,
                                       const char* version, int* width);

/**
 * @brief Resolve a version token to a supported Unicode version.
 *
 * Writes the NUL-terminated version into @p out. Fails with
 * TERMWIDTH_ERROR_BUFFER_TOO_SMALL if it does not fit in @p out_size bytes.
 */
termwidth_error_t termwidth_resolve(const char* token, char* out, size_t out_size);

/* Supported versions in ascending order. The strings live for the whole process. */
size_t termwidth_supported_version_count(void);
const char* termwidth_supported_version(size_t index);

#ifdef __cplusplus
}
#endif

#endif // TERMWIDTH_C_H
