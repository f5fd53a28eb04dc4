/**
 * @file termwidth.h
 * @brief Umbrella header for the termwidth library.
 *
 * termwidth determines how many cells of a monospace terminal a Unicode
 * code point or string occupies, for a selectable Unicode version.
 *
 * @code
 * #include "termwidth.h"
 *
 * int w = termwidth::width_of(0x4E00);               // 2
 * int s = termwidth::utf8_width("コンニチハ");        // 10
 * int c = termwidth::utf8_width("abc\x1b[0m");       // -1, contains ESC
 * std::string v = termwidth::resolve("8.0");         // "8.0.0"
 * @endcode
 */

#ifndef TERMWIDTH_H
#define TERMWIDTH_H

#define TERMWIDTH_VERSION_MAJOR 0
#define TERMWIDTH_VERSION_MINOR 1
#define TERMWIDTH_VERSION_PATCH 0

#define TERMWIDTH_STRINGIFY_IMPL(x) #x
#define TERMWIDTH_STRINGIFY(x) TERMWIDTH_STRINGIFY_IMPL(x)

/// "MAJOR.MINOR.PATCH", as returned by termwidth_version().
#define TERMWIDTH_VERSION_STRING                                                        \
  TERMWIDTH_STRINGIFY(TERMWIDTH_VERSION_MAJOR)                                          \
  "." TERMWIDTH_STRINGIFY(TERMWIDTH_VERSION_MINOR) "."                                  \
  TERMWIDTH_STRINGIFY(TERMWIDTH_VERSION_PATCH)

#include "termwidth/error.h"
#include "termwidth/interval_table.h"
#include "termwidth/table_store.h"
#include "termwidth/utf8.h"
#include "termwidth/version.h"
#include "termwidth/version_resolver.h"
#include "termwidth/width.h"
#include "termwidth/width_cache.h"

#endif // TERMWIDTH_H
