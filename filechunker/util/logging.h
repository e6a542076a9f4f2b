/**
 * This file is part of filechunker.
 */

#ifndef FILECHUNKER_UTIL_LOGGING_H_
#define FILECHUNKER_UTIL_LOGGING_H_

#include <string>

#include "util/export.h"
// Shared declarations of debug and non-debug logging
#include "util/logging_internal.h"

#ifdef FILECHUNKER_NAMESPACE_GUARD
namespace FILECHUNKER_NAMESPACE_GUARD {
#endif

FILECHUNKER_EXPORT
void vLogChunker(const LogSource source, const int mask,
                 const char *format, va_list variadic_list);
__attribute__((format(printf, 3, 4)))
FILECHUNKER_EXPORT
void LogChunker(const LogSource source, const int mask,
                const char *format, ...);
// Ensure that pure debug messages are not compiled except in DEBUGMSG mode
#ifndef DEBUGMSG
#define LogChunker(source, mask, ...) \
  (((mask) == static_cast<int>(kLogDebug)) ? \
    ((void)0) : LogChunker(source, mask, __VA_ARGS__))  // NOLINT
#endif

#ifdef FILECHUNKER_NAMESPACE_GUARD
}  // namespace FILECHUNKER_NAMESPACE_GUARD
#endif

#endif  // FILECHUNKER_UTIL_LOGGING_H_
