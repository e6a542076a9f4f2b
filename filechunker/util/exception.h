/**
 * This file is part of filechunker.
 */

#ifndef FILECHUNKER_UTIL_EXCEPTION_H_
#define FILECHUNKER_UTIL_EXCEPTION_H_

#include <cstdarg>
#include <stdexcept>
#include <string>

#include "util/export.h"
#include "util/logging.h"

#ifdef FILECHUNKER_NAMESPACE_GUARD
namespace FILECHUNKER_NAMESPACE_GUARD {
#endif

class FILECHUNKER_EXPORT EFileChunkerException : public std::runtime_error {
 public:
  explicit EFileChunkerException(const std::string& what_arg)
      : std::runtime_error(what_arg) {}
};

#define FILECHUNKER_S1(x) #x
#define FILECHUNKER_S2(x) FILECHUNKER_S1(x)
#define FILECHUNKER_SOURCE_LOCATION \
  "PANIC: " __FILE__ " : " FILECHUNKER_S2(__LINE__)
#define PANIC(...) Panic(FILECHUNKER_SOURCE_LOCATION, kLogChunker, __VA_ARGS__)

/**
 * Logs the message together with the source location and aborts.  If the
 * library is built with FILECHUNKER_RAISE_EXCEPTIONS, an EFileChunkerException
 * is thrown instead, so that a host application can survive the failure.
 */
FILECHUNKER_EXPORT
__attribute__((noreturn))
void Panic(const char *coordinates, const LogSource source, const int mask,
           const char *format, ...);

// For PANIC(NULL)
FILECHUNKER_EXPORT
__attribute__((noreturn))
void Panic(const char *coordinates, const LogSource source, const char *nul);

#ifdef FILECHUNKER_NAMESPACE_GUARD
}  // namespace FILECHUNKER_NAMESPACE_GUARD
#endif

#endif  // FILECHUNKER_UTIL_EXCEPTION_H_
