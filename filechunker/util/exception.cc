/**
 * This file is part of filechunker.
 */

#include "util/exception.h"

#include <cassert>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>

#include "util/logging.h"

#ifdef FILECHUNKER_NAMESPACE_GUARD
namespace FILECHUNKER_NAMESPACE_GUARD {
#endif

void Panic(const char* coordinates, const LogSource source, const int mask,
           const char* format, ...) {
  char* msg = NULL;
  va_list variadic_list;

  // Format the message string
  va_start(variadic_list, format);
  int retval = vasprintf(&msg, format, variadic_list);
  assert(retval != -1);  // else: out of memory
  va_end(variadic_list);

  // Add the coordinates
  char* msg_with_coordinates = NULL;
  retval = asprintf(&msg_with_coordinates, "%s\n%s", coordinates, msg);
  if (retval != -1) {
    free(msg);
    msg = msg_with_coordinates;
  }

#ifdef FILECHUNKER_RAISE_EXCEPTIONS
  (void) source;
  (void) mask;
  const std::string what(msg);
  free(msg);
  throw EFileChunkerException(what);
#else
  LogChunker(source, mask, "%s", msg);
  free(msg);
  abort();
#endif
}

void Panic(const char* coordinates, const LogSource source, const char *nul) {
  assert(nul == NULL);
  Panic(coordinates, source, kLogDebug | kLogStderr | kLogSyslogErr, "");
}

#ifdef FILECHUNKER_NAMESPACE_GUARD
}  // namespace FILECHUNKER_NAMESPACE_GUARD
#endif
