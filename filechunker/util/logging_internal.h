/**
 * This file is part of filechunker.
 */

// Internal use, include only logging.h!

#ifndef FILECHUNKER_UTIL_LOGGING_INTERNAL_H_
#define FILECHUNKER_UTIL_LOGGING_INTERNAL_H_

#include <cstdarg>
#include <string>

#include "util/export.h"

#ifdef FILECHUNKER_NAMESPACE_GUARD
namespace FILECHUNKER_NAMESPACE_GUARD {
#endif

enum LogFacilities {
  kLogDebug = 0x01,
  kLogStdout = 0x02,
  kLogStderr = 0x04,
  kLogSyslog = 0x08,
  kLogSyslogWarn = 0x10,
  kLogSyslogErr = 0x20,
};

enum LogFlags {
  kLogNoLinebreak = 0x200,
};

enum LogLevels {
  kLogLevel0   = 0x01000,
  kLogNormal   = 0x02000,
  kLogInform   = 0x04000,
  kLogVerbose  = 0x08000,
  kLogNone     = 0x10000,
};

/**
 * Changes in this enum must be done in logging.cc as well!
 * (see const char *module_names[] = {....})
 */
enum LogSource {
  kLogChunker = 1,
  kLogMmap,
  kLogOptions,
  kLogSplit,
};

FILECHUNKER_EXPORT void SetLogSyslogLevel(const int level);
FILECHUNKER_EXPORT void SetLogVerbosity(const LogLevels max_level);
FILECHUNKER_EXPORT void LogShutdown();

#ifdef DEBUGMSG
FILECHUNKER_EXPORT void SetLogDebugFile(const std::string &filename);
#else
#define SetLogDebugFile(filename) ((void)0)
#endif

FILECHUNKER_EXPORT
void SetAltLogFunc(void (*fn)(const LogSource source, const int mask,
                              const char *msg));

#ifdef FILECHUNKER_NAMESPACE_GUARD
}  // namespace FILECHUNKER_NAMESPACE_GUARD
#endif

#endif  // FILECHUNKER_UTIL_LOGGING_INTERNAL_H_
