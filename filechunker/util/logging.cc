/**
 * This file is part of filechunker.
 *
 * LogChunker() handles all message output.  It works like printf.
 * It can log to a debug log file, stdout, stderr, and syslog.
 *
 * The setter routines are not thread-safe.  They are meant to be
 * invoked at the very first, single-threaded stage.
 *
 * If DEBUGMSG is undefined, pure debug messages are compiled into no-ops.
 */

#include "util/logging_internal.h"  // NOLINT(build/include)

#include <errno.h>
#include <fcntl.h>
#include <pthread.h>
#include <syslog.h>
#include <time.h>
#include <unistd.h>

#include <cassert>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>

using namespace std;  // NOLINT

#ifdef FILECHUNKER_NAMESPACE_GUARD
namespace FILECHUNKER_NAMESPACE_GUARD {
#endif

namespace {

pthread_mutex_t lock_stdout = PTHREAD_MUTEX_INITIALIZER;
pthread_mutex_t lock_stderr = PTHREAD_MUTEX_INITIALIZER;
#ifdef DEBUGMSG
pthread_mutex_t lock_debug = PTHREAD_MUTEX_INITIALIZER;
FILE *file_debug = NULL;
#endif
const char *module_names[] = { "unknown", "chunker", "mmap", "options",
  "split" };
int syslog_level = LOG_NOTICE;

LogLevels min_log_level = kLogNormal;
static void (*alt_log_func)(const LogSource source, const int mask,
                            const char *msg) = NULL;

}  // namespace


/**
 * Sets the level that is used for all messages to the syslog facility.
 */
void SetLogSyslogLevel(const int level) {
  switch (level) {
    case 1:
      syslog_level = LOG_DEBUG;
      break;
    case 2:
      syslog_level = LOG_INFO;
      break;
    case 3:
      syslog_level = LOG_NOTICE;
      break;
    default:
      syslog_level = LOG_NOTICE;
      break;
  }
}


/**
 * Set the minimum verbosity level.  By default kLogNormal.
 */
void SetLogVerbosity(const LogLevels min_level) {
  min_log_level = min_level;
}


/**
 * Changes the debug log file from stderr. No effect if DEBUGMSG is undefined.
 */
#ifdef DEBUGMSG
void SetLogDebugFile(const string &filename) {
  if (filename == "") {
    if ((file_debug != NULL) && (file_debug != stderr)) {
      fclose(file_debug);
      file_debug = NULL;
    }
    return;
  }

  if ((file_debug != NULL) && (file_debug != stderr)) {
    if ((fclose(file_debug) < 0)) {
      fprintf(stderr, "could not close current log file (%d), aborting\n",
              errno);
      abort();
    }
  }
  int fd = open(filename.c_str(), O_WRONLY | O_APPEND | O_CREAT, 0600);
  if ((fd < 0) || ((file_debug = fdopen(fd, "a")) == NULL)) {
    fprintf(stderr, "could not open debug log file %s (%d), aborting\n",
            filename.c_str(), errno);
    syslog(LOG_USER | LOG_ERR, "could not open debug log file %s (%d), "
           "aborting\n", filename.c_str(), errno);
    abort();
  }
}
#endif


void SetAltLogFunc(void (*fn)(const LogSource source, const int mask,
                              const char *msg))
{
  alt_log_func = fn;
}


/**
 * Logs a message to one or multiple facilities specified by mask.
 *
 * @param[in] source Component that triggers the logging
 * @param[in] mask Bit mask of log facilities, flags, and level
 * @param[in] format Format string
 * @param[in] variadic_list Arguments for the format string
 */
FILECHUNKER_EXPORT
void vLogChunker(const LogSource source, const int mask,
                 const char *format, va_list variadic_list)
{
  char *msg = NULL;

  // Log level check, no flag set in mask means kLogNormal
#ifndef DEBUGMSG
  int log_level = mask & ((2*kLogNone - 1) ^ (kLogLevel0 - 1));
  if (!log_level)
    log_level = kLogNormal;
  if (log_level < min_log_level)
    return;
#endif

  int retval = vasprintf(&msg, format, variadic_list);
  assert(retval != -1);  // else: out of memory

  if (alt_log_func) {
    (*alt_log_func)(source, mask, msg);
    free(msg);
    return;
  }

#ifdef DEBUGMSG
  if (mask & kLogDebug) {
    pthread_mutex_lock(&lock_debug);

    // Set the file pointer for debuging to stderr, if necessary
    if (file_debug == NULL)
      file_debug = stderr;

    // Get timestamp
    time_t rawtime;
    time(&rawtime);
    struct tm now;
    localtime_r(&rawtime, &now);

    if (file_debug == stderr) pthread_mutex_lock(&lock_stderr);
    fprintf(file_debug, "(%s) %s    [%02d-%02d-%04d %02d:%02d:%02d %s]\n",
            module_names[source], msg,
            (now.tm_mon)+1, now.tm_mday, (now.tm_year)+1900, now.tm_hour,
            now.tm_min, now.tm_sec, now.tm_zone);
    fflush(file_debug);
    if (file_debug == stderr) pthread_mutex_unlock(&lock_stderr);

    pthread_mutex_unlock(&lock_debug);
  }
#endif

  if (mask & kLogStdout) {
    pthread_mutex_lock(&lock_stdout);
    printf("%s", msg);
    if (!(mask & kLogNoLinebreak))
      printf("\n");
    fflush(stdout);
    pthread_mutex_unlock(&lock_stdout);
  }

  if (mask & kLogStderr) {
    pthread_mutex_lock(&lock_stderr);
    fprintf(stderr, "%s", msg);
    if (!(mask & kLogNoLinebreak))
      fprintf(stderr, "\n");
    fflush(stderr);
    pthread_mutex_unlock(&lock_stderr);
  }

  if (mask & (kLogSyslog | kLogSyslogWarn | kLogSyslogErr)) {
    int level = syslog_level;
    if (mask & kLogSyslogWarn) level = LOG_WARNING;
    if (mask & kLogSyslogErr) level = LOG_ERR;
    syslog(LOG_USER | level, "(%s) %s", module_names[source], msg);
  }

  free(msg);
}


FILECHUNKER_EXPORT
void LogChunker(const LogSource source, const int mask,
                const char *format, ...)
{
  va_list variadic_list;
  va_start(variadic_list, format);
  vLogChunker(source, mask, format, variadic_list);
  va_end(variadic_list);
}


/**
 * Closes the debug log file and restores the default log settings.  Used at
 * the end of a tool run and between unit tests.
 */
void LogShutdown() {
  SetLogDebugFile("");
  SetAltLogFunc(NULL);
  SetLogVerbosity(kLogNormal);
}

#ifdef FILECHUNKER_NAMESPACE_GUARD
}  // namespace FILECHUNKER_NAMESPACE_GUARD
#endif
