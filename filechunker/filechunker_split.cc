/**
 * This file is part of filechunker.
 *
 * Prints how a file would be split into chunks for parallel processing.  With
 * -w, every chunk is handed to its own worker thread which counts the records
 * in the chunk, the way a log analyzer would process the file.
 */

#include <unistd.h>

#include <string>

#include "options.h"
#include "split.h"
#include "util/logging.h"

#ifndef FILECHUNKER_VERSION
#define FILECHUNKER_VERSION "1.0.0"
#endif

using namespace std;  // NOLINT


static void Usage() {
  LogChunker(kLogSplit, kLogStdout,
             "filechunker file splitter, version %s\n\n"
             "Splits a file into roughly equally sized chunks for parallel\n"
             "processing and prints the chunk table.\n\n"
             "Usage: filechunker_split [-c config] [-n #chunks] "
             "[-d delimiter] [-w] [-l level] [-v] <file>\n"
             "Options:\n"
             "  -c configuration file (KEY=VALUE lines)\n"
             "  -n number of chunks (default: number of CPUs)\n"
             "  -d record delimiter: none, \\n, newline, tab, 0xNN or a "
             "character\n"
             "  -w count the records of every chunk, one thread per chunk\n"
             "  -l log level 0-4 (default: 1, 4 suppresses all output)\n"
             "  -v print the effective configuration and a summary\n\n"
             "Parameters can also be set in the environment, e.g.\n"
             "  FILECHUNKER_CHUNKS, FILECHUNKER_DELIMITER, "
             "FILECHUNKER_WORKERS,\n"
             "  FILECHUNKER_LOG_LEVEL, FILECHUNKER_VERBOSE, "
             "FILECHUNKER_SYSLOG_LEVEL,\n  FILECHUNKER_DEBUGLOG",
             FILECHUNKER_VERSION);
}


static unsigned GetNumberOfCpus() {
  const long num_cpus = sysconf(_SC_NPROCESSORS_ONLN);  // NOLINT
  return (num_cpus > 0) ? static_cast<unsigned>(num_cpus) : 1;
}


/**
 * Fills args and path.  Leaves path empty if only the help text is requested.
 */
static split::Errors ParseCommandLine(int argc, char **argv,
                                      split::Arguments *args, string *path)
{
  int c;
  while ((c = getopt(argc, argv, "hc:n:d:wl:v")) != -1) {
    switch (c) {
      case 'h':
        Usage();
        return split::kErrorOk;
      case 'c':
        args->config_file = optarg;
        break;
      case 'n':
        args->chunks = optarg;
        break;
      case 'd':
        args->delimiter = optarg;
        break;
      case 'w':
        args->workers = true;
        break;
      case 'l':
        args->log_level = optarg;
        break;
      case 'v':
        args->verbose = true;
        break;
      case '?':
      default:
        Usage();
        return split::kErrorUsage;
    }
  }
  if (optind >= argc) {
    Usage();
    return split::kErrorUsage;
  }
  *path = argv[optind];
  return split::kErrorOk;
}


int main(int argc, char **argv) {
  split::Arguments args;
  string path;
  split::Errors retval = ParseCommandLine(argc, argv, &args, &path);
  if ((retval == split::kErrorOk) && !path.empty()) {
    SimpleOptionsParser options;
    split::Parameters params(GetNumberOfCpus());
    retval = split::LoadOptions(args, &options);
    if (retval == split::kErrorOk)
      retval = split::ResolveParameters(options, &params);
    if (retval == split::kErrorOk)
      retval = split::SplitFile(path, params);
  }

  LogShutdown();
  return retval;
}
