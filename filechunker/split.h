/**
 * This file is part of filechunker.
 *
 * Building blocks of the filechunker_split tool: option resolution, the
 * record counting workers, and the chunk table output.
 */

#ifndef FILECHUNKER_SPLIT_H_
#define FILECHUNKER_SPLIT_H_

#include <stdint.h>

#include <string>
#include <vector>

#include "file_chunker.h"
#include "options.h"

#ifdef FILECHUNKER_NAMESPACE_GUARD
namespace FILECHUNKER_NAMESPACE_GUARD {
#endif

namespace split {

enum Errors {
  kErrorOk = 0,
  kErrorUsage = 1,
  kErrorIo = 2,
  kErrorInvalidArgument = 3,
  kErrorOperational = 4,
};

/**
 * Command line values.  Empty strings and false mean "not given", so that
 * the configuration file and the environment decide.
 */
struct Arguments {
  Arguments() : workers(false), verbose(false) { }

  std::string config_file;
  std::string chunks;
  std::string delimiter;
  std::string log_level;
  bool workers;
  bool verbose;
};

struct Parameters {
  explicit Parameters(const unsigned default_count)
    : request(default_count), count_records(false), verbose(false) { }

  ChunkRequest request;
  bool count_records;
  bool verbose;
};

/**
 * Work item of a worker thread.  The chunk keeps the mapping alive.
 */
struct ChunkJob {
  ChunkJob() : record_separator('\n'), is_last(false), num_records(0) { }

  FileChunk chunk;
  unsigned char record_separator;
  bool is_last;
  uint64_t num_records;
};

/**
 * Merges the configuration file, the FILECHUNKER_ environment variables, and
 * the command line, in this order of priority.
 */
Errors LoadOptions(const Arguments &args, SimpleOptionsParser *options);

/**
 * Validates the options and applies the logging settings.
 */
Errors ResolveParameters(const SimpleOptionsParser &options,
                         Parameters *params);

/**
 * Every record is counted in the chunk that contains its separator.  Only
 * the chunk at the end of the file counts a trailing record that has no
 * separator.
 */
void PrepareJobs(const FileChunkList &chunks,
                 const unsigned char record_separator,
                 const size_t file_size,
                 std::vector<ChunkJob> *jobs);
void CountChunkRecords(ChunkJob *job);

/**
 * Runs one worker per job.  Returns false if a thread cannot be created; in
 * this case the threads that were started are joined before returning.
 */
bool CountRecords(std::vector<ChunkJob> *jobs);

/**
 * Maps path, splits it, and prints the chunk table to stdout.
 */
Errors SplitFile(const std::string &path, const Parameters &params);

}  // namespace split

#ifdef FILECHUNKER_NAMESPACE_GUARD
}  // namespace FILECHUNKER_NAMESPACE_GUARD
#endif

#endif  // FILECHUNKER_SPLIT_H_
