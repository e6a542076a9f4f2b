/**
 * This file is part of filechunker.
 */

#include "split.h"

#include <pthread.h>

#include <cerrno>

#include "util/logging.h"
#include "util/string.h"

using namespace std;  // NOLINT

#ifdef FILECHUNKER_NAMESPACE_GUARD
namespace FILECHUNKER_NAMESPACE_GUARD {
#endif

namespace split {

namespace {

void *MainCountRecords(void *data) {
  CountChunkRecords(reinterpret_cast<ChunkJob *>(data));
  return NULL;
}

}  // anonymous namespace


Errors LoadOptions(const Arguments &args, SimpleOptionsParser *options) {
  if (!args.config_file.empty() && !options->TryParsePath(args.config_file)) {
    LogChunker(kLogSplit, kLogStderr, "cannot read configuration file %s",
               args.config_file.c_str());
    return kErrorUsage;
  }
  options->ParseEnvironment("FILECHUNKER_");
  if (!args.chunks.empty())
    options->SetValue("FILECHUNKER_CHUNKS", args.chunks);
  if (!args.delimiter.empty())
    options->SetValue("FILECHUNKER_DELIMITER", args.delimiter);
  if (args.workers)
    options->SetValue("FILECHUNKER_WORKERS", "yes");
  if (!args.log_level.empty())
    options->SetValue("FILECHUNKER_LOG_LEVEL", args.log_level);
  if (args.verbose)
    options->SetValue("FILECHUNKER_VERBOSE", "yes");
  return kErrorOk;
}


Errors ResolveParameters(const SimpleOptionsParser &options,
                         Parameters *params)
{
  string value;
  if (options.GetValue("FILECHUNKER_LOG_LEVEL", &value)) {
    uint64_t level;
    if (!String2Uint64Parse(value, &level) || (level > 4)) {
      LogChunker(kLogSplit, kLogStderr, "invalid log level: %s",
                 value.c_str());
      return kErrorUsage;
    }
    SetLogVerbosity(static_cast<LogLevels>(kLogLevel0 << level));
  }
  if (options.GetValue("FILECHUNKER_SYSLOG_LEVEL", &value)) {
    uint64_t level;
    if (String2Uint64Parse(value, &level))
      SetLogSyslogLevel(static_cast<int>(level));
  }
  if (options.GetValue("FILECHUNKER_DEBUGLOG", &value))
    SetLogDebugFile(value);

  params->verbose =
    options.GetValue("FILECHUNKER_VERBOSE", &value) && options.IsOn(value);
  params->count_records =
    options.GetValue("FILECHUNKER_WORKERS", &value) && options.IsOn(value);

  if (options.GetValue("FILECHUNKER_CHUNKS", &value)) {
    uint64_t count;
    if (!String2Uint64Parse(value, &count) || (count == 0) ||
        (count > 0xFFFFFFFFu))
    {
      LogChunker(kLogSplit, kLogStderr, "invalid number of chunks: %s",
                 value.c_str());
      return kErrorInvalidArgument;
    }
    params->request.count = static_cast<unsigned>(count);
  }
  if (options.GetValue("FILECHUNKER_DELIMITER", &value) &&
      !ParseDelimiter(value, &params->request))
  {
    LogChunker(kLogSplit, kLogStderr, "invalid delimiter: %s", value.c_str());
    return kErrorInvalidArgument;
  }

  if (params->verbose) {
    LogChunker(kLogSplit, kLogStderr | kLogNoLinebreak,
               "effective configuration:\n%s", options.Dump().c_str());
  }
  return kErrorOk;
}


void PrepareJobs(const FileChunkList &chunks,
                 const unsigned char record_separator,
                 const size_t file_size,
                 vector<ChunkJob> *jobs)
{
  jobs->clear();
  jobs->resize(chunks.size());
  for (unsigned i = 0; i < chunks.size(); ++i) {
    (*jobs)[i].chunk = chunks[i];
    (*jobs)[i].record_separator = record_separator;
    (*jobs)[i].is_last =
      (chunks[i].offset() + chunks[i].size() == file_size);
  }
}


void CountChunkRecords(ChunkJob *job) {
  const unsigned char *bytes = job->chunk.data();
  const size_t size = job->chunk.size();

  uint64_t num_records = 0;
  for (size_t i = 0; i < size; ++i) {
    if (bytes[i] == job->record_separator)
      num_records++;
  }
  if (job->is_last && (size > 0) && (bytes[size - 1] != job->record_separator))
    num_records++;

  job->num_records = num_records;
}


bool CountRecords(vector<ChunkJob> *jobs) {
  vector<pthread_t> workers(jobs->size());
  unsigned num_started = 0;
  bool retval = true;
  for (unsigned i = 0; i < jobs->size(); ++i) {
    LogChunker(kLogSplit, kLogDebug, "starting worker %u", i);
    if (pthread_create(&workers[i], NULL, MainCountRecords, &(*jobs)[i]) != 0)
    {
      LogChunker(kLogSplit, kLogStderr, "could not create worker thread %u",
                 i);
      retval = false;
      break;
    }
    num_started++;
  }
  for (unsigned i = 0; i < num_started; ++i) {
    pthread_join(workers[i], NULL);
  }
  return retval;
}


Errors SplitFile(const string &path, const Parameters &params) {
  ChunkerFailures retval;
  FileChunker *chunker = FileChunker::Create(path, &retval);
  if (chunker == NULL) {
    LogChunker(kLogSplit, kLogStderr, "failed to map %s: %s (errno: %d)",
               path.c_str(), Code2Ascii(retval), errno);
    return kErrorIo;
  }

  const ChunkRequest &request = params.request;
  const size_t file_size = chunker->size();
  FileChunkList chunks;
  retval = chunker->Chunks(request, &chunks);
  // The chunks keep the mapping alive on their own
  delete chunker;
  if (retval != kChunkerOk) {
    LogChunker(kLogSplit, kLogStderr, "failed to split %s: %s",
               path.c_str(), Code2Ascii(retval));
    return kErrorInvalidArgument;
  }
  if (params.verbose) {
    LogChunker(kLogSplit, kLogStderr, "%s: %u chunks requested, %lu created",
               path.c_str(), request.count,
               static_cast<unsigned long>(chunks.size()));  // NOLINT
  }

  vector<ChunkJob> jobs;
  PrepareJobs(chunks, request.has_delimiter ? request.delimiter : '\n',
              file_size, &jobs);
  if (params.count_records && !CountRecords(&jobs))
    return kErrorOperational;

  uint64_t total_records = 0;
  for (unsigned i = 0; i < jobs.size(); ++i) {
    const FileChunk &chunk = jobs[i].chunk;
    if (params.count_records) {
      LogChunker(kLogSplit, kLogStdout, "%u\t%lu\t%lu\t%lu", i,
                 static_cast<unsigned long>(chunk.offset()),  // NOLINT
                 static_cast<unsigned long>(chunk.size()),  // NOLINT
                 static_cast<unsigned long>(jobs[i].num_records));  // NOLINT
      total_records += jobs[i].num_records;
    } else {
      LogChunker(kLogSplit, kLogStdout, "%u\t%lu\t%lu", i,
                 static_cast<unsigned long>(chunk.offset()),  // NOLINT
                 static_cast<unsigned long>(chunk.size()));  // NOLINT
    }
  }
  if (params.count_records && params.verbose) {
    LogChunker(kLogSplit, kLogStderr, "%lu records in total",
               static_cast<unsigned long>(total_records));  // NOLINT
  }
  return kErrorOk;
}

}  // namespace split

#ifdef FILECHUNKER_NAMESPACE_GUARD
}  // namespace FILECHUNKER_NAMESPACE_GUARD
#endif
