/**
 * This file is part of filechunker.
 */

#include "file_chunker.h"

#include <cctype>
#include <cstdlib>

#include "util/logging.h"
#include "util/string.h"

using namespace std;  // NOLINT

#ifdef FILECHUNKER_NAMESPACE_GUARD
namespace FILECHUNKER_NAMESPACE_GUARD {
#endif

bool ParseDelimiter(const std::string &text, ChunkRequest *request) {
  const string upper = ToUpper(text);
  if (text.empty() || (upper == "NONE")) {
    request->has_delimiter = false;
    request->delimiter = 0;
    return true;
  }

  unsigned char delimiter;
  if (text.length() == 1) {
    delimiter = static_cast<unsigned char>(text[0]);
  } else if ((text == "\\n") || (upper == "NEWLINE")) {
    delimiter = '\n';
  } else if (text == "\\r") {
    delimiter = '\r';
  } else if ((text == "\\t") || (upper == "TAB")) {
    delimiter = '\t';
  } else if (text == "\\0") {
    delimiter = '\0';
  } else if (HasPrefix(text, "0x", true) &&
             (text.length() > 2) && (text.length() <= 4))
  {
    for (unsigned i = 2; i < text.length(); ++i) {
      if (!isxdigit(static_cast<unsigned char>(text[i])))
        return false;
    }
    delimiter = static_cast<unsigned char>(
      strtoul(text.c_str() + 2, NULL, 16));
  } else {
    return false;
  }

  request->has_delimiter = true;
  request->delimiter = delimiter;
  return true;
}


string FileChunk::ToString() const {
  if (size_ == 0)
    return "";
  return string(reinterpret_cast<const char *>(data()), size_);
}


FileChunker::FileChunker(MemoryMappedFile *mapping) : mapping_(mapping) { }


FileChunker *FileChunker::Create(const int fd, ChunkerFailures *error) {
  return Map(new MemoryMappedFile(fd), error);
}


FileChunker *FileChunker::Create(const string &path, ChunkerFailures *error) {
  return Map(new MemoryMappedFile(path), error);
}


FileChunker *FileChunker::Map(MemoryMappedFile *mapping,
                              ChunkerFailures *error)
{
  if (!mapping->Map()) {
    LogChunker(kLogChunker, kLogDebug, "cannot map %s",
               mapping->file_path().c_str());
    delete mapping;
    if (error != NULL) *error = kChunkerIoError;
    return NULL;
  }
  if (error != NULL) *error = kChunkerOk;
  return new FileChunker(mapping);
}


ChunkerFailures FileChunker::Chunks(const unsigned count,
                                    FileChunkList *chunks) const
{
  return Chunks(ChunkRequest(count), chunks);
}


ChunkerFailures FileChunker::Chunks(const unsigned count,
                                    const unsigned char delimiter,
                                    FileChunkList *chunks) const
{
  return Chunks(ChunkRequest(count, delimiter), chunks);
}


/**
 * Returns the position right after the first delimiter at or behind boundary.
 * The last byte of the file counts as a delimiter.  Requires
 * boundary < size().
 */
size_t FileChunker::ScanForDelimiter(size_t boundary,
                                     const unsigned char delimiter) const
{
  const unsigned char *data = mapping_->buffer();
  const size_t last = mapping_->size() - 1;
  while ((boundary < last) && (data[boundary] != delimiter))
    ++boundary;
  return boundary + 1;
}


ChunkerFailures FileChunker::Chunks(const ChunkRequest &request,
                                    FileChunkList *chunks) const
{
  chunks->clear();
  if (request.count == 0) {
    LogChunker(kLogChunker, kLogDebug, "refusing to split %s into 0 chunks",
               path().c_str());
    return kChunkerInvalidArgument;
  }

  const size_t total = mapping_->size();
  // Ceiling division, cannot overflow
  const size_t target_size =
    total / request.count + ((total % request.count) ? 1 : 0);

  size_t offset = 0;
  while (offset < total) {
    size_t boundary = offset + target_size;
    if ((boundary >= total) || (boundary < offset)) {
      chunks->push_back(FileChunk(mapping_, offset, total - offset));
      break;
    }
    if (request.has_delimiter)
      boundary = ScanForDelimiter(boundary, request.delimiter);
    chunks->push_back(FileChunk(mapping_, offset, boundary - offset));
    offset = boundary;
  }

  LogChunker(kLogChunker, kLogDebug, "split %s (%lu bytes) into %lu chunks "
             "(requested %u)", path().c_str(),
             static_cast<unsigned long>(total),  // NOLINT
             static_cast<unsigned long>(chunks->size()),  // NOLINT
             request.count);
  return kChunkerOk;
}

#ifdef FILECHUNKER_NAMESPACE_GUARD
}  // namespace FILECHUNKER_NAMESPACE_GUARD
#endif
