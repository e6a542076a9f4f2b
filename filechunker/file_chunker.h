/**
 * This file is part of filechunker.
 *
 * Splits a memory mapped file into a given number of roughly equally sized
 * chunks, e.g. to process a large log file with one thread per chunk.  If a
 * delimiter is given, every chunk but the last one ends right after a
 * delimiter byte so that no record is cut in half.
 */

#ifndef FILECHUNKER_FILE_CHUNKER_H_
#define FILECHUNKER_FILE_CHUNKER_H_

#include <cstddef>
#include <string>
#include <vector>

#include "util/export.h"
#include "util/mmap_file.h"
#include "util/shared_ptr.h"

#ifdef FILECHUNKER_NAMESPACE_GUARD
namespace FILECHUNKER_NAMESPACE_GUARD {
#endif

enum ChunkerFailures {
  kChunkerOk = 0,
  kChunkerIoError,
  kChunkerInvalidArgument,

  kChunkerNumEntries
};  // ChunkerFailures

inline const char *Code2Ascii(const ChunkerFailures error) {
  const char *texts[kChunkerNumEntries + 1];
  texts[0] = "OK";
  texts[1] = "file cannot be mapped";
  texts[2] = "invalid chunk request";
  texts[3] = "no text";
  return texts[error];
}


/**
 * Parameters of a single chunking run.  A count of zero is not a valid
 * request.
 */
struct FILECHUNKER_EXPORT ChunkRequest {
  ChunkRequest() : count(1), has_delimiter(false), delimiter(0) { }
  explicit ChunkRequest(const unsigned c)
    : count(c), has_delimiter(false), delimiter(0) { }
  ChunkRequest(const unsigned c, const unsigned char d)
    : count(c), has_delimiter(true), delimiter(d) { }

  unsigned count;
  bool has_delimiter;
  unsigned char delimiter;
};

/**
 * Parses a human readable delimiter into request.  Accepted are "none" or the
 * empty string (no delimiter), the escapes \n \r \t \0, the names "newline"
 * and "tab", a single character, and a hex byte like 0x1e.
 */
FILECHUNKER_EXPORT bool ParseDelimiter(const std::string &text,
                                       ChunkRequest *request);


/**
 * A contiguous byte range of a mapped file.  Every chunk holds a reference to
 * the mapping, so the bytes stay readable as long as the chunk exists, even
 * after the FileChunker is gone.  Copies are cheap and can be passed to other
 * threads.
 */
class FILECHUNKER_EXPORT FileChunk {
 public:
  FileChunk() : offset_(0), size_(0) { }
  FileChunk(const SharedPtr<MemoryMappedFile> &mapping,
            const size_t offset,
            const size_t size)
    : mapping_(mapping), offset_(offset), size_(size) { }

  const unsigned char *data() const {
    return mapping_.IsValid() ? mapping_->buffer() + offset_ : NULL;
  }
  size_t offset() const { return offset_; }
  size_t size()   const { return size_; }
  bool IsEmpty()  const { return size_ == 0; }

  /**
   * Copies the chunk's bytes.  Meant for tests and small chunks.
   */
  std::string ToString() const;

 private:
  SharedPtr<MemoryMappedFile> mapping_;
  size_t offset_;
  size_t size_;
};

typedef std::vector<FileChunk> FileChunkList;


/**
 * Owns the read-only mapping of a file and computes chunk lists over it.
 * The content of the file must not change while it is mapped.
 */
class FILECHUNKER_EXPORT FileChunker {
 public:
  /**
   * Maps the file behind an open, readable descriptor.  The descriptor is not
   * taken over and can be closed once Create() returns.  Returns NULL if the
   * file cannot be mapped.
   */
  static FileChunker *Create(const int fd, ChunkerFailures *error = NULL);
  static FileChunker *Create(const std::string &path,
                             ChunkerFailures *error = NULL);

  /**
   * Fills chunks with the ordered, gapless chunk list of the file.  The number
   * of chunks is exactly request.count (or less for tiny files) without a
   * delimiter and at most request.count with one.  An empty file yields no
   * chunks.
   *
   * @return kChunkerInvalidArgument if request.count is zero, kChunkerOk
   *         otherwise
   */
  ChunkerFailures Chunks(const ChunkRequest &request,
                         FileChunkList *chunks) const;
  ChunkerFailures Chunks(const unsigned count, FileChunkList *chunks) const;
  ChunkerFailures Chunks(const unsigned count,
                         const unsigned char delimiter,
                         FileChunkList *chunks) const;

  const unsigned char *buffer() const { return mapping_->buffer(); }
  size_t size() const { return mapping_->size(); }
  const std::string &path() const { return mapping_->file_path(); }

 private:
  explicit FileChunker(MemoryMappedFile *mapping);
  FileChunker(const FileChunker &other);
  FileChunker& operator=(const FileChunker &other);

  static FileChunker *Map(MemoryMappedFile *mapping, ChunkerFailures *error);

  size_t ScanForDelimiter(size_t boundary,
                          const unsigned char delimiter) const;

  SharedPtr<MemoryMappedFile> mapping_;
};

#ifdef FILECHUNKER_NAMESPACE_GUARD
}  // namespace FILECHUNKER_NAMESPACE_GUARD
#endif

#endif  // FILECHUNKER_FILE_CHUNKER_H_
