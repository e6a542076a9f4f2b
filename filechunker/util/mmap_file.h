/**
 * This file is part of filechunker.
 */

#ifndef FILECHUNKER_UTIL_MMAP_FILE_H_
#define FILECHUNKER_UTIL_MMAP_FILE_H_

#include <cstddef>
#include <string>

#include "util/export.h"

#ifdef FILECHUNKER_NAMESPACE_GUARD
namespace FILECHUNKER_NAMESPACE_GUARD {
#endif


/**
 * Wraps the functionality of mmap() to create a read-only memory mapped file.
 * The file is either given by path, in which case it is opened on Map(), or
 * as an open file descriptor that remains owned by the caller.
 *
 * Note: You need to call Map() to actually map the file to memory
 */
class FILECHUNKER_EXPORT MemoryMappedFile {
 public:
  explicit MemoryMappedFile(const std::string &file_path);
  explicit MemoryMappedFile(const int fd);
  ~MemoryMappedFile();

  bool Map();
  void Unmap();

  inline unsigned char*      buffer()    const { return mapped_file_; }
  inline size_t              size()      const { return mapped_size_; }
  inline const std::string&  file_path() const { return file_path_; }

  inline bool IsMapped() const { return mapped_; }

 private:
  MemoryMappedFile(const MemoryMappedFile &other);
  MemoryMappedFile& operator=(const MemoryMappedFile &other);

  const std::string  file_path_;
  const bool         owns_descriptor_;
  int                file_descriptor_;
  unsigned char     *mapped_file_;
  size_t             mapped_size_;
  bool               mapped_;
};


#ifdef FILECHUNKER_NAMESPACE_GUARD
}  // namespace FILECHUNKER_NAMESPACE_GUARD
#endif

#endif  // FILECHUNKER_UTIL_MMAP_FILE_H_
