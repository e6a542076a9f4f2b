/**
 * This file is part of filechunker.
 */

#include "util/mmap_file.h"

#include <errno.h>
#include <fcntl.h>
#include <sys/mman.h>
#include <unistd.h>

#include "util/exception.h"
#include "util/logging.h"
#include "util/platform.h"
#include "util/string.h"

using namespace std;  // NOLINT

#ifdef FILECHUNKER_NAMESPACE_GUARD
namespace FILECHUNKER_NAMESPACE_GUARD {
#endif


MemoryMappedFile::MemoryMappedFile(const std::string &file_path) :
  file_path_(file_path),
  owns_descriptor_(true),
  file_descriptor_(-1),
  mapped_file_(NULL),
  mapped_size_(0),
  mapped_(false) {}

MemoryMappedFile::MemoryMappedFile(const int fd) :
  file_path_("fd:" + StringifyInt(fd)),
  owns_descriptor_(false),
  file_descriptor_(fd),
  mapped_file_(NULL),
  mapped_size_(0),
  mapped_(false) {}

MemoryMappedFile::~MemoryMappedFile() {
  if (IsMapped()) {
    Unmap();
  }
}

bool MemoryMappedFile::Map() {
  if (mapped_) {
    LogChunker(kLogMmap, kLogDebug, "%s is already mapped",
               file_path_.c_str());
    return false;
  }

  // open the file, unless we got a descriptor
  int fd = file_descriptor_;
  if (owns_descriptor_) {
    if ((fd = open(file_path_.c_str(), O_RDONLY, 0)) == -1) {
      LogChunker(kLogMmap, kLogDebug, "failed to open %s (%d)",
                 file_path_.c_str(), errno);
      return false;
    }
  }

  // get file size
  platform_stat64 filesize;
  if (platform_fstat(fd, &filesize) != 0) {
    LogChunker(kLogMmap, kLogDebug, "failed to fstat %s (%d)",
               file_path_.c_str(), errno);
    if (owns_descriptor_) close(fd);
    return false;
  }
  if (S_ISDIR(filesize.st_mode)) {
    LogChunker(kLogMmap, kLogDebug, "%s is a directory",
               file_path_.c_str());
    if (owns_descriptor_) close(fd);
    return false;
  }

  // check if the file is empty and 'pretend' that the file is mapped
  // --> buffer will then look like a buffer without any size...
  void *mapping = NULL;
  if (filesize.st_size > 0) {
    // map the given file into memory
    mapping = mmap(NULL, filesize.st_size, PROT_READ, MAP_PRIVATE, fd, 0);
    if (mapping == MAP_FAILED) {  // NOLINT(performance-no-int-to-ptr)
      LogChunker(kLogMmap, kLogDebug,
                 "failed to mmap %s (file size: %lld) (errno: %d)",
                 file_path_.c_str(),
                 static_cast<long long>(filesize.st_size),  // NOLINT
                 errno);
      if (owns_descriptor_) close(fd);
      return false;
    }
  }

  // save results
  mapped_file_     = static_cast<unsigned char*>(mapping);
  file_descriptor_ = fd;
  mapped_size_     = filesize.st_size;
  mapped_          = true;
  LogChunker(kLogMmap, kLogDebug, "mmap'ed %s (%lu bytes)", file_path_.c_str(),
             static_cast<unsigned long>(mapped_size_));  // NOLINT
  return true;
}

void MemoryMappedFile::Unmap() {
  if (!mapped_) {
    PANIC(kLogStderr, "attempt to unmap %s which is not mapped",
          file_path_.c_str());
  }

  // unmap the previously mapped file
  if ((mapped_file_ != NULL) &&
      (munmap(static_cast<void*>(mapped_file_), mapped_size_) != 0))
  {
    PANIC(kLogStderr | kLogSyslogErr, "failed to unmap %s (%d)",
          file_path_.c_str(), errno);
  }
  if (owns_descriptor_) {
    if (close(file_descriptor_) != 0) {
      LogChunker(kLogMmap, kLogDebug | kLogSyslogWarn,
                 "failed to close %s (%d)", file_path_.c_str(), errno);
    }
    file_descriptor_ = -1;
  }

  // reset (resettable) data
  mapped_file_     = NULL;
  mapped_size_     = 0;
  mapped_          = false;
  LogChunker(kLogMmap, kLogDebug, "munmap'ed %s", file_path_.c_str());
}

#ifdef FILECHUNKER_NAMESPACE_GUARD
}  // namespace FILECHUNKER_NAMESPACE_GUARD
#endif
