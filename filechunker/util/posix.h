/**
 * This file is part of filechunker.
 */

#ifndef FILECHUNKER_UTIL_POSIX_H_
#define FILECHUNKER_UTIL_POSIX_H_

#include <stdint.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <cstddef>
#include <cstdio>
#include <string>

#include "util/export.h"

#ifdef FILECHUNKER_NAMESPACE_GUARD
namespace FILECHUNKER_NAMESPACE_GUARD {
#endif

const int kDefaultFileMode = S_IWUSR | S_IRUSR | S_IRGRP | S_IROTH;
const int kPrivateFileMode = S_IWUSR | S_IRUSR;

FILECHUNKER_EXPORT bool DirectoryExists(const std::string &path);

FILECHUNKER_EXPORT FILE *CreateTempFile(const std::string &path_prefix,
                                        const int mode,
                                        const char *open_flags,
                                        std::string *final_path);
FILECHUNKER_EXPORT std::string CreateTempDir(const std::string &path_prefix);
FILECHUNKER_EXPORT bool RemoveTree(const std::string &path);

FILECHUNKER_EXPORT bool SafeWrite(int fd, const void *buf, size_t nbyte);
FILECHUNKER_EXPORT bool SafeWriteToFile(const std::string &content,
                                        const std::string &path,
                                        int mode);

#ifdef FILECHUNKER_NAMESPACE_GUARD
}  // namespace FILECHUNKER_NAMESPACE_GUARD
#endif

#endif  // FILECHUNKER_UTIL_POSIX_H_
