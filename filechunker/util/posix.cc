/**
 * This file is part of filechunker.
 *
 * File system helpers, mostly used by the tools and the unit tests.
 */

#include "util/posix.h"

#include <errno.h>
#include <fcntl.h>
#include <ftw.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cassert>
#include <cstdio>
#include <cstdlib>
#include <vector>

#include "util/platform.h"

using namespace std;  // NOLINT

#ifdef FILECHUNKER_NAMESPACE_GUARD
namespace FILECHUNKER_NAMESPACE_GUARD {
#endif

/**
 * Checks if the directory (not symlink) path exists.
 */
bool DirectoryExists(const std::string &path) {
  platform_stat64 info;
  return ((platform_lstat(path.c_str(), &info) == 0) &&
          S_ISDIR(info.st_mode));
}


FILE *CreateTempFile(const std::string &path_prefix, const int mode,
                     const char *open_flags, std::string *final_path)
{
  *final_path = path_prefix + ".XXXXXX";
  vector<char> tmp_file(final_path->begin(), final_path->end());
  tmp_file.push_back('\0');
  int tmp_fd = mkstemp(&tmp_file[0]);
  if (tmp_fd < 0) {
    return NULL;
  }
  if (fchmod(tmp_fd, mode) != 0) {
    close(tmp_fd);
    return NULL;
  }

  *final_path = &tmp_file[0];
  FILE *tmp_fp = fdopen(tmp_fd, open_flags);
  if (!tmp_fp) {
    close(tmp_fd);
    unlink(&tmp_file[0]);
    return NULL;
  }

  return tmp_fp;
}


/**
 * Creates a private directory path_prefix.XXXXXX.  Returns the empty string on
 * failure.
 */
std::string CreateTempDir(const std::string &path_prefix) {
  std::string dir = path_prefix + ".XXXXXX";
  vector<char> tmp_dir(dir.begin(), dir.end());
  tmp_dir.push_back('\0');
  if (mkdtemp(&tmp_dir[0]) == NULL)
    return "";
  return std::string(&tmp_dir[0]);
}


namespace {

int RemoveTreeEntry(const char *fpath, const struct stat * /* sb */,
                    int typeflag, struct FTW * /* ftwbuf */)
{
  int retval;
  if ((typeflag == FTW_DP) || (typeflag == FTW_D))
    retval = rmdir(fpath);
  else
    retval = unlink(fpath);
  // Returning non-zero stops the walk
  return (retval == 0) ? 0 : -1;
}

}  // anonymous namespace


/**
 * Removes a directory with all its content, like rm -rf.  A path that does
 * not exist counts as removed.
 */
bool RemoveTree(const std::string &path) {
  platform_stat64 info;
  int retval = platform_lstat(path.c_str(), &info);
  if (retval != 0)
    return errno == ENOENT;
  if (!S_ISDIR(info.st_mode))
    return false;

  retval = nftw(path.c_str(), RemoveTreeEntry, 16, FTW_DEPTH | FTW_PHYS);
  return retval == 0;
}


bool SafeWrite(int fd, const void *buf, size_t nbyte) {
  while (nbyte) {
    ssize_t retval = write(fd, buf, nbyte);
    if (retval < 0) {
      if (errno == EINTR)
        continue;
      return false;
    }
    assert(static_cast<size_t>(retval) <= nbyte);
    buf = reinterpret_cast<const char *>(buf) + retval;
    nbyte -= retval;
  }
  return true;
}


bool SafeWriteToFile(const std::string &content,
                     const std::string &path,
                     int mode) {
  int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, mode);
  if (fd < 0) return false;
  bool retval = SafeWrite(fd, content.data(), content.size());
  if (close(fd) != 0)
    return false;
  return retval;
}

#ifdef FILECHUNKER_NAMESPACE_GUARD
}  // namespace FILECHUNKER_NAMESPACE_GUARD
#endif
