/**
 * This file is part of filechunker.
 */

#ifndef FILECHUNKER_UTIL_STRING_H_
#define FILECHUNKER_UTIL_STRING_H_

#include <stdint.h>

#include <cstdio>
#include <string>
#include <vector>

#include "util/export.h"

#ifdef FILECHUNKER_NAMESPACE_GUARD
namespace FILECHUNKER_NAMESPACE_GUARD {
#endif

FILECHUNKER_EXPORT std::string StringifyInt(const int64_t value);
FILECHUNKER_EXPORT bool String2Uint64Parse(const std::string &value,
                                           uint64_t *result);
FILECHUNKER_EXPORT bool HasPrefix(const std::string &str,
                                  const std::string &prefix,
                                  const bool ignore_case);
FILECHUNKER_EXPORT std::vector<std::string> SplitString(
  const std::string &str, char delim);
FILECHUNKER_EXPORT std::string JoinStrings(
  const std::vector<std::string> &strings, const std::string &joint);
FILECHUNKER_EXPORT bool GetLineFile(FILE *f, std::string *line);
FILECHUNKER_EXPORT std::string Trim(const std::string &raw,
                                    bool trim_newline = false);
FILECHUNKER_EXPORT std::string ToUpper(const std::string &mixed_case);

#ifdef FILECHUNKER_NAMESPACE_GUARD
}  // namespace FILECHUNKER_NAMESPACE_GUARD
#endif

#endif  // FILECHUNKER_UTIL_STRING_H_
