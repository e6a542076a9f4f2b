/**
 * This file is part of filechunker.
 *
 * String helpers used by the configuration parser and the split tool.
 */

#ifndef __STDC_FORMAT_MACROS
// NOLINTNEXTLINE
#define __STDC_FORMAT_MACROS
#endif

#include "util/string.h"

#include <errno.h>
#include <inttypes.h>

#include <cctype>
#include <cstdlib>

using namespace std;  // NOLINT

#ifdef FILECHUNKER_NAMESPACE_GUARD
namespace FILECHUNKER_NAMESPACE_GUARD {
#endif

string StringifyInt(const int64_t value) {
  char buffer[48];
  snprintf(buffer, sizeof(buffer), "%" PRId64, value);
  return string(buffer);
}

/**
 * Accepts decimal numbers only, no sign and no trailing garbage.  Sets errno
 * to EINVAL or ERANGE on failure.
 */
bool String2Uint64Parse(const string &value, uint64_t *result) {
  if (value.empty() || !isdigit(static_cast<unsigned char>(value[0]))) {
    errno = EINVAL;
    return false;
  }
  char *endptr = NULL;
  errno = 0;
  unsigned long long myval = strtoull(value.c_str(), &endptr, 10);  // NOLINT
  if (endptr != (value.c_str() + value.size())) {
    errno = EINVAL;
    return false;
  }
  if (errno) {
    return false;
  }
  if (result) {
    *result = myval;
  }
  return true;
}

bool HasPrefix(const string &str, const string &prefix,
               const bool ignore_case) {
  if (prefix.length() > str.length()) return false;

  for (unsigned i = 0, l = prefix.length(); i < l; ++i) {
    if (ignore_case) {
      if (toupper(str[i]) != toupper(prefix[i])) return false;
    } else {
      if (str[i] != prefix[i]) return false;
    }
  }
  return true;
}

vector<string> SplitString(const string &str, char delim) {
  vector<string> result;

  const unsigned size = str.size();
  unsigned marker = 0;
  for (unsigned i = 0; i < size; ++i) {
    if (str[i] == delim) {
      result.push_back(str.substr(marker, i - marker));
      marker = i + 1;
    }
  }

  // push the remainings of the string and return
  result.push_back(str.substr(marker));
  return result;
}

string JoinStrings(const vector<string> &strings, const string &joint) {
  string result = "";
  const unsigned size = strings.size();

  if (size > 0) {
    result = strings[0];
    for (unsigned i = 1; i < size; ++i) result += joint + strings[i];
  }

  return result;
}

bool GetLineFile(FILE *f, string *line) {
  int retval;
  line->clear();
  while (true) {
    retval = fgetc(f);
    if (ferror(f) && (errno == EINTR)) {
      clearerr(f);
      continue;
    } else if (retval == EOF) {
      break;
    }
    char c = static_cast<char>(retval);
    if (c == '\n') break;
    line->push_back(c);
  }
  return (retval != EOF) || !line->empty();
}

string Trim(const string &raw, bool trim_newline) {
  if (raw.empty()) return "";

  unsigned start_pos = 0;
  for (; (start_pos < raw.length()) &&
         (raw[start_pos] == ' ' || raw[start_pos] == '\t' ||
         (trim_newline && (raw[start_pos] == '\n' || raw[start_pos] == '\r')));
       ++start_pos)
  {
  }
  if (start_pos == raw.length()) return "";

  unsigned end_pos = raw.length() - 1;  // at least one character in raw
  for (;
       (end_pos > start_pos) &&
         (raw[end_pos] == ' ' || raw[end_pos] == '\t' ||
         (trim_newline && (raw[end_pos] == '\n' || raw[end_pos] == '\r')));
       --end_pos)
  {
  }

  return raw.substr(start_pos, end_pos - start_pos + 1);
}

string ToUpper(const string &mixed_case) {
  string result(mixed_case);
  for (unsigned i = 0, l = result.length(); i < l; ++i) {
    result[i] = static_cast<char>(toupper(result[i]));
  }
  return result;
}

#ifdef FILECHUNKER_NAMESPACE_GUARD
}  // namespace FILECHUNKER_NAMESPACE_GUARD
#endif
