/**
 * This file is part of filechunker.
 */

#ifndef FILECHUNKER_UTIL_EXPORT_H_
#define FILECHUNKER_UTIL_EXPORT_H_

#ifdef FILECHUNKER_LIBRARY
#define FILECHUNKER_EXPORT __attribute__((visibility("default")))
#else
#define FILECHUNKER_EXPORT
#endif

#endif  // FILECHUNKER_UTIL_EXPORT_H_
