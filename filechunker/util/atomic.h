/**
 * This file is part of filechunker.
 *
 * Wrapper functions for the atomic counter operations of SharedPtr.  The
 * operations are handled by GCC builtins.
 */

#ifndef FILECHUNKER_UTIL_ATOMIC_H_
#define FILECHUNKER_UTIL_ATOMIC_H_

#include <stdint.h>

#ifdef FILECHUNKER_NAMESPACE_GUARD
namespace FILECHUNKER_NAMESPACE_GUARD {
#endif

typedef int64_t atomic_int64;

static void inline __attribute__((used)) atomic_init64(atomic_int64 *a) {
  *a = 0;
}

static int64_t inline __attribute__((used)) atomic_read64(atomic_int64 *a) {
  return __sync_fetch_and_add(a, 0);
}

static void inline __attribute__((used)) atomic_inc64(atomic_int64 *a) {
  (void) __sync_fetch_and_add(a, 1);
}

/**
 * Returns the counter value after the decrement, so that exactly one of
 * several concurrent callers sees zero.
 */
static int64_t inline __attribute__((used)) atomic_dec64(atomic_int64 *a) {
  return __sync_sub_and_fetch(a, 1);
}

#ifdef FILECHUNKER_NAMESPACE_GUARD
}  // namespace FILECHUNKER_NAMESPACE_GUARD
#endif

#endif  // FILECHUNKER_UTIL_ATOMIC_H_
