/**
 * This file is part of filechunker.
 */

#ifndef FILECHUNKER_UTIL_SHARED_PTR_H_
#define FILECHUNKER_UTIL_SHARED_PTR_H_

#include <cstdlib>

#include "util/atomic.h"

#ifdef FILECHUNKER_NAMESPACE_GUARD
namespace FILECHUNKER_NAMESPACE_GUARD {
#endif  // FILECHUNKER_NAMESPACE_GUARD

/**
 * Reference counted pointer.  The pointee is deleted when the last copy goes
 * away.  Copies may live in different threads; only the counter is shared.
 */
template <typename T>
class SharedPtr {
 public:
  typedef T element_type;

  SharedPtr() : value_(NULL), count_(NULL) { }  // never throws

  explicit SharedPtr(T *p) : value_(p), count_(NULL) {
    if (value_ != NULL) {
      count_ = new atomic_int64;
      atomic_init64(count_);
      atomic_inc64(count_);
    }
  }

  ~SharedPtr() { Release(); }  // never throws

  SharedPtr(const SharedPtr &r)
      : value_(r.value_), count_(r.count_) {  // never throws
    if (count_)
      atomic_inc64(count_);
  }

  SharedPtr& operator=(const SharedPtr &r) {  // never throws
    if (this == &r)
      return *this;

    Release();
    value_ = r.value_;
    count_ = r.count_;
    if (count_)
      atomic_inc64(count_);
    return *this;
  }

  void Reset() { Release(); }  // never throws

  void Reset(T *p) {
    Release();
    if (p != NULL) {
      value_ = p;
      count_ = new atomic_int64;
      atomic_init64(count_);
      atomic_inc64(count_);
    }
  }

  T& operator*() const { return *value_; }  // never throws
  T* operator->() const { return value_; }  // never throws
  T* Get() const { return value_; }  // never throws
  bool IsValid() const { return value_ != NULL; }

  bool Unique() const {  // never throws
    return count_ && (atomic_read64(count_) == 1);
  }

  int64_t UseCount() const {  // never throws
    return count_ ? atomic_read64(count_) : 0;
  }

 private:
  void Release() {
    if (count_) {
      if (atomic_dec64(count_) == 0) {
        delete value_;
        delete count_;
      }
    }
    value_ = NULL;
    count_ = NULL;
  }

  T            *value_;
  atomic_int64 *count_;
};

template <class T, class U>
bool operator==(const SharedPtr<T> &a, const SharedPtr<U> &b) {
  return a.Get() == b.Get();
}

template <class T, class U>
bool operator!=(const SharedPtr<T> &a, const SharedPtr<U> &b) {
  return a.Get() != b.Get();
}

#ifdef FILECHUNKER_NAMESPACE_GUARD
}  // namespace FILECHUNKER_NAMESPACE_GUARD
#endif

#endif  // FILECHUNKER_UTIL_SHARED_PTR_H_
