#ifndef UTIL_SCOPED_H
#define UTIL_SCOPED_H

#include "util/exception.hh"

#include <cstddef>

namespace util {

// malloc, calloc or realloc returned NULL.  Callers that fall back on memory
// pressure treat this like std::bad_alloc.
class MallocException : public ErrnoException {
  public:
    explicit MallocException(std::size_t requested) throw();
    ~MallocException() throw();
};

void *MallocOrThrow(std::size_t requested);
// Zeroed.
void *CallocOrThrow(std::size_t requested);

// Frees a malloc block on destruction.
class scoped_malloc {
  public:
    explicit scoped_malloc(void *p = NULL) : p_(p) {}

    ~scoped_malloc();

    void reset(void *p = NULL) {
      scoped_malloc previous(p_);
      p_ = p;
    }

    // Grow or shrink the block.  If that fails the old block stays and
    // MallocException is thrown.
    void call_realloc(std::size_t to);

    void *get() { return p_; }
    const void *get() const { return p_; }

  private:
    void *p_;

    scoped_malloc(const scoped_malloc &);
    scoped_malloc &operator=(const scoped_malloc &);
};

// Single owner of a heap object; the C++98 subset of unique_ptr.
template <class T> class scoped_ptr {
  public:
    explicit scoped_ptr(T *owned = NULL) : p_(owned) {}

    ~scoped_ptr() { delete p_; }

    T *get() { return p_; }
    const T *get() const { return p_; }

    T *operator->() { return p_; }
    const T *operator->() const { return p_; }

    // Destroys the old object before taking the new one.
    void reset(T *to = NULL) {
      delete p_;
      p_ = to;
    }

  private:
    T *p_;

    scoped_ptr(const scoped_ptr &);
    scoped_ptr &operator=(const scoped_ptr &);
};

} // namespace util

#endif // UTIL_SCOPED_H
