#ifndef UTIL_EXCEPTION_H
#define UTIL_EXCEPTION_H

#include <cstddef>
#include <exception>
#include <limits>
#include <sstream>
#include <string>

#include <stdint.h>

namespace util {

/* Base of every error the engine throws.  Messages are built with <<, and the
 * UTIL_THROW macros put the throw site in front of them.
 */
class Exception : public std::exception {
  public:
    Exception() throw();
    virtual ~Exception() throw();

    Exception(const Exception &from);
    Exception &operator=(const Exception &from);

    template <class T> Exception &operator<<(const T &data) {
      stream_ << data;
      return *this;
    }

    const char *what() const throw();

    // Called by the macros.  condition may be NULL.
    void SetLocation(const char *file, unsigned int line, const char *function, const char *type, const char *condition);

  private:
    std::string location_;
    std::ostringstream stream_;
    mutable std::string what_;
};

#ifdef __GNUC__
#define UTIL_FUNC_NAME __PRETTY_FUNCTION__
#define UTIL_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
#define UTIL_FUNC_NAME NULL
#define UTIL_UNLIKELY(x) (x)
#endif

/* Construct Exception with the parenthesized Arg (which may be empty), append
 * Modify, a << chain, and throw.
 */
#define UTIL_THROW_BACKEND(Condition, Exception, Arg, Modify) do { \
  Exception UTIL_e Arg; \
  UTIL_e.SetLocation(__FILE__, __LINE__, UTIL_FUNC_NAME, #Exception, Condition); \
  UTIL_e << Modify; \
  throw UTIL_e; \
} while (0)

#define UTIL_THROW_ARG(Exception, Arg, Modify) \
  UTIL_THROW_BACKEND(NULL, Exception, Arg, Modify)

#define UTIL_THROW(Exception, Modify) \
  UTIL_THROW_BACKEND(NULL, Exception, , Modify)

#define UTIL_THROW_IF_ARG(Condition, Exception, Arg, Modify) do { \
  if (UTIL_UNLIKELY(Condition)) { \
    UTIL_THROW_BACKEND(#Condition, Exception, Arg, Modify); \
  } \
} while (0)

#define UTIL_THROW_IF(Condition, Exception, Modify) \
  UTIL_THROW_IF_ARG(Condition, Exception, , Modify)

// Appends strerror of the errno current at construction.
class ErrnoException : public Exception {
  public:
    ErrnoException() throw();

    virtual ~ErrnoException() throw();

    int Error() const throw() { return errno_; }

  private:
    int errno_;
};

// A count does not fit the type that has to hold it.
class OverflowException : public Exception {
  public:
    OverflowException() throw();
    ~OverflowException() throw();
};

inline std::size_t CheckOverflow(uint64_t value) {
  UTIL_THROW_IF(value > static_cast<uint64_t>(std::numeric_limits<std::size_t>::max()), OverflowException, value << " does not fit in size_t on this platform.");
  return static_cast<std::size_t>(value);
}

} // namespace util

#endif // UTIL_EXCEPTION_H
