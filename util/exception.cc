#include "util/exception.hh"

#include <errno.h>
#include <string.h>

namespace util {

Exception::Exception() throw() {}
Exception::~Exception() throw() {}

Exception::Exception(const Exception &from) : std::exception(), location_(from.location_) {
  stream_ << from.stream_.str();
}

Exception &Exception::operator=(const Exception &from) {
  location_ = from.location_;
  stream_.str(from.stream_.str());
  stream_.seekp(0, std::ios_base::end);
  return *this;
}

const char *Exception::what() const throw() {
  what_ = location_ + stream_.str();
  return what_.c_str();
}

void Exception::SetLocation(const char *file, unsigned int line, const char *function, const char *type, const char *condition) {
  std::ostringstream out;
  out << file << ':' << line;
  if (function) out << " in " << function;
  out << " threw " << type;
  if (condition) out << " because `" << condition << '\'';
  out << ".\n";
  location_ = out.str();
}

namespace {
// strerror_r is the XSI one returning int or the GNU one returning a string,
// depending on libc.  Overloading accepts either.
#ifdef __GNUC__
const char *ErrorText(int status, const char *buffer) __attribute__((unused));
const char *ErrorText(const char *text, const char *buffer) __attribute__((unused));
#endif

const char *ErrorText(int status, const char *buffer) {
  return status ? NULL : buffer;
}

const char *ErrorText(const char *text, const char *) {
  return text;
}
} // namespace

ErrnoException::ErrnoException() throw() : errno_(errno) {
  char buffer[256];
  buffer[0] = 0;
  const char *text = ErrorText(strerror_r(errno_, buffer, sizeof(buffer)), buffer);
  if (text) *this << text << ' ';
}

ErrnoException::~ErrnoException() throw() {}

OverflowException::OverflowException() throw() {}
OverflowException::~OverflowException() throw() {}

} // namespace util
