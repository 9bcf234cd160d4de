#ifndef NGRAM_EXCEPTION_H
#define NGRAM_EXCEPTION_H

#include "util/exception.hh"

namespace ngram {

// Bad parameters from the caller or the command line.
class ConfigException : public util::Exception {
  public:
    ConfigException() throw();
    ~ConfigException() throw();
};

// Memory could not be found even at the smallest unit of work.
class ResourceException : public util::Exception {
  public:
    ResourceException() throw();
    ~ResourceException() throw();
};

// A spill table or sorted run on disk is not what we wrote, or an input line
// lacks the fields its format needs.
class FormatException : public util::Exception {
  public:
    FormatException() throw();
    ~FormatException() throw();
};

} // namespace ngram

#endif // NGRAM_EXCEPTION_H
