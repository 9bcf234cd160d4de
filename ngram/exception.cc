#include "ngram/exception.hh"

namespace ngram {

ConfigException::ConfigException() throw() {}
ConfigException::~ConfigException() throw() {}

ResourceException::ResourceException() throw() {}
ResourceException::~ResourceException() throw() {}

FormatException::FormatException() throw() {}
FormatException::~FormatException() throw() {}

} // namespace ngram
