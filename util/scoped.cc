#include "util/scoped.hh"

#include <cstdlib>

namespace util {

MallocException::MallocException(std::size_t requested) throw() {
  *this << "allocating " << requested << " bytes ";
}

MallocException::~MallocException() throw() {}

namespace {
void *Checked(void *block, std::size_t requested, const char *call) {
  // A zero byte request may legitimately return NULL.
  UTIL_THROW_IF_ARG(!block && requested, MallocException, (requested), "in " << call);
  return block;
}
} // namespace

void *MallocOrThrow(std::size_t requested) {
  return Checked(std::malloc(requested), requested, "malloc");
}

void *CallocOrThrow(std::size_t requested) {
  return Checked(std::calloc(requested, 1), requested, "calloc");
}

scoped_malloc::~scoped_malloc() {
  std::free(p_);
}

void scoped_malloc::call_realloc(std::size_t to) {
  p_ = Checked(std::realloc(p_, to), to, "realloc");
}

} // namespace util
