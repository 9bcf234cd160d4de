#include "util/line_reader.hh"

#include "util/file.hh"

#include <cstring>

namespace util {

LineReader::LineReader(int fd, std::size_t buffer)
  : reader_(fd),
    buffer_(MallocOrThrow(buffer)), buffer_size_(buffer),
    position_(NULL), end_(NULL), at_end_(false), lines_(0) {}

LineReader::LineReader(const char *file, std::size_t buffer)
  : reader_(OpenReadOrThrow(file)),
    buffer_(MallocOrThrow(buffer)), buffer_size_(buffer),
    position_(NULL), end_(NULL), at_end_(false), lines_(0) {}

bool LineReader::Fill() {
  if (at_end_) return false;
  std::size_t got = reader_.Read(buffer_.get(), buffer_size_);
  if (!got) {
    at_end_ = true;
    return false;
  }
  position_ = static_cast<const char*>(buffer_.get());
  end_ = position_ + got;
  return true;
}

bool LineReader::ReadLine(std::string &out, char delim) {
  out.clear();
  bool any = false;
  while (true) {
    if (position_ == end_ && !Fill()) {
      if (any) ++lines_;
      return any;
    }
    any = true;
    const char *found = static_cast<const char*>(std::memchr(position_, delim, end_ - position_));
    if (found) {
      out.append(position_, found);
      position_ = found + 1;
      ++lines_;
      return true;
    }
    out.append(position_, end_);
    position_ = end_;
  }
}

} // namespace util
