#define _FILE_OFFSET_BITS 64

#include "util/file.hh"

#include <algorithm>
#include <cstring>
#include <iostream>
#include <sstream>
#include <vector>

#include <errno.h>
#include <fcntl.h>
#include <limits.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace util {

scoped_fd::~scoped_fd() {
  if (fd_ != -1 && close(fd_))
    std::cerr << "Warning: closing " << NameFromFD(fd_) << " failed: " << std::strerror(errno) << std::endl;
}

scoped_FILE::~scoped_FILE() {
  if (file_ && std::fclose(file_))
    std::cerr << "Warning: closing a stream failed: " << std::strerror(errno) << std::endl;
}

// ErrnoException captures errno before the name lookup can disturb it.
FDException::FDException(int fd) throw() {
  *this << "on " << NameFromFD(fd) << ' ';
}

FDException::~FDException() throw() {}

EndOfFileException::EndOfFileException() throw() {
  *this << "Unexpected end of file";
}

EndOfFileException::~EndOfFileException() throw() {}

int OpenReadOrThrow(const char *name) {
  int fd = open(name, O_RDONLY);
  UTIL_THROW_IF(fd == -1, ErrnoException, "while opening " << name << " for read");
  return fd;
}

int CreateOrThrow(const char *name) {
  int fd = open(name, O_RDWR | O_CREAT | O_TRUNC, 0644);
  UTIL_THROW_IF(fd == -1, ErrnoException, "while creating " << name);
  return fd;
}

uint64_t SizeOrThrow(int fd) {
  struct stat info;
  UTIL_THROW_IF_ARG(fstat(fd, &info), FDException, (fd), "in fstat");
  UTIL_THROW_IF_ARG(!S_ISREG(info.st_mode), FDException, (fd), "is not a regular file so it has no size");
  return info.st_size;
}

namespace {
// Retry a read or write interrupted by a signal.
template <class Call> ssize_t Restarting(Call call) {
  ssize_t ret;
  do {
    errno = 0;
    ret = call();
  } while (ret == -1 && errno == EINTR);
  return ret;
}

struct ReadCall {
  int fd; void *to; std::size_t size;
  ssize_t operator()() const { return read(fd, to, size); }
};

struct PReadCall {
  int fd; void *to; std::size_t size; off_t offset;
  ssize_t operator()() const { return pread(fd, to, size, offset); }
};

struct WriteCall {
  int fd; const void *from; std::size_t size;
  ssize_t operator()() const { return write(fd, from, size); }
};

// Linux caps a single transfer a little under 2 GiB.
const std::size_t kMaxTransfer = static_cast<std::size_t>(INT_MAX) & ~static_cast<std::size_t>(4095);
} // namespace

std::size_t PartialRead(int fd, void *to, std::size_t size) {
  ReadCall call = {fd, to, std::min(size, kMaxTransfer)};
  ssize_t got = Restarting(call);
  UTIL_THROW_IF_ARG(got < 0, FDException, (fd), "reading " << size << " bytes");
  return static_cast<std::size_t>(got);
}

void ReadOrThrow(int fd, void *to, std::size_t size) {
  std::size_t got = ReadOrEOF(fd, to, size);
  UTIL_THROW_IF(got != size, EndOfFileException, " in " << NameFromFD(fd) << " after " << got << " of " << size << " bytes");
}

std::size_t ReadOrEOF(int fd, void *to, std::size_t size) {
  uint8_t *at = static_cast<uint8_t*>(to);
  std::size_t done = 0;
  while (done < size) {
    std::size_t got = PartialRead(fd, at + done, size - done);
    if (!got) break;
    done += got;
  }
  return done;
}

void PReadOrThrow(int fd, void *to, std::size_t size, uint64_t offset) {
  uint8_t *at = static_cast<uint8_t*>(to);
  while (size) {
    PReadCall call = {fd, at, std::min(size, kMaxTransfer), static_cast<off_t>(offset)};
    ssize_t got = Restarting(call);
    UTIL_THROW_IF_ARG(got < 0, FDException, (fd), "reading " << size << " bytes at offset " << offset);
    UTIL_THROW_IF(!got, EndOfFileException, " in " << NameFromFD(fd) << " reading " << size << " bytes at offset " << offset);
    at += got;
    size -= got;
    offset += got;
  }
}

void WriteOrThrow(int fd, const void *data, std::size_t size) {
  const uint8_t *at = static_cast<const uint8_t*>(data);
  while (size) {
    WriteCall call = {fd, at, std::min(size, kMaxTransfer)};
    ssize_t wrote = Restarting(call);
    UTIL_THROW_IF_ARG(wrote <= 0, FDException, (fd), "writing " << size << " bytes");
    at += wrote;
    size -= wrote;
  }
}

void WriteOrThrow(std::FILE *to, const void *data, std::size_t size) {
  UTIL_THROW_IF(size && std::fwrite(data, 1, size, to) != size, ErrnoException, "writing " << size << " bytes to a stream");
}

std::size_t FReadOrEOF(std::FILE *from, void *to, std::size_t size) {
  std::size_t got = std::fread(to, 1, size, from);
  UTIL_THROW_IF(got < size && std::ferror(from), ErrnoException, "reading " << size << " bytes from a stream");
  return got;
}

void FFlushOrThrow(std::FILE *to) {
  UTIL_THROW_IF(std::fflush(to), ErrnoException, "flushing a stream");
}

namespace {
std::FILE *Wrap(scoped_fd &file, const char *mode) {
  std::FILE *ret = fdopen(file.get(), mode);
  UTIL_THROW_IF_ARG(!ret, FDException, (file.get()), "in fdopen with mode " << mode);
  file.release();
  return ret;
}
} // namespace

std::FILE *FDOpenOrThrow(scoped_fd &file) {
  return Wrap(file, "r+b");
}

std::FILE *FDOpenReadOrThrow(scoped_fd &file) {
  return Wrap(file, "rb");
}

void NormalizeTempPrefix(std::string &prefix) {
  if (prefix.empty() || prefix[prefix.size() - 1] == '/') return;
  struct stat info;
  // A prefix that does not exist yet is a file name stem.
  if (!stat(prefix.c_str(), &info) && S_ISDIR(info.st_mode)) prefix += '/';
}

std::string MakeTempDir(const std::string &prefix) {
  std::string pattern(prefix + "XXXXXX");
  std::vector<char> buffer(pattern.begin(), pattern.end());
  buffer.push_back(0);
  UTIL_THROW_IF(!mkdtemp(&buffer[0]), ErrnoException, "while creating a temporary directory from " << prefix);
  return std::string(&buffer[0]);
}

bool RemoveFile(const std::string &name) {
  return !unlink(name.c_str());
}

bool RemoveDirectory(const std::string &name) {
  return !rmdir(name.c_str());
}

int DupOrThrow(int fd) {
  int ret = dup(fd);
  UTIL_THROW_IF_ARG(ret == -1, FDException, (fd), "in dup");
  return ret;
}

std::string NameFromFD(int fd) {
  std::ostringstream link;
  link << "/proc/self/fd/" << fd;
  char target[PATH_MAX];
  ssize_t length = readlink(link.str().c_str(), target, sizeof(target));
  // Pipes and sockets come back as "pipe:[123]"; only paths are useful.
  if (length > 0 && static_cast<std::size_t>(length) < sizeof(target) && target[0] == '/')
    return std::string(target, length);
  switch (fd) {
    case 0: return "stdin";
    case 1: return "stdout";
    case 2: return "stderr";
  }
  std::ostringstream fallback;
  fallback << "fd " << fd;
  return fallback.str();
}

} // namespace util
