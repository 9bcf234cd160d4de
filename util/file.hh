#ifndef UTIL_FILE_H
#define UTIL_FILE_H

#include "util/exception.hh"

#include <cstddef>
#include <cstdio>
#include <string>

#include <stdint.h>

namespace util {

// Owns a file descriptor and closes it on destruction.
class scoped_fd {
  public:
    scoped_fd() : fd_(-1) {}

    explicit scoped_fd(int fd) : fd_(fd) {}

    ~scoped_fd();

    void reset(int to = -1) {
      scoped_fd previous(fd_);
      fd_ = to;
    }

    int get() const { return fd_; }

    int release() {
      int ret = fd_;
      fd_ = -1;
      return ret;
    }

  private:
    int fd_;

    scoped_fd(const scoped_fd &);
    scoped_fd &operator=(const scoped_fd &);
};

// Owns a stdio stream and fcloses it on destruction.
class scoped_FILE {
  public:
    explicit scoped_FILE(std::FILE *file = NULL) : file_(file) {}

    ~scoped_FILE();

    std::FILE *get() { return file_; }

    void reset(std::FILE *to = NULL) {
      scoped_FILE previous(file_);
      file_ = to;
    }

  private:
    std::FILE *file_;

    scoped_FILE(const scoped_FILE &);
    scoped_FILE &operator=(const scoped_FILE &);
};

// A system call on a known descriptor failed.  The message names the file.
class FDException : public ErrnoException {
  public:
    explicit FDException(int fd) throw();

    ~FDException() throw();
};

// The file ended before the bytes a caller asked for.
class EndOfFileException : public Exception {
  public:
    EndOfFileException() throw();
    ~EndOfFileException() throw();
};

int OpenReadOrThrow(const char *name);
// Read and write, truncating any existing file.
int CreateOrThrow(const char *name);

// Size of a regular file.  Pipes and the like throw.
uint64_t SizeOrThrow(int fd);

// Whatever one read returns; 0 means end of file.
std::size_t PartialRead(int fd, void *to, std::size_t size);
void ReadOrThrow(int fd, void *to, std::size_t size);
// Short only at end of file.
std::size_t ReadOrEOF(int fd, void *to, std::size_t size);
void PReadOrThrow(int fd, void *to, std::size_t size, uint64_t offset);

void WriteOrThrow(int fd, const void *data, std::size_t size);
void WriteOrThrow(std::FILE *to, const void *data, std::size_t size);

// Short only at end of file.
std::size_t FReadOrEOF(std::FILE *from, void *to, std::size_t size);
void FFlushOrThrow(std::FILE *to);

// Wrap the descriptor in a stream.  On success file gives up ownership.
std::FILE *FDOpenOrThrow(scoped_fd &file);
std::FILE *FDOpenReadOrThrow(scoped_fd &file);

// A prefix naming an existing directory gets a trailing slash, so "/tmp"
// places files inside /tmp.
void NormalizeTempPrefix(std::string &prefix);
// mkdtemp on prefix followed by six random characters.
std::string MakeTempDir(const std::string &prefix);

// Return false with errno set when removal fails.
bool RemoveFile(const std::string &name);
bool RemoveDirectory(const std::string &name);

int DupOrThrow(int fd);

// Best guess at the path behind fd, for messages only.  Falls back to
// "stdin" and friends or "fd N".
std::string NameFromFD(int fd);

} // namespace util

#endif // UTIL_FILE_H
