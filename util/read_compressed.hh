#ifndef UTIL_READ_COMPRESSED_H
#define UTIL_READ_COMPRESSED_H

#include "util/exception.hh"
#include "util/scoped.hh"

#include <cstddef>

#include <stdint.h>

namespace util {

// Corrupt or truncated compressed input, or a format the build left out.
class CompressedException : public Exception {
  public:
    CompressedException() throw();
    ~CompressedException() throw();
};

namespace detail { class Decoder; }

/* Byte stream over a file that is plain text or gzip, bzip2 or xz, told
 * apart by its first bytes.  Each compressed format needs its library at
 * build time (HAVE_ZLIB, HAVE_BZLIB, HAVE_XZLIB).  Concatenated streams are
 * decoded as one.
 */
class ReadCompressed {
  public:
    // Takes ownership of fd.
    explicit ReadCompressed(int fd);

    ~ReadCompressed();

    // Returns 0 only at end of file.
    std::size_t Read(void *to, std::size_t amount);

    // Bytes taken from the file so far, before decompression.
    uint64_t RawAmount() const { return raw_amount_; }

  private:
    scoped_ptr<detail::Decoder> decoder_;

    uint64_t raw_amount_;

    ReadCompressed(const ReadCompressed &);
    void operator=(const ReadCompressed &);
};

} // namespace util

#endif // UTIL_READ_COMPRESSED_H
