#include "util/read_compressed.hh"

#include "util/file.hh"

#include <algorithm>
#include <iostream>
#include <limits>
#include <new>
#include <string>

#include <string.h>

#ifdef HAVE_ZLIB
#include <zlib.h>
#endif

#ifdef HAVE_BZLIB
#include <bzlib.h>
#endif

#ifdef HAVE_XZLIB
#include <lzma.h>
#endif

namespace util {

CompressedException::CompressedException() throw() {}
CompressedException::~CompressedException() throw() {}

namespace detail {

// One per input format.  Read adds the file bytes it consumed to raw and
// returns 0 once the data has ended.
class Decoder {
  public:
    virtual ~Decoder() {}

    virtual std::size_t Read(uint8_t *to, std::size_t amount, uint64_t &raw) = 0;
};

} // namespace detail

namespace {

using detail::Decoder;

const std::size_t kSniffSize = 6;
const std::size_t kChunk = 16384;

const uint8_t kGzipMagic[] = {0x1f, 0x8b};
const uint8_t kBzip2Magic[] = {'B', 'Z', 'h'};
const uint8_t kXzMagic[] = {0xfd, '7', 'z', 'X', 'Z', 0x00};

enum Format { FORMAT_PLAIN, FORMAT_GZIP, FORMAT_BZIP2, FORMAT_XZ };

template <std::size_t N> bool StartsWith(const uint8_t *data, std::size_t size, const uint8_t (&magic)[N]) {
  return size >= N && !memcmp(data, magic, N);
}

Format Sniff(const uint8_t *data, std::size_t size) {
  if (StartsWith(data, size, kGzipMagic)) return FORMAT_GZIP;
  if (StartsWith(data, size, kBzip2Magic)) return FORMAT_BZIP2;
  if (StartsWith(data, size, kXzMagic)) return FORMAT_XZ;
  return FORMAT_PLAIN;
}

class PlainDecoder : public Decoder {
  public:
    PlainDecoder(int fd, const uint8_t *sniffed, std::size_t sniffed_size)
      : fd_(fd), sniffed_(reinterpret_cast<const char*>(sniffed), sniffed_size), handed_(0) {}

    std::size_t Read(uint8_t *to, std::size_t amount, uint64_t &raw) {
      if (handed_ < sniffed_.size()) {
        std::size_t copy = std::min(amount, sniffed_.size() - handed_);
        memcpy(to, sniffed_.data() + handed_, copy);
        handed_ += copy;
        return copy;
      }
      std::size_t got = PartialRead(fd_.get(), to, amount);
      raw += got;
      return got;
    }

  private:
    scoped_fd fd_;
    std::string sniffed_;
    std::size_t handed_;
};

// Compressed bytes in fixed chunks, starting with the ones read to sniff the
// format.
class ChunkedInput {
  public:
    ChunkedInput(int fd, const uint8_t *sniffed, std::size_t sniffed_size)
      : fd_(fd), chunk_(MallocOrThrow(kChunk)), held_(sniffed_size) {
      memcpy(chunk_.get(), sniffed, sniffed_size);
    }

    uint8_t *Data() { return static_cast<uint8_t*>(chunk_.get()); }

    // Fills Data() and returns its size, 0 at end of file.
    std::size_t Next(uint64_t &raw) {
      if (held_) {
        std::size_t ret = held_;
        held_ = 0;
        return ret;
      }
      std::size_t got = ReadOrEOF(fd_.get(), chunk_.get(), kChunk);
      raw += got;
      return got;
    }

  private:
    scoped_fd fd_;
    scoped_malloc chunk_;
    std::size_t held_;
};

#ifdef HAVE_ZLIB
class GzipDecoder : public Decoder {
  public:
    GzipDecoder(int fd, const uint8_t *sniffed, std::size_t sniffed_size)
      : input_(fd, sniffed, sniffed_size), ended_(false) {
      memset(&z_, 0, sizeof(z_));
      // 15 bits of window; adding 32 accepts gzip and zlib headers alike.
      int ret = inflateInit2(&z_, 15 + 32);
      if (ret == Z_MEM_ERROR) throw std::bad_alloc();
      UTIL_THROW_IF(ret != Z_OK, CompressedException, "zlib setup failed with code " << ret);
    }

    ~GzipDecoder() {
      if (inflateEnd(&z_) != Z_OK)
        std::cerr << "Warning: zlib did not shut down cleanly" << std::endl;
    }

    std::size_t Read(uint8_t *to, std::size_t amount, uint64_t &raw) {
      if (ended_ || !amount) return 0;
      z_.next_out = to;
      z_.avail_out = static_cast<uInt>(std::min<std::size_t>(amount, std::numeric_limits<uInt>::max()));
      while (z_.next_out == to) {
        if (!z_.avail_in) {
          z_.avail_in = static_cast<uInt>(input_.Next(raw));
          z_.next_in = input_.Data();
          UTIL_THROW_IF(!z_.avail_in, CompressedException, "gzip data ends in the middle of a stream");
        }
        int ret = inflate(&z_, Z_NO_FLUSH);
        if (ret == Z_STREAM_END) {
          // gzip writes appended files as further members.
          if (!z_.avail_in) {
            z_.avail_in = static_cast<uInt>(input_.Next(raw));
            z_.next_in = input_.Data();
          }
          if (!z_.avail_in) {
            ended_ = true;
            break;
          }
          UTIL_THROW_IF(inflateReset(&z_) != Z_OK, CompressedException, "zlib could not start the next gzip member");
        } else if (ret == Z_MEM_ERROR) {
          throw std::bad_alloc();
        } else {
          UTIL_THROW_IF(ret != Z_OK && ret != Z_BUF_ERROR, CompressedException, "zlib: " << (z_.msg ? z_.msg : "corrupt data") << " (code " << ret << ")");
        }
      }
      return z_.next_out - to;
    }

  private:
    ChunkedInput input_;
    z_stream z_;
    bool ended_;
};
#endif // HAVE_ZLIB

#ifdef HAVE_BZLIB
class Bzip2Decoder : public Decoder {
  public:
    Bzip2Decoder(int fd, const uint8_t *sniffed, std::size_t sniffed_size)
      : input_(fd, sniffed, sniffed_size), ended_(false), open_(false) {
      memset(&bz_, 0, sizeof(bz_));
      Open();
    }

    ~Bzip2Decoder() {
      Close();
    }

    std::size_t Read(uint8_t *to, std::size_t amount, uint64_t &raw) {
      if (ended_ || !amount) return 0;
      char *begin = reinterpret_cast<char*>(to);
      bz_.next_out = begin;
      bz_.avail_out = static_cast<unsigned int>(std::min<std::size_t>(amount, std::numeric_limits<unsigned int>::max()));
      while (bz_.next_out == begin) {
        if (!bz_.avail_in) {
          Feed(raw);
          UTIL_THROW_IF(!bz_.avail_in, CompressedException, "bzip2 data ends in the middle of a stream");
        }
        int ret = BZ2_bzDecompress(&bz_);
        if (ret == BZ_STREAM_END) {
          // pbzip2 output is a series of streams.
          if (!bz_.avail_in) Feed(raw);
          if (!bz_.avail_in) {
            ended_ = true;
            break;
          }
          char *next_in = bz_.next_in;
          unsigned int avail_in = bz_.avail_in;
          Close();
          Open();
          bz_.next_in = next_in;
          bz_.avail_in = avail_in;
        } else if (ret == BZ_MEM_ERROR) {
          throw std::bad_alloc();
        } else {
          UTIL_THROW_IF(ret != BZ_OK, CompressedException, "bzip2 decoding failed with code " << ret);
        }
      }
      return bz_.next_out - begin;
    }

  private:
    void Feed(uint64_t &raw) {
      bz_.avail_in = static_cast<unsigned int>(input_.Next(raw));
      bz_.next_in = reinterpret_cast<char*>(input_.Data());
    }

    void Open() {
      int ret = BZ2_bzDecompressInit(&bz_, 0, 0);
      if (ret == BZ_MEM_ERROR) throw std::bad_alloc();
      UTIL_THROW_IF(ret != BZ_OK, CompressedException, "bzip2 setup failed with code " << ret);
      open_ = true;
    }

    void Close() {
      if (!open_) return;
      open_ = false;
      if (BZ2_bzDecompressEnd(&bz_) != BZ_OK)
        std::cerr << "Warning: bzip2 did not shut down cleanly" << std::endl;
    }

    ChunkedInput input_;
    bz_stream bz_;
    bool ended_, open_;
};
#endif // HAVE_BZLIB

#ifdef HAVE_XZLIB
class XzDecoder : public Decoder {
  public:
    XzDecoder(int fd, const uint8_t *sniffed, std::size_t sniffed_size)
      : input_(fd, sniffed, sniffed_size), finishing_(false), ended_(false) {
      lzma_stream init = LZMA_STREAM_INIT;
      lzma_ = init;
      lzma_ret ret = lzma_stream_decoder(&lzma_, UINT64_MAX, LZMA_CONCATENATED);
      if (ret == LZMA_MEM_ERROR) throw std::bad_alloc();
      UTIL_THROW_IF(ret != LZMA_OK, CompressedException, "liblzma setup failed with code " << ret);
    }

    ~XzDecoder() {
      lzma_end(&lzma_);
    }

    std::size_t Read(uint8_t *to, std::size_t amount, uint64_t &raw) {
      if (ended_ || !amount) return 0;
      lzma_.next_out = to;
      lzma_.avail_out = amount;
      while (lzma_.next_out == to) {
        if (!lzma_.avail_in && !finishing_) {
          lzma_.avail_in = input_.Next(raw);
          lzma_.next_in = input_.Data();
          finishing_ = !lzma_.avail_in;
        }
        lzma_ret ret = lzma_code(&lzma_, finishing_ ? LZMA_FINISH : LZMA_RUN);
        if (ret == LZMA_STREAM_END) {
          ended_ = true;
          break;
        }
        if (ret == LZMA_MEM_ERROR) throw std::bad_alloc();
        UTIL_THROW_IF(ret == LZMA_BUF_ERROR, CompressedException, "xz data ends in the middle of a stream");
        UTIL_THROW_IF(ret != LZMA_OK, CompressedException, "liblzma decoding failed with code " << ret);
      }
      return lzma_.next_out - to;
    }

  private:
    ChunkedInput input_;
    lzma_stream lzma_;
    bool finishing_, ended_;
};
#endif // HAVE_XZLIB

Decoder *MakeDecoder(int fd, const uint8_t *sniffed, std::size_t sniffed_size) {
  scoped_fd hold(fd);
  switch (Sniff(sniffed, sniffed_size)) {
    case FORMAT_GZIP:
#ifdef HAVE_ZLIB
      return new GzipDecoder(hold.release(), sniffed, sniffed_size);
#else
      UTIL_THROW(CompressedException, "Input is gzip compressed but this build has no zlib.");
#endif
    case FORMAT_BZIP2:
#ifdef HAVE_BZLIB
      return new Bzip2Decoder(hold.release(), sniffed, sniffed_size);
#else
      UTIL_THROW(CompressedException, "Input is bzip2 compressed but this build has no libbz2.");
#endif
    case FORMAT_XZ:
#ifdef HAVE_XZLIB
      return new XzDecoder(hold.release(), sniffed, sniffed_size);
#else
      UTIL_THROW(CompressedException, "Input is xz compressed but this build has no liblzma.");
#endif
    case FORMAT_PLAIN:
      break;
  }
  return new PlainDecoder(hold.release(), sniffed, sniffed_size);
}

} // namespace

ReadCompressed::ReadCompressed(int fd) : raw_amount_(0) {
  scoped_fd hold(fd);
  uint8_t sniffed[kSniffSize];
  raw_amount_ = ReadOrEOF(fd, sniffed, kSniffSize);
  decoder_.reset(MakeDecoder(hold.release(), sniffed, raw_amount_));
}

ReadCompressed::~ReadCompressed() {}

std::size_t ReadCompressed::Read(void *to, std::size_t amount) {
  return decoder_->Read(static_cast<uint8_t*>(to), amount, raw_amount_);
}

} // namespace util
