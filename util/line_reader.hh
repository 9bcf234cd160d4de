#ifndef UTIL_LINE_READER_H
#define UTIL_LINE_READER_H

#include "util/read_compressed.hh"
#include "util/scoped.hh"

#include <cstddef>
#include <string>

#include <stdint.h>

namespace util {

/* Buffered line reader over a possibly compressed file.  A cut-down FilePiece
 * that only knows about lines.
 */
class LineReader {
  public:
    // Takes ownership of fd.
    explicit LineReader(int fd, std::size_t buffer = 1048576);

    // Opens the file.
    explicit LineReader(const char *file, std::size_t buffer = 1048576);

    // Reads the next line without its delimiter.  A final line lacking the
    // delimiter is still returned.  Returns false at end of file.
    bool ReadLine(std::string &out, char delim = '\n');

    // Compressed bytes consumed so far.
    uint64_t RawOffset() const { return reader_.RawAmount(); }

    uint64_t LinesRead() const { return lines_; }

  private:
    bool Fill();

    ReadCompressed reader_;

    scoped_malloc buffer_;
    std::size_t buffer_size_;
    const char *position_, *end_;
    bool at_end_;
    uint64_t lines_;
};

} // namespace util

#endif // UTIL_LINE_READER_H
