#ifndef NGRAM_BUILDER_RECORD_SOURCE_H
#define NGRAM_BUILDER_RECORD_SOURCE_H

#include "ngram/builder/message.hh"
#include "ngram/builder/tokenizer.hh"
#include "ngram/ngram_index.hh"
#include "util/line_reader.hh"
#include "util/scoped.hh"

#include <cstddef>
#include <cstdio>
#include <deque>
#include <string>
#include <vector>

#include <stdint.h>

namespace ngram { namespace builder {

// Count() of a source that cannot be counted without reading it.
const uint64_t kUnknownCount = static_cast<uint64_t>(-1);

struct TokenizedRecord {
  RecordId id;
  std::vector<std::string> tokens;
};

/* Ordered records, read in windows. */
class RecordSource {
  public:
    virtual ~RecordSource() {}

    // Number of records or kUnknownCount.
    virtual uint64_t Count() = 0;

    // Append records [offset, offset + length) to out.  Fewer are appended at
    // the end of input.  Returns the number appended.
    virtual std::size_t Slice(uint64_t offset, std::size_t length, std::vector<TokenizedRecord> &out) = 0;

    // Whether Slice can go back to the first record after reading further.
    virtual bool CanRestart() const = 0;
};

// Records already in memory.  The vector must outlive the source.
class VectorRecordSource : public RecordSource {
  public:
    explicit VectorRecordSource(const std::vector<TokenizedRecord> &records) : records_(records) {}

    uint64_t Count() { return records_.size(); }

    std::size_t Slice(uint64_t offset, std::size_t length, std::vector<TokenizedRecord> &out);

    bool CanRestart() const { return true; }

  private:
    const std::vector<TokenizedRecord> &records_;
};

/* One record per line of a text file, which may be compressed.  Record ids
 * are line numbers starting at 1.  Only the text field is tokenized.  Offsets normally only move forward; the
 * records of the most recent window stay buffered so that window can be read
 * again.  Going back further reopens the file, which is impossible for
 * standard input.  A line whose tokenization throws is kept and tokenized
 * again by the next read, so a failed window loses nothing.
 */
class TextRecordSource : public RecordSource {
  public:
    // An empty path or "-" reads standard input and the count is unknown.
    // The first time each record is read, it is written to echo as a row of
    // the records table and its author is added to authors.  Either may be
    // NULL.
    TextRecordSource(const std::string &path, const Tokenizer &tokenizer, std::FILE *echo = NULL, RecordFormat format = FORMAT_TEXT, AuthorIndex *authors = NULL);

    // Counts lines with a separate pass over the file on first call.
    uint64_t Count();

    std::size_t Slice(uint64_t offset, std::size_t length, std::vector<TokenizedRecord> &out);

    bool CanRestart() const { return !path_.empty(); }

  private:
    void Reopen();

    // Reopen and skip lines until the next line read is record index + 1.
    void Rewind(uint64_t index);

    bool ReadOne();

    void Observe(RecordId id);

    void Echo(RecordId id);

    std::string path_;
    const Tokenizer &tokenizer_;
    std::FILE *echo_;
    RecordFormat format_;
    AuthorIndex *authors_;

    util::scoped_ptr<util::LineReader> reader_;
    bool at_end_;
    // Lines taken from reader_.
    uint64_t read_;
    // line_ holds the record after the buffer but is not tokenized yet.
    bool pending_;

    // Records [buffer_start_, buffer_start_ + buffer_.size()).
    std::deque<TokenizedRecord> buffer_;
    uint64_t buffer_start_;

    // Records passed to echo_ and authors_.
    RecordId observed_;

    uint64_t count_;

    std::string line_;
    MessageFields fields_;
};

}} // namespaces

#endif // NGRAM_BUILDER_RECORD_SOURCE_H
