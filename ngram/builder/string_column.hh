#ifndef NGRAM_BUILDER_STRING_COLUMN_H
#define NGRAM_BUILDER_STRING_COLUMN_H

#include "util/line_reader.hh"
#include "util/scoped.hh"

#include <cstddef>
#include <string>
#include <vector>

#include <stdint.h>

namespace ngram { namespace builder {

class NgramDictionary;

/* A column of strings read in windows, in order. */
class StringColumn {
  public:
    virtual ~StringColumn() {}

    virtual uint64_t Count() = 0;

    // Append values [offset, offset + length) to out.  Returns the number
    // appended, fewer at the end.
    virtual std::size_t Slice(uint64_t offset, std::size_t length, std::vector<std::string> &out) = 0;
};

class VectorStringColumn : public StringColumn {
  public:
    explicit VectorStringColumn(const std::vector<std::string> &values) : values_(values) {}

    uint64_t Count() { return values_.size(); }

    std::size_t Slice(uint64_t offset, std::size_t length, std::vector<std::string> &out);

  private:
    const std::vector<std::string> &values_;
};

/* The dictionary's n-gram strings in id order, read back from its vocabulary
 * file.  Flushes the dictionary on construction.  Reading backwards reopens
 * the file.
 */
class VocabColumn : public StringColumn {
  public:
    explicit VocabColumn(NgramDictionary &dictionary);

    uint64_t Count() { return count_; }

    std::size_t Slice(uint64_t offset, std::size_t length, std::vector<std::string> &out);

  private:
    void Reopen();

    std::string path_;
    uint64_t count_;
    util::scoped_ptr<util::LineReader> reader_;
    uint64_t position_;
    std::string value_;
};

}} // namespaces

#endif // NGRAM_BUILDER_STRING_COLUMN_H
