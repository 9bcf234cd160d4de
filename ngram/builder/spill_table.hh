#ifndef NGRAM_BUILDER_SPILL_TABLE_H
#define NGRAM_BUILDER_SPILL_TABLE_H

#include "ngram/builder/generate.hh"
#include "util/file.hh"

#include <string>
#include <vector>

#include <stdint.h>

namespace ngram { namespace builder {

/* Columnar file of (record, n-gram) rows in native byte order:
 *   8 byte magic, uint64_t row count,
 *   row count RecordIds, then row count NgramIds.
 */
extern const char kSpillMagic[8];

void WriteSpillTable(const std::string &path, const std::vector<NgramRecord> &rows);

// Lazy: the constructor only checks the header.
class SpillTableReader {
  public:
    // Throws FormatException if the file is not a complete spill table.
    explicit SpillTableReader(const std::string &path);

    uint64_t Rows() const { return rows_; }

    const std::string &Path() const { return path_; }

    // Append every row to out.
    void ReadAll(std::vector<NgramRecord> &out);

  private:
    std::string path_;
    util::scoped_fd file_;
    uint64_t rows_;
};

}} // namespaces

#endif // NGRAM_BUILDER_SPILL_TABLE_H
