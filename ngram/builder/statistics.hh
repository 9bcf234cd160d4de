#ifndef NGRAM_BUILDER_STATISTICS_H
#define NGRAM_BUILDER_STATISTICS_H

#include "ngram/builder/external_sort.hh"
#include "ngram/builder/generate.hh"
#include "ngram/ngram_index.hh"
#include "util/file.hh"

#include <cstdio>
#include <string>
#include <vector>

#include <stdint.h>

namespace ngram { namespace builder {

class AuthorIndex;
class NgramDictionary;
class StringColumn;

extern const char kOccurrencesHeader[];
extern const char kDefinitionsHeader[];
extern const char kStatsHeader[];

// Indexed by NgramId.
struct NgramTotals {
  std::vector<uint64_t> total_reps;
  std::vector<uint32_t> distinct_records;
  std::vector<uint32_t> distinct_authors;
};

// Tab separated output file that starts with a header line.
class TsvFile {
  public:
    TsvFile(const std::string &path, const char *header);

    std::FILE *get() { return file_.get(); }

    const std::string &Path() const { return path_; }

    // Flush and check for errors.
    void Close();

  private:
    std::string path_;
    util::scoped_FILE file_;
};

// Number of tokens in an n-gram string.
unsigned int NgramLength(const std::string &words);

/* rows must be grouped by record, as every generator leaves them.  Writes one
 * "record_id ngram_id count" line per distinct n-gram of each record, ordered
 * by record then n-gram id, and fills totals.  to may be NULL to only count.
 * Without authors, every record counts as its own author.  Returns the number
 * of (record, n-gram) pairs.
 */
uint64_t CountOccurrences(const std::vector<NgramRecord> &rows, NgramId ngram_count, std::FILE *to, NgramTotals &totals, const AuthorIndex *authors = NULL);

// Writes "ngram_id words n" for each value it is sent, in the order sent.
class DefinitionSink : public UniqueSink {
  public:
    DefinitionSink(const NgramDictionary &dictionary, std::FILE *to) : dictionary_(dictionary), to_(to), written_(0) {}

    void Emit(const std::string &words);

    uint64_t Written() const { return written_; }

  private:
    const NgramDictionary &dictionary_;
    std::FILE *to_;
    uint64_t written_;
};

struct NgramStatsRow {
  NgramId id;
  unsigned int n;
  std::string words;
  uint64_t total_reps;
  uint32_t distinct_records;
  uint32_t distinct_authors;
};

// Longer first, then more repetitions, more authors, more records, and
// finally lower id.
bool StatsOrder(const NgramStatsRow &first, const NgramStatsRow &second);

// Rows for every n-gram repeated more than once, in StatsOrder.  vocab holds
// the n-gram strings in id order.
void CollectNgramStats(StringColumn &vocab, const NgramTotals &totals, std::vector<NgramStatsRow> &out);

void WriteNgramStats(const std::vector<NgramStatsRow> &rows, std::FILE *to);

}} // namespaces

#endif // NGRAM_BUILDER_STATISTICS_H
