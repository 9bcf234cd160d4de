#ifndef NGRAM_BUILDER_FULL_REPORT_H
#define NGRAM_BUILDER_FULL_REPORT_H

#include "ngram/builder/message.hh"
#include "ngram/builder/statistics.hh"

#include <cstddef>
#include <cstdio>
#include <string>
#include <vector>

#include <stdint.h>

namespace ngram { namespace builder {

class ProgressReporter;

extern const char kFullReportHeader[];

// Number of repeated n-grams handled per pass.  Fewer when each n-gram
// occurs in many records, so one pass holds about 100000 rows.
std::size_t FullReportChunk(uint64_t occurrences, uint64_t ngrams);

struct FullReportInput {
  // Occurrences table as CountOccurrences writes it, with its header.
  std::string occurrences_path;
  // Records table as TextRecordSource echoes it, with its header.
  std::string records_path;
  RecordFormat format;
  // Sizes used to pick the chunk.
  uint64_t occurrence_rows;
  uint64_t ngram_count;
};

/* One line per (repeated n-gram, record) pair, carrying the n-gram's
 * statistics, the author's total repetitions of it, and the record itself.
 * Rows follow stats, then more repetitions by the author, then author, then
 * record.  In text format each record is its own author, so user_id is the
 * record id and message_id and timestamp are empty.
 *
 * Each chunk of stats rescans both tables, so memory holds one chunk.
 * Returns the number of lines written.
 */
uint64_t WriteFullReport(const std::vector<NgramStatsRow> &stats, const FullReportInput &input, std::FILE *to, ProgressReporter *progress = NULL);

}} // namespaces

#endif // NGRAM_BUILDER_FULL_REPORT_H
