#include "ngram/builder/statistics.hh"

#include "ngram/builder/dictionary.hh"
#include "ngram/builder/message.hh"
#include "ngram/builder/string_column.hh"
#include "ngram/exception.hh"

#include <algorithm>
#include <utility>

#include <stdio.h>

namespace ngram { namespace builder {

namespace {
const std::size_t kVocabWindow = 10000;

void CheckPrint(int ret, std::FILE *to) {
  UTIL_THROW_IF(ret < 0, util::ErrnoException, "while writing to " << util::NameFromFD(fileno(to)));
}
} // namespace

const char kOccurrencesHeader[] = "record_id\tngram_id\tcount";
const char kDefinitionsHeader[] = "ngram_id\twords\tn";
const char kStatsHeader[] = "ngram_id\tn\twords\ttotal_reps\tdistinct_records\tdistinct_posters";

TsvFile::TsvFile(const std::string &path, const char *header) : path_(path) {
  util::scoped_fd fd(util::CreateOrThrow(path.c_str()));
  file_.reset(util::FDOpenOrThrow(fd));
  CheckPrint(std::fprintf(file_.get(), "%s\n", header), file_.get());
}

void TsvFile::Close() {
  util::FFlushOrThrow(file_.get());
  file_.reset();
}

unsigned int NgramLength(const std::string &words) {
  return std::count(words.begin(), words.end(), ' ') + 1;
}

uint64_t CountOccurrences(const std::vector<NgramRecord> &rows, NgramId ngram_count, std::FILE *to, NgramTotals &totals, const AuthorIndex *authors) {
  totals.total_reps.assign(ngram_count, 0);
  totals.distinct_records.assign(ngram_count, 0);
  totals.distinct_authors.clear();
  // (n-gram, author) once per record that has both.
  std::vector<std::pair<NgramId, AuthorId> > posted;
  std::vector<NgramId> ids;
  uint64_t pairs = 0;
  for (std::vector<NgramRecord>::const_iterator begin = rows.begin(); begin != rows.end();) {
    const RecordId record = begin->record;
    std::vector<NgramRecord>::const_iterator end = begin;
    ids.clear();
    for (; end != rows.end() && end->record == record; ++end) {
      UTIL_THROW_IF(end->ngram >= ngram_count, FormatException, "N-gram id " << end->ngram << " in record " << record << " is not in the dictionary of " << ngram_count);
      ids.push_back(end->ngram);
    }
    std::sort(ids.begin(), ids.end());
    for (std::vector<NgramId>::const_iterator i = ids.begin(); i != ids.end();) {
      std::vector<NgramId>::const_iterator run = i;
      for (; run != ids.end() && *run == *i; ++run) {}
      uint64_t count = run - i;
      totals.total_reps[*i] += count;
      ++totals.distinct_records[*i];
      ++pairs;
      if (authors) posted.push_back(std::make_pair(*i, authors->Of(record)));
      if (to) {
        CheckPrint(std::fprintf(to, "%llu\t%u\t%llu\n", static_cast<unsigned long long>(record), static_cast<unsigned int>(*i), static_cast<unsigned long long>(count)), to);
      }
      i = run;
    }
    begin = end;
  }
  if (!authors) {
    totals.distinct_authors = totals.distinct_records;
    return pairs;
  }
  totals.distinct_authors.assign(ngram_count, 0);
  std::sort(posted.begin(), posted.end());
  posted.erase(std::unique(posted.begin(), posted.end()), posted.end());
  for (std::vector<std::pair<NgramId, AuthorId> >::const_iterator i = posted.begin(); i != posted.end(); ++i) {
    ++totals.distinct_authors[i->first];
  }
  return pairs;
}

void DefinitionSink::Emit(const std::string &words) {
  NgramId id;
  UTIL_THROW_IF(!dictionary_.Find(words, id), FormatException, "Unique n-gram " << words << " is not in the dictionary.");
  CheckPrint(std::fprintf(to_, "%u\t", static_cast<unsigned int>(id)), to_);
  util::WriteOrThrow(to_, words.data(), words.size());
  CheckPrint(std::fprintf(to_, "\t%u\n", NgramLength(words)), to_);
  ++written_;
}

bool StatsOrder(const NgramStatsRow &first, const NgramStatsRow &second) {
  if (first.n != second.n) return first.n > second.n;
  if (first.total_reps != second.total_reps) return first.total_reps > second.total_reps;
  if (first.distinct_authors != second.distinct_authors) return first.distinct_authors > second.distinct_authors;
  if (first.distinct_records != second.distinct_records) return first.distinct_records > second.distinct_records;
  return first.id < second.id;
}

void CollectNgramStats(StringColumn &vocab, const NgramTotals &totals, std::vector<NgramStatsRow> &out) {
  const uint64_t count = vocab.Count();
  UTIL_THROW_IF(count != totals.total_reps.size() || count != totals.distinct_authors.size(), FormatException, "Vocabulary has " << count << " entries but totals cover " << totals.total_reps.size());
  std::vector<std::string> window;
  NgramStatsRow row;
  for (uint64_t offset = 0; offset < count;) {
    window.clear();
    std::size_t got = vocab.Slice(offset, kVocabWindow, window);
    UTIL_THROW_IF(!got, FormatException, "Vocabulary ended at entry " << offset << " of " << count);
    for (std::size_t i = 0; i < got; ++i) {
      NgramId id = static_cast<NgramId>(offset + i);
      if (totals.total_reps[id] <= 1) continue;
      row.id = id;
      row.words = window[i];
      row.n = NgramLength(row.words);
      row.total_reps = totals.total_reps[id];
      row.distinct_records = totals.distinct_records[id];
      row.distinct_authors = totals.distinct_authors[id];
      out.push_back(row);
    }
    offset += got;
  }
  std::sort(out.begin(), out.end(), StatsOrder);
}

void WriteNgramStats(const std::vector<NgramStatsRow> &rows, std::FILE *to) {
  for (std::vector<NgramStatsRow>::const_iterator i = rows.begin(); i != rows.end(); ++i) {
    CheckPrint(std::fprintf(to, "%u\t%u\t", static_cast<unsigned int>(i->id), i->n), to);
    util::WriteOrThrow(to, i->words.data(), i->words.size());
    CheckPrint(std::fprintf(to, "\t%llu\t%u\t%u\n", static_cast<unsigned long long>(i->total_reps), static_cast<unsigned int>(i->distinct_records), static_cast<unsigned int>(i->distinct_authors)), to);
  }
}

}} // namespaces
