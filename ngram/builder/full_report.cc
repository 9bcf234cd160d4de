#include "ngram/builder/full_report.hh"

#include "ngram/builder/progress.hh"
#include "ngram/exception.hh"
#include "util/file.hh"
#include "util/line_reader.hh"

#include <algorithm>
#include <exception>
#include <utility>

#include <ctype.h>
#include <errno.h>
#include <stdio.h>
#include <stdlib.h>

namespace ngram { namespace builder {

const char kFullReportHeader[] = "ngram_id\tn\twords\ttotal_reps\tdistinct_posters\tuser_id\treps_per_user\trecord_id\tmessage_id\ttext\ttimestamp";

namespace {

const char kReportStep[] = "report";

void CheckPrint(int ret, std::FILE *to) {
  UTIL_THROW_IF(ret < 0, util::ErrnoException, "while writing to " << util::NameFromFD(fileno(to)));
}

void WriteString(std::FILE *to, const std::string &str) {
  util::WriteOrThrow(to, str.data(), str.size());
}

// Reads the number at line[at] and moves at past it and a following tab.
uint64_t ReadNumber(const std::string &line, std::size_t &at, const char *table) {
  const char *begin = line.c_str() + at;
  char *end;
  errno = 0;
  unsigned long long ret = strtoull(begin, &end, 10);
  UTIL_THROW_IF(!isdigit(static_cast<unsigned char>(*begin)) || errno == ERANGE || (*end != '\t' && *end != '\0'),
      FormatException, "Expected a number in the " << table << " table line " << line);
  at = end - line.c_str();
  if (*end == '\t') ++at;
  return ret;
}

struct ReportRow {
  // Index into the stats rows.
  std::size_t position;
  RecordId record;
  uint64_t count;
  uint64_t reps_per_user;
  MessageFields fields;
};

bool GroupOrder(const ReportRow &first, const ReportRow &second) {
  if (first.position != second.position) return first.position < second.position;
  if (first.fields.author != second.fields.author) return first.fields.author < second.fields.author;
  return first.record < second.record;
}

class ReportOrder {
  public:
    // In text format the author is the record id, so order by record alone.
    explicit ReportOrder(bool by_author) : by_author_(by_author) {}

    bool operator()(const ReportRow &first, const ReportRow &second) const {
      if (first.position != second.position) return first.position < second.position;
      if (first.reps_per_user != second.reps_per_user) return first.reps_per_user > second.reps_per_user;
      if (by_author_ && first.fields.author != second.fields.author) return first.fields.author < second.fields.author;
      return first.record < second.record;
    }

  private:
    bool by_author_;
};

// N-gram ids of one chunk paired with their index in stats, sorted by id.
typedef std::vector<std::pair<NgramId, std::size_t> > ChunkIds;

// Occurrences of the chunk's n-grams, in record order.
void CollectHits(const std::string &path, const ChunkIds &ids, std::vector<ReportRow> &out) {
  util::LineReader in(path.c_str());
  std::string line;
  UTIL_THROW_IF(!in.ReadLine(line), FormatException, "Occurrences table " << path << " lacks its header.");
  ReportRow row;
  row.reps_per_user = 0;
  RecordId last = 0;
  while (in.ReadLine(line)) {
    std::size_t at = 0;
    row.record = ReadNumber(line, at, "occurrences");
    NgramId ngram = static_cast<NgramId>(ReadNumber(line, at, "occurrences"));
    row.count = ReadNumber(line, at, "occurrences");
    UTIL_THROW_IF(row.record < last, FormatException, "Occurrences table " << path << " goes back from record " << last << " to " << row.record);
    last = row.record;
    ChunkIds::const_iterator found = std::lower_bound(ids.begin(), ids.end(), std::make_pair(ngram, static_cast<std::size_t>(0)));
    if (found == ids.end() || found->first != ngram) continue;
    row.position = found->second;
    out.push_back(row);
  }
}

// Fills in the fields of each row from the records table.
void JoinRecords(const FullReportInput &input, std::vector<ReportRow> &rows) {
  if (rows.empty()) return;
  util::LineReader in(input.records_path.c_str());
  std::string line;
  UTIL_THROW_IF(!in.ReadLine(line), FormatException, "Records table " << input.records_path << " lacks its header.");
  MessageFields fields;
  std::vector<ReportRow>::iterator next = rows.begin();
  while (next != rows.end() && in.ReadLine(line)) {
    std::size_t at = 0;
    RecordId id = ReadNumber(line, at, "records");
    if (id < next->record) continue;
    UTIL_THROW_IF(id > next->record, FormatException, "Record " << next->record << " is missing from " << input.records_path);
    SplitRecord(line.substr(at), input.format, fields);
    if (input.format == FORMAT_TEXT) fields.author = line.substr(0, line.find('\t'));
    for (; next != rows.end() && next->record == id; ++next) next->fields = fields;
  }
  UTIL_THROW_IF(next != rows.end(), FormatException, "Record " << next->record << " is missing from " << input.records_path);
}

void SumPerAuthor(std::vector<ReportRow> &rows) {
  std::sort(rows.begin(), rows.end(), GroupOrder);
  for (std::vector<ReportRow>::iterator begin = rows.begin(); begin != rows.end();) {
    std::vector<ReportRow>::iterator end = begin;
    uint64_t sum = 0;
    for (; end != rows.end() && end->position == begin->position && end->fields.author == begin->fields.author; ++end) {
      sum += end->count;
    }
    for (; begin != end; ++begin) begin->reps_per_user = sum;
  }
}

void WriteRows(const std::vector<NgramStatsRow> &stats, const std::vector<ReportRow> &rows, std::FILE *to) {
  for (std::vector<ReportRow>::const_iterator i = rows.begin(); i != rows.end(); ++i) {
    const NgramStatsRow &ngram = stats[i->position];
    CheckPrint(std::fprintf(to, "%u\t%u\t", static_cast<unsigned int>(ngram.id), ngram.n), to);
    WriteString(to, ngram.words);
    CheckPrint(std::fprintf(to, "\t%llu\t%u\t", static_cast<unsigned long long>(ngram.total_reps), static_cast<unsigned int>(ngram.distinct_authors)), to);
    WriteString(to, i->fields.author);
    CheckPrint(std::fprintf(to, "\t%llu\t%llu\t", static_cast<unsigned long long>(i->reps_per_user), static_cast<unsigned long long>(i->record)), to);
    WriteString(to, i->fields.message_id);
    util::WriteOrThrow(to, "\t", 1);
    WriteString(to, i->fields.text);
    util::WriteOrThrow(to, "\t", 1);
    WriteString(to, i->fields.timestamp);
    util::WriteOrThrow(to, "\n", 1);
  }
}

} // namespace

std::size_t FullReportChunk(uint64_t occurrences, uint64_t ngrams) {
  uint64_t per_ngram = std::max<uint64_t>(1, occurrences / std::max<uint64_t>(1, ngrams));
  return static_cast<std::size_t>(std::max<uint64_t>(1, std::min<uint64_t>(1000, 100000 / per_ngram)));
}

uint64_t WriteFullReport(const std::vector<NgramStatsRow> &stats, const FullReportInput &input, std::FILE *to, ProgressReporter *reporter) {
  SafeProgress progress(reporter);
  const std::size_t chunk = FullReportChunk(input.occurrence_rows, input.ngram_count);
  progress.AddSubstep(kReportStep, "full_report", "Writing full report", (stats.size() + chunk - 1) / chunk);
  progress.StartSubstep(kReportStep, "full_report");
  uint64_t written = 0;
  ChunkIds ids;
  std::vector<ReportRow> rows;
  try {
    for (std::size_t begin = 0; begin < stats.size(); begin += chunk) {
      std::size_t end = std::min(stats.size(), begin + chunk);
      ids.clear();
      rows.clear();
      for (std::size_t i = begin; i < end; ++i) ids.push_back(std::make_pair(stats[i].id, i));
      std::sort(ids.begin(), ids.end());
      CollectHits(input.occurrences_path, ids, rows);
      JoinRecords(input, rows);
      SumPerAuthor(rows);
      std::sort(rows.begin(), rows.end(), ReportOrder(input.format == FORMAT_MESSAGE));
      WriteRows(stats, rows, to);
      written += rows.size();
      progress.UpdateSubstep(kReportStep, "full_report", begin / chunk + 1);
    }
  } catch (const std::exception &e) {
    progress.FailSubstep(kReportStep, "full_report", e.what());
    throw;
  }
  progress.CompleteSubstep(kReportStep, "full_report");
  return written;
}

}} // namespaces
