#include "ngram/builder/pipeline.hh"

#include "ngram/builder/dictionary.hh"
#include "ngram/builder/full_report.hh"
#include "ngram/builder/record_source.hh"
#include "ngram/builder/statistics.hh"
#include "ngram/builder/string_column.hh"
#include "ngram/builder/tokenizer.hh"
#include "ngram/exception.hh"
#include "util/file.hh"
#include "util/scoped.hh"
#include "util/temp_dir.hh"

#include <iostream>
#include <vector>

namespace ngram { namespace builder {

void PipelineConfig::SetTempPrefix(const std::string &prefix) {
  temp_prefix = prefix;
  orchestrator.spill.temp_prefix = prefix;
  orchestrator.sort.temp_prefix = prefix;
}

PipelineReport Pipeline(const PipelineConfig &config, MemoryProbe &probe, ProgressReporter *progress) {
  config.range.Validate();
  UTIL_THROW_IF(config.out_prefix.empty(), ConfigException, "An output prefix is required.");

  PipelineReport report;
  MemoryMonitor monitor(config.monitor, probe);
  std::cerr << "Memory budget is " << monitor.Budget() << " bytes." << std::endl;
  Orchestrator orchestrator(config.orchestrator, monitor, progress);

  util::TempDirectory work(config.temp_prefix);
  NgramDictionary dictionary(work.NewFile("vocab"), config.dictionary_estimate);

  util::scoped_ptr<AuthorIndex> authors;
  if (config.format == FORMAT_MESSAGE) authors.reset(new AuthorIndex(work.NewFile("authors")));

  // The full report joins against the records table, so keep one even when
  // the user did not ask for it.
  std::string records_path;
  if (config.write_records) {
    records_path = config.out_prefix + ".records";
  } else if (config.full_report) {
    records_path = work.NewFile("records");
  }

  std::vector<NgramRecord> rows;
  {
    util::scoped_ptr<TsvFile> records;
    if (!records_path.empty()) records.reset(new TsvFile(records_path, RecordsHeader(config.format)));
    WhitespaceTokenizer tokenizer;
    TextRecordSource source(config.text_path, tokenizer, records.get() ? records->get() : NULL, config.format, authors.get());
    report.generation = orchestrator.Generate(source, config.range, dictionary, rows);
    if (records.get()) records->Close();
  }
  if (authors.get()) {
    std::cerr << authors->Distinct() << " distinct authors over " << authors->Records() << " records." << std::endl;
  }

  NgramTotals totals;
  uint64_t occurrence_rows;
  {
    TsvFile occurrences(config.out_prefix + ".message_ngrams", kOccurrencesHeader);
    occurrence_rows = CountOccurrences(rows, dictionary.Size(), occurrences.get(), totals, authors.get());
    occurrences.Close();
  }
  std::vector<NgramRecord>().swap(rows);
  report.distinct_ngrams = dictionary.Size();

  {
    TsvFile definitions(config.out_prefix + ".ngrams", kDefinitionsHeader);
    VocabColumn vocab(dictionary);
    DefinitionSink sink(dictionary, definitions.get());
    report.dedup = orchestrator.ExtractUnique(vocab, sink);
    definitions.Close();
  }

  std::vector<NgramStatsRow> stats;
  {
    VocabColumn vocab(dictionary);
    CollectNgramStats(vocab, totals, stats);
    report.repeated_ngrams = stats.size();
    TsvFile out(config.out_prefix + ".ngram_stats", kStatsHeader);
    WriteNgramStats(stats, out.get());
    out.Close();
  }

  report.full_rows = 0;
  if (config.full_report) {
    FullReportInput input;
    input.occurrences_path = config.out_prefix + ".message_ngrams";
    input.records_path = records_path;
    input.format = config.format;
    input.occurrence_rows = occurrence_rows;
    input.ngram_count = report.distinct_ngrams;
    TsvFile out(config.out_prefix + ".ngram_full", kFullReportHeader);
    report.full_rows = WriteFullReport(stats, input, out.get(), progress);
    out.Close();
  }
  std::cerr << report.distinct_ngrams << " distinct n-grams, " << report.repeated_ngrams << " repeated more than once." << std::endl;
  return report;
}

}} // namespaces
