#ifndef NGRAM_BUILDER_PIPELINE_H
#define NGRAM_BUILDER_PIPELINE_H

#include "ngram/builder/generate.hh"
#include "ngram/builder/memory_monitor.hh"
#include "ngram/builder/message.hh"
#include "ngram/builder/orchestrator.hh"

#include <cstddef>
#include <string>

#include <stdint.h>

namespace ngram { namespace builder {

class ProgressReporter;

struct PipelineConfig {
  // Corpus with one record per line.  Empty or "-" reads stdin.
  std::string text_path;

  // Whether lines carry author, message id and timestamp before the text.
  RecordFormat format;

  NgramRange range;

  // Outputs are out_prefix followed by .message_ngrams, .ngrams,
  // .ngram_stats, and optionally .records and .ngram_full.
  std::string out_prefix;

  // Private working directories are created under this prefix.
  std::string temp_prefix;

  // Also write the input records with their ids.
  bool write_records;

  // Also write one row per repeated n-gram and record that has it.
  bool full_report;

  // Initial size of the dictionary's hash table.
  std::size_t dictionary_estimate;

  MonitorConfig monitor;
  OrchestratorConfig orchestrator;

  PipelineConfig()
    : format(FORMAT_TEXT), range(3, 5), temp_prefix("/tmp/ngram"), write_records(false), full_report(false), dictionary_estimate(1 << 20) {}

  // Point every temporary directory at temp_prefix.
  void SetTempPrefix(const std::string &prefix);
};

struct PipelineReport {
  GenerationReport generation;
  DedupMode dedup;
  uint64_t distinct_ngrams;
  uint64_t repeated_ngrams;
  // Lines of .ngram_full, 0 when it was not asked for.
  uint64_t full_rows;
};

// Throws ConfigException on bad parameters.  progress may be NULL.
PipelineReport Pipeline(const PipelineConfig &config, MemoryProbe &probe, ProgressReporter *progress = NULL);

}} // namespaces

#endif // NGRAM_BUILDER_PIPELINE_H
