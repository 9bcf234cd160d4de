#include "ngram/builder/orchestrator.hh"

#include "ngram/builder/dictionary.hh"
#include "ngram/builder/string_column.hh"
#include "ngram/exception.hh"
#include "util/scoped.hh"

#include <algorithm>
#include <iostream>
#include <limits>
#include <new>

namespace ngram { namespace builder {

namespace {
const uint64_t kGiB = 1ULL << 30;
const char *kModeNames[] = {"NORMAL", "CHUNKED", "DISK_SPILL"};
const char *kDedupNames[] = {"IN_MEMORY", "EXTERNAL_SORT"};

// Number of n-grams with length in range from a record of length tokens.
uint64_t NgramsIn(std::size_t length, const NgramRange &range) {
  uint64_t ret = 0;
  for (std::size_t n = range.min_n; n <= range.max_n && n <= length; ++n) {
    ret += length - n + 1;
  }
  return ret;
}

// Loads, sorts, and deduplicates the whole column.  Returns false if memory
// ran out, leaving values empty.
bool SortInMemory(StringColumn &column, std::vector<std::string> &values) {
  try {
    column.Slice(0, util::CheckOverflow(column.Count()), values);
    std::sort(values.begin(), values.end());
    values.erase(std::unique(values.begin(), values.end()), values.end());
  } catch (const std::bad_alloc &e) {
    std::vector<std::string>().swap(values);
    return false;
  } catch (const util::MallocException &e) {
    std::vector<std::string>().swap(values);
    return false;
  }
  return true;
}
} // namespace

const char *ModeName(GenerationMode mode) {
  return kModeNames[mode];
}

const char *DedupName(DedupMode mode) {
  return kDedupNames[mode];
}

std::ostream &operator<<(std::ostream &out, GenerationMode mode) {
  return out << ModeName(mode);
}

std::ostream &operator<<(std::ostream &out, DedupMode mode) {
  return out << DedupName(mode);
}

uint64_t SpillRowThreshold(uint64_t total) {
  if (total >= 32 * kGiB) return 3000000;
  if (total >= 16 * kGiB) return 1500000;
  if (total >= 8 * kGiB) return 500000;
  return 200000;
}

GenerationMode ChooseGenerationMode(PressureTier tier, uint64_t record_count, uint64_t estimated_rows, uint64_t spill_threshold, uint64_t chunked_records) {
  if (tier == PRESSURE_CRITICAL) return MODE_DISK_SPILL;
  if (estimated_rows != kUnknownCount && estimated_rows > spill_threshold) return MODE_DISK_SPILL;
  if (tier == PRESSURE_HIGH) return MODE_CHUNKED;
  if (record_count != kUnknownCount && record_count > chunked_records) return MODE_CHUNKED;
  return MODE_NORMAL;
}

DedupMode ChooseDedupMode(PressureTier tier, uint64_t values, uint64_t spill_threshold) {
  if (tier == PRESSURE_CRITICAL || values > spill_threshold) return DEDUP_EXTERNAL_SORT;
  return DEDUP_IN_MEMORY;
}

Orchestrator::Orchestrator(const OrchestratorConfig &config, MemoryMonitor &monitor, ProgressReporter *progress)
  : config_(config), monitor_(monitor), progress_(progress),
    spill_threshold_(config.spill_threshold ? config.spill_threshold : SpillRowThreshold(monitor.TotalSystemBytes())) {}

uint64_t Orchestrator::EstimateRows(RecordSource &source, const NgramRange &range) {
  uint64_t count = source.Count();
  if (count == kUnknownCount) return kUnknownCount;
  if (!count || !config_.estimate_sample) return 0;
  std::vector<TokenizedRecord> sample;
  std::size_t got = source.Slice(0, config_.estimate_sample, sample);
  if (!got) return 0;
  uint64_t rows = 0;
  for (std::vector<TokenizedRecord>::const_iterator i = sample.begin(); i != sample.end(); ++i) {
    rows += NgramsIn(i->tokens.size(), range);
  }
  return rows * count / got;
}

GenerationStrategy *Orchestrator::MakeStrategy(GenerationMode mode) {
  switch (mode) {
    case MODE_NORMAL:
      return new DirectGenerator(progress_);
    case MODE_CHUNKED:
      return new ChunkedGenerator(config_.chunked, monitor_, progress_);
    case MODE_DISK_SPILL:
      return new DiskSpillGenerator(config_.spill, monitor_, progress_);
  }
  UTIL_THROW(util::Exception, "Unknown generation mode " << static_cast<int>(mode));
}

GenerationReport Orchestrator::Generate(RecordSource &source, const NgramRange &range, NgramDictionary &dictionary, std::vector<NgramRecord> &out) {
  range.Validate();
  UTIL_THROW_IF(!out.empty(), util::Exception, "Generation must start with no rows.");
  GenerationReport report;
  report.records = source.Count();
  report.estimated_rows = EstimateRows(source, range);
  report.downgrades = 0;
  PressureTier tier = monitor_.Sample().tier;
  report.initial = config_.force_mode ? config_.forced_mode : ChooseGenerationMode(tier, report.records, report.estimated_rows, spill_threshold_, config_.chunked_records);

  std::cerr << "Generating " << range.min_n << " to " << range.max_n << "-grams in " << report.initial << " mode at " << tier << " pressure";
  if (report.records != kUnknownCount) {
    std::cerr << " for " << report.records << " records, about " << report.estimated_rows << " rows";
  }
  std::cerr << '.' << std::endl;

  GenerationMode mode = report.initial;
  while (true) {
    std::string failure;
    try {
      util::scoped_ptr<GenerationStrategy> strategy(MakeStrategy(mode));
      strategy->Generate(source, range, dictionary, out);
      break;
    } catch (const ResourceException &e) {
      failure = e.what();
    } catch (const std::bad_alloc &e) {
      failure = "out of memory";
    } catch (const util::MallocException &e) {
      failure = e.what();
    }
    std::vector<NgramRecord>().swap(out);
    if (mode == MODE_DISK_SPILL) {
      UTIL_THROW(ResourceException, "Every generation strategy ran out of memory.  The last failure was: " << failure);
    }
    GenerationMode next = static_cast<GenerationMode>(mode + 1);
    UTIL_THROW_IF(!source.CanRestart(), ResourceException, mode << " generation ran out of memory and the input cannot be read again for " << next << " mode: " << failure);
    std::cerr << "Warning: " << mode << " generation ran out of memory; restarting in " << next << " mode.  " << failure << std::endl;
    monitor_.Collect();
    mode = next;
    ++report.downgrades;
  }
  report.used = mode;
  report.rows = out.size();
  std::cerr << "Generated " << report.rows << " rows over " << dictionary.Size() << " distinct n-grams in " << mode << " mode." << std::endl;
  return report;
}

DedupMode Orchestrator::ExtractUnique(StringColumn &column, UniqueSink &sink) {
  PressureTier tier = monitor_.Sample().tier;
  uint64_t count = column.Count();
  DedupMode mode = config_.force_dedup ? config_.forced_dedup : ChooseDedupMode(tier, count, spill_threshold_);
  std::cerr << "Extracting unique values from " << count << " rows with " << mode << " at " << tier << " pressure." << std::endl;
  if (mode == DEDUP_IN_MEMORY) {
    std::vector<std::string> values;
    if (SortInMemory(column, values)) {
      for (std::vector<std::string>::const_iterator i = values.begin(); i != values.end(); ++i) {
        sink.Emit(*i);
      }
      return mode;
    }
    std::cerr << "Warning: out of memory deduplicating in memory; switching to " << DEDUP_EXTERNAL_SORT << '.' << std::endl;
    monitor_.Collect();
    mode = DEDUP_EXTERNAL_SORT;
  }
  ExternalSortUniqueExtractor extractor(config_.sort, monitor_, progress_);
  extractor.Extract(column, sink);
  return mode;
}

}} // namespaces
