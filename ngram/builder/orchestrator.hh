#ifndef NGRAM_BUILDER_ORCHESTRATOR_H
#define NGRAM_BUILDER_ORCHESTRATOR_H

#include "ngram/builder/chunked_generator.hh"
#include "ngram/builder/disk_spill_generator.hh"
#include "ngram/builder/external_sort.hh"
#include "ngram/builder/generate.hh"
#include "ngram/builder/memory_monitor.hh"
#include "ngram/builder/progress.hh"

#include <cstddef>
#include <iosfwd>
#include <string>
#include <vector>

#include <stdint.h>

namespace ngram { namespace builder {

class StringColumn;

// Escalation order.  A run only ever moves to a later mode.
enum GenerationMode {
  MODE_NORMAL,
  MODE_CHUNKED,
  MODE_DISK_SPILL
};

enum DedupMode {
  DEDUP_IN_MEMORY,
  DEDUP_EXTERNAL_SORT
};

const char *ModeName(GenerationMode mode);
const char *DedupName(DedupMode mode);

std::ostream &operator<<(std::ostream &out, GenerationMode mode);
std::ostream &operator<<(std::ostream &out, DedupMode mode);

// Rows that justify going to disk: 3M at 32 GiB of system memory, 1.5M at
// 16 GiB, 500K at 8 GiB, otherwise 200K.
uint64_t SpillRowThreshold(uint64_t total_system_bytes);

// Pass kUnknownCount for a count or estimate that is not known.
GenerationMode ChooseGenerationMode(PressureTier tier, uint64_t record_count, uint64_t estimated_rows, uint64_t spill_threshold, uint64_t chunked_records);

DedupMode ChooseDedupMode(PressureTier tier, uint64_t values, uint64_t spill_threshold);

struct OrchestratorConfig {
  ChunkedConfig chunked;
  SpillConfig spill;
  ExternalSortConfig sort;

  // Estimated rows above which generation and deduplication go to disk.
  // 0 derives it from system memory with SpillRowThreshold.
  uint64_t spill_threshold;

  // Records above which generation is chunked.
  uint64_t chunked_records;

  // Records sampled to estimate the number of rows.
  std::size_t estimate_sample;

  // Start in this mode instead of choosing one.
  bool force_mode;
  GenerationMode forced_mode;

  bool force_dedup;
  DedupMode forced_dedup;

  OrchestratorConfig()
    : spill_threshold(0), chunked_records(100000), estimate_sample(1000),
      force_mode(false), forced_mode(MODE_NORMAL),
      force_dedup(false), forced_dedup(DEDUP_IN_MEMORY) {}
};

struct GenerationReport {
  GenerationMode initial;
  // The mode that produced the rows.
  GenerationMode used;
  unsigned int downgrades;
  uint64_t records;
  // kUnknownCount when the record count is unknown.
  uint64_t estimated_rows;
  uint64_t rows;
};

/* Picks a strategy for each operation from the live pressure and the size of
 * the input, and moves to the next strategy when one runs out of memory.  The
 * dictionary is only borrowed; every attempt folds into the same one.
 */
class Orchestrator {
  public:
    // monitor must outlive this.  progress may be NULL.
    Orchestrator(const OrchestratorConfig &config, MemoryMonitor &monitor, ProgressReporter *progress = NULL);

    uint64_t SpillThreshold() const { return spill_threshold_; }

    // Extrapolate the rows of the first estimate_sample records to the whole
    // source.  kUnknownCount if the source cannot be counted.
    uint64_t EstimateRows(RecordSource &source, const NgramRange &range);

    // Rows are appended to out, which must be empty.  A mode that runs out of
    // memory is abandoned for the next one, restarting from the first record.
    // Throws ResourceException if the disk spill strategy fails too.
    GenerationReport Generate(RecordSource &source, const NgramRange &range, NgramDictionary &dictionary, std::vector<NgramRecord> &out);

    // Emit the distinct values of column in ascending byte order.  Sorting in
    // memory falls back to the external sort if memory runs out.
    DedupMode ExtractUnique(StringColumn &column, UniqueSink &sink);

  private:
    GenerationStrategy *MakeStrategy(GenerationMode mode);

    const OrchestratorConfig config_;
    MemoryMonitor &monitor_;
    SafeProgress progress_;
    uint64_t spill_threshold_;
};

}} // namespaces

#endif // NGRAM_BUILDER_ORCHESTRATOR_H
