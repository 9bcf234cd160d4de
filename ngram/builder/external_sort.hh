#ifndef NGRAM_BUILDER_EXTERNAL_SORT_H
#define NGRAM_BUILDER_EXTERNAL_SORT_H

#include "ngram/builder/chunk_size.hh"
#include "util/file.hh"

#include <cstddef>
#include <string>
#include <vector>

#include <stdint.h>

namespace util { class TempDirectory; }

namespace ngram { namespace builder {

class MemoryMonitor;
class SafeProgress;
class StringColumn;

// Receives distinct values in ascending byte order.
class UniqueSink {
  public:
    virtual ~UniqueSink() {}

    virtual void Emit(const std::string &value) = 0;
};

class VectorSink : public UniqueSink {
  public:
    explicit VectorSink(std::vector<std::string> &to) : to_(to) {}

    void Emit(const std::string &value) { to_.push_back(value); }

  private:
    std::vector<std::string> &to_;
};

// A sorted run is each value as a uint32_t length followed by its bytes.
void WriteSortedRun(const std::string &path, const std::vector<std::string> &sorted);

// Pull-based sequential cursor over one sorted run.
class RunReader {
  public:
    explicit RunReader(const std::string &path);

    // Returns false at the end of the run.
    bool Next(std::string &out);

  private:
    std::string path_;
    util::scoped_FILE file_;
};

struct ExternalSortConfig {
  // Values per partition before scaling for pressure.
  std::size_t base_partition;

  // Use exactly this many values per partition.  0 adapts to pressure.
  std::size_t fixed_partition;

  // Where the private run directory goes.
  std::string temp_prefix;

  ExternalSortConfig() : base_partition(kExtractionBaseSize), fixed_partition(0), temp_prefix("/tmp/ngram") {}
};

/* Distinct values of a column too large to deduplicate in memory.
 * Partitions are sorted and deduplicated in memory and written as runs, then
 * the runs are merged through a heap holding one value per run.  Runs that
 * fail to build are logged and skipped.  Failures while merging are fatal.
 * The runs are deleted however Extract exits.
 */
class ExternalSortUniqueExtractor {
  public:
    ExternalSortUniqueExtractor(const ExternalSortConfig &config, MemoryMonitor &monitor, SafeProgress &progress);

    // Returns the number of values emitted.
    uint64_t Extract(StringColumn &column, UniqueSink &sink);

    // Collect into a vector instead.
    void Extract(StringColumn &column, std::vector<std::string> &out);

    // Statistics of the last Extract call.
    std::size_t Partitions() const { return runs_.size(); }
    std::size_t SkippedPartitions() const { return skipped_; }

  private:
    void Partition(StringColumn &column, util::TempDirectory &dir);

    uint64_t Merge(UniqueSink &sink);

    const ExternalSortConfig config_;
    MemoryMonitor &monitor_;
    SafeProgress &progress_;

    std::vector<std::string> runs_;
    std::size_t skipped_;
};

}} // namespaces

#endif // NGRAM_BUILDER_EXTERNAL_SORT_H
