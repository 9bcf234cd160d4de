#ifndef NGRAM_BUILDER_GENERATE_H
#define NGRAM_BUILDER_GENERATE_H

#include "ngram/builder/chunk_size.hh"
#include "ngram/builder/record_source.hh"
#include "ngram/ngram_index.hh"

#include <cstddef>
#include <string>
#include <vector>

#include <stdint.h>

namespace ngram { namespace builder {

class MemoryMonitor;
class NgramDictionary;
class SafeProgress;

struct NgramRecord {
  RecordId record;
  NgramId ngram;
};

inline bool operator==(const NgramRecord &first, const NgramRecord &second) {
  return first.record == second.record && first.ngram == second.ngram;
}

// Inclusive range of n-gram lengths.
struct NgramRange {
  NgramRange(unsigned int min, unsigned int max) : min_n(min), max_n(max) {}

  // Throws ConfigException unless 1 <= min_n <= max_n.
  void Validate() const;

  unsigned int min_n, max_n;
};

// Progress parent for every generation substep.
extern const char kGenerateStep[];

/* Append the n-grams of one record: by start position, then by length.  An
 * n-gram's string is its tokens joined by single spaces.  scratch is reused
 * across calls to avoid allocation.
 */
void RecordNgrams(const TokenizedRecord &record, const NgramRange &range, NgramDictionary &dictionary, std::vector<NgramRecord> &out, std::string &scratch);

enum WindowStatus {
  WINDOW_OK,
  WINDOW_OUT_OF_MEMORY
};

struct Window {
  Window() : consumed(0) {}

  // Frees the memory, not just the contents.
  void Release();

  std::vector<TokenizedRecord> records;
  std::vector<NgramRecord> rows;
  // Records read from the source.
  std::size_t consumed;
};

/* Read records [offset, offset + size) and generate their rows into window.
 * Running out of memory returns WINDOW_OUT_OF_MEMORY with the window released
 * so the caller can retry smaller.  Every other failure propagates.
 */
WindowStatus MaterializeWindow(RecordSource &source, uint64_t offset, std::size_t size, const NgramRange &range, NgramDictionary &dictionary, Window &window);

/* One way to turn records into (record, n-gram) rows.  Every strategy draws
 * ids from the dictionary it is handed and appends rows to out in record then
 * position order, so the result does not depend on the strategy.
 */
class GenerationStrategy {
  public:
    virtual ~GenerationStrategy() {}

    virtual const char *Name() const = 0;

    // Throws ResourceException when memory runs out for good.
    virtual void Generate(RecordSource &source, const NgramRange &range, NgramDictionary &dictionary, std::vector<NgramRecord> &out) = 0;
};

// Everything in one window.  No retry.
class DirectGenerator : public GenerationStrategy {
  public:
    explicit DirectGenerator(SafeProgress &progress) : progress_(progress) {}

    const char *Name() const { return "direct"; }

    void Generate(RecordSource &source, const NgramRange &range, NgramDictionary &dictionary, std::vector<NgramRecord> &out);

  private:
    SafeProgress &progress_;
};

struct ChunkedConfig {
  // Window size in records before scaling for pressure.
  std::size_t base_size;

  // Use exactly this many records per window.  0 adapts to pressure.
  std::size_t fixed_size;

  // After running out of memory, retry the window with size / retry_divisor
  // records, but never fewer than retry_floor.  Failing at the floor is fatal.
  std::size_t retry_divisor;
  std::size_t retry_floor;

  // Stop a source of unknown size after this many empty windows in a row.
  unsigned int max_empty_windows;

  explicit ChunkedConfig(std::size_t base = kGenerationBaseSize)
    : base_size(base), fixed_size(0), retry_divisor(4), retry_floor(500), max_empty_windows(3) {}
};

/* The adaptive window loop.  Before each window the monitor is sampled and
 * the window size recomputed, so consecutive windows may differ in size.
 * Subclasses decide where each window's rows go.
 */
class WindowedGenerator : public GenerationStrategy {
  public:
    void Generate(RecordSource &source, const NgramRange &range, NgramDictionary &dictionary, std::vector<NgramRecord> &out);

    // Statistics of the last Generate call.
    std::size_t Windows() const { return windows_; }
    std::size_t Retries() const { return retries_; }
    const std::vector<std::size_t> &WindowSizes() const { return window_sizes_; }

  protected:
    WindowedGenerator(const ChunkedConfig &config, MemoryMonitor &monitor, SafeProgress &progress, const char *step);

    virtual void Begin() {}

    // window.rows holds the rows of window.consumed records.
    virtual void Consume(Window &window, std::vector<NgramRecord> &out) = 0;

    virtual void Finish(std::vector<NgramRecord> &out) = 0;

    MemoryMonitor &monitor_;
    SafeProgress &progress_;

  private:
    std::size_t NextSize();

    const ChunkedConfig config_;
    const char *step_;

    std::size_t windows_, retries_;
    std::vector<std::size_t> window_sizes_;
};

}} // namespaces

#endif // NGRAM_BUILDER_GENERATE_H
