#ifndef NGRAM_BUILDER_DISK_SPILL_GENERATOR_H
#define NGRAM_BUILDER_DISK_SPILL_GENERATOR_H

#include "ngram/builder/generate.hh"
#include "util/scoped.hh"
#include "util/temp_dir.hh"

#include <string>
#include <vector>

namespace ngram { namespace builder {

struct SpillConfig {
  ChunkedConfig chunked;

  // Where the private spill directory goes.
  std::string temp_prefix;

  SpillConfig() : chunked(kSpillBaseSize), temp_prefix("/tmp/ngram") {}
};

/* Adaptive windows like ChunkedGenerator, but each window's rows are written
 * to their own spill table as soon as they are generated.  After the last
 * window every table is opened, the concatenation is read into memory once,
 * and only then are the files deleted.  The spill directory is removed on
 * every exit path.
 */
class DiskSpillGenerator : public WindowedGenerator {
  public:
    DiskSpillGenerator(const SpillConfig &config, MemoryMonitor &monitor, SafeProgress &progress);

    const char *Name() const { return "disk_spill"; }

    void Generate(RecordSource &source, const NgramRange &range, NgramDictionary &dictionary, std::vector<NgramRecord> &out);

    // Spill tables written by the last Generate.
    std::size_t SpillFiles() const { return files_.size(); }

  protected:
    void Begin();

    void Consume(Window &window, std::vector<NgramRecord> &out);

    void Finish(std::vector<NgramRecord> &out);

  private:
    std::string temp_prefix_;

    util::scoped_ptr<util::TempDirectory> dir_;
    std::vector<std::string> files_;
};

}} // namespaces

#endif // NGRAM_BUILDER_DISK_SPILL_GENERATOR_H
