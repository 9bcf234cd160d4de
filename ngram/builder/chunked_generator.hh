#ifndef NGRAM_BUILDER_CHUNKED_GENERATOR_H
#define NGRAM_BUILDER_CHUNKED_GENERATOR_H

#include "ngram/builder/generate.hh"

namespace ngram { namespace builder {

// Adaptive windows, every window's rows kept in memory.
class ChunkedGenerator : public WindowedGenerator {
  public:
    ChunkedGenerator(const ChunkedConfig &config, MemoryMonitor &monitor, SafeProgress &progress)
      : WindowedGenerator(config, monitor, progress, "chunked") {}

    const char *Name() const { return "chunked"; }

  protected:
    void Consume(Window &window, std::vector<NgramRecord> &out) {
      out.insert(out.end(), window.rows.begin(), window.rows.end());
    }

    void Finish(std::vector<NgramRecord> &) {}
};

}} // namespaces

#endif // NGRAM_BUILDER_CHUNKED_GENERATOR_H
