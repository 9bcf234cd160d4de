#ifndef NGRAM_BUILDER_SCRIPTED_PROBE_H
#define NGRAM_BUILDER_SCRIPTED_PROBE_H

#include "ngram/builder/memory_monitor.hh"
#include "util/exception.hh"

#include <deque>

#include <stdint.h>

namespace ngram { namespace builder {

/* MemoryProbe for tests.  Resident memory is whatever the test says: queued
 * readings are consumed first, then resident repeats.  Each Reclaim lowers
 * resident by reclaim_step.
 */
class ScriptedProbe : public MemoryProbe {
  public:
    explicit ScriptedProbe(uint64_t total = 16ULL << 30)
      : resident(0), total_system(total), reclaim_step(0), reclaim_calls(0), fail(false) {}

    uint64_t ResidentBytes() {
      UTIL_THROW_IF(fail, util::Exception, "Scripted probe failure");
      if (!queued.empty()) {
        resident = queued.front();
        queued.pop_front();
      }
      return resident;
    }

    uint64_t VirtualBytes() {
      UTIL_THROW_IF(fail, util::Exception, "Scripted probe failure");
      return resident * 2;
    }

    uint64_t TotalSystemBytes() { return total_system; }

    bool Reclaim() {
      UTIL_THROW_IF(fail, util::Exception, "Scripted probe failure");
      ++reclaim_calls;
      if (!reclaim_step) return false;
      resident = resident > reclaim_step ? resident - reclaim_step : 0;
      return true;
    }

    uint64_t resident;
    std::deque<uint64_t> queued;
    uint64_t total_system;
    uint64_t reclaim_step;
    unsigned int reclaim_calls;
    bool fail;
};

}} // namespaces

#endif // NGRAM_BUILDER_SCRIPTED_PROBE_H
