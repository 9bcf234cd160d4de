#ifndef NGRAM_BUILDER_MEMORY_MONITOR_H
#define NGRAM_BUILDER_MEMORY_MONITOR_H

#include <boost/circular_buffer.hpp>

#include <cstddef>
#include <iosfwd>

#include <stdint.h>

namespace ngram { namespace builder {

// Ordered: a higher tier means less room.
enum PressureTier {
  PRESSURE_LOW = 0,
  PRESSURE_MEDIUM = 1,
  PRESSURE_HIGH = 2,
  PRESSURE_CRITICAL = 3
};

enum MemoryTrend {
  TREND_INSUFFICIENT_DATA,
  TREND_INCREASING,
  TREND_DECREASING,
  TREND_STABLE
};

const char *TierName(PressureTier tier);
const char *TrendName(MemoryTrend trend);

std::ostream &operator<<(std::ostream &out, PressureTier tier);

struct MemorySample {
  // Seconds since the process started.
  double timestamp;
  uint64_t resident_bytes;
  uint64_t virtual_bytes;
  PressureTier tier;
};

struct CollectionResult {
  uint64_t freed_bytes;
  uint64_t before;
  uint64_t after;
  unsigned int passes;
};

/* Where memory numbers come from.  Tests script this. */
class MemoryProbe {
  public:
    virtual ~MemoryProbe() {}

    virtual uint64_t ResidentBytes() = 0;
    virtual uint64_t VirtualBytes() = 0;
    // 0 if unknown.
    virtual uint64_t TotalSystemBytes() = 0;

    // One reclamation pass.  Returns false if nothing could be done.
    virtual bool Reclaim() = 0;
};

// Reads /proc/self/statm and sysconf.  Reclaim trims the malloc heap.
class ProcessMemoryProbe : public MemoryProbe {
  public:
    uint64_t ResidentBytes();
    uint64_t VirtualBytes();
    uint64_t TotalSystemBytes();
    bool Reclaim();
};

struct MonitorConfig {
  // Bytes the process may use.  0 derives it from system memory.
  uint64_t budget;

  // Usage ratios at which MEDIUM, HIGH, and CRITICAL begin.
  double medium_ratio;
  double high_ratio;
  double critical_ratio;

  // Ratio above which ShouldCollect answers true.
  double collect_ratio;

  // Samples kept for trend analysis.
  std::size_t history;

  MonitorConfig()
    : budget(0), medium_ratio(0.70), high_ratio(0.80), critical_ratio(0.90),
      collect_ratio(0.70), history(100) {}
};

// Budget derived from total system memory: 40% at 32 GiB and above, 30% at
// 16 GiB, 25% at 8 GiB, otherwise 20%.  2 GiB if the total is unknown.
uint64_t AutoBudget(uint64_t total_system_bytes);

class MemoryMonitor {
  public:
    static const unsigned int kMaxCollectPasses = 3;
    static const std::size_t kTrendWindow = 5;

    // probe must outlive the monitor.
    MemoryMonitor(const MonitorConfig &config, MemoryProbe &probe);

    uint64_t Budget() const { return budget_; }

    uint64_t TotalSystemBytes() const { return total_system_; }

    // Read memory, append to the history, and return the sample.
    MemorySample Sample();

    // Classify the current usage without touching the history.
    PressureTier Tier();

    PressureTier Classify(uint64_t resident_bytes) const;

    // Current usage over budget.  0 if the probe fails.
    double UsageRatio();

    bool ShouldCollect() { return ShouldCollect(config_.collect_ratio); }
    bool ShouldCollect(double ratio) { return UsageRatio() > ratio; }

    // Never throws.
    CollectionResult Collect();

    MemoryTrend Trend() const;

    const boost::circular_buffer<MemorySample> &History() const { return history_; }

  private:
    uint64_t SafeResident();

    const MonitorConfig config_;
    MemoryProbe &probe_;
    uint64_t total_system_;
    uint64_t budget_;

    boost::circular_buffer<MemorySample> history_;
};

}} // namespaces

#endif // NGRAM_BUILDER_MEMORY_MONITOR_H
