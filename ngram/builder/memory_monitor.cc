#include "ngram/builder/memory_monitor.hh"

#include "util/exception.hh"
#include "util/usage.hh"

#include <iostream>

namespace ngram { namespace builder {

namespace {
const uint64_t kGiB = 1ULL << 30;
const char *kTierNames[] = {"LOW", "MEDIUM", "HIGH", "CRITICAL"};
const char *kTrendNames[] = {"insufficient_data", "increasing", "decreasing", "stable"};
} // namespace

const unsigned int MemoryMonitor::kMaxCollectPasses;
const std::size_t MemoryMonitor::kTrendWindow;

const char *TierName(PressureTier tier) {
  return kTierNames[tier];
}

const char *TrendName(MemoryTrend trend) {
  return kTrendNames[trend];
}

std::ostream &operator<<(std::ostream &out, PressureTier tier) {
  return out << TierName(tier);
}

uint64_t ProcessMemoryProbe::ResidentBytes() {
  return util::ResidentMemory();
}

uint64_t ProcessMemoryProbe::VirtualBytes() {
  return util::VirtualMemory();
}

uint64_t ProcessMemoryProbe::TotalSystemBytes() {
  return util::GuessPhysicalMemory();
}

bool ProcessMemoryProbe::Reclaim() {
  return util::ReleaseFreeMemory();
}

uint64_t AutoBudget(uint64_t total) {
  if (!total) return 2 * kGiB;
  double fraction;
  if (total >= 32 * kGiB) {
    fraction = 0.40;
  } else if (total >= 16 * kGiB) {
    fraction = 0.30;
  } else if (total >= 8 * kGiB) {
    fraction = 0.25;
  } else {
    fraction = 0.20;
  }
  return static_cast<uint64_t>(static_cast<double>(total) * fraction);
}

MemoryMonitor::MemoryMonitor(const MonitorConfig &config, MemoryProbe &probe)
  : config_(config), probe_(probe), total_system_(0), history_(config.history ? config.history : 1) {
  try {
    total_system_ = probe_.TotalSystemBytes();
  } catch (const std::exception &e) {
    std::cerr << "Warning: could not determine system memory: " << e.what() << std::endl;
  }
  budget_ = config_.budget ? config_.budget : AutoBudget(total_system_);
}

uint64_t MemoryMonitor::SafeResident() {
  // Introspection failure counts as no usage so the run keeps going.
  try {
    return probe_.ResidentBytes();
  } catch (const std::exception &e) {
    std::cerr << "Warning: memory probe failed, assuming LOW pressure: " << e.what() << std::endl;
    return 0;
  }
}

double MemoryMonitor::UsageRatio() {
  return static_cast<double>(SafeResident()) / static_cast<double>(budget_);
}

PressureTier MemoryMonitor::Classify(uint64_t resident) const {
  double ratio = static_cast<double>(resident) / static_cast<double>(budget_);
  if (ratio >= config_.critical_ratio) return PRESSURE_CRITICAL;
  if (ratio >= config_.high_ratio) return PRESSURE_HIGH;
  if (ratio >= config_.medium_ratio) return PRESSURE_MEDIUM;
  return PRESSURE_LOW;
}

PressureTier MemoryMonitor::Tier() {
  return Classify(SafeResident());
}

MemorySample MemoryMonitor::Sample() {
  MemorySample ret;
  ret.timestamp = util::WallTime();
  ret.resident_bytes = SafeResident();
  try {
    ret.virtual_bytes = probe_.VirtualBytes();
  } catch (const std::exception &e) {
    std::cerr << "Warning: could not read virtual memory size: " << e.what() << std::endl;
    ret.virtual_bytes = 0;
  }
  ret.tier = Classify(ret.resident_bytes);
  history_.push_back(ret);
  return ret;
}

CollectionResult MemoryMonitor::Collect() {
  CollectionResult ret;
  ret.before = SafeResident();
  ret.passes = 0;
  uint64_t previous = ret.before;
  while (ret.passes < kMaxCollectPasses) {
    ++ret.passes;
    bool did;
    try {
      did = probe_.Reclaim();
    } catch (const std::exception &e) {
      std::cerr << "Warning: memory reclamation failed: " << e.what() << std::endl;
      break;
    }
    uint64_t now = SafeResident();
    bool reclaimed = did && now < previous;
    previous = now;
    if (!reclaimed) break;
  }
  ret.after = previous;
  ret.freed_bytes = ret.before > ret.after ? ret.before - ret.after : 0;
  return ret;
}

MemoryTrend MemoryMonitor::Trend() const {
  if (history_.size() < kTrendWindow) return TREND_INSUFFICIENT_DATA;
  std::size_t begin = history_.size() - kTrendWindow;
  bool rising = true, falling = true;
  for (std::size_t i = begin; i + 1 < history_.size(); ++i) {
    if (history_[i].resident_bytes > history_[i + 1].resident_bytes) rising = false;
    if (history_[i].resident_bytes < history_[i + 1].resident_bytes) falling = false;
  }
  // A flat series is both; rising is checked first.
  if (rising) return TREND_INCREASING;
  if (falling) return TREND_DECREASING;
  return TREND_STABLE;
}

}} // namespaces
