#include "ngram/builder/external_sort.hh"

#include "ngram/builder/memory_monitor.hh"
#include "ngram/builder/progress.hh"
#include "ngram/builder/string_column.hh"
#include "ngram/exception.hh"
#include "util/temp_dir.hh"

#include <boost/ptr_container/ptr_vector.hpp>

#include <algorithm>
#include <functional>
#include <iostream>
#include <limits>
#include <queue>

namespace ngram { namespace builder {

namespace {
const char kExtractStep[] = "extract";
} // namespace

void WriteSortedRun(const std::string &path, const std::vector<std::string> &sorted) {
  util::scoped_fd fd(util::CreateOrThrow(path.c_str()));
  util::scoped_FILE file(util::FDOpenOrThrow(fd));
  for (std::vector<std::string>::const_iterator i = sorted.begin(); i != sorted.end(); ++i) {
    UTIL_THROW_IF(i->size() > std::numeric_limits<uint32_t>::max(), FormatException, "Value of " << i->size() << " bytes is too long for a sorted run.");
    uint32_t length = static_cast<uint32_t>(i->size());
    util::WriteOrThrow(file.get(), &length, sizeof(uint32_t));
    util::WriteOrThrow(file.get(), i->data(), i->size());
  }
  util::FFlushOrThrow(file.get());
}

RunReader::RunReader(const std::string &path) : path_(path) {
  util::scoped_fd fd(util::OpenReadOrThrow(path.c_str()));
  file_.reset(util::FDOpenReadOrThrow(fd));
}

bool RunReader::Next(std::string &out) {
  uint32_t length;
  std::size_t got = util::FReadOrEOF(file_.get(), &length, sizeof(uint32_t));
  if (!got) return false;
  UTIL_THROW_IF(got != sizeof(uint32_t), FormatException, "Sorted run " << path_ << " ends in the middle of a length.");
  out.resize(length);
  if (length) {
    UTIL_THROW_IF(util::FReadOrEOF(file_.get(), &out[0], length) != length, FormatException, "Sorted run " << path_ << " ends in the middle of a value.");
  }
  return true;
}

ExternalSortUniqueExtractor::ExternalSortUniqueExtractor(const ExternalSortConfig &config, MemoryMonitor &monitor, SafeProgress &progress)
  : config_(config), monitor_(monitor), progress_(progress), skipped_(0) {}

void ExternalSortUniqueExtractor::Partition(StringColumn &column, util::TempDirectory &dir) {
  const uint64_t count = column.Count();
  std::vector<std::string> values;
  uint64_t offset = 0;
  progress_.AddSubstep(kExtractStep, "partition", "Sorting partitions", count);
  progress_.StartSubstep(kExtractStep, "partition");
  while (offset < count) {
    std::size_t size = config_.fixed_partition;
    if (!size) size = EffectiveChunkSize(config_.base_partition, OPERATION_UNIQUE_EXTRACTION, monitor_.Sample().tier);
    values.clear();
    std::string path(dir.NewFile("run"));
    std::size_t got = 0;
    try {
      got = column.Slice(offset, size, values);
      if (got) {
        std::sort(values.begin(), values.end());
        values.erase(std::unique(values.begin(), values.end()), values.end());
        WriteSortedRun(path, values);
        runs_.push_back(path);
      }
    } catch (const std::exception &e) {
      got = static_cast<std::size_t>(std::min<uint64_t>(size, count - offset));
      std::cerr << "Warning: skipping the partition of values " << (offset + 1) << " to " << (offset + got) << ": " << e.what() << std::endl;
      dir.Remove(path);
      ++skipped_;
    }
    if (!got) {
      dir.Remove(path);
      break;
    }
    offset += got;
    progress_.UpdateSubstep(kExtractStep, "partition", offset);
  }
  std::vector<std::string>().swap(values);
  progress_.CompleteSubstep(kExtractStep, "partition");
}

namespace {
struct HeapEntry {
  std::string value;
  std::size_t run;
};

// std::priority_queue is a max heap, so order by greater.
struct HeapGreater {
  bool operator()(const HeapEntry &first, const HeapEntry &second) const {
    if (first.value != second.value) return first.value > second.value;
    return first.run > second.run;
  }
};
} // namespace

uint64_t ExternalSortUniqueExtractor::Merge(UniqueSink &sink) {
  uint64_t emitted = 0;
  if (runs_.empty()) return emitted;
  if (runs_.size() == 1) {
    // Already sorted and distinct.
    RunReader reader(runs_.front());
    std::string value;
    while (reader.Next(value)) {
      sink.Emit(value);
      ++emitted;
    }
    return emitted;
  }

  boost::ptr_vector<RunReader> readers;
  std::priority_queue<HeapEntry, std::vector<HeapEntry>, HeapGreater> heap;
  HeapEntry entry;
  for (std::size_t i = 0; i < runs_.size(); ++i) {
    readers.push_back(new RunReader(runs_[i]));
    entry.run = i;
    if (readers.back().Next(entry.value)) heap.push(entry);
  }
  progress_.AddSubstep(kExtractStep, "merge", "Merging sorted partitions", 0);
  progress_.StartSubstep(kExtractStep, "merge");
  std::string last;
  while (!heap.empty()) {
    entry = heap.top();
    heap.pop();
    if (!emitted || entry.value != last) {
      sink.Emit(entry.value);
      last = entry.value;
      ++emitted;
    }
    if (readers[entry.run].Next(entry.value)) heap.push(entry);
  }
  progress_.CompleteSubstep(kExtractStep, "merge");
  return emitted;
}

uint64_t ExternalSortUniqueExtractor::Extract(StringColumn &column, UniqueSink &sink) {
  runs_.clear();
  skipped_ = 0;
  util::TempDirectory dir(config_.temp_prefix);
  uint64_t emitted;
  const char *phase = "partition";
  try {
    Partition(column, dir);
    phase = "merge";
    emitted = Merge(sink);
  } catch (const std::exception &e) {
    progress_.FailSubstep(kExtractStep, phase, e.what());
    throw;
  }
  if (skipped_) {
    std::cerr << "Warning: " << skipped_ << " of " << (skipped_ + runs_.size()) << " partitions were skipped during unique extraction." << std::endl;
  }
  return emitted;
}

void ExternalSortUniqueExtractor::Extract(StringColumn &column, std::vector<std::string> &out) {
  VectorSink sink(out);
  Extract(column, sink);
}

}} // namespaces
