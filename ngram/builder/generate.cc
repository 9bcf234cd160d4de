#include "ngram/builder/generate.hh"

#include "ngram/builder/dictionary.hh"
#include "ngram/builder/memory_monitor.hh"
#include "ngram/builder/progress.hh"
#include "ngram/exception.hh"
#include "util/scoped.hh"

#include <algorithm>
#include <iostream>
#include <limits>
#include <new>
#include <sstream>

namespace ngram { namespace builder {

const char kGenerateStep[] = "generate";

void NgramRange::Validate() const {
  UTIL_THROW_IF(min_n < 1, ConfigException, "min_n must be at least 1, not " << min_n);
  UTIL_THROW_IF(max_n < min_n, ConfigException, "max_n " << max_n << " is below min_n " << min_n);
}

void RecordNgrams(const TokenizedRecord &record, const NgramRange &range, NgramDictionary &dictionary, std::vector<NgramRecord> &out, std::string &scratch) {
  const std::vector<std::string> &tokens = record.tokens;
  NgramRecord row;
  row.record = record.id;
  for (std::size_t start = 0; start < tokens.size(); ++start) {
    std::size_t remaining = tokens.size() - start;
    if (remaining < range.min_n) break;
    scratch.clear();
    for (std::size_t i = 0; i < range.min_n - 1; ++i) {
      scratch += tokens[start + i];
      scratch += ' ';
    }
    for (std::size_t n = range.min_n; n <= range.max_n && n <= remaining; ++n) {
      if (n > range.min_n) scratch += ' ';
      scratch += tokens[start + n - 1];
      row.ngram = dictionary.Lookup(scratch);
      out.push_back(row);
    }
  }
}

void Window::Release() {
  std::vector<TokenizedRecord>().swap(records);
  std::vector<NgramRecord>().swap(rows);
  consumed = 0;
}

WindowStatus MaterializeWindow(RecordSource &source, uint64_t offset, std::size_t size, const NgramRange &range, NgramDictionary &dictionary, Window &window) {
  window.Release();
  try {
    window.consumed = source.Slice(offset, size, window.records);
    std::string scratch;
    for (std::vector<TokenizedRecord>::const_iterator i = window.records.begin(); i != window.records.end(); ++i) {
      RecordNgrams(*i, range, dictionary, window.rows, scratch);
    }
  } catch (const std::bad_alloc &e) {
    window.Release();
    return WINDOW_OUT_OF_MEMORY;
  } catch (const util::MallocException &e) {
    window.Release();
    return WINDOW_OUT_OF_MEMORY;
  }
  return WINDOW_OK;
}

void DirectGenerator::Generate(RecordSource &source, const NgramRange &range, NgramDictionary &dictionary, std::vector<NgramRecord> &out) {
  range.Validate();
  progress_.AddSubstep(kGenerateStep, Name(), "Generating n-grams in one pass", 1);
  progress_.StartSubstep(kGenerateStep, Name());
  uint64_t count = source.Count();
  std::size_t size = (count == kUnknownCount) ? std::numeric_limits<std::size_t>::max() : util::CheckOverflow(count);
  Window window;
  if (MaterializeWindow(source, 0, size, range, dictionary, window) != WINDOW_OK) {
    progress_.FailSubstep(kGenerateStep, Name(), "out of memory");
    UTIL_THROW(ResourceException, "Out of memory generating n-grams for all records at once.");
  }
  out.insert(out.end(), window.rows.begin(), window.rows.end());
  progress_.UpdateSubstep(kGenerateStep, Name(), 1);
  progress_.CompleteSubstep(kGenerateStep, Name());
}

WindowedGenerator::WindowedGenerator(const ChunkedConfig &config, MemoryMonitor &monitor, SafeProgress &progress, const char *step)
  : monitor_(monitor), progress_(progress), config_(config), step_(step), windows_(0), retries_(0) {}

std::size_t WindowedGenerator::NextSize() {
  MemorySample sample = monitor_.Sample();
  if (config_.fixed_size) return config_.fixed_size;
  return EffectiveChunkSize(config_.base_size, OPERATION_NGRAM_GENERATION, sample.tier);
}

void WindowedGenerator::Generate(RecordSource &source, const NgramRange &range, NgramDictionary &dictionary, std::vector<NgramRecord> &out) {
  range.Validate();
  windows_ = 0;
  retries_ = 0;
  window_sizes_.clear();
  const uint64_t total = source.Count();

  std::size_t size = NextSize();
  std::ostringstream label;
  label << "Generating n-grams with the " << Name() << " strategy";
  progress_.AddSubstep(kGenerateStep, step_, label.str(), total == kUnknownCount ? 0 : (total + size - 1) / size);
  progress_.StartSubstep(kGenerateStep, step_);

  try {
    Begin();
    Window window;
    uint64_t offset = 0;
    unsigned int empty = 0;
    while (total == kUnknownCount || offset < total) {
      if (windows_ || empty) size = NextSize();
      while (MaterializeWindow(source, offset, size, range, dictionary, window) != WINDOW_OK) {
        UTIL_THROW_IF(size <= config_.retry_floor, ResourceException, "Out of memory generating n-grams for " << size << " records starting at record " << (offset + 1) << ", which is the smallest window allowed.");
        std::size_t smaller = std::max(config_.retry_floor, size / config_.retry_divisor);
        std::cerr << "Warning: out of memory on a window of " << size << " records at record " << (offset + 1) << ".  Retrying with " << smaller << '.' << std::endl;
        monitor_.Collect();
        size = smaller;
        ++retries_;
      }
      if (!window.consumed) {
        if (++empty >= config_.max_empty_windows) break;
        continue;
      }
      empty = 0;
      window_sizes_.push_back(window.consumed);
      offset += window.consumed;
      Consume(window, out);
      window.Release();
      progress_.UpdateSubstep(kGenerateStep, step_, ++windows_);
      if (monitor_.ShouldCollect()) monitor_.Collect();
    }
    Finish(out);
  } catch (const std::exception &e) {
    progress_.FailSubstep(kGenerateStep, step_, e.what());
    throw;
  }
  progress_.CompleteSubstep(kGenerateStep, step_);
}

}} // namespaces
