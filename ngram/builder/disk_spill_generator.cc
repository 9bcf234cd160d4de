#include "ngram/builder/disk_spill_generator.hh"

#include "ngram/builder/spill_table.hh"

#include <boost/ptr_container/ptr_vector.hpp>

#include <iostream>

namespace ngram { namespace builder {

namespace {
class ReleaseOnExit {
  public:
    explicit ReleaseOnExit(util::scoped_ptr<util::TempDirectory> &dir) : dir_(dir) {}

    ~ReleaseOnExit() { dir_.reset(); }

  private:
    util::scoped_ptr<util::TempDirectory> &dir_;
};
} // namespace

DiskSpillGenerator::DiskSpillGenerator(const SpillConfig &config, MemoryMonitor &monitor, SafeProgress &progress)
  : WindowedGenerator(config.chunked, monitor, progress, "disk_spill"), temp_prefix_(config.temp_prefix) {}

void DiskSpillGenerator::Generate(RecordSource &source, const NgramRange &range, NgramDictionary &dictionary, std::vector<NgramRecord> &out) {
  ReleaseOnExit release(dir_);
  WindowedGenerator::Generate(source, range, dictionary, out);
}

void DiskSpillGenerator::Begin() {
  files_.clear();
  dir_.reset();
  dir_.reset(new util::TempDirectory(temp_prefix_));
}

void DiskSpillGenerator::Consume(Window &window, std::vector<NgramRecord> &) {
  std::string path(dir_->NewFile("window"));
  WriteSpillTable(path, window.rows);
  files_.push_back(path);
}

void DiskSpillGenerator::Finish(std::vector<NgramRecord> &out) {
  uint64_t total = 0;
  {
    boost::ptr_vector<SpillTableReader> tables;
    for (std::vector<std::string>::const_iterator i = files_.begin(); i != files_.end(); ++i) {
      tables.push_back(new SpillTableReader(*i));
      total += tables.back().Rows();
    }
    out.reserve(out.size() + util::CheckOverflow(total));
    for (boost::ptr_vector<SpillTableReader>::iterator i = tables.begin(); i != tables.end(); ++i) {
      i->ReadAll(out);
    }
  }
  std::cerr << "Read back " << total << " rows from " << files_.size() << " spill tables." << std::endl;
  dir_.reset();
}

}} // namespaces
