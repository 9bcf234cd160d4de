#include "ngram/builder/spill_table.hh"

#include "ngram/exception.hh"

#include <algorithm>
#include <cstring>

namespace ngram { namespace builder {

const char kSpillMagic[8] = {'N', 'G', 'S', 'P', 'I', 'L', 'L', '1'};

namespace {
const std::size_t kBlockRows = 1 << 16;
const uint64_t kHeaderSize = sizeof(kSpillMagic) + sizeof(uint64_t);
} // namespace

void WriteSpillTable(const std::string &path, const std::vector<NgramRecord> &rows) {
  util::scoped_fd file(util::CreateOrThrow(path.c_str()));
  uint64_t count = rows.size();
  util::WriteOrThrow(file.get(), kSpillMagic, sizeof(kSpillMagic));
  util::WriteOrThrow(file.get(), &count, sizeof(uint64_t));

  std::vector<RecordId> records;
  for (std::size_t begin = 0; begin < rows.size(); begin += kBlockRows) {
    std::size_t end = std::min(rows.size(), begin + kBlockRows);
    records.clear();
    for (std::size_t i = begin; i < end; ++i) records.push_back(rows[i].record);
    util::WriteOrThrow(file.get(), &records[0], records.size() * sizeof(RecordId));
  }
  std::vector<NgramId> ngrams;
  for (std::size_t begin = 0; begin < rows.size(); begin += kBlockRows) {
    std::size_t end = std::min(rows.size(), begin + kBlockRows);
    ngrams.clear();
    for (std::size_t i = begin; i < end; ++i) ngrams.push_back(rows[i].ngram);
    util::WriteOrThrow(file.get(), &ngrams[0], ngrams.size() * sizeof(NgramId));
  }
}

SpillTableReader::SpillTableReader(const std::string &path)
  : path_(path), file_(util::OpenReadOrThrow(path.c_str())) {
  uint64_t size = util::SizeOrThrow(file_.get());
  UTIL_THROW_IF(size < kHeaderSize, FormatException, "Spill table " << path << " has only " << size << " bytes.");
  char magic[sizeof(kSpillMagic)];
  util::ReadOrThrow(file_.get(), magic, sizeof(magic));
  UTIL_THROW_IF(std::memcmp(magic, kSpillMagic, sizeof(magic)), FormatException, "Spill table " << path << " has the wrong magic bytes.");
  util::ReadOrThrow(file_.get(), &rows_, sizeof(uint64_t));
  uint64_t expect = kHeaderSize + rows_ * (sizeof(RecordId) + sizeof(NgramId));
  UTIL_THROW_IF(size != expect, FormatException, "Spill table " << path << " claims " << rows_ << " rows so it should be " << expect << " bytes, not " << size << '.');
}

void SpillTableReader::ReadAll(std::vector<NgramRecord> &out) {
  const std::size_t base = out.size();
  out.resize(base + util::CheckOverflow(rows_));
  const uint64_t ngram_offset = kHeaderSize + rows_ * sizeof(RecordId);

  std::vector<RecordId> records;
  std::vector<NgramId> ngrams;
  for (uint64_t begin = 0; begin < rows_; begin += kBlockRows) {
    std::size_t amount = static_cast<std::size_t>(std::min<uint64_t>(kBlockRows, rows_ - begin));
    records.resize(amount);
    ngrams.resize(amount);
    util::PReadOrThrow(file_.get(), &records[0], amount * sizeof(RecordId), kHeaderSize + begin * sizeof(RecordId));
    util::PReadOrThrow(file_.get(), &ngrams[0], amount * sizeof(NgramId), ngram_offset + begin * sizeof(NgramId));
    NgramRecord *to = &out[base + begin];
    for (std::size_t i = 0; i < amount; ++i, ++to) {
      to->record = records[i];
      to->ngram = ngrams[i];
    }
  }
}

}} // namespaces
