#include "ngram/builder/string_column.hh"

#include "ngram/builder/dictionary.hh"
#include "ngram/exception.hh"

#include <algorithm>

namespace ngram { namespace builder {

std::size_t VectorStringColumn::Slice(uint64_t offset, std::size_t length, std::vector<std::string> &out) {
  if (offset >= values_.size()) return 0;
  std::size_t take = static_cast<std::size_t>(std::min<uint64_t>(length, values_.size() - offset));
  out.insert(out.end(), values_.begin() + offset, values_.begin() + offset + take);
  return take;
}

VocabColumn::VocabColumn(NgramDictionary &dictionary)
  : path_(dictionary.VocabPath()), count_(dictionary.Size()), position_(0) {
  dictionary.Flush();
  Reopen();
}

void VocabColumn::Reopen() {
  reader_.reset();
  reader_.reset(new util::LineReader(path_.c_str()));
  position_ = 0;
}

std::size_t VocabColumn::Slice(uint64_t offset, std::size_t length, std::vector<std::string> &out) {
  if (offset >= count_) return 0;
  if (offset < position_) Reopen();
  for (; position_ < offset; ++position_) {
    UTIL_THROW_IF(!reader_->ReadLine(value_, '\0'), FormatException, "Vocabulary file " << path_ << " ends at entry " << position_ << " but should have " << count_);
  }
  std::size_t take = static_cast<std::size_t>(std::min<uint64_t>(length, count_ - offset));
  for (std::size_t i = 0; i < take; ++i, ++position_) {
    UTIL_THROW_IF(!reader_->ReadLine(value_, '\0'), FormatException, "Vocabulary file " << path_ << " ends at entry " << position_ << " but should have " << count_);
    out.push_back(value_);
  }
  return take;
}

}} // namespaces
