#include "ngram/builder/dictionary.hh"

#include "ngram/exception.hh"
#include "util/exception.hh"
#include "util/murmur_hash.hh"

#include <algorithm>
#include <cstring>

namespace ngram { namespace builder {

namespace {
const float kProbingMultiplier = 1.5;
} // namespace

std::size_t NgramDictionary::MemUsage(std::size_t initial_guess) {
  if (initial_guess < 2) initial_guess = 2;
  return util::CheckOverflow(Table::Size(initial_guess, kProbingMultiplier));
}

NgramDictionary::NgramDictionary(const std::string &vocab_path, std::size_t initial_guess)
  : table_backing_(util::CallocOrThrow(MemUsage(initial_guess))),
    table_(table_backing_.get(), MemUsage(initial_guess)),
    double_cutoff_(std::max<std::size_t>(initial_guess * 1.1, 1)),
    vocab_path_(vocab_path) {
  util::scoped_fd fd(util::CreateOrThrow(vocab_path.c_str()));
  vocab_.reset(util::FDOpenOrThrow(fd));
}

// 0 marks an empty bucket.
uint64_t NgramDictionary::Key(const char *data, std::size_t length) {
  uint64_t key = util::MurmurHash64A(data, length);
  return key ? key : 1;
}

NgramId NgramDictionary::Lookup(const char *data, std::size_t length) {
  DictionaryEntry entry;
  entry.key = Key(data, length);
  entry.value = Size();

  Table::MutableIterator it;
  if (table_.FindOrInsert(entry, it))
    return it->value;
  util::WriteOrThrow(vocab_.get(), data, length);
  util::WriteOrThrow(vocab_.get(), "", 1);
  UTIL_THROW_IF(Size() >= kMaxNgramId, util::OverflowException, "Too many distinct n-grams for a 32-bit NgramId.");
  if (Size() >= double_cutoff_) {
    table_backing_.call_realloc(table_.DoubleTo());
    table_.Double(table_backing_.get());
    double_cutoff_ *= 2;
  }
  return entry.value;
}

bool NgramDictionary::Find(const std::string &ngram, NgramId &out) const {
  Table::ConstIterator it;
  if (!table_.Find(Key(ngram.data(), ngram.size()), it)) return false;
  out = it->value;
  return true;
}

void NgramDictionary::Flush() {
  util::FFlushOrThrow(vocab_.get());
}

}} // namespaces
