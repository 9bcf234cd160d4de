#ifndef NGRAM_BUILDER_DICTIONARY_H
#define NGRAM_BUILDER_DICTIONARY_H

#include "ngram/ngram_index.hh"
#include "util/file.hh"
#include "util/probing_hash_table.hh"
#include "util/scoped.hh"

#include <cstddef>
#include <string>

#include <stdint.h>

namespace ngram { namespace builder {

#pragma pack(push)
#pragma pack(4)
struct DictionaryEntry {
  typedef uint64_t Key;

  uint64_t GetKey() const { return key; }
  void SetKey(uint64_t to) { key = to; }

  uint64_t key;
  NgramId value;
};
#pragma pack(pop)

/* N-gram string to id, ids handed out densely in first-observation order.
 * Only 64-bit hashes live in memory; the strings are appended to a vocabulary
 * file, null delimited, in id order.
 */
class NgramDictionary {
  public:
    static std::size_t MemUsage(std::size_t initial_guess);

    // Creates or truncates vocab_path.  The file is left in place.
    explicit NgramDictionary(const std::string &vocab_path, std::size_t initial_guess = 65536);

    NgramId Lookup(const char *data, std::size_t length);

    NgramId Lookup(const std::string &ngram) {
      return Lookup(ngram.data(), ngram.size());
    }

    // Does not insert.
    bool Find(const std::string &ngram, NgramId &out) const;

    NgramId Size() const {
      return static_cast<NgramId>(table_.SizeNoSerialization());
    }

    // Push buffered strings to the vocabulary file so it can be read.
    void Flush();

    const std::string &VocabPath() const { return vocab_path_; }

  private:
    typedef util::ProbingHashTable<DictionaryEntry, util::IdentityHash> Table;

    static uint64_t Key(const char *data, std::size_t length);

    util::scoped_malloc table_backing_;
    Table table_;

    std::size_t double_cutoff_;

    std::string vocab_path_;
    util::scoped_FILE vocab_;
};

}} // namespaces

#endif // NGRAM_BUILDER_DICTIONARY_H
