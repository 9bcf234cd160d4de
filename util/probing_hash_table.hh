#ifndef UTIL_PROBING_HASH_TABLE_H
#define UTIL_PROBING_HASH_TABLE_H

#include "util/exception.hh"

#include <algorithm>
#include <cstddef>
#include <vector>

#include <stdint.h>

namespace util {

// No empty bucket is left for an insertion.
class ProbingSizeException : public Exception {
  public:
    ProbingSizeException() throw() {}
    ~ProbingSizeException() throw() {}
};

// For keys that are already hashes.
struct IdentityHash {
  template <class T> T operator()(T arg) const { return arg; }
};

/* Open addressing with linear probing over memory the caller owns.  Entries
 * provide Key, GetKey and SetKey; a bucket whose key equals Key() is empty,
 * so the memory must start zeroed and Key() is never stored.  To grow, the
 * caller reallocates to DoubleTo() bytes and passes the new base to Double.
 */
template <class EntryT, class HashT> class ProbingHashTable {
  public:
    typedef EntryT Entry;
    typedef typename Entry::Key Key;
    typedef const Entry *ConstIterator;
    typedef Entry *MutableIterator;

    // Bytes for at least entries + 1 buckets, scaled by multiplier.
    static uint64_t Size(uint64_t entries, float multiplier) {
      uint64_t scaled = static_cast<uint64_t>(static_cast<float>(entries) * multiplier);
      return std::max(scaled, entries + 1) * sizeof(Entry);
    }

    ProbingHashTable(void *base, std::size_t bytes, const HashT &hash = HashT())
      : begin_(static_cast<Entry*>(base)), buckets_(bytes / sizeof(Entry)), entries_(0), hash_(hash) {}

    // Points out at the stored entry with the key of add, inserting add if
    // there was none.  Returns true when the key was already present.
    bool FindOrInsert(const Entry &add, MutableIterator &out) {
      std::size_t at = Home(add.GetKey());
      for (; !Empty(begin_[at]); at = Next(at)) {
        if (begin_[at].GetKey() == add.GetKey()) {
          out = begin_ + at;
          return true;
        }
      }
      UTIL_THROW_IF(entries_ + 1 >= buckets_, ProbingSizeException, "All but one of " << buckets_ << " buckets are in use.");
      begin_[at] = add;
      ++entries_;
      out = begin_ + at;
      return false;
    }

    bool Find(const Key key, ConstIterator &out) const {
      for (std::size_t at = Home(key); !Empty(begin_[at]); at = Next(at)) {
        if (begin_[at].GetKey() == key) {
          out = begin_ + at;
          return true;
        }
      }
      return false;
    }

    std::size_t SizeNoSerialization() const { return entries_; }

    std::size_t Buckets() const { return buckets_; }

    std::size_t DoubleTo() const { return buckets_ * 2 * sizeof(Entry); }

    // The first half of new_base holds the old buckets.
    void Double(void *new_base) {
      begin_ = static_cast<Entry*>(new_base);
      std::vector<Entry> moving;
      moving.reserve(entries_);
      for (std::size_t i = 0; i < buckets_; ++i) {
        if (!Empty(begin_[i])) moving.push_back(begin_[i]);
      }
      buckets_ *= 2;
      Entry blank;
      blank.SetKey(Key());
      std::fill(begin_, begin_ + buckets_, blank);
      for (typename std::vector<Entry>::const_iterator i = moving.begin(); i != moving.end(); ++i) {
        std::size_t at = Home(i->GetKey());
        while (!Empty(begin_[at])) at = Next(at);
        begin_[at] = *i;
      }
    }

    // Throws unless every entry is reachable from its home bucket without
    // crossing an empty one.  For tests.
    void CheckConsistency() const {
      std::size_t seen = 0;
      for (std::size_t i = 0; i < buckets_; ++i) {
        if (Empty(begin_[i])) continue;
        ++seen;
        for (std::size_t at = Home(begin_[i].GetKey()); at != i; at = Next(at)) {
          UTIL_THROW_IF(Empty(begin_[at]), Exception, "Entry in bucket " << i << " is cut off from its home bucket by an empty bucket at " << at);
        }
      }
      UTIL_THROW_IF(seen != entries_, Exception, "Counted " << seen << " entries but " << entries_ << " were inserted");
    }

  private:
    bool Empty(const Entry &entry) const { return entry.GetKey() == Key(); }

    std::size_t Home(const Key key) const { return hash_(key) % buckets_; }

    std::size_t Next(std::size_t at) const { return at + 1 == buckets_ ? 0 : at + 1; }

    Entry *begin_;
    std::size_t buckets_;
    std::size_t entries_;
    HashT hash_;
};

} // namespace util

#endif // UTIL_PROBING_HASH_TABLE_H
