#include "util/probing_hash_table.hh"

#include "util/scoped.hh"

#define BOOST_TEST_MODULE ProbingHashTableTest
#include <boost/test/unit_test.hpp>
#include <boost/functional/hash.hpp>

#include <stdint.h>

namespace util {
namespace {

struct Counted {
  typedef uint64_t Key;
  uint64_t GetKey() const { return key; }
  void SetKey(uint64_t to) { key = to; }

  uint64_t key;
  uint32_t count;
};

typedef ProbingHashTable<Counted, IdentityHash> Table;
typedef ProbingHashTable<Counted, boost::hash<uint64_t> > HashedTable;

Counted Make(uint64_t key, uint32_t count) {
  Counted ret;
  ret.key = key;
  ret.count = count;
  return ret;
}

BOOST_AUTO_TEST_CASE(FirstInsertWins) {
  std::size_t bytes = HashedTable::Size(8, 1.5);
  scoped_malloc mem(CallocOrThrow(bytes));
  HashedTable table(mem.get(), bytes);

  HashedTable::ConstIterator found;
  BOOST_CHECK(!table.Find(42, found));
  HashedTable::MutableIterator slot;
  BOOST_CHECK(!table.FindOrInsert(Make(42, 1), slot));
  BOOST_CHECK(table.FindOrInsert(Make(42, 2), slot));
  BOOST_CHECK_EQUAL(1U, slot->count);
  BOOST_REQUIRE(table.Find(42, found));
  BOOST_CHECK_EQUAL(1U, found->count);
  BOOST_CHECK(!table.Find(43, found));
  BOOST_CHECK_EQUAL(static_cast<std::size_t>(1), table.SizeNoSerialization());
}

BOOST_AUTO_TEST_CASE(OneBucketStaysEmpty) {
  std::size_t bytes = Table::Size(2, 1.0);
  scoped_malloc mem(CallocOrThrow(bytes));
  Table table(mem.get(), bytes);
  BOOST_REQUIRE_EQUAL(static_cast<std::size_t>(3), table.Buckets());
  Table::MutableIterator slot;
  table.FindOrInsert(Make(5, 0), slot);
  table.FindOrInsert(Make(6, 0), slot);
  BOOST_CHECK_THROW(table.FindOrInsert(Make(7, 0), slot), ProbingSizeException);
  // Keys already present are still found in a full table.
  BOOST_CHECK(table.FindOrInsert(Make(5, 9), slot));
}

// Keys that hash to the last buckets wrap to the front, and doubling must
// still find them.
BOOST_AUTO_TEST_CASE(WrappedClusterSurvivesDoubling) {
  std::size_t bytes = Table::Size(6, 1.0);
  scoped_malloc mem(CallocOrThrow(bytes));
  Table table(mem.get(), bytes);
  BOOST_REQUIRE_EQUAL(static_cast<std::size_t>(7), table.Buckets());
  Table::MutableIterator slot;
  const uint64_t keys[] = {6, 13, 20, 27};
  for (unsigned int i = 0; i < 4; ++i) table.FindOrInsert(Make(keys[i], i), slot);
  table.CheckConsistency();

  mem.call_realloc(table.DoubleTo());
  table.Double(mem.get());
  BOOST_CHECK_EQUAL(static_cast<std::size_t>(14), table.Buckets());
  table.CheckConsistency();
  for (unsigned int i = 0; i < 4; ++i) {
    Table::ConstIterator found;
    BOOST_REQUIRE(table.Find(keys[i], found));
    BOOST_CHECK_EQUAL(i, found->count);
  }
}

// Grows the way NgramDictionary does, from several starting sizes.
BOOST_AUTO_TEST_CASE(GrowOnDemand) {
  for (uint64_t start = 2; start < 12; ++start) {
    std::size_t bytes = Table::Size(start, 1.5);
    scoped_malloc mem(CallocOrThrow(bytes));
    Table table(mem.get(), bytes);
    const uint32_t kKeys = 1500;
    for (uint32_t i = 0; i < kKeys; ++i) {
      if (table.SizeNoSerialization() + 2 >= table.Buckets()) {
        mem.call_realloc(table.DoubleTo());
        table.Double(mem.get());
      }
      Table::MutableIterator slot;
      BOOST_REQUIRE(!table.FindOrInsert(Make(i * 7 + 1, i), slot));
    }
    table.CheckConsistency();
    BOOST_CHECK_EQUAL(static_cast<std::size_t>(kKeys), table.SizeNoSerialization());
    for (uint32_t i = 0; i < kKeys; ++i) {
      Table::ConstIterator found;
      BOOST_REQUIRE(table.Find(i * 7 + 1, found));
      BOOST_CHECK_EQUAL(i, found->count);
      BOOST_CHECK(!table.Find(i * 7 + 2, found));
    }
  }
}

BOOST_AUTO_TEST_CASE(ConsistencyCatchesGap) {
  std::size_t bytes = Table::Size(4, 2.0);
  scoped_malloc mem(CallocOrThrow(bytes));
  Table table(mem.get(), bytes);
  Table::MutableIterator slot;
  table.FindOrInsert(Make(1, 0), slot);
  table.CheckConsistency();
  // Move the entry two buckets past its home, leaving an empty bucket between.
  Counted *raw = static_cast<Counted*>(mem.get());
  raw[3] = raw[1];
  raw[1].SetKey(0);
  BOOST_CHECK_THROW(table.CheckConsistency(), Exception);
}

} // namespace
} // namespace util
