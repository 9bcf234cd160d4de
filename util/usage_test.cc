#include "util/usage.hh"

#include "util/exception.hh"
#include "util/scoped.hh"

#define BOOST_TEST_MODULE UsageTest
#include <boost/test/unit_test.hpp>

#include <cstring>

namespace util {
namespace {

BOOST_AUTO_TEST_CASE(Sizes) {
  BOOST_CHECK_EQUAL(static_cast<uint64_t>(10 * 1024), ParseSize("10"));
  BOOST_CHECK_EQUAL(static_cast<uint64_t>(10), ParseSize("10b"));
  BOOST_CHECK_EQUAL(static_cast<uint64_t>(3) << 20, ParseSize("3M"));
  BOOST_CHECK_EQUAL(static_cast<uint64_t>(1) << 31, ParseSize("2G"));
  BOOST_CHECK_EQUAL(static_cast<uint64_t>(1536), ParseSize("1.5K"));
  BOOST_CHECK_EQUAL(static_cast<uint64_t>(0), ParseSize("0"));
}

BOOST_AUTO_TEST_CASE(BadSizes) {
  BOOST_CHECK_THROW(ParseSize("lots"), Exception);
  BOOST_CHECK_THROW(ParseSize("10Q"), Exception);
  BOOST_CHECK_THROW(ParseSize("10 M extra"), Exception);
  BOOST_CHECK_THROW(ParseSize("-5M"), Exception);
  BOOST_CHECK_THROW(ParseSize("1Z"), Exception);
  BOOST_CHECK_THROW(ParseSize(""), Exception);
}

BOOST_AUTO_TEST_CASE(SpacedAndPercent) {
  BOOST_CHECK_EQUAL(static_cast<uint64_t>(5) << 20, ParseSize(" 5 M "));
  BOOST_CHECK_EQUAL(static_cast<uint64_t>(1) << 60, ParseSize("1E"));
  uint64_t half = ParseSize("50%");
  BOOST_CHECK(half > 0);
  BOOST_CHECK(half <= GuessPhysicalMemory());
}

BOOST_AUTO_TEST_CASE(ProcessMemory) {
  uint64_t resident = ResidentMemory();
  BOOST_CHECK(resident > 0);
  BOOST_CHECK(VirtualMemory() >= resident);

  // Touch enough pages that resident memory has to grow.
  const std::size_t kBig = 64 << 20;
  scoped_malloc big(MallocOrThrow(kBig));
  std::memset(big.get(), 1, kBig);
  BOOST_CHECK(ResidentMemory() > resident);
}

BOOST_AUTO_TEST_CASE(Physical) {
  BOOST_CHECK(GuessPhysicalMemory() > 0);
}

} // namespace
} // namespace util
