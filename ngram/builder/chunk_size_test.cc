#include "ngram/builder/chunk_size.hh"

#define BOOST_TEST_MODULE ChunkSizeTest
#include <boost/test/unit_test.hpp>

#include <algorithm>

namespace ngram { namespace builder { namespace {

const PressureTier kTiers[] = {PRESSURE_LOW, PRESSURE_MEDIUM, PRESSURE_HIGH, PRESSURE_CRITICAL};
const OperationKind kKinds[] = {OPERATION_DEFAULT, OPERATION_TOKENIZATION, OPERATION_NGRAM_GENERATION, OPERATION_UNIQUE_EXTRACTION};

BOOST_AUTO_TEST_CASE(Factors) {
  BOOST_CHECK_CLOSE(1.0, TierFactor(PRESSURE_LOW), 0.001);
  BOOST_CHECK_CLOSE(0.8, TierFactor(PRESSURE_MEDIUM), 0.001);
  BOOST_CHECK_CLOSE(0.6, TierFactor(PRESSURE_HIGH), 0.001);
  BOOST_CHECK_CLOSE(0.4, TierFactor(PRESSURE_CRITICAL), 0.001);
  BOOST_CHECK_CLOSE(0.6, OperationFactor(OPERATION_NGRAM_GENERATION), 0.001);
  BOOST_CHECK_CLOSE(1.2, OperationFactor(OPERATION_UNIQUE_EXTRACTION), 0.001);
  BOOST_CHECK_CLOSE(1.0, OperationFactor(OPERATION_TOKENIZATION), 0.001);
  BOOST_CHECK_CLOSE(1.0, OperationFactor(OPERATION_DEFAULT), 0.001);
}

BOOST_AUTO_TEST_CASE(Minimum) {
  BOOST_CHECK_EQUAL(static_cast<std::size_t>(1000), MinimumChunkSize(0));
  BOOST_CHECK_EQUAL(static_cast<std::size_t>(1000), MinimumChunkSize(5000));
  BOOST_CHECK_EQUAL(static_cast<std::size_t>(5000), MinimumChunkSize(50000));
}

BOOST_AUTO_TEST_CASE(Generation) {
  BOOST_CHECK_EQUAL(static_cast<std::size_t>(30000), EffectiveChunkSize(kGenerationBaseSize, OPERATION_NGRAM_GENERATION, PRESSURE_LOW));
  BOOST_CHECK_EQUAL(static_cast<std::size_t>(24000), EffectiveChunkSize(kGenerationBaseSize, OPERATION_NGRAM_GENERATION, PRESSURE_MEDIUM));
  BOOST_CHECK_EQUAL(static_cast<std::size_t>(18000), EffectiveChunkSize(kGenerationBaseSize, OPERATION_NGRAM_GENERATION, PRESSURE_HIGH));
  BOOST_CHECK_EQUAL(static_cast<std::size_t>(12000), EffectiveChunkSize(kGenerationBaseSize, OPERATION_NGRAM_GENERATION, PRESSURE_CRITICAL));
}

BOOST_AUTO_TEST_CASE(FloorWins) {
  // 5000 * 0.4 * 0.6 = 1200, still above the floor of 1000.
  BOOST_CHECK_EQUAL(static_cast<std::size_t>(1200), EffectiveChunkSize(kSpillBaseSize, OPERATION_NGRAM_GENERATION, PRESSURE_CRITICAL));
  // 2000 * 0.4 = 800 rounds up to the floor.
  BOOST_CHECK_EQUAL(static_cast<std::size_t>(1000), EffectiveChunkSize(2000, OPERATION_DEFAULT, PRESSURE_CRITICAL));
  BOOST_CHECK_EQUAL(static_cast<std::size_t>(1000), EffectiveChunkSize(10, OPERATION_UNIQUE_EXTRACTION, PRESSURE_LOW));
}

BOOST_AUTO_TEST_CASE(Monotonic) {
  const std::size_t bases[] = {0, 10, 2000, kSpillBaseSize, kExtractionBaseSize, kGenerationBaseSize, 1000000};
  for (std::size_t b = 0; b < sizeof(bases) / sizeof(bases[0]); ++b) {
    for (std::size_t k = 0; k < 4; ++k) {
      std::size_t previous = EffectiveChunkSize(bases[b], kKinds[k], kTiers[0]);
      BOOST_CHECK(previous >= MinimumChunkSize(bases[b]));
      BOOST_CHECK(previous <= std::max(MinimumChunkSize(bases[b]), static_cast<std::size_t>(bases[b] * 1.2)));
      for (std::size_t t = 1; t < 4; ++t) {
        std::size_t now = EffectiveChunkSize(bases[b], kKinds[k], kTiers[t]);
        BOOST_CHECK(now <= previous);
        BOOST_CHECK(now >= MinimumChunkSize(bases[b]));
        previous = now;
      }
    }
  }
}

}}} // namespaces
