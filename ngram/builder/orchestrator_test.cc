#include "ngram/builder/orchestrator.hh"

#include "ngram/builder/dictionary.hh"
#include "ngram/builder/scripted_probe.hh"
#include "ngram/builder/string_column.hh"
#include "ngram/exception.hh"
#include "util/scoped.hh"
#include "util/temp_dir.hh"

#define BOOST_TEST_MODULE OrchestratorTest
#include <boost/test/unit_test.hpp>

#include <new>
#include <string>
#include <vector>

namespace ngram { namespace builder { namespace {

const uint64_t kGiB = 1ULL << 30;

// Allocation fails for any window longer than limit.
class StarvedSource : public RecordSource {
  public:
    StarvedSource(const std::vector<TokenizedRecord> &records, std::size_t limit, bool restart = true)
      : backing_(records), limit_(limit), restart_(restart) {}

    uint64_t Count() { return backing_.Count(); }

    std::size_t Slice(uint64_t offset, std::size_t length, std::vector<TokenizedRecord> &out) {
      if (length > limit_) throw std::bad_alloc();
      return backing_.Slice(offset, length, out);
    }

    bool CanRestart() const { return restart_; }

  private:
    VectorRecordSource backing_;
    std::size_t limit_;
    bool restart_;
};

std::vector<TokenizedRecord> ScenarioRecords() {
  const unsigned int lengths[] = {3, 4, 2, 5, 3, 3, 4};
  const char *words[] = {"to", "be", "or", "not"};
  std::vector<TokenizedRecord> ret(7);
  for (std::size_t r = 0; r < 7; ++r) {
    ret[r].id = r + 1;
    for (unsigned int t = 0; t < lengths[r]; ++t) {
      ret[r].tokens.push_back(words[(r + t) % 4]);
    }
  }
  return ret;
}

struct Fixture {
  Fixture() : work("orchestrator_test"), dictionary(work.NewFile("vocab")), probe(16 * kGiB), monitor(Monitor(), probe) {
    config.spill.temp_prefix = work.Path() + "/";
    config.sort.temp_prefix = work.Path() + "/";
  }

  static MonitorConfig Monitor() {
    MonitorConfig ret;
    ret.budget = 1000;
    return ret;
  }

  util::TempDirectory work;
  NgramDictionary dictionary;
  ScriptedProbe probe;
  MemoryMonitor monitor;
  OrchestratorConfig config;
};

BOOST_AUTO_TEST_CASE(Thresholds) {
  BOOST_CHECK_EQUAL(static_cast<uint64_t>(200000), SpillRowThreshold(0));
  BOOST_CHECK_EQUAL(static_cast<uint64_t>(200000), SpillRowThreshold(4 * kGiB));
  BOOST_CHECK_EQUAL(static_cast<uint64_t>(500000), SpillRowThreshold(8 * kGiB));
  BOOST_CHECK_EQUAL(static_cast<uint64_t>(1500000), SpillRowThreshold(16 * kGiB));
  BOOST_CHECK_EQUAL(static_cast<uint64_t>(3000000), SpillRowThreshold(32 * kGiB));
  BOOST_CHECK_EQUAL(static_cast<uint64_t>(3000000), SpillRowThreshold(256 * kGiB));
}

BOOST_AUTO_TEST_CASE(ChooseMode) {
  const uint64_t kThreshold = 1000, kChunked = 100;
  BOOST_CHECK_EQUAL(MODE_NORMAL, ChooseGenerationMode(PRESSURE_LOW, 10, 50, kThreshold, kChunked));
  BOOST_CHECK_EQUAL(MODE_NORMAL, ChooseGenerationMode(PRESSURE_MEDIUM, 100, 1000, kThreshold, kChunked));
  BOOST_CHECK_EQUAL(MODE_CHUNKED, ChooseGenerationMode(PRESSURE_LOW, 101, 50, kThreshold, kChunked));
  BOOST_CHECK_EQUAL(MODE_CHUNKED, ChooseGenerationMode(PRESSURE_HIGH, 10, 50, kThreshold, kChunked));
  BOOST_CHECK_EQUAL(MODE_DISK_SPILL, ChooseGenerationMode(PRESSURE_LOW, 10, 1001, kThreshold, kChunked));
  BOOST_CHECK_EQUAL(MODE_DISK_SPILL, ChooseGenerationMode(PRESSURE_CRITICAL, 1, 1, kThreshold, kChunked));
  BOOST_CHECK_EQUAL(MODE_NORMAL, ChooseGenerationMode(PRESSURE_LOW, kUnknownCount, kUnknownCount, kThreshold, kChunked));
  BOOST_CHECK_EQUAL(MODE_CHUNKED, ChooseGenerationMode(PRESSURE_HIGH, kUnknownCount, kUnknownCount, kThreshold, kChunked));

  BOOST_CHECK_EQUAL(DEDUP_IN_MEMORY, ChooseDedupMode(PRESSURE_HIGH, 1000, kThreshold));
  BOOST_CHECK_EQUAL(DEDUP_EXTERNAL_SORT, ChooseDedupMode(PRESSURE_LOW, 1001, kThreshold));
  BOOST_CHECK_EQUAL(DEDUP_EXTERNAL_SORT, ChooseDedupMode(PRESSURE_CRITICAL, 1, kThreshold));
}

BOOST_AUTO_TEST_CASE(Estimate) {
  Fixture f;
  f.config.estimate_sample = 2;
  Orchestrator orchestrator(f.config, f.monitor);
  BOOST_CHECK_EQUAL(static_cast<uint64_t>(1500000), orchestrator.SpillThreshold());
  std::vector<TokenizedRecord> records(ScenarioRecords());
  VectorRecordSource source(records);
  // The first two records have 2 and 3 bigrams, so 2.5 per record.
  BOOST_CHECK_EQUAL(static_cast<uint64_t>(17), orchestrator.EstimateRows(source, NgramRange(2, 2)));
  f.config.estimate_sample = 1000;
  Orchestrator all(f.config, f.monitor);
  BOOST_CHECK_EQUAL(static_cast<uint64_t>(17), all.EstimateRows(source, NgramRange(2, 2)));
}

BOOST_AUTO_TEST_CASE(NormalRun) {
  Fixture f;
  Orchestrator orchestrator(f.config, f.monitor);
  std::vector<TokenizedRecord> records(ScenarioRecords());
  VectorRecordSource source(records);
  std::vector<NgramRecord> rows;
  GenerationReport report = orchestrator.Generate(source, NgramRange(2, 2), f.dictionary, rows);
  BOOST_CHECK_EQUAL(MODE_NORMAL, report.initial);
  BOOST_CHECK_EQUAL(MODE_NORMAL, report.used);
  BOOST_CHECK_EQUAL(0U, report.downgrades);
  BOOST_CHECK_EQUAL(static_cast<uint64_t>(7), report.records);
  BOOST_CHECK_EQUAL(static_cast<uint64_t>(17), report.rows);
  BOOST_CHECK_EQUAL(static_cast<std::size_t>(17), rows.size());
  // Rows are only appended to an empty vector.
  BOOST_CHECK_THROW(orchestrator.Generate(source, NgramRange(2, 2), f.dictionary, rows), util::Exception);
  rows.clear();
  BOOST_CHECK_THROW(orchestrator.Generate(source, NgramRange(3, 2), f.dictionary, rows), ConfigException);
}

BOOST_AUTO_TEST_CASE(CriticalPressureSpills) {
  Fixture f;
  f.probe.resident = 990;
  Orchestrator orchestrator(f.config, f.monitor);
  std::vector<TokenizedRecord> records(ScenarioRecords());
  VectorRecordSource source(records);
  std::vector<NgramRecord> rows;
  GenerationReport report = orchestrator.Generate(source, NgramRange(2, 3), f.dictionary, rows);
  BOOST_CHECK_EQUAL(MODE_DISK_SPILL, report.initial);
  BOOST_CHECK_EQUAL(MODE_DISK_SPILL, report.used);
  BOOST_CHECK_EQUAL(static_cast<std::size_t>(17 + 10), rows.size());
}

BOOST_AUTO_TEST_CASE(ForcedModesAgree) {
  std::vector<TokenizedRecord> records(ScenarioRecords());
  std::vector<NgramRecord> expected;
  std::vector<std::string> expected_vocab;
  const GenerationMode modes[] = {MODE_NORMAL, MODE_CHUNKED, MODE_DISK_SPILL};
  for (std::size_t m = 0; m < 3; ++m) {
    Fixture f;
    f.config.force_mode = true;
    f.config.forced_mode = modes[m];
    f.config.chunked.fixed_size = 2;
    f.config.spill.chunked.fixed_size = 3;
    Orchestrator orchestrator(f.config, f.monitor);
    VectorRecordSource source(records);
    std::vector<NgramRecord> rows;
    GenerationReport report = orchestrator.Generate(source, NgramRange(1, 4), f.dictionary, rows);
    BOOST_CHECK_EQUAL(modes[m], report.used);
    VocabColumn vocab(f.dictionary);
    std::vector<std::string> strings;
    vocab.Slice(0, vocab.Count(), strings);
    if (m == 0) {
      expected = rows;
      expected_vocab = strings;
    } else {
      BOOST_CHECK(rows == expected);
      BOOST_CHECK(strings == expected_vocab);
    }
  }
}

BOOST_AUTO_TEST_CASE(DowngradeOnOutOfMemory) {
  Fixture f;
  f.config.estimate_sample = 3;
  f.config.chunked.fixed_size = 3;
  Orchestrator orchestrator(f.config, f.monitor);
  std::vector<TokenizedRecord> records(ScenarioRecords());
  StarvedSource source(records, 3);
  std::vector<NgramRecord> rows;
  GenerationReport report = orchestrator.Generate(source, NgramRange(2, 2), f.dictionary, rows);
  BOOST_CHECK_EQUAL(MODE_NORMAL, report.initial);
  BOOST_CHECK_EQUAL(MODE_CHUNKED, report.used);
  BOOST_CHECK_EQUAL(1U, report.downgrades);
  BOOST_CHECK_EQUAL(static_cast<std::size_t>(17), rows.size());
}

BOOST_AUTO_TEST_CASE(DowngradeToDisk) {
  Fixture f;
  f.config.estimate_sample = 2;
  f.config.chunked.fixed_size = 8;
  f.config.spill.chunked.fixed_size = 2;
  f.config.spill.chunked.retry_floor = 1;
  Orchestrator orchestrator(f.config, f.monitor);
  std::vector<TokenizedRecord> records(ScenarioRecords());
  StarvedSource source(records, 2);
  std::vector<NgramRecord> rows;
  GenerationReport report = orchestrator.Generate(source, NgramRange(2, 2), f.dictionary, rows);
  BOOST_CHECK_EQUAL(MODE_DISK_SPILL, report.used);
  BOOST_CHECK_EQUAL(2U, report.downgrades);
  BOOST_CHECK_EQUAL(static_cast<std::size_t>(17), rows.size());
}

BOOST_AUTO_TEST_CASE(EverythingFails) {
  Fixture f;
  f.config.estimate_sample = 0;
  Orchestrator orchestrator(f.config, f.monitor);
  std::vector<TokenizedRecord> records(ScenarioRecords());
  StarvedSource source(records, 0);
  std::vector<NgramRecord> rows;
  BOOST_CHECK_THROW(orchestrator.Generate(source, NgramRange(2, 2), f.dictionary, rows), ResourceException);
  BOOST_CHECK(rows.empty());
}

BOOST_AUTO_TEST_CASE(CannotRestart) {
  Fixture f;
  f.config.estimate_sample = 3;
  Orchestrator orchestrator(f.config, f.monitor);
  std::vector<TokenizedRecord> records(ScenarioRecords());
  StarvedSource source(records, 3, false);
  std::vector<NgramRecord> rows;
  BOOST_CHECK_THROW(orchestrator.Generate(source, NgramRange(2, 2), f.dictionary, rows), ResourceException);
}

BOOST_AUTO_TEST_CASE(UniqueBothWays) {
  const char *input[] = {"b", "a", "a", "c", "a", "b"};
  std::vector<std::string> values(input, input + 6);
  const char *expect[] = {"a", "b", "c"};
  const DedupMode modes[] = {DEDUP_IN_MEMORY, DEDUP_EXTERNAL_SORT};
  for (std::size_t m = 0; m < 2; ++m) {
    Fixture f;
    f.config.force_dedup = true;
    f.config.forced_dedup = modes[m];
    f.config.sort.fixed_partition = 3;
    Orchestrator orchestrator(f.config, f.monitor);
    VectorStringColumn column(values);
    std::vector<std::string> out;
    VectorSink sink(out);
    BOOST_CHECK_EQUAL(modes[m], orchestrator.ExtractUnique(column, sink));
    BOOST_CHECK_EQUAL_COLLECTIONS(expect, expect + 3, out.begin(), out.end());
  }
}

// The first read of the whole column cannot be allocated.
class OnceStarvedColumn : public StringColumn {
  public:
    explicit OnceStarvedColumn(const std::vector<std::string> &values) : backing_(values), starved_(false) {}

    uint64_t Count() { return backing_.Count(); }

    std::size_t Slice(uint64_t offset, std::size_t length, std::vector<std::string> &out) {
      if (!starved_) {
        starved_ = true;
        UTIL_THROW_ARG(util::MallocException, (length), "while loading the column");
      }
      return backing_.Slice(offset, length, out);
    }

  private:
    VectorStringColumn backing_;
    bool starved_;
};

BOOST_AUTO_TEST_CASE(UniqueFallsBackOnMallocFailure) {
  Fixture f;
  Orchestrator orchestrator(f.config, f.monitor);
  const char *input[] = {"b", "a", "b"};
  std::vector<std::string> values(input, input + 3);
  OnceStarvedColumn column(values);
  std::vector<std::string> out;
  VectorSink sink(out);
  BOOST_CHECK_EQUAL(DEDUP_EXTERNAL_SORT, orchestrator.ExtractUnique(column, sink));
  BOOST_REQUIRE_EQUAL(static_cast<std::size_t>(2), out.size());
  BOOST_CHECK_EQUAL("a", out[0]);
  BOOST_CHECK_EQUAL("b", out[1]);
}

BOOST_AUTO_TEST_CASE(UniqueUnderPressure) {
  Fixture f;
  f.probe.resident = 950;
  Orchestrator orchestrator(f.config, f.monitor);
  std::vector<std::string> values(3, "x");
  VectorStringColumn column(values);
  std::vector<std::string> out;
  VectorSink sink(out);
  BOOST_CHECK_EQUAL(DEDUP_EXTERNAL_SORT, orchestrator.ExtractUnique(column, sink));
  BOOST_REQUIRE_EQUAL(static_cast<std::size_t>(1), out.size());
  BOOST_CHECK_EQUAL("x", out[0]);
}

}}} // namespaces
