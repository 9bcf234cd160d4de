#include "ngram/builder/pipeline.hh"

#include "ngram/builder/scripted_probe.hh"
#include "ngram/exception.hh"
#include "util/file.hh"
#include "util/temp_dir.hh"

#define BOOST_TEST_MODULE PipelineTest
#include <boost/test/unit_test.hpp>

#include <cstring>
#include <string>

#include <unistd.h>

namespace ngram { namespace builder { namespace {

std::string ReadText(const std::string &path) {
  util::scoped_fd file(util::OpenReadOrThrow(path.c_str()));
  std::string ret(util::SizeOrThrow(file.get()), 0);
  if (!ret.empty()) util::ReadOrThrow(file.get(), &ret[0], ret.size());
  return ret;
}

bool Exists(const std::string &path) {
  return access(path.c_str(), F_OK) == 0;
}

const char kCorpus[] = "the cat sat\nthe cat sat down\nthe dog\n";

const char kOccurrences[] =
  "record_id\tngram_id\tcount\n"
  "1\t0\t1\n"
  "1\t1\t1\n"
  "1\t2\t1\n"
  "2\t0\t1\n"
  "2\t1\t1\n"
  "2\t2\t1\n"
  "2\t3\t1\n"
  "2\t4\t1\n"
  "3\t5\t1\n";

const char kDefinitions[] =
  "ngram_id\twords\tn\n"
  "2\tcat sat\t2\n"
  "3\tcat sat down\t3\n"
  "4\tsat down\t2\n"
  "0\tthe cat\t2\n"
  "1\tthe cat sat\t3\n"
  "5\tthe dog\t2\n";

const char kStats[] =
  "ngram_id\tn\twords\ttotal_reps\tdistinct_records\tdistinct_posters\n"
  "1\t3\tthe cat sat\t2\t2\t2\n"
  "0\t2\tthe cat\t2\t2\t2\n"
  "2\t2\tcat sat\t2\t2\t2\n";

const char kTextFull[] =
  "ngram_id\tn\twords\ttotal_reps\tdistinct_posters\tuser_id\treps_per_user\trecord_id\tmessage_id\ttext\ttimestamp\n"
  "1\t3\tthe cat sat\t2\t2\t1\t1\t1\t\tthe cat sat\t\n"
  "1\t3\tthe cat sat\t2\t2\t2\t1\t2\t\tthe cat sat down\t\n"
  "0\t2\tthe cat\t2\t2\t1\t1\t1\t\tthe cat sat\t\n"
  "0\t2\tthe cat\t2\t2\t2\t1\t2\t\tthe cat sat down\t\n"
  "2\t2\tcat sat\t2\t2\t1\t1\t1\t\tthe cat sat\t\n"
  "2\t2\tcat sat\t2\t2\t2\t1\t2\t\tthe cat sat down\t\n";

// The same texts, but ann wrote the first two.
const char kMessageCorpus[] =
  "ann\tm1\t2020\tthe cat sat\n"
  "ann\tm2\t2021\tthe cat sat down\n"
  "bob\tm3\t2022\tthe dog\n";

const char kMessageStats[] =
  "ngram_id\tn\twords\ttotal_reps\tdistinct_records\tdistinct_posters\n"
  "1\t3\tthe cat sat\t2\t2\t1\n"
  "0\t2\tthe cat\t2\t2\t1\n"
  "2\t2\tcat sat\t2\t2\t1\n";

const char kMessageFull[] =
  "ngram_id\tn\twords\ttotal_reps\tdistinct_posters\tuser_id\treps_per_user\trecord_id\tmessage_id\ttext\ttimestamp\n"
  "1\t3\tthe cat sat\t2\t1\tann\t2\t1\tm1\tthe cat sat\t2020\n"
  "1\t3\tthe cat sat\t2\t1\tann\t2\t2\tm2\tthe cat sat down\t2021\n"
  "0\t2\tthe cat\t2\t1\tann\t2\t1\tm1\tthe cat sat\t2020\n"
  "0\t2\tthe cat\t2\t1\tann\t2\t2\tm2\tthe cat sat down\t2021\n"
  "2\t2\tcat sat\t2\t1\tann\t2\t1\tm1\tthe cat sat\t2020\n"
  "2\t2\tcat sat\t2\t1\tann\t2\t2\tm2\tthe cat sat down\t2021\n";

struct Fixture {
  explicit Fixture(const char *text = kCorpus) : dir("pipeline_test") {
    corpus = dir.NewFile("corpus");
    util::scoped_fd file(util::CreateOrThrow(corpus.c_str()));
    util::WriteOrThrow(file.get(), text, std::strlen(text));

    config.text_path = corpus;
    config.range = NgramRange(2, 3);
    config.out_prefix = dir.Path() + "/out";
    config.SetTempPrefix(dir.Path() + "/");
    config.monitor.budget = 1ULL << 30;
    config.dictionary_estimate = 4;
  }

  // The outputs are not tracked by dir.
  void RemoveOutputs() {
    const char *suffixes[] = {".message_ngrams", ".ngrams", ".ngram_stats", ".records", ".ngram_full"};
    for (std::size_t i = 0; i < 5; ++i) {
      if (Exists(config.out_prefix + suffixes[i])) util::RemoveFile(config.out_prefix + suffixes[i]);
    }
  }

  ~Fixture() { RemoveOutputs(); }

  util::TempDirectory dir;
  std::string corpus;
  PipelineConfig config;
  ScriptedProbe probe;
};

BOOST_AUTO_TEST_CASE(Outputs) {
  Fixture f;
  f.config.write_records = true;
  f.config.full_report = true;
  PipelineReport report = Pipeline(f.config, f.probe);
  BOOST_CHECK_EQUAL(MODE_NORMAL, report.generation.used);
  BOOST_CHECK_EQUAL(DEDUP_IN_MEMORY, report.dedup);
  BOOST_CHECK_EQUAL(static_cast<uint64_t>(9), report.generation.rows);
  BOOST_CHECK_EQUAL(static_cast<uint64_t>(6), report.distinct_ngrams);
  BOOST_CHECK_EQUAL(static_cast<uint64_t>(3), report.repeated_ngrams);

  BOOST_CHECK_EQUAL(kOccurrences, ReadText(f.config.out_prefix + ".message_ngrams"));
  BOOST_CHECK_EQUAL(kDefinitions, ReadText(f.config.out_prefix + ".ngrams"));
  BOOST_CHECK_EQUAL(kStats, ReadText(f.config.out_prefix + ".ngram_stats"));
  BOOST_CHECK_EQUAL("record_id\ttext\n1\tthe cat sat\n2\tthe cat sat down\n3\tthe dog\n", ReadText(f.config.out_prefix + ".records"));
  BOOST_CHECK_EQUAL(kTextFull, ReadText(f.config.out_prefix + ".ngram_full"));
  BOOST_CHECK_EQUAL(static_cast<uint64_t>(6), report.full_rows);
}

BOOST_AUTO_TEST_CASE(Messages) {
  Fixture f(kMessageCorpus);
  f.config.format = FORMAT_MESSAGE;
  f.config.full_report = true;
  PipelineReport report = Pipeline(f.config, f.probe);
  BOOST_CHECK_EQUAL(static_cast<uint64_t>(3), report.repeated_ngrams);
  BOOST_CHECK_EQUAL(kOccurrences, ReadText(f.config.out_prefix + ".message_ngrams"));
  BOOST_CHECK_EQUAL(kMessageStats, ReadText(f.config.out_prefix + ".ngram_stats"));
  BOOST_CHECK_EQUAL(kMessageFull, ReadText(f.config.out_prefix + ".ngram_full"));
  // The records table for the join stayed in the working directory.
  BOOST_CHECK(!Exists(f.config.out_prefix + ".records"));
}

BOOST_AUTO_TEST_CASE(MessageWithoutFields) {
  Fixture f;
  f.config.format = FORMAT_MESSAGE;
  BOOST_CHECK_THROW(Pipeline(f.config, f.probe), FormatException);
}

BOOST_AUTO_TEST_CASE(DiskAndExternalSortAgree) {
  Fixture f;
  f.config.orchestrator.force_mode = true;
  f.config.orchestrator.forced_mode = MODE_DISK_SPILL;
  f.config.orchestrator.spill.chunked.fixed_size = 1;
  f.config.orchestrator.force_dedup = true;
  f.config.orchestrator.forced_dedup = DEDUP_EXTERNAL_SORT;
  f.config.orchestrator.sort.fixed_partition = 2;
  f.config.full_report = true;
  PipelineReport report = Pipeline(f.config, f.probe);
  BOOST_CHECK_EQUAL(MODE_DISK_SPILL, report.generation.used);
  BOOST_CHECK_EQUAL(DEDUP_EXTERNAL_SORT, report.dedup);

  BOOST_CHECK_EQUAL(kOccurrences, ReadText(f.config.out_prefix + ".message_ngrams"));
  BOOST_CHECK_EQUAL(kDefinitions, ReadText(f.config.out_prefix + ".ngrams"));
  BOOST_CHECK_EQUAL(kStats, ReadText(f.config.out_prefix + ".ngram_stats"));
  BOOST_CHECK_EQUAL(kTextFull, ReadText(f.config.out_prefix + ".ngram_full"));
  BOOST_CHECK(!Exists(f.config.out_prefix + ".records"));
}

BOOST_AUTO_TEST_CASE(BadConfig) {
  Fixture f;
  f.config.out_prefix.clear();
  BOOST_CHECK_THROW(Pipeline(f.config, f.probe), ConfigException);
  f.config.out_prefix = f.dir.Path() + "/out";
  f.config.range = NgramRange(0, 2);
  BOOST_CHECK_THROW(Pipeline(f.config, f.probe), ConfigException);
}

BOOST_AUTO_TEST_CASE(MissingInput) {
  Fixture f;
  f.config.text_path = f.dir.Path() + "/does_not_exist";
  BOOST_CHECK_THROW(Pipeline(f.config, f.probe), util::ErrnoException);
}

}}} // namespaces
