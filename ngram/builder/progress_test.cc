#include "ngram/builder/progress.hh"

#define BOOST_TEST_MODULE ProgressTest
#include <boost/test/unit_test.hpp>

#include <sstream>
#include <string>

namespace ngram { namespace builder { namespace {

const std::string kRuler("----5---10---15---20---25---30---35---40---45---50---55---60---65---70---75---80---85---90---95--100\n");

BOOST_AUTO_TEST_CASE(Bar) {
  std::ostringstream out;
  ConsoleProgress console(out);
  SafeProgress progress(&console);
  progress.AddSubstep("generate", "chunked", "Windows", 4);
  progress.StartSubstep("generate", "chunked");
  progress.UpdateSubstep("generate", "chunked", 2);
  BOOST_CHECK_EQUAL("Windows\n" + kRuler + std::string(50, '*'), out.str());
  progress.CompleteSubstep("generate", "chunked");
  BOOST_CHECK_EQUAL("Windows\n" + kRuler + std::string(100, '*') + "\n", out.str());
  // Updates after completion are ignored.
  progress.UpdateSubstep("generate", "chunked", 3);
  BOOST_CHECK_EQUAL("Windows\n" + kRuler + std::string(100, '*') + "\n", out.str());
}

BOOST_AUTO_TEST_CASE(UnknownTotal) {
  std::ostringstream out;
  ConsoleProgress console(out);
  console.AddSubstep("extract", "merge", "Merging", 0);
  console.StartSubstep("extract", "merge");
  console.UpdateSubstep("extract", "merge", 10);
  console.CompleteSubstep("extract", "merge");
  BOOST_CHECK_EQUAL("Merging\n", out.str());
}

BOOST_AUTO_TEST_CASE(Failure) {
  std::ostringstream out;
  ConsoleProgress console(out);
  console.AddSubstep("generate", "disk_spill", "Spilling", 10);
  console.StartSubstep("generate", "disk_spill");
  console.UpdateSubstep("generate", "disk_spill", 1);
  console.FailSubstep("generate", "disk_spill", "out of memory");
  BOOST_CHECK_EQUAL("Spilling\n" + kRuler + std::string(10, '*') + "\nSpilling failed: out of memory\n", out.str());
  // Steps never added are ignored.
  console.StartSubstep("generate", "unknown");
  console.FailSubstep("generate", "unknown", "whatever");
}

BOOST_AUTO_TEST_CASE(OpenBarsFilledOnDestruction) {
  std::ostringstream out;
  {
    ConsoleProgress console(out);
    console.AddSubstep("extract", "partition", "Sorting", 4);
    console.StartSubstep("extract", "partition");
    console.UpdateSubstep("extract", "partition", 1);
    BOOST_CHECK_EQUAL("Sorting\n" + kRuler + std::string(25, '*'), out.str());
    // Starting again replaces the bar, filling the old one.
    console.StartSubstep("extract", "partition");
    BOOST_CHECK_EQUAL("Sorting\n" + kRuler + std::string(100, '*') + "\nSorting\n" + kRuler, out.str());
    console.UpdateSubstep("extract", "partition", 2);
  }
  BOOST_CHECK_EQUAL("Sorting\n" + kRuler + std::string(100, '*') + "\nSorting\n" + kRuler + std::string(100, '*') + "\n", out.str());
}

BOOST_AUTO_TEST_CASE(NoReporter) {
  SafeProgress progress;
  progress.AddSubstep("a", "b", "c", 1);
  progress.StartSubstep("a", "b");
  progress.UpdateSubstep("a", "b", 1);
  progress.FailSubstep("a", "b", "d");
}

}}} // namespaces
