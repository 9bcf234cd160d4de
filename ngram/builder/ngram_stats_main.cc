#include "ngram/builder/pipeline.hh"
#include "ngram/builder/progress.hh"
#include "ngram/exception.hh"
#include "util/file.hh"
#include "util/usage.hh"

#include <iostream>

#include <boost/program_options.hpp>

namespace {

// Parses a memory size once program_options has the string.
class ParseSizeInto {
  public:
    explicit ParseSizeInto(uint64_t &to) : to_(to) {}

    void operator()(const std::string &arg) { to_ = util::ParseSize(arg); }

  private:
    uint64_t &to_;
};

class ParseFormatInto {
  public:
    explicit ParseFormatInto(ngram::builder::RecordFormat &to) : to_(to) {}

    void operator()(const std::string &arg) { to_ = ngram::builder::ParseRecordFormat(arg); }

  private:
    ngram::builder::RecordFormat &to_;
};

void Describe(std::ostream &out) {
  out <<
    "Finds word n-grams repeated across the records of a corpus, one record per\n"
    "line, without exceeding a memory budget.  When memory runs short the records\n"
    "are processed in windows, and after that by spilling tables under -T.\n\n"
    "Tables written, all tab separated with a header line:\n"
    "  <prefix>.message_ngrams  n-gram counts per record\n"
    "  <prefix>.ngrams          every distinct n-gram\n"
    "  <prefix>.ngram_stats     n-grams seen more than once\n"
    "  <prefix>.records         with --write_records\n"
    "  <prefix>.ngram_full      with --full_report, one row per record holding a\n"
    "                           repeated n-gram\n\n"
    "With --format message each line is author, message id, timestamp and text\n"
    "separated by tabs.  Otherwise the whole line is text and every record is its\n"
    "own author.\n\n"
    "A memory size is a number and an optional unit: b, K, M, G, T, P, E, Z or Y\n"
    "for powers of 1024, or % for a share of physical memory.  The unit defaults\n"
    "to K.\n";
  uint64_t physical = util::GuessPhysicalMemory();
  if (physical) {
    out << "Physical memory here is " << physical << " bytes.\n\n";
  } else {
    out << "Physical memory size is unknown here.\n\n";
  }
}

} // namespace

int main(int argc, char *argv[]) {
  try {
    namespace po = boost::program_options;
    ngram::builder::PipelineConfig pipeline;
    std::string temp_prefix;
    std::size_t chunk_size;

    po::options_description options("ngram_stats options");
    options.add_options()
      ("help,h", po::bool_switch(), "Print usage and exit")
      ("text", po::value<std::string>(&pipeline.text_path), "Corpus file.  Standard input when absent.  gzip, bzip2 and xz input is decompressed.")
      ("format", po::value<std::string>()->notifier(ParseFormatInto(pipeline.format))->default_value("text"), "Line format: text or message")
      ("min_n", po::value<unsigned int>(&pipeline.range.min_n)->default_value(3), "Fewest tokens per n-gram")
      ("max_n", po::value<unsigned int>(&pipeline.range.max_n)->default_value(5), "Most tokens per n-gram")
      ("out_prefix,o", po::value<std::string>(&pipeline.out_prefix)->required(), "Where the tables go")
      ("memory,S", po::value<std::string>()->notifier(ParseSizeInto(pipeline.monitor.budget))->default_value("0"), "Memory budget.  0 takes a share of physical memory.")
      ("temp_prefix,T", po::value<std::string>(&temp_prefix)->default_value("/tmp/ngram"), "Directory or prefix for spilled tables")
      ("chunk_size", po::value<std::size_t>(&chunk_size)->default_value(0), "Fixed records per window.  0 sizes windows from memory pressure.")
      ("write_records", po::bool_switch(&pipeline.write_records), "Write <prefix>.records")
      ("full_report", po::bool_switch(&pipeline.full_report), "Write <prefix>.ngram_full")
      ("progress", po::bool_switch(), "Show progress bars on stderr");
    po::variables_map vm;
    po::store(po::parse_command_line(argc, argv, options), vm);

    if (argc == 1 || vm["help"].as<bool>()) {
      Describe(std::cerr);
      std::cerr << options << std::endl;
      return 1;
    }
    po::notify(vm);

    util::NormalizeTempPrefix(temp_prefix);
    pipeline.SetTempPrefix(temp_prefix);
    pipeline.orchestrator.chunked.fixed_size = chunk_size;
    pipeline.orchestrator.spill.chunked.fixed_size = chunk_size;

    ngram::builder::ProcessMemoryProbe probe;
    ngram::builder::ConsoleProgress console(std::cerr);
    try {
      ngram::builder::Pipeline(pipeline, probe, vm["progress"].as<bool>() ? &console : NULL);
    } catch (const ngram::ResourceException &e) {
      std::cerr << e.what() << '\n'
        << "Raise -S above " << vm["memory"].as<std::string>() << " or free disk space under " << temp_prefix << std::endl;
      return 1;
    }
    util::PrintUsage(std::cerr);
  } catch (const std::exception &e) {
    std::cerr << e.what() << std::endl;
    return 1;
  }
}
