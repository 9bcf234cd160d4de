#ifndef NGRAM_BUILDER_FAIL_ONCE_TOKENIZER_H
#define NGRAM_BUILDER_FAIL_ONCE_TOKENIZER_H

#include "ngram/builder/tokenizer.hh"

#include <new>
#include <string>
#include <vector>

namespace ngram { namespace builder {

// Runs out of memory partway through the first text equal to victim, then
// behaves like WhitespaceTokenizer.  Tests only.
class FailOnceTokenizer : public Tokenizer {
  public:
    explicit FailOnceTokenizer(const std::string &victim) : victim_(victim), failed_(false) {}

    void Tokenize(const std::string &text, std::vector<std::string> &out) const {
      if (!failed_ && text == victim_) {
        failed_ = true;
        out.clear();
        out.push_back("partial");
        throw std::bad_alloc();
      }
      base_.Tokenize(text, out);
    }

    bool Failed() const { return failed_; }

  private:
    WhitespaceTokenizer base_;
    std::string victim_;
    mutable bool failed_;
};

}} // namespaces

#endif // NGRAM_BUILDER_FAIL_ONCE_TOKENIZER_H
