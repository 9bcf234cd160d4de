#include "ngram/builder/tokenizer.hh"

namespace ngram { namespace builder {

namespace {
inline bool IsDelimiter(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\0';
}
} // namespace

void WhitespaceTokenizer::Tokenize(const std::string &text, std::vector<std::string> &out) const {
  out.clear();
  std::string::const_iterator i = text.begin();
  while (true) {
    for (; i != text.end() && IsDelimiter(*i); ++i) {}
    if (i == text.end()) return;
    std::string::const_iterator start = i;
    for (; i != text.end() && !IsDelimiter(*i); ++i) {}
    out.push_back(std::string(start, i));
  }
}

}} // namespaces
