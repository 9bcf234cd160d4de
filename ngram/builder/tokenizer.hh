#ifndef NGRAM_BUILDER_TOKENIZER_H
#define NGRAM_BUILDER_TOKENIZER_H

#include <string>
#include <vector>

namespace ngram { namespace builder {

/* Text to ordered tokens.  Implementations must be deterministic and must not
 * produce empty tokens.
 */
class Tokenizer {
  public:
    virtual ~Tokenizer() {}

    // Replaces the contents of out.
    virtual void Tokenize(const std::string &text, std::vector<std::string> &out) const = 0;
};

// Splits on space, tab, carriage return, and NUL.
class WhitespaceTokenizer : public Tokenizer {
  public:
    void Tokenize(const std::string &text, std::vector<std::string> &out) const;
};

}} // namespaces

#endif // NGRAM_BUILDER_TOKENIZER_H
