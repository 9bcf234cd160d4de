#ifndef NGRAM_BUILDER_MESSAGE_H
#define NGRAM_BUILDER_MESSAGE_H

#include "ngram/builder/dictionary.hh"
#include "ngram/ngram_index.hh"

#include <cstddef>
#include <string>
#include <vector>

#include <stdint.h>

namespace ngram { namespace builder {

enum RecordFormat {
  // The whole line is the text.
  FORMAT_TEXT,
  // author, message id, timestamp and text separated by tabs.  The text is
  // everything after the third tab.
  FORMAT_MESSAGE
};

// "text" or "message".  Throws ConfigException for anything else.
RecordFormat ParseRecordFormat(const std::string &name);

// Header line of the records table in each format.
const char *RecordsHeader(RecordFormat format);

// One input line.  FORMAT_TEXT leaves everything but text empty.
struct MessageFields {
  std::string author;
  std::string message_id;
  std::string timestamp;
  std::string text;
};

// Drops a trailing carriage return.  Throws FormatException if a
// FORMAT_MESSAGE line has fewer than three tabs.
void SplitRecord(const std::string &line, RecordFormat format, MessageFields &out);

typedef uint32_t AuthorId;

/* Author of each record as a dense id.  Names go through an NgramDictionary,
 * so memory holds their hashes and one id per record.
 */
class AuthorIndex {
  public:
    // Creates or truncates names_path for the interned names.
    explicit AuthorIndex(const std::string &names_path, std::size_t estimate = 4096);

    // Records arrive in order starting at 1.  Records already seen are
    // ignored, so a reread after a restart is harmless.
    void Add(RecordId record, const std::string &author);

    // Throws FormatException for a record that was never added.
    AuthorId Of(RecordId record) const;

    uint64_t Records() const { return by_record_.size(); }

    AuthorId Distinct() const { return names_.Size(); }

  private:
    NgramDictionary names_;
    std::vector<AuthorId> by_record_;

    AuthorIndex(const AuthorIndex &);
    AuthorIndex &operator=(const AuthorIndex &);
};

}} // namespaces

#endif // NGRAM_BUILDER_MESSAGE_H
