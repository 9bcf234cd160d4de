#include "ngram/builder/message.hh"

#include "ngram/exception.hh"

namespace ngram { namespace builder {

RecordFormat ParseRecordFormat(const std::string &name) {
  if (name == "text") return FORMAT_TEXT;
  if (name == "message") return FORMAT_MESSAGE;
  UTIL_THROW(ConfigException, "Unknown record format " << name << "; use text or message.");
}

const char *RecordsHeader(RecordFormat format) {
  return format == FORMAT_MESSAGE ? "record_id\tuser_id\tmessage_id\ttimestamp\ttext" : "record_id\ttext";
}

void SplitRecord(const std::string &line, RecordFormat format, MessageFields &out) {
  std::size_t length = line.size();
  if (length && line[length - 1] == '\r') --length;
  if (format == FORMAT_TEXT) {
    out.author.clear();
    out.message_id.clear();
    out.timestamp.clear();
    out.text.assign(line, 0, length);
    return;
  }
  std::string *fields[] = {&out.author, &out.message_id, &out.timestamp};
  std::size_t begin = 0;
  for (std::size_t i = 0; i < 3; ++i) {
    std::size_t tab = line.find('\t', begin);
    UTIL_THROW_IF(tab == std::string::npos || tab >= length, FormatException, "Message line has " << i << " tabs but needs three before the text: " << line.substr(0, length));
    fields[i]->assign(line, begin, tab - begin);
    begin = tab + 1;
  }
  out.text.assign(line, begin, length - begin);
}

AuthorIndex::AuthorIndex(const std::string &names_path, std::size_t estimate)
  : names_(names_path, estimate) {}

void AuthorIndex::Add(RecordId record, const std::string &author) {
  if (record <= by_record_.size()) return;
  UTIL_THROW_IF(record != by_record_.size() + 1, FormatException, "Author of record " << record << " arrived before record " << (by_record_.size() + 1));
  by_record_.push_back(names_.Lookup(author));
}

AuthorId AuthorIndex::Of(RecordId record) const {
  UTIL_THROW_IF(!record || record > by_record_.size(), FormatException, "No author for record " << record << "; " << by_record_.size() << " are known.");
  return by_record_[record - 1];
}

}} // namespaces
