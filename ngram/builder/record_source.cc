#include "ngram/builder/record_source.hh"

#include "util/exception.hh"
#include "util/file.hh"

#include <algorithm>

namespace ngram { namespace builder {

std::size_t VectorRecordSource::Slice(uint64_t offset, std::size_t length, std::vector<TokenizedRecord> &out) {
  if (offset >= records_.size()) return 0;
  std::size_t take = static_cast<std::size_t>(std::min<uint64_t>(length, records_.size() - offset));
  out.insert(out.end(), records_.begin() + offset, records_.begin() + offset + take);
  return take;
}

TextRecordSource::TextRecordSource(const std::string &path, const Tokenizer &tokenizer, std::FILE *echo, RecordFormat format, AuthorIndex *authors)
  : path_(path == "-" ? std::string() : path), tokenizer_(tokenizer), echo_(echo), format_(format), authors_(authors),
    at_end_(false), read_(0), pending_(false), buffer_start_(0), observed_(0), count_(kUnknownCount) {
  if (path_.empty()) {
    reader_.reset(new util::LineReader(util::DupOrThrow(0)));
  } else {
    Reopen();
  }
}

uint64_t TextRecordSource::Count() {
  if (path_.empty() || count_ != kUnknownCount) return count_;
  util::LineReader counter(path_.c_str());
  std::string line;
  while (counter.ReadLine(line)) {}
  count_ = counter.LinesRead();
  return count_;
}

void TextRecordSource::Reopen() {
  Rewind(0);
  buffer_.clear();
  buffer_start_ = 0;
}

void TextRecordSource::Rewind(uint64_t index) {
  reader_.reset();
  reader_.reset(new util::LineReader(path_.c_str()));
  at_end_ = false;
  pending_ = false;
  for (read_ = 0; read_ < index; ++read_) {
    if (!reader_->ReadLine(line_)) {
      at_end_ = true;
      break;
    }
  }
}

void TextRecordSource::Observe(RecordId id) {
  if (authors_) authors_->Add(id, fields_.author);
  if (echo_) Echo(id);
  observed_ = id;
}

namespace {
// Tabs inside a field would shift the columns of the records table.
void WriteField(std::FILE *to, std::string &field) {
  std::replace(field.begin(), field.end(), '\t', ' ');
  util::WriteOrThrow(to, field.data(), field.size());
}
} // namespace

void TextRecordSource::Echo(RecordId id) {
  UTIL_THROW_IF(std::fprintf(echo_, "%llu\t", static_cast<unsigned long long>(id)) < 0, util::ErrnoException, "while writing records");
  if (format_ == FORMAT_MESSAGE) {
    util::WriteOrThrow(echo_, fields_.author.data(), fields_.author.size());
    util::WriteOrThrow(echo_, "\t", 1);
    util::WriteOrThrow(echo_, fields_.message_id.data(), fields_.message_id.size());
    util::WriteOrThrow(echo_, "\t", 1);
    util::WriteOrThrow(echo_, fields_.timestamp.data(), fields_.timestamp.size());
    util::WriteOrThrow(echo_, "\t", 1);
  }
  WriteField(echo_, fields_.text);
  util::WriteOrThrow(echo_, "\n", 1);
}

bool TextRecordSource::ReadOne() {
  const uint64_t index = buffer_start_ + buffer_.size();
  if (!pending_) {
    // The buffer was trimmed behind the reader.
    if (read_ > index) Rewind(index);
    if (at_end_) return false;
    if (!reader_->ReadLine(line_)) {
      at_end_ = true;
      return false;
    }
    ++read_;
    pending_ = true;
  }
  TokenizedRecord record;
  record.id = index + 1;
  SplitRecord(line_, format_, fields_);
  tokenizer_.Tokenize(fields_.text, record.tokens);
  buffer_.push_back(TokenizedRecord());
  buffer_.back().id = record.id;
  buffer_.back().tokens.swap(record.tokens);
  pending_ = false;
  if (record.id > observed_) Observe(record.id);
  return true;
}

std::size_t TextRecordSource::Slice(uint64_t offset, std::size_t length, std::vector<TokenizedRecord> &out) {
  if (offset < buffer_start_) {
    UTIL_THROW_IF(!CanRestart(), util::Exception, "Cannot go back to record " << (offset + 1) << " of standard input; it has already been read.");
    Reopen();
  }
  while (buffer_start_ < offset) {
    if (buffer_.empty() && !ReadOne()) return 0;
    buffer_.pop_front();
    ++buffer_start_;
  }
  if (buffer_.size() > length && CanRestart()) {
    // A smaller window than last time.  Free the rest; it is read again later.
    buffer_.erase(buffer_.begin() + length, buffer_.end());
    pending_ = false;
  }
  while (buffer_.size() < length && ReadOne()) {}
  std::size_t take = std::min<std::size_t>(length, buffer_.size());
  out.insert(out.end(), buffer_.begin(), buffer_.begin() + take);
  return take;
}

}} // namespaces
