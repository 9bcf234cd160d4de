#include "util/ersatz_progress.hh"

#include <ostream>

namespace util {

namespace {
const unsigned int kWidth = 100;
const char kRuler[] = "----5---10---15---20---25---30---35---40---45---50---55---60---65---70---75---80---85---90---95--100\n";
} // namespace

ErsatzProgress::ErsatzProgress(std::ostream *to, const std::string &message, uint64_t total)
  : out_(to), total_(total), drawn_(0) {
  if (!out_) return;
  *out_ << message << '\n';
  if (!total_) {
    out_->flush();
    out_ = NULL;
    return;
  }
  *out_ << kRuler;
}

ErsatzProgress::~ErsatzProgress() {
  if (out_) Finished();
}

void ErsatzProgress::Set(uint64_t current) {
  if (!out_) return;
  unsigned int stars = (current >= total_) ? kWidth : static_cast<unsigned int>(current * kWidth / total_);
  for (; drawn_ < stars; ++drawn_) *out_ << '*';
  if (drawn_ == kWidth) {
    *out_ << std::endl;
    out_ = NULL;
  }
}

void ErsatzProgress::Abandon(const std::string &why) {
  if (!out_) return;
  *out_ << '\n' << why << std::endl;
  out_ = NULL;
}

} // namespace util
