#include "ngram/builder/progress.hh"

#include <exception>
#include <iostream>
#include <ostream>

namespace ngram { namespace builder {

void SafeProgress::Failed(const char *call, const std::exception &e) {
  std::cerr << "Warning: progress reporter failed in " << call << ": " << e.what() << std::endl;
}

void SafeProgress::AddSubstep(const std::string &parent, const std::string &id, const std::string &label, uint64_t total) {
  if (!to_) return;
  try {
    to_->AddSubstep(parent, id, label, total);
  } catch (const std::exception &e) {
    Failed("AddSubstep", e);
  }
}

void SafeProgress::StartSubstep(const std::string &parent, const std::string &id) {
  if (!to_) return;
  try {
    to_->StartSubstep(parent, id);
  } catch (const std::exception &e) {
    Failed("StartSubstep", e);
  }
}

void SafeProgress::UpdateSubstep(const std::string &parent, const std::string &id, uint64_t current) {
  if (!to_) return;
  try {
    to_->UpdateSubstep(parent, id, current);
  } catch (const std::exception &e) {
    Failed("UpdateSubstep", e);
  }
}

void SafeProgress::CompleteSubstep(const std::string &parent, const std::string &id) {
  if (!to_) return;
  try {
    to_->CompleteSubstep(parent, id);
  } catch (const std::exception &e) {
    Failed("CompleteSubstep", e);
  }
}

void SafeProgress::FailSubstep(const std::string &parent, const std::string &id, const std::string &message) {
  if (!to_) return;
  try {
    to_->FailSubstep(parent, id, message);
  } catch (const std::exception &e) {
    Failed("FailSubstep", e);
  }
}

namespace {
std::string Key(const std::string &parent, const std::string &id) {
  return parent + '/' + id;
}
} // namespace

void ConsoleProgress::AddSubstep(const std::string &parent, const std::string &id, const std::string &label, uint64_t total) {
  std::string key(Key(parent, id));
  bars_.erase(key);
  Substep &step = steps_[key];
  step.label = label;
  step.total = total;
}

void ConsoleProgress::StartSubstep(const std::string &parent, const std::string &id) {
  std::string key(Key(parent, id));
  std::map<std::string, Substep>::const_iterator step = steps_.find(key);
  if (step == steps_.end()) return;
  bars_.erase(key);
  bars_.insert(key, new util::ErsatzProgress(&out_, step->second.label, step->second.total));
}

void ConsoleProgress::UpdateSubstep(const std::string &parent, const std::string &id, uint64_t current) {
  Bars::iterator bar = bars_.find(Key(parent, id));
  if (bar != bars_.end()) bar->second->Set(current);
}

void ConsoleProgress::CompleteSubstep(const std::string &parent, const std::string &id) {
  Bars::iterator bar = bars_.find(Key(parent, id));
  if (bar == bars_.end()) return;
  bar->second->Finished();
  bars_.erase(bar);
}

void ConsoleProgress::FailSubstep(const std::string &parent, const std::string &id, const std::string &message) {
  std::string key(Key(parent, id));
  Bars::iterator bar = bars_.find(key);
  if (bar == bars_.end()) return;
  bar->second->Abandon(steps_[key].label + " failed: " + message);
  bars_.erase(bar);
}

}} // namespaces
