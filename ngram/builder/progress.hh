#ifndef NGRAM_BUILDER_PROGRESS_H
#define NGRAM_BUILDER_PROGRESS_H

#include "util/ersatz_progress.hh"

#include <boost/ptr_container/ptr_map.hpp>

#include <exception>
#include <iosfwd>
#include <map>
#include <string>

#include <stdint.h>

namespace ngram { namespace builder {

/* Optional observer of sub-steps such as "chunk 3 of 7".  Substeps are named
 * by (parent, id).  A total of 0 means unknown.
 */
class ProgressReporter {
  public:
    virtual ~ProgressReporter() {}

    virtual void AddSubstep(const std::string &parent, const std::string &id, const std::string &label, uint64_t total) = 0;
    virtual void StartSubstep(const std::string &parent, const std::string &id) = 0;
    virtual void UpdateSubstep(const std::string &parent, const std::string &id, uint64_t current) = 0;
    virtual void CompleteSubstep(const std::string &parent, const std::string &id) = 0;
    virtual void FailSubstep(const std::string &parent, const std::string &id, const std::string &message) = 0;
};

/* What the engine actually calls.  Forwards to the reporter, if any, and logs
 * and swallows whatever it throws.
 */
class SafeProgress {
  public:
    // NULL means do nothing.
    explicit SafeProgress(ProgressReporter *to = NULL) : to_(to) {}

    void AddSubstep(const std::string &parent, const std::string &id, const std::string &label, uint64_t total);
    void StartSubstep(const std::string &parent, const std::string &id);
    void UpdateSubstep(const std::string &parent, const std::string &id, uint64_t current);
    void CompleteSubstep(const std::string &parent, const std::string &id);
    void FailSubstep(const std::string &parent, const std::string &id, const std::string &message);

  private:
    void Failed(const char *call, const std::exception &e);

    ProgressReporter *to_;
};

// Draws one ErsatzProgress bar per started substep.  Bars still open when
// this is destroyed are filled.
class ConsoleProgress : public ProgressReporter {
  public:
    explicit ConsoleProgress(std::ostream &out) : out_(out) {}

    void AddSubstep(const std::string &parent, const std::string &id, const std::string &label, uint64_t total);
    void StartSubstep(const std::string &parent, const std::string &id);
    void UpdateSubstep(const std::string &parent, const std::string &id, uint64_t current);
    void CompleteSubstep(const std::string &parent, const std::string &id);
    void FailSubstep(const std::string &parent, const std::string &id, const std::string &message);

  private:
    struct Substep {
      std::string label;
      uint64_t total;
    };

    typedef boost::ptr_map<std::string, util::ErsatzProgress> Bars;

    std::ostream &out_;
    std::map<std::string, Substep> steps_;
    Bars bars_;

    ConsoleProgress(const ConsoleProgress &);
    ConsoleProgress &operator=(const ConsoleProgress &);
};

}} // namespaces

#endif // NGRAM_BUILDER_PROGRESS_H
