#ifndef UTIL_ERSATZ_PROGRESS_H
#define UTIL_ERSATZ_PROGRESS_H

#include <iosfwd>
#include <string>

#include <stdint.h>

namespace util {

/* A row of 100 stars under a ruler, filled as work completes.  With a total
 * of 0 only the message is printed.  Once full or abandoned, nothing more is
 * written.
 */
class ErsatzProgress {
  public:
    // NULL draws nothing.
    ErsatzProgress(std::ostream *to, const std::string &message, uint64_t total);

    // Fills whatever is left.
    ~ErsatzProgress();

    void Set(uint64_t current);

    void Finished() { Set(total_); }

    // Stop drawing without filling the bar.
    void Abandon(const std::string &why);

  private:
    std::ostream *out_;
    uint64_t total_;
    unsigned int drawn_;

    // noncopyable
    ErsatzProgress(const ErsatzProgress &other);
    ErsatzProgress &operator=(const ErsatzProgress &other);
};

} // namespace util

#endif // UTIL_ERSATZ_PROGRESS_H
