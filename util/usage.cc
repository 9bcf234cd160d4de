#include "util/usage.hh"

#include "util/exception.hh"

#include <cmath>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <ostream>
#include <string>

#include <ctype.h>
#include <errno.h>
#include <sys/resource.h>
#include <sys/time.h>
#include <time.h>
#include <unistd.h>

#ifdef __GLIBC__
#include <malloc.h>
#endif

namespace util {

namespace {

double Seconds(const struct timeval &tv) {
  return static_cast<double>(tv.tv_sec) + static_cast<double>(tv.tv_usec) * 1e-6;
}

double Now() {
  struct timespec now;
  clock_gettime(CLOCK_MONOTONIC, &now);
  return static_cast<double>(now.tv_sec) + static_cast<double>(now.tv_nsec) * 1e-9;
}

// Taken during static initialization, so close enough to process start.
const double kStarted = Now();

uint64_t PageSize() {
  long size = sysconf(_SC_PAGESIZE);
  return size > 0 ? static_cast<uint64_t>(size) : 0;
}

// /proc/self/statm holds page counts: total, resident, shared, ...
uint64_t StatmPages(unsigned int field) {
  std::ifstream statm("/proc/self/statm");
  uint64_t pages = 0;
  for (unsigned int i = 0; i <= field; ++i) {
    if (!(statm >> pages)) return 0;
  }
  return pages * PageSize();
}

bool Reported(const std::string &key) {
  return key == "Name" || key == "VmPeak" || key == "VmRSS";
}

} // namespace

double WallTime() {
  return Now() - kStarted;
}

void PrintUsage(std::ostream &out) {
  // getrusage leaves the current sizes at 0 on Linux, so they come from /proc.
  std::ifstream status("/proc/self/status");
  std::string line;
  while (std::getline(status, line)) {
    std::string::size_type colon = line.find(':');
    if (colon == std::string::npos || !Reported(line.substr(0, colon))) continue;
    std::string::size_type value = line.find_first_not_of(" \t", colon + 1);
    out << line.substr(0, colon + 1) << (value == std::string::npos ? "" : line.substr(value)) << '\t';
  }
  struct rusage usage;
  if (getrusage(RUSAGE_SELF, &usage)) {
    out << "getrusage failed: " << std::strerror(errno) << '\n';
    return;
  }
  double user = Seconds(usage.ru_utime), sys = Seconds(usage.ru_stime);
  out << "RSSMax:" << usage.ru_maxrss << " kB\tuser:" << user << "\tsys:" << sys
      << "\tCPU:" << (user + sys) << "\treal:" << WallTime() << '\n';
}

uint64_t GuessPhysicalMemory() {
#ifdef _SC_PHYS_PAGES
  long pages = sysconf(_SC_PHYS_PAGES);
  if (pages > 0) return static_cast<uint64_t>(pages) * PageSize();
#endif
  return 0;
}

uint64_t ResidentMemory() {
  return StatmPages(1);
}

uint64_t VirtualMemory() {
  return StatmPages(0);
}

bool ReleaseFreeMemory() {
#ifdef __GLIBC__
  return malloc_trim(0) != 0;
#else
  return false;
#endif
}

namespace {

class SizeParseError : public Exception {
  public:
    explicit SizeParseError(const std::string &arg) throw() {
      *this << "Cannot read \"" << arg << "\" as a memory size ";
    }
};

// Powers of 1024 in order.  A bare number is in kilobytes, as sort -S reads it.
const char kUnits[] = "bKMGTPEZY";

const char *SkipSpace(const char *at) {
  while (isspace(static_cast<unsigned char>(*at))) ++at;
  return at;
}

} // namespace

uint64_t ParseSize(const std::string &arg) {
  const char *number = SkipSpace(arg.c_str());
  UTIL_THROW_IF_ARG(*number == '-', SizeParseError, (arg), "because sizes cannot be negative.");
  bool fractional = arg.find('.') != std::string::npos;
  char *end;
  errno = 0;
  double real = 0.0;
  uint64_t whole = 0;
  if (fractional) {
    real = std::strtod(number, &end);
  } else {
    whole = std::strtoull(number, &end, 10);
  }
  UTIL_THROW_IF_ARG(end == number || errno == ERANGE, SizeParseError, (arg), "because it does not start with a number.");

  const char *rest = SkipSpace(end);
  char unit = *rest ? *rest++ : 'K';
  rest = SkipSpace(rest);
  UTIL_THROW_IF_ARG(*rest, SizeParseError, (arg), "because of the text \"" << rest << "\" after the unit.");

  if (unit == '%') {
    uint64_t physical = GuessPhysicalMemory();
    UTIL_THROW_IF_ARG(!physical, SizeParseError, (arg), "because the physical memory size is unknown.");
    double percent = fractional ? real : static_cast<double>(whole);
    return static_cast<uint64_t>(percent * static_cast<double>(physical) / 100.0);
  }
  const char *found = std::strchr(kUnits, unit);
  UTIL_THROW_IF_ARG(!found, SizeParseError, (arg), "because the unit is not one of " << kUnits << "%.");
  int shift = 10 * static_cast<int>(found - kUnits);
  if (fractional) {
    double bytes = std::ldexp(real, shift);
    UTIL_THROW_IF_ARG(bytes >= 18446744073709551616.0, SizeParseError, (arg), "because it does not fit in 64 bits.");
    return static_cast<uint64_t>(bytes);
  }
  UTIL_THROW_IF_ARG(shift && (shift >= 64 || (whole >> (64 - shift)) != 0), SizeParseError, (arg), "because it does not fit in 64 bits.");
  return whole << shift;
}

} // namespace util
