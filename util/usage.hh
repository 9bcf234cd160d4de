#ifndef UTIL_USAGE_H
#define UTIL_USAGE_H
#include <cstddef>
#include <iosfwd>
#include <string>

#include <stdint.h>

namespace util {
// Time in seconds since process started.
double WallTime();

void PrintUsage(std::ostream &to);

// Determine how much physical memory there is.  Return 0 on failure.
uint64_t GuessPhysicalMemory();

// Resident set and virtual size of this process in bytes, read from
// /proc/self/statm.  Return 0 on failure.
uint64_t ResidentMemory();
uint64_t VirtualMemory();

// Hand free heap pages back to the operating system.  Returns false if the C
// library could not release anything or does not support it.
bool ReleaseFreeMemory();

// Parse a size like unix sort.  Sadly, this means the default multiplier is K.
uint64_t ParseSize(const std::string &arg);
} // namespace util
#endif // UTIL_USAGE_H
