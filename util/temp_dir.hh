#ifndef UTIL_TEMP_DIR_H
#define UTIL_TEMP_DIR_H

#include <cstddef>
#include <set>
#include <string>

namespace util {

/* Private directory for temporary files.  Every file named through NewFile is
 * tracked and the destructor removes whatever is left, then the directory.
 * Removal failures are logged as warnings and never thrown.
 */
class TempDirectory {
  public:
    // Creates prefix followed by six random characters.  prefix is normalized
    // with NormalizeTempPrefix, so a bare directory works.
    explicit TempDirectory(const std::string &prefix);

    ~TempDirectory();

    const std::string &Path() const { return path_; }

    // Reserve a unique file name inside the directory.  The file is not created.
    std::string NewFile(const std::string &stem);

    // Delete one tracked file now.  Returns false and logs on failure.
    bool Remove(const std::string &file);

    // Delete every tracked file.  Returns the number that could not be removed.
    std::size_t RemoveAll();

    std::size_t Tracked() const { return files_.size(); }

  private:
    std::string path_;
    std::set<std::string> files_;
    std::size_t counter_;

    TempDirectory(const TempDirectory &);
    TempDirectory &operator=(const TempDirectory &);
};

} // namespace util

#endif // UTIL_TEMP_DIR_H
