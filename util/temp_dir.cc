#include "util/temp_dir.hh"

#include "util/file.hh"

#include <cstring>
#include <iostream>
#include <sstream>

#include <errno.h>

namespace util {

TempDirectory::TempDirectory(const std::string &prefix) : counter_(0) {
  std::string base(prefix);
  NormalizeTempPrefix(base);
  path_ = MakeTempDir(base);
}

TempDirectory::~TempDirectory() {
  RemoveAll();
  if (!RemoveDirectory(path_)) {
    std::cerr << "Warning: could not remove temporary directory " << path_ << ": " << std::strerror(errno) << std::endl;
  }
}

std::string TempDirectory::NewFile(const std::string &stem) {
  std::ostringstream name;
  name << path_ << '/' << stem << '_' << counter_++;
  files_.insert(name.str());
  return name.str();
}

bool TempDirectory::Remove(const std::string &file_ref) {
  // file_ref may refer into files_.
  std::string file(file_ref);
  std::set<std::string>::iterator i = files_.find(file);
  if (i == files_.end()) return true;
  files_.erase(i);
  if (RemoveFile(file) || errno == ENOENT) return true;
  std::cerr << "Warning: could not remove temporary file " << file << ": " << std::strerror(errno) << std::endl;
  return false;
}

std::size_t TempDirectory::RemoveAll() {
  std::size_t failed = 0;
  while (!files_.empty()) {
    if (!Remove(*files_.begin())) ++failed;
  }
  return failed;
}

} // namespace util
