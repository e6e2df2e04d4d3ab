#ifndef RUNBOX_TEST_UTIL_H
#define RUNBOX_TEST_UTIL_H

#include <boost/process/search_path.hpp>
#include "shim.h"
#include "util.h"

namespace runbox {

// A fresh directory removed with everything in it.
class TempDir {
 public:
  TempDir() : path_(CreateTempPath(TempPath() / "runbox_test.%%%%%%%%")) {}
  ~TempDir() {
    ErrorCode ignored;
    boost::filesystem::remove_all(path_, ignored);
  }

  const Path& path() const { return path_; }

 private:
  const Path path_;
};

inline bool HasProgram(const char* name) {
  return !boost::process::search_path(name).empty();
}

inline std::size_t CountEntries(const Path& dir) {
  std::size_t count = 0;
  ErrorCode error_code;
  for (DirIterator iter(dir, error_code);
       !error_code && iter != DirIterator(); iter.increment(error_code)) {
    count++;
  }
  return count;
}

}  // namespace runbox

#endif  // RUNBOX_TEST_UTIL_H
