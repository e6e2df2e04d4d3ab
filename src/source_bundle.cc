#include "source_bundle.h"

#include <unordered_set>
#include "error.h"

namespace runbox {

bool IsSafeFileName(StringView name) {
  if (name.empty() || name.size() > 255 || name.front() == '/') {
    return false;
  }
  for (char c : name) {
    if (static_cast<unsigned char>(c) < 0x20 || c == '\\') {
      return false;
    }
  }
  size_t begin = 0;
  while (begin <= name.size()) {
    size_t end = name.find('/', begin);
    if (end == StringView::npos) {
      end = name.size();
    }
    StringView component = name.substr(begin, end - begin);
    if (component.empty() || component == "." || component == "..") {
      return false;
    }
    begin = end + 1;
  }
  return true;
}

const SourceFile* FindFile(const Vector<SourceFile>& files, StringView name) {
  for (const SourceFile& file : files) {
    if (file.name == name) {
      return &file;
    }
  }
  return nullptr;
}

ErrorCode ValidateBundle(const SourceBundle& bundle) {
  if (bundle.files.empty()) {
    return Errc::kInvalidBundle;
  }
  std::unordered_set<String> seen;
  for (const SourceFile& file : bundle.files) {
    if (!IsSafeFileName(file.name) || !seen.insert(file.name).second) {
      LOG(INFO) << "Rejecting bundle file name \"" << file.name << "\"";
      return Errc::kInvalidBundle;
    }
  }
  if (!seen.count(bundle.entry_file)) {
    LOG(INFO) << "Entry file \"" << bundle.entry_file
              << "\" is not part of the bundle";
    return Errc::kInvalidBundle;
  }
  return ErrorCode();
}

}  // namespace runbox
