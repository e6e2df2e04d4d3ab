#ifndef RUNBOX_SOURCE_BUNDLE_H
#define RUNBOX_SOURCE_BUNDLE_H

#include "shim.h"

namespace runbox {

enum class Language {
  kPython,
  kJavaScript,
  kJava,
  kCpp,
};

struct SourceFile {
  String name;
  String content;
};

struct SourceBundle {
  Language language = Language::kPython;
  Vector<SourceFile> files;
  String entry_file;
  // Declared packages, name to version. An empty version means any.
  OrderedMap<String, String> dependencies;
  Optional<String> input;
};

// A name is acceptable when it is relative, has no "." or ".." component,
// and contains no NUL or control characters.
bool IsSafeFileName(StringView name);

const SourceFile* FindFile(const Vector<SourceFile>& files, StringView name);

// Returns Errc::kInvalidBundle when the entry file is missing from the file
// set, a name is unsafe, or a name appears twice.
ErrorCode ValidateBundle(const SourceBundle& bundle);

}  // namespace runbox

#endif  // RUNBOX_SOURCE_BUNDLE_H
