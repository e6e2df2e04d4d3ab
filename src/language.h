#ifndef RUNBOX_LANGUAGE_H
#define RUNBOX_LANGUAGE_H

#include "shim.h"
#include "source_bundle.h"

namespace runbox {

// A dependency manifest as it will exist in the scratch directory.
struct Manifest {
  String file_name;
  String content;
  // True when the engine rendered it from SourceBundle::dependencies and has
  // to write it next to the sources.
  bool generated = false;
};

// Knows how to build and run one language. Implementations are stateless;
// the registry hands out shared singletons.
class LanguageStrategy {
 public:
  virtual ~LanguageStrategy() = default;

  virtual Language language() const = 0;
  virtual const char* name() const = 0;

  // The shell command that compiles (when needed) and runs |entry_file| from
  // |files| located in |scratch_dir|.
  virtual String BuildCommand(const Vector<SourceFile>& files,
                              StringView entry_file,
                              const Path& scratch_dir) const = 0;

  // File name used for single-file submissions.
  virtual String DefaultFileName(StringView code) const = 0;

  // Dependency support. An empty manifest file name means the language does
  // not install packages.
  virtual const char* manifest_file() const { return ""; }
  virtual const char* dependency_dir() const { return ""; }
  virtual String InstallCommand(const Path& scratch_dir) const { return ""; }
  virtual String RenderManifest(
      const OrderedMap<String, String>& dependencies) const {
    return "";
  }

  LanguageStrategy() = default;
  LanguageStrategy(const LanguageStrategy&) = delete;
  LanguageStrategy& operator=(const LanguageStrategy&) = delete;
};

// Accepts canonical names and the usual aliases ("py", "js", "c++").
Optional<Language> ParseLanguage(StringView name);

const LanguageStrategy& GetLanguage(Language language);

inline const char* LanguageName(Language language) {
  return GetLanguage(language).name();
}

// Pure. Sets |ec| to Errc::kUnsupportedLanguage and returns an empty string
// when |language| is not one of the supported names.
String SynthesizeCommand(StringView language,
                         const Vector<SourceFile>& files,
                         StringView entry_file,
                         const Path& scratch_dir,
                         ErrorCode& ec);

// The manifest the bundle declares, either as a file of the bundle or through
// its dependency map. None when nothing needs installing.
Optional<Manifest> ResolveManifest(const SourceBundle& bundle);

// Class name declared by "public class X" in |code|, qualified with the
// package when one is declared. Falls back to "Main".
String FindJavaMainClass(StringView code);

}  // namespace runbox

#endif  // RUNBOX_LANGUAGE_H
