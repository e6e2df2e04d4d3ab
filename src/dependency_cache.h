#ifndef RUNBOX_DEPENDENCY_CACHE_H
#define RUNBOX_DEPENDENCY_CACHE_H

#include "shim.h"
#include "source_bundle.h"
#include "util.h"

namespace runbox {

// Content-addressed store of installed dependency trees, shared by every
// session of a language. An entry is usable only once its completion marker
// exists; the marker is written after the tree is fully in place, so readers
// never observe a partial entry and concurrent populates of one key are
// harmless.
//
// Layout: <root>/<language>/<key>/tree/ and <root>/<language>/<key>/.cache-complete
class DependencyCache {
 public:
  static constexpr const char* kTreeDir = "tree";
  static constexpr const char* kCompletionMarker = ".cache-complete";

  explicit DependencyCache(Path root);

  static String Key(Language language, StringView manifest);

  // Tree directory of a complete entry, or none.
  Optional<Path> Lookup(Language language, StringView manifest) const;

  // Copies |source_tree| into the entry for |manifest|. |source_tree| must be
  // a directory, not a link to one. Failures are logged and returned as
  // Errc::kCacheWriteFailure; a set |cancel| returns Errc::kCancelled before
  // the tree is placed.
  ErrorCode Populate(Language language,
                     StringView manifest,
                     const Path& source_tree,
                     const CancelFlag& cancel = nullptr);

  // Copies a cached tree to |destination|, leaving the entry intact.
  static bool CopyOut(const Path& tree,
                      const Path& destination,
                      const CancelFlag& cancel = nullptr);

  const Path& root() const { return root_; }

 private:
  Path EntryDir(Language language, StringView manifest) const;

  const Path root_;
};

}  // namespace runbox

#endif  // RUNBOX_DEPENDENCY_CACHE_H
