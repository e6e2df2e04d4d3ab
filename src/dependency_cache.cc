#include "dependency_cache.h"

#include "error.h"
#include "language.h"

namespace runbox {

constexpr const char* DependencyCache::kTreeDir;
constexpr const char* DependencyCache::kCompletionMarker;

DependencyCache::DependencyCache(Path root) : root_(std::move(root)) {}

String DependencyCache::Key(Language language, StringView manifest) {
  String data = LanguageName(language);
  data.push_back('\0');
  data.append(manifest.data(), manifest.size());
  return Sha256Hex(data);
}

Path DependencyCache::EntryDir(Language language, StringView manifest) const {
  return root_ / LanguageName(language) / Key(language, manifest);
}

Optional<Path> DependencyCache::Lookup(Language language,
                                       StringView manifest) const {
  Path entry = EntryDir(language, manifest);
  Path tree = entry / kTreeDir;
  if (IsDirectory(tree) && IsRegularFile(entry / kCompletionMarker)) {
    LOG(INFO) << "Dependency cache hit " << entry;
    return tree;
  }
  LOG(INFO) << "Dependency cache miss " << entry;
  return boost::none;
}

ErrorCode DependencyCache::Populate(Language language,
                                    StringView manifest,
                                    const Path& source_tree,
                                    const CancelFlag& cancel) {
  Path entry = EntryDir(language, manifest);
  if (IsRegularFile(entry / kCompletionMarker)) {
    return ErrorCode();
  }
  // The source was written by sandboxed code; a link there could name any
  // host directory.
  ErrorCode status_error;
  if (boost::filesystem::symlink_status(source_tree, status_error).type() !=
      FileType::directory_file) {
    LOG(WARNING) << "Not caching " << source_tree
                 << ": not a plain directory";
    return Errc::kCacheWriteFailure;
  }
  Path staging;
  try {
    MakeDirs(entry);
    staging = CreateTempPath(entry / "staging.%%%%%%%%%%%%");
    // A session being torn down sets |cancel| before its scratch directory
    // goes away, so a copy that saw the removal is never renamed.
    if (!CopyTree(source_tree, staging, cancel) || IsCancelled(cancel)) {
      RemoveAll(staging);
      LOG(INFO) << "Dependency cache populate of " << entry << " cancelled";
      return Errc::kCancelled;
    }
    // The tree only ever appears through this rename, so an existing one is
    // complete and equivalent to ours.
    ErrorCode rename_error;
    boost::filesystem::rename(staging, entry / kTreeDir, rename_error);
    if (rename_error) {
      VLOG(1) << "Keeping existing tree in " << entry << ": "
              << rename_error.message();
      RemoveAll(staging);
    }
    Path marker_temp = entry / RandomPath(".marker.%%%%%%%%");
    WriteFile(marker_temp, Key(language, manifest));
    boost::filesystem::rename(marker_temp, entry / kCompletionMarker);
  } catch (const boost::filesystem::filesystem_error& e) {
    LOG(WARNING) << "Failed to populate dependency cache " << entry << ": "
                 << e.what();
    if (!staging.empty()) {
      ErrorCode ignored;
      boost::filesystem::remove_all(staging, ignored);
    }
    return Errc::kCacheWriteFailure;
  }
  LOG(INFO) << "Dependency cache populated " << entry;
  return ErrorCode();
}

bool DependencyCache::CopyOut(const Path& tree,
                              const Path& destination,
                              const CancelFlag& cancel) {
  try {
    return CopyTree(tree, destination, cancel);
  } catch (const boost::filesystem::filesystem_error& e) {
    LOG(WARNING) << "Failed to copy cached dependencies from " << tree << ": "
                 << e.what();
    return false;
  }
}

}  // namespace runbox
