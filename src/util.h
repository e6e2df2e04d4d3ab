#ifndef RUNBOX_UTIL_H
#define RUNBOX_UTIL_H

#include <atomic>
#include "shim.h"

namespace runbox {

// Shared between a run and the work done on its behalf; set once by Stop.
using CancelFlag = std::shared_ptr<std::atomic<bool>>;

inline CancelFlag MakeCancelFlag() {
  return std::make_shared<std::atomic<bool>>(false);
}

inline bool IsCancelled(const CancelFlag& flag) {
  return flag && flag->load();
}

// Writes |content| as opaque bytes, creating parent directories. Throws
// boost::filesystem::filesystem_error on failure.
void WriteFile(const Path& file, StringView content);

String ReadFile(const Path& file);

Path CreateTempPath(const Path& model, int num_attempts);

inline Path CreateTempPath(const Path& model) {
  return CreateTempPath(model, /*num_attempts=*/4);
}

// Recursively copies the contents of |from_dir| into |to_dir|. Symlinks are
// copied as links, never followed; |from_dir| itself must be a real
// directory. Stops early and returns false once |cancel| is set.
bool CopyTree(const Path& from_dir, const Path& to_dir,
              const CancelFlag& cancel = nullptr);

String Sha256Hex(StringView data);

// Quotes |arg| for /bin/sh so that it is always a single literal word.
String ShellQuote(StringView arg);

// Async-signal-safe helpers for the child side of a fork. They return -1
// with errno set on failure.
int MountTmpfs(const char* dir, const char* options);
int MakeBindMount(const char* from, const char* to, bool read_only);
int PivotRoot(const char* new_root, const char* old_root);
int WriteProcFile(const char* file, const char* content);
// Makes the caller root of its fresh user namespace, backed by the host ids
// given as "0 <id> 1". Call right after unshare(CLONE_NEWUSER).
int MapRootToSelf(const char* uid_map, const char* gid_map);

}  // namespace runbox

#endif  // RUNBOX_UTIL_H
