#ifndef RUNBOX_SANDBOX_H
#define RUNBOX_SANDBOX_H

#include <sys/types.h>
#include <boost/process/async_pipe.hpp>
#include <boost/process/child.hpp>
#include <chrono>
#include <functional>
#include <mutex>
#include <set>
#include "error.h"
#include "shim.h"
#include "source_bundle.h"

namespace runbox {

enum class Isolation {
  // Fresh user, mount, UTS, IPC and network namespaces around a private root.
  kNamespaces,
  // Process groups and resource limits only.
  kNone,
};

struct SandboxOptions {
  Path root = "/tmp/runbox";
  Isolation isolation = Isolation::kNamespaces;
  // Address space ceiling of every sandboxed process; 0 disables it.
  std::size_t memory_limit_bytes = std::size_t(1) << 30;
  std::size_t file_size_limit_bytes = std::size_t(64) << 20;
  std::size_t tmpfs_size_bytes = std::size_t(64) << 20;
  Vector<Path> read_only_mounts = {"/bin", "/etc", "/lib", "/lib64", "/usr"};
  Vector<Path> writable_mounts = {"/dev"};
};

class SandboxProvisioner;

// The live process of a sandbox: its pipes and its process group.
class ExecutionHandle {
 public:
  explicit ExecutionHandle(EventLoop& loop);

  pid_t pid() const { return pid_; }
  boost::process::async_pipe& stdin_pipe() { return stdin_; }
  boost::process::async_pipe& stdout_pipe() { return stdout_; }
  boost::process::async_pipe& stderr_pipe() { return stderr_; }

  // SIGKILLs the whole process group.
  void Kill();

 private:
  friend class Sandbox;

  boost::process::async_pipe stdin_;
  boost::process::async_pipe stdout_;
  boost::process::async_pipe stderr_;
  boost::process::child child_;
  pid_t pid_ = -1;
};

// An isolated, resource-limited environment bound to one session. The
// program sees its scratch directory at a fixed path.
class Sandbox {
 public:
  static constexpr const char* kVisibleScratchDir = "/scratch";

  struct RunResult {
    int exit_code = -1;
    String output;
    bool timed_out = false;
  };

  ~Sandbox();

  const String& name() const { return name_; }
  const String& session_id() const { return session_id_; }
  const Path& dir() const { return dir_; }
  // Host side location of the scratch directory.
  const Path& scratch_dir() const { return scratch_dir_; }
  // The scratch directory as the sandboxed program sees it.
  Path visible_scratch_dir() const;

  // Calls |function| with the host scratch directory. Destroy waits for it,
  // and once the sandbox is destroyed it throws SystemError with
  // Errc::kCancelled instead of calling, so nothing recreates a removed
  // sandbox.
  template <typename Function>
  auto WithScratchDir(Function function) -> decltype(function(Path())) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (destroyed_) {
      throw SystemError(Errc::kCancelled, "sandbox " + name_);
    }
    return function(scratch_dir_);
  }

  // Throws boost::filesystem::filesystem_error, or SystemError once
  // destroyed.
  void WriteFiles(const Vector<SourceFile>& files);

  // Runs |command| to completion and collects its combined output, also
  // handing every chunk to |on_output| as it arrives. Used for dependency
  // installs, which are the only commands allowed network access, before a
  // program is attached. Every process of the sandbox is killed once the
  // command exits or times out. Throws SystemError when the process cannot
  // be started.
  RunResult Run(const String& command,
                bool network,
                std::chrono::seconds timeout,
                const std::function<void(StringView)>& on_output = nullptr);

  // Starts |command| as the session program. |on_exit| runs on |loop| with
  // the exit code. Throws SystemError when the sandbox is destroyed, already
  // has a program attached, or the process cannot be started.
  std::shared_ptr<ExecutionHandle> Attach(EventLoop& loop,
                                          const String& command,
                                          std::function<void(int)> on_exit);

  // SIGKILLs the process groups started in the sandbox so far. The sandbox
  // stays usable.
  void KillProcessGroups();

  // Kills every process of the sandbox and deletes its directory. Returns
  // true only for the call that actually destroyed it.
  bool Destroy();

  bool destroyed() const;

 private:
  friend class SandboxProvisioner;

  Sandbox(SandboxProvisioner& provisioner,
          String session_id,
          String name,
          Path dir);

  SandboxProvisioner& provisioner_;
  const String session_id_;
  const String name_;
  const Path dir_;
  const Path scratch_dir_;

  mutable std::mutex mutex_;
  bool destroyed_ = false;
  std::shared_ptr<ExecutionHandle> handle_;
  std::set<pid_t> process_groups_;
};

class SandboxProvisioner {
 public:
  explicit SandboxProvisioner(SandboxOptions options);

  // "runbox-<id>" for ids made of [A-Za-z0-9._-] only. Other ids are
  // truncated, have unsafe characters replaced and get an "@<digest>"
  // suffix.
  static String SandboxName(StringView session_id);

  // Removes any sandbox already using the name, then creates a fresh one.
  // Throws SystemError with Errc::kProvisioningFailure.
  std::shared_ptr<Sandbox> Provision(StringView session_id);

  // Kills leftover processes and deletes leftover directories of sandboxes
  // from a previous daemon. Returns the number removed.
  std::size_t RecoverStale();

  std::size_t live_count() const;
  std::size_t destroyed_count() const;
  const SandboxOptions& options() const { return options_; }

 private:
  friend class Sandbox;

  void RemoveStale(const String& name, const Path& dir);
  void OnDestroyed(const Sandbox* sandbox);

  const SandboxOptions options_;
  mutable std::mutex mutex_;
  HashMap<String, std::weak_ptr<Sandbox>> live_;
  std::size_t destroyed_count_ = 0;
};

// SIGKILLs every process whose environment marks it as part of sandbox
// |name|, including ones that left their process group.
void KillSandboxProcesses(StringView name);

// True when unprivileged user and mount namespaces can be created here.
bool NamespacesAvailable();

}  // namespace runbox

#endif  // RUNBOX_SANDBOX_H
