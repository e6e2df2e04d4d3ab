#include "sandbox.h"

#include <dirent.h>
#include <sched.h>
#include <signal.h>
#include <sys/mount.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/process.hpp>
#include <boost/process/extend.hpp>
#include <array>
#include <fstream>
#include <iterator>
#include <thread>
#include "error.h"
#include "util.h"

namespace bp = boost::process;

namespace runbox {

namespace {

constexpr char kNamePrefix[] = "runbox-";
constexpr std::size_t kMaxOutputBytes = std::size_t(1) << 20;

struct Mount {
  String source;
  String target;
  bool read_only;
};

// Everything the child needs, prepared before fork so the child allocates
// nothing.
struct IsolationPlan {
  bool namespaces = false;
  bool network = false;
  String root;
  Vector<Mount> mounts;
  String tmp_dir;
  String tmpfs_options;
  String work_dir;
  String uid_map;
  String gid_map;
  rlim_t memory_limit = 0;
  rlim_t file_size_limit = 0;
};

int SetLimit(int resource, rlim_t value) {
  if (!value) {
    return 0;
  }
  struct rlimit limit;
  limit.rlim_cur = value;
  limit.rlim_max = value;
  return setrlimit(resource, &limit);
}

// Runs between fork and exec.
int EnterSandbox(const IsolationPlan& plan, const char** step) {
  *step = "setpgid";
  if (setpgid(0, 0) < 0) {
    return -1;
  }
  if (plan.namespaces) {
    int flags = CLONE_NEWUSER | CLONE_NEWNS | CLONE_NEWUTS | CLONE_NEWIPC;
    if (!plan.network) {
      flags |= CLONE_NEWNET;
    }
    *step = "unshare";
    if (unshare(flags) < 0) {
      return -1;
    }
    *step = "map ids";
    if (MapRootToSelf(plan.uid_map.c_str(), plan.gid_map.c_str()) < 0) {
      return -1;
    }
    *step = "make mounts private";
    if (mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) < 0) {
      return -1;
    }
    *step = "mount root tmpfs";
    if (MountTmpfs(plan.root.c_str(), plan.tmpfs_options.c_str()) < 0) {
      return -1;
    }
    for (const Mount& mount_point : plan.mounts) {
      *step = mount_point.target.c_str();
      if (MakeBindMount(mount_point.source.c_str(), mount_point.target.c_str(),
                        mount_point.read_only) < 0) {
        return -1;
      }
    }
    *step = "mount /tmp";
    if (mkdir(plan.tmp_dir.c_str(), 01777) < 0 ||
        MountTmpfs(plan.tmp_dir.c_str(), plan.tmpfs_options.c_str()) < 0) {
      return -1;
    }
    *step = "pivot_root";
    if (PivotRoot(plan.root.c_str(), ".old_root") < 0) {
      return -1;
    }
  }
  *step = "chdir";
  if (chdir(plan.work_dir.c_str()) < 0) {
    return -1;
  }
  *step = "setrlimit";
  if (SetLimit(RLIMIT_AS, plan.memory_limit) < 0 ||
      SetLimit(RLIMIT_FSIZE, plan.file_size_limit) < 0) {
    return -1;
  }
  return 0;
}

// Reports a failed setup step to the parent, where the child constructor
// throws bp::process_error.
template <typename Executor>
void SetupChild(Executor& exec, const IsolationPlan& plan) {
  const char* step = "";
  if (EnterSandbox(plan, &step) < 0) {
    exec.set_error(std::error_code(errno, std::system_category()), step);
    _exit(EXIT_FAILURE);
  }
}

String IdMap(unsigned int id) {
  return "0 " + std::to_string(id) + " 1";
}

bool IsSafeNameChar(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
         (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.';
}

void KillProcessGroup(pid_t pgid) {
  if (kill(-pgid, SIGKILL) < 0 && errno != ESRCH) {
    PLOG(WARNING) << "Failed to kill process group " << pgid;
  }
}

}  // namespace

constexpr const char* Sandbox::kVisibleScratchDir;

ExecutionHandle::ExecutionHandle(EventLoop& loop)
    : stdin_(loop), stdout_(loop), stderr_(loop) {}

void ExecutionHandle::Kill() {
  if (pid_ > 0) {
    KillProcessGroup(pid_);
  }
}

Sandbox::Sandbox(SandboxProvisioner& provisioner,
                 String session_id,
                 String name,
                 Path dir)
    : provisioner_(provisioner),
      session_id_(std::move(session_id)),
      name_(std::move(name)),
      dir_(std::move(dir)),
      scratch_dir_(dir_ / "scratch") {}

Sandbox::~Sandbox() {
  Destroy();
}

Path Sandbox::visible_scratch_dir() const {
  if (provisioner_.options().isolation == Isolation::kNamespaces) {
    return kVisibleScratchDir;
  }
  return scratch_dir_;
}

void Sandbox::WriteFiles(const Vector<SourceFile>& files) {
  WithScratchDir([&files](const Path& scratch_dir) {
    for (const SourceFile& file : files) {
      WriteFile(scratch_dir / file.name, file.content);
    }
  });
}

namespace {

IsolationPlan MakePlan(const SandboxOptions& options,
                       const Path& dir,
                       const Path& scratch_dir,
                       const Path& work_dir,
                       bool network) {
  IsolationPlan plan;
  plan.namespaces = options.isolation == Isolation::kNamespaces;
  plan.network = network;
  if (plan.namespaces) {
    String root = (dir / "root").string();
    plan.root = root;
    for (const Path& path : options.read_only_mounts) {
      if (Exists(path)) {
        plan.mounts.push_back(Mount{path.string(), root + path.string(), true});
      }
    }
    for (const Path& path : options.writable_mounts) {
      if (Exists(path)) {
        plan.mounts.push_back(
            Mount{path.string(), root + path.string(), false});
      }
    }
    plan.mounts.push_back(Mount{scratch_dir.string(),
                                root + Sandbox::kVisibleScratchDir, false});
    plan.tmp_dir = root + "/tmp";
    plan.tmpfs_options =
        "size=" + std::to_string(options.tmpfs_size_bytes) + ",mode=755";
    plan.uid_map = IdMap(getuid());
    plan.gid_map = IdMap(getgid());
  }
  plan.work_dir = work_dir.string();
  plan.memory_limit = options.memory_limit_bytes;
  plan.file_size_limit = options.file_size_limit_bytes;
  return plan;
}

bp::environment MakeEnvironment(const String& name,
                                 const Path& work_dir,
                                 bool namespaces) {
  bp::environment env;
  env["PATH"] = "/usr/local/bin:/usr/bin:/bin";
  env["HOME"] = work_dir.string();
  env["LANG"] = "C.UTF-8";
  env["RUNBOX_SANDBOX"] = name;
  if (namespaces) {
    env["TMPDIR"] = "/tmp";
  }
  return env;
}

}  // namespace

Sandbox::RunResult Sandbox::Run(
    const String& command,
    bool network,
    std::chrono::seconds timeout,
    const std::function<void(StringView)>& on_output) {
  const SandboxOptions& options = provisioner_.options();
  Path work_dir = visible_scratch_dir();
  IsolationPlan plan =
      MakePlan(options, dir_, scratch_dir_, work_dir, network);
  bp::environment env = MakeEnvironment(
      name_, work_dir, options.isolation == Isolation::kNamespaces);

  EventLoop loop;
  bp::async_pipe output_pipe(loop);
  bp::child child;
  pid_t pgid = -1;
  // Processes that left the group would keep the pipe open and, during an
  // install, network access.
  auto kill_all = [this, &pgid]() {
    KillProcessGroup(pgid);
    KillSandboxProcesses(name_);
  };
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (destroyed_) {
      throw SystemError(Errc::kCancelled, "sandbox " + name_);
    }
    if (handle_) {
      throw SystemError(Errc::kProvisioningFailure,
                        "sandbox " + name_ + " already runs a program");
    }
    try {
      child = bp::child(
          bp::exe = "/bin/sh", bp::args = Vector<String>{"-c", command},
          (bp::std_out & bp::std_err) > output_pipe, bp::std_in < bp::null,
          env, loop,
          bp::on_exit =
              [&kill_all](int, const std::error_code&) { kill_all(); },
          bp::extend::on_exec_setup = [&plan](auto& exec) {
            SetupChild(exec, plan);
          });
    } catch (const bp::process_error& e) {
      LOG(ERROR) << "Failed to start \"" << command << "\" in " << name_
                 << ": " << e.what();
      throw SystemError(Errc::kProvisioningFailure, e.what());
    }
    pgid = child.id();
    process_groups_.insert(pgid);
  }

  RunResult result;
  boost::asio::steady_timer timer(loop);
  timer.expires_from_now(timeout);
  timer.async_wait([&](const ErrorCode& error_code) {
    if (error_code != boost::asio::error::operation_aborted) {
      result.timed_out = true;
      kill_all();
      ErrorCode ignored;
      output_pipe.close(ignored);
    }
  });

  std::array<char, 4096> buffer;
  std::function<void(const ErrorCode&, std::size_t)> on_read =
      [&](const ErrorCode& error_code, std::size_t length) {
        if (length) {
          StringView chunk(buffer.data(), length);
          if (on_output) {
            on_output(chunk);
          }
          if (result.output.size() < kMaxOutputBytes) {
            result.output.append(chunk.data(), chunk.size());
          }
        }
        if (error_code) {
          timer.cancel();
          return;
        }
        output_pipe.async_read_some(boost::asio::buffer(buffer), on_read);
      };
  output_pipe.async_read_some(boost::asio::buffer(buffer), on_read);
  loop.run();

  std::error_code wait_error;
  child.wait(wait_error);
  result.exit_code = wait_error ? -1 : child.exit_code();
  if (!WIFEXITED(child.native_exit_code())) {
    result.exit_code = -1;
  }
  kill_all();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    process_groups_.erase(pgid);
  }
  VLOG(1) << "\"" << command << "\" in " << name_ << " exited with "
          << result.exit_code;
  return result;
}

std::shared_ptr<ExecutionHandle> Sandbox::Attach(
    EventLoop& loop,
    const String& command,
    std::function<void(int)> on_exit) {
  const SandboxOptions& options = provisioner_.options();
  Path work_dir = visible_scratch_dir();
  IsolationPlan plan =
      MakePlan(options, dir_, scratch_dir_, work_dir, /*network=*/false);
  bp::environment env = MakeEnvironment(
      name_, work_dir, options.isolation == Isolation::kNamespaces);

  auto handle = std::make_shared<ExecutionHandle>(loop);
  std::lock_guard<std::mutex> lock(mutex_);
  if (destroyed_) {
    throw SystemError(Errc::kCancelled, "sandbox " + name_);
  }
  if (handle_) {
    throw SystemError(Errc::kProvisioningFailure,
                      "sandbox " + name_ + " already runs a program");
  }
  try {
    handle->child_ = bp::child(
        bp::exe = "/bin/sh", bp::args = Vector<String>{"-c", command},
        bp::std_in < handle->stdin_, bp::std_out > handle->stdout_,
        bp::std_err > handle->stderr_, env, loop,
        bp::on_exit =
            [on_exit](int exit_code, const std::error_code&) {
              on_exit(exit_code);
            },
        bp::extend::on_exec_setup = [&plan](auto& exec) {
          SetupChild(exec, plan);
        });
  } catch (const bp::process_error& e) {
    LOG(ERROR) << "Failed to start program in " << name_ << ": " << e.what();
    throw SystemError(Errc::kProvisioningFailure, e.what());
  }
  handle->pid_ = handle->child_.id();
  // Reaping is left to the on_exit handler.
  handle->child_.detach();
  process_groups_.insert(handle->pid_);
  handle_ = handle;
  LOG(INFO) << "Sandbox " << name_ << " running pid " << handle->pid_;
  return handle;
}

void Sandbox::KillProcessGroups() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (pid_t pgid : process_groups_) {
    KillProcessGroup(pgid);
  }
}

bool Sandbox::Destroy() {
  std::shared_ptr<ExecutionHandle> handle;
  std::set<pid_t> process_groups;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (destroyed_) {
      return false;
    }
    destroyed_ = true;
    handle = std::move(handle_);
    process_groups.swap(process_groups_);
  }
  for (pid_t pgid : process_groups) {
    KillProcessGroup(pgid);
  }
  KillSandboxProcesses(name_);
  // Dying processes may still create files for a moment.
  ErrorCode error_code;
  for (int attempt = 0; attempt < 3; attempt++) {
    boost::filesystem::remove_all(dir_, error_code);
    if (!error_code) {
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  if (error_code) {
    LOG(WARNING) << "Failed to remove " << dir_ << ": "
                 << error_code.message();
  }
  LOG(INFO) << "Sandbox " << name_ << " destroyed";
  provisioner_.OnDestroyed(this);
  return true;
}

bool Sandbox::destroyed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return destroyed_;
}

SandboxProvisioner::SandboxProvisioner(SandboxOptions options)
    : options_(std::move(options)) {}

String SandboxProvisioner::SandboxName(StringView session_id) {
  String sanitized;
  for (char c : session_id.substr(0, 64)) {
    sanitized.push_back(IsSafeNameChar(c) ? c : '_');
  }
  // '@' never survives sanitizing, so a rewritten id cannot meet an id
  // that was used as is.
  if (sanitized.empty() || sanitized != session_id) {
    sanitized += "@" + Sha256Hex(session_id).substr(0, 12);
  }
  return kNamePrefix + sanitized;
}

std::shared_ptr<Sandbox> SandboxProvisioner::Provision(StringView session_id) {
  String name = SandboxName(session_id);
  Path dir = options_.root / name;

  std::shared_ptr<Sandbox> previous;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto iter = live_.find(name);
    if (iter != live_.end()) {
      previous = iter->second.lock();
    }
  }
  if (previous) {
    LOG(INFO) << "Replacing live sandbox " << name;
    previous->Destroy();
  }
  if (Exists(dir)) {
    RemoveStale(name, dir);
  }

  std::shared_ptr<Sandbox> sandbox(
      new Sandbox(*this, session_id.to_string(), name, dir));
  try {
    MakeDirs(sandbox->scratch_dir());
    if (options_.isolation == Isolation::kNamespaces) {
      MakeDirs(dir / "root");
    }
  } catch (const boost::filesystem::filesystem_error& e) {
    LOG(ERROR) << "Failed to create sandbox " << name << ": " << e.what();
    sandbox->Destroy();
    throw SystemError(Errc::kProvisioningFailure, e.what());
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    live_[name] = sandbox;
  }
  LOG(INFO) << "Provisioned sandbox " << name << " for session "
            << session_id;
  return sandbox;
}

void SandboxProvisioner::RemoveStale(const String& name, const Path& dir) {
  LOG(INFO) << "Removing stale sandbox " << name;
  KillSandboxProcesses(name);
  ErrorCode error_code;
  boost::filesystem::remove_all(dir, error_code);
  if (error_code) {
    LOG(WARNING) << "Failed to remove stale sandbox " << dir << ": "
                 << error_code.message();
  }
}

std::size_t SandboxProvisioner::RecoverStale() {
  std::size_t removed = 0;
  ErrorCode error_code;
  MakeDirs(options_.root);
  for (DirIterator iter(options_.root, error_code);
       !error_code && iter != DirIterator(); iter.increment(error_code)) {
    String name = iter->path().filename().string();
    if (name.compare(0, sizeof(kNamePrefix) - 1, kNamePrefix) != 0) {
      continue;
    }
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (live_.count(name)) {
        continue;
      }
    }
    RemoveStale(name, iter->path());
    removed++;
  }
  return removed;
}

std::size_t SandboxProvisioner::live_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return live_.size();
}

std::size_t SandboxProvisioner::destroyed_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return destroyed_count_;
}

void SandboxProvisioner::OnDestroyed(const Sandbox* sandbox) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto iter = live_.find(sandbox->name());
  if (iter != live_.end()) {
    std::shared_ptr<Sandbox> current = iter->second.lock();
    if (!current || current.get() == sandbox) {
      live_.erase(iter);
    }
  }
  destroyed_count_++;
}

void KillSandboxProcesses(StringView name) {
  String marker = "RUNBOX_SANDBOX=" + name.to_string();
  marker.push_back('\0');
  DIR* proc = opendir("/proc");
  if (!proc) {
    PLOG(WARNING) << "Failed to scan /proc";
    return;
  }
  pid_t self = getpid();
  while (struct dirent* entry = readdir(proc)) {
    char* end = nullptr;
    long pid = strtol(entry->d_name, &end, 10);
    if (*end != '\0' || pid <= 0 || pid == self) {
      continue;
    }
    std::ifstream stream(String("/proc/") + entry->d_name + "/environ",
                         std::ios::binary);
    String environ{std::istreambuf_iterator<char>(stream),
                   std::istreambuf_iterator<char>()};
    environ.insert(environ.begin(), '\0');
    if (environ.find('\0' + marker) != String::npos) {
      VLOG(1) << "Killing leftover pid " << pid << " of " << name;
      kill(static_cast<pid_t>(pid), SIGKILL);
    }
  }
  closedir(proc);
}

bool NamespacesAvailable() {
  Path dir;
  try {
    dir = CreateTempPath(TempPath() / "runbox_ns_check.%%%%%%%%");
  } catch (const boost::filesystem::filesystem_error& e) {
    LOG(WARNING) << "Failed to create namespace check directory: " << e.what();
    return false;
  }
  // Same steps as a sandboxed child up to the first file created inside the
  // private root.
  String root = dir.string();
  String check_dir = (dir / "check").string();
  String uid_map = IdMap(getuid());
  String gid_map = IdMap(getgid());
  pid_t pid = fork();
  if (pid == 0) {
    bool ok =
        unshare(CLONE_NEWUSER | CLONE_NEWNS | CLONE_NEWNET) == 0 &&
        MapRootToSelf(uid_map.c_str(), gid_map.c_str()) == 0 &&
        mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) == 0 &&
        MountTmpfs(root.c_str(), "size=65536,mode=755") == 0 &&
        mkdir(check_dir.c_str(), 0755) == 0;
    _exit(ok ? 0 : 1);
  }
  int status = 0;
  bool available = pid > 0 && waitpid(pid, &status, 0) == pid &&
                   WIFEXITED(status) && WEXITSTATUS(status) == 0;
  ErrorCode ignored;
  boost::filesystem::remove_all(dir, ignored);
  return available;
}

}  // namespace runbox
