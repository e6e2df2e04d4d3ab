#ifndef RUNBOX_SESSION_MANAGER_H
#define RUNBOX_SESSION_MANAGER_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include "dependency_cache.h"
#include "language.h"
#include "sandbox.h"
#include "shim.h"
#include "source_bundle.h"
#include "stream.h"

namespace runbox {

enum class SessionState {
  kIdle,
  kProvisioning,
  kRunning,
  kTerminating,
};

const char* SessionStateName(SessionState state);

struct SessionOptions {
  // Wall-clock limit of a program run.
  std::chrono::seconds timeout{30};
  // Limit of a dependency install, which runs before the program.
  std::chrono::seconds install_timeout{300};
};

struct ExecuteRequest {
  String session_id;
  // As given by the client, validated by Start.
  String language;
  Vector<SourceFile> files;
  String entry_file;
  OrderedMap<String, String> dependencies;
  Optional<String> input;
};

class Execution;

// Arena of sessions keyed by id. At most one run per session; a new Start for
// an id replaces the previous run.
class SessionManager {
 public:
  SessionManager(EventLoop& loop,
                 SandboxProvisioner& provisioner,
                 DependencyCache& cache,
                 SessionOptions options);
  ~SessionManager();

  // Returns the event channel of the new run. Validation failures return no
  // channel and touch no resource; after Shutdown every request is refused
  // with Errc::kCancelled. On Errc::kProvisioningFailure the channel is
  // returned anyway and already holds an error event followed by end.
  std::shared_ptr<EventChannel> Start(const ExecuteRequest& request,
                                      ErrorCode& ec);

  // Like Start, but provisioning, dependency installs and program start run
  // on a thread of their own; only validation happens before returning.
  // Every launch failure reaches the channel as an error event.
  std::shared_ptr<EventChannel> StartAsync(const ExecuteRequest& request,
                                           ErrorCode& ec);

  // Stops the current run of |session_id|. Errc::kNoActiveSession only
  // informs; stopping is always safe.
  ErrorCode Stop(StringView session_id);

  // Relays |text| plus a newline to the program's stdin.
  ErrorCode WriteInput(StringView session_id, StringView text);

  SessionState State(StringView session_id) const;
  Vector<String> ActiveSessions() const;

  // Refuses further starts, stops every session and waits for launches still
  // in flight.
  void Shutdown();

  const SessionOptions& options() const { return options_; }

 private:
  friend class Execution;

  struct Slot {
    // Serializes Start for one id.
    std::mutex start_mutex;
    std::shared_ptr<Execution> run;
  };

  // Validates |request| into |bundle| and creates its run.
  std::shared_ptr<Execution> Admit(const ExecuteRequest& request,
                                   SourceBundle& bundle,
                                   ErrorCode& ec);
  // Makes |run| the current run of its session and launches it.
  ErrorCode Launch(const std::shared_ptr<Execution>& run,
                   const SourceBundle& bundle);
  std::shared_ptr<Slot> GetSlot(const String& session_id);
  std::shared_ptr<Execution> FindRun(StringView session_id) const;
  // Clears the slot only if it still holds |run|.
  void Release(const String& session_id, const Execution* run);

  EventLoop& loop_;
  SandboxProvisioner& provisioner_;
  DependencyCache& cache_;
  const SessionOptions options_;

  mutable std::mutex mutex_;
  HashMap<String, std::shared_ptr<Slot>> slots_;
  bool shut_down_ = false;
  // Threads of StartAsync that have not returned yet.
  int launching_ = 0;
  std::condition_variable launches_done_;
};

// One run of a session from provisioning to teardown.
class Execution : public std::enable_shared_from_this<Execution> {
 public:
  Execution(SessionManager& manager,
            String session_id,
            const LanguageStrategy& language);
  ~Execution();

  const String& session_id() const { return session_id_; }
  const std::shared_ptr<EventChannel>& channel() const { return channel_; }
  SessionState state() const;
  bool finished() const { return finished_.load(); }

  // Provisions the sandbox and starts the program. Any failure has already
  // ended the run with an error event on the channel; the returned code is
  // Errc::kProvisioningFailure or Errc::kCancelled in that case. A failed
  // dependency install is reported on the channel only.
  ErrorCode Launch(const SourceBundle& bundle);

  void WriteInput(String data);

  // Kills the program and destroys the sandbox. Idempotent.
  void Stop();

 private:
  void SetState(SessionState state);
  // Pushes install output with control bytes removed.
  void PushOutput(StringView text);
  bool InstallDependencies(const SourceBundle& bundle,
                           const std::shared_ptr<Sandbox>& sandbox);
  void HandleExit(int exit_code);
  void HandleDrained();
  void HandleTimeout(const ErrorCode& error_code);
  void MaybeFinish();
  // The single teardown path: destroy the sandbox, then deliver end.
  void Finish();
  void Fail(const String& message);

  SessionManager& manager_;
  const String session_id_;
  const LanguageStrategy& language_;
  const std::shared_ptr<EventChannel> channel_;
  const CancelFlag cancel_;
  EventLoop::strand strand_;
  boost::asio::steady_timer timer_;

  mutable std::mutex mutex_;
  SessionState state_ = SessionState::kProvisioning;
  std::shared_ptr<Sandbox> sandbox_;
  std::shared_ptr<ExecutionHandle> handle_;
  std::shared_ptr<StreamPump> pump_;

  // Touched on the strand only.
  bool exited_ = false;
  bool drained_ = false;

  std::atomic<bool> finished_{false};
};

}  // namespace runbox

#endif  // RUNBOX_SESSION_MANAGER_H
