#include "session_manager.h"

#include <boost/bind.hpp>
#include <thread>
#include "error.h"
#include "util.h"

namespace runbox {

const char* SessionStateName(SessionState state) {
  switch (state) {
    case SessionState::kIdle:
      return "idle";
    case SessionState::kProvisioning:
      return "provisioning";
    case SessionState::kRunning:
      return "running";
    case SessionState::kTerminating:
      return "terminating";
  }
  return "unknown";
}

SessionManager::SessionManager(EventLoop& loop,
                               SandboxProvisioner& provisioner,
                               DependencyCache& cache,
                               SessionOptions options)
    : loop_(loop),
      provisioner_(provisioner),
      cache_(cache),
      options_(options) {}

SessionManager::~SessionManager() {
  Shutdown();
}

std::shared_ptr<EventChannel> SessionManager::Start(
    const ExecuteRequest& request,
    ErrorCode& ec) {
  SourceBundle bundle;
  std::shared_ptr<Execution> run = Admit(request, bundle, ec);
  if (!run) {
    return nullptr;
  }
  ec = Launch(run, bundle);
  return run->channel();
}

std::shared_ptr<EventChannel> SessionManager::StartAsync(
    const ExecuteRequest& request,
    ErrorCode& ec) {
  SourceBundle bundle;
  std::shared_ptr<Execution> run = Admit(request, bundle, ec);
  if (!run) {
    return nullptr;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    launching_++;
  }
  std::shared_ptr<EventChannel> channel = run->channel();
  std::thread([this, bundle](std::shared_ptr<Execution> run) {
    ErrorCode ec = Launch(run, bundle);
    if (ec) {
      VLOG(1) << "Launch of session " << run->session_id()
              << " failed: " << ec.message();
    }
    run.reset();
    std::lock_guard<std::mutex> lock(mutex_);
    if (--launching_ == 0) {
      launches_done_.notify_all();
    }
  }, std::move(run)).detach();
  return channel;
}

std::shared_ptr<Execution> SessionManager::Admit(const ExecuteRequest& request,
                                                 SourceBundle& bundle,
                                                 ErrorCode& ec) {
  Optional<Language> language = ParseLanguage(request.language);
  if (!language) {
    LOG(INFO) << "Rejecting session " << request.session_id
              << ": unsupported language \"" << request.language << "\"";
    ec = Errc::kUnsupportedLanguage;
    return nullptr;
  }
  bundle.language = *language;
  bundle.files = request.files;
  bundle.entry_file = request.entry_file;
  bundle.dependencies = request.dependencies;
  bundle.input = request.input;
  ec = ValidateBundle(bundle);
  if (!ec && request.session_id.empty()) {
    ec = Errc::kInvalidBundle;
  }
  if (!ec) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shut_down_) {
      ec = Errc::kCancelled;
    }
  }
  if (ec) {
    LOG(INFO) << "Rejecting session " << request.session_id << ": "
              << ec.message();
    return nullptr;
  }

  auto run = std::make_shared<Execution>(*this, request.session_id,
                                         GetLanguage(*language));
  std::weak_ptr<Execution> weak_run = run;
  run->channel()->SetDisconnectHandler([weak_run]() {
    if (std::shared_ptr<Execution> run = weak_run.lock()) {
      LOG(INFO) << "Consumer of session " << run->session_id()
                << " disconnected";
      run->Stop();
    }
  });
  return run;
}

ErrorCode SessionManager::Launch(const std::shared_ptr<Execution>& run,
                                 const SourceBundle& bundle) {
  const String& session_id = run->session_id();
  std::shared_ptr<Slot> slot = GetSlot(session_id);
  std::lock_guard<std::mutex> start_lock(slot->start_mutex);
  std::shared_ptr<Execution> previous;
  bool admitted;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    // A run stopped before getting here must not displace the current one.
    admitted = !shut_down_ && !run->finished();
    if (admitted) {
      previous = std::move(slot->run);
      slot->run = run;
    }
  }
  if (previous) {
    LOG(INFO) << "Replacing the current run of session " << session_id;
    previous->Stop();
  }
  if (!admitted) {
    run->Stop();
    return Errc::kCancelled;
  }

  LOG(INFO) << "Starting " << LanguageName(bundle.language)
            << " run of session " << session_id << " with "
            << bundle.files.size() << " files";
  ErrorCode ec = run->Launch(bundle);
  if (ec == Errc::kCancelled) {
    ec.clear();
  }
  return ec;
}

ErrorCode SessionManager::Stop(StringView session_id) {
  std::shared_ptr<Execution> run = FindRun(session_id);
  if (!run) {
    return Errc::kNoActiveSession;
  }
  LOG(INFO) << "Stopping session " << session_id;
  run->Stop();
  return ErrorCode();
}

ErrorCode SessionManager::WriteInput(StringView session_id, StringView text) {
  std::shared_ptr<Execution> run = FindRun(session_id);
  if (!run || run->state() != SessionState::kRunning) {
    return Errc::kNoActiveSession;
  }
  String data = text.to_string();
  data.push_back('\n');
  run->WriteInput(std::move(data));
  return ErrorCode();
}

SessionState SessionManager::State(StringView session_id) const {
  std::shared_ptr<Execution> run = FindRun(session_id);
  return run ? run->state() : SessionState::kIdle;
}

Vector<String> SessionManager::ActiveSessions() const {
  Vector<String> session_ids;
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& slot : slots_) {
    if (slot.second->run) {
      session_ids.push_back(slot.first);
    }
  }
  return session_ids;
}

void SessionManager::Shutdown() {
  Vector<std::shared_ptr<Execution>> runs;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    shut_down_ = true;
    for (const auto& slot : slots_) {
      if (slot.second->run) {
        runs.push_back(slot.second->run);
      }
    }
  }
  if (!runs.empty()) {
    LOG(INFO) << "Stopping " << runs.size() << " sessions";
  }
  for (const auto& run : runs) {
    run->Stop();
  }
  std::unique_lock<std::mutex> lock(mutex_);
  launches_done_.wait(lock, [this]() { return launching_ == 0; });
}

std::shared_ptr<SessionManager::Slot> SessionManager::GetSlot(
    const String& session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::shared_ptr<Slot>& slot = slots_[session_id];
  if (!slot) {
    slot = std::make_shared<Slot>();
  }
  return slot;
}

std::shared_ptr<Execution> SessionManager::FindRun(
    StringView session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto iter = slots_.find(session_id.to_string());
  if (iter == slots_.end()) {
    return nullptr;
  }
  return iter->second->run;
}

void SessionManager::Release(const String& session_id, const Execution* run) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto iter = slots_.find(session_id);
  if (iter == slots_.end() || iter->second->run.get() != run) {
    return;
  }
  iter->second->run.reset();
  // A Start in progress holds another reference.
  if (iter->second.use_count() == 1) {
    slots_.erase(iter);
  }
}

Execution::Execution(SessionManager& manager,
                     String session_id,
                     const LanguageStrategy& language)
    : manager_(manager),
      session_id_(std::move(session_id)),
      language_(language),
      channel_(std::make_shared<EventChannel>()),
      cancel_(MakeCancelFlag()),
      strand_(manager.loop_),
      timer_(manager.loop_) {}

Execution::~Execution() {
  VLOG(1) << "Released run of session " << session_id_;
}

SessionState Execution::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

void Execution::SetState(SessionState state) {
  std::lock_guard<std::mutex> lock(mutex_);
  state_ = state;
}

ErrorCode Execution::Launch(const SourceBundle& bundle) {
  std::shared_ptr<Sandbox> sandbox;
  try {
    sandbox = manager_.provisioner_.Provision(session_id_);
  } catch (const SystemError& e) {
    Fail(String("Failed to provision sandbox: ") + e.what());
    return Errc::kProvisioningFailure;
  }
  bool cancelled;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled = IsCancelled(cancel_);
    if (!cancelled) {
      sandbox_ = sandbox;
    }
  }
  if (cancelled) {
    sandbox->Destroy();
    return Errc::kCancelled;
  }

  try {
    sandbox->WriteFiles(bundle.files);
  } catch (const boost::filesystem::filesystem_error& e) {
    LOG(ERROR) << "Failed to write files of session " << session_id_ << ": "
               << e.what();
    Fail("Failed to write source files");
    return Errc::kProvisioningFailure;
  } catch (const SystemError&) {
    // Destroyed by Stop.
    return Errc::kCancelled;
  }

  if (!InstallDependencies(bundle, sandbox)) {
    return IsCancelled(cancel_) ? ErrorCode(Errc::kCancelled) : ErrorCode();
  }

  ErrorCode ec;
  String command =
      SynthesizeCommand(language_.name(), bundle.files, bundle.entry_file,
                        sandbox->visible_scratch_dir(), ec);
  CHECK(!ec) << "no command for validated language " << language_.name();

  auto self = shared_from_this();
  std::shared_ptr<ExecutionHandle> handle;
  try {
    handle = sandbox->Attach(manager_.loop_, command,
                             strand_.wrap([self](int exit_code) {
                               self->HandleExit(exit_code);
                             }));
  } catch (const SystemError& e) {
    if (IsCancelled(cancel_)) {
      return Errc::kCancelled;
    }
    Fail(String("Failed to start program: ") + e.what());
    return Errc::kProvisioningFailure;
  }

  auto pump = std::make_shared<StreamPump>(
      strand_, handle, channel_, [self]() { self->HandleDrained(); });
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (finished_) {
      // Finish already destroyed the sandbox and its program.
      return Errc::kCancelled;
    }
    handle_ = handle;
    pump_ = pump;
    state_ = SessionState::kRunning;
  }
  pump->Start();
  if (bundle.input) {
    pump->Write(*bundle.input + "\n");
  }
  strand_.dispatch([self]() {
    if (self->finished_) {
      return;
    }
    self->timer_.expires_from_now(self->manager_.options_.timeout);
    self->timer_.async_wait(self->strand_.wrap(
        boost::bind(&Execution::HandleTimeout, self,
                    boost::asio::placeholders::error)));
  });
  LOG(INFO) << "Session " << session_id_ << " running as pid "
            << handle->pid();
  return ErrorCode();
}

bool Execution::InstallDependencies(const SourceBundle& bundle,
                                    const std::shared_ptr<Sandbox>& sandbox) {
  Optional<Manifest> manifest = ResolveManifest(bundle);
  if (!manifest) {
    return true;
  }
  const char* dependency_dir = language_.dependency_dir();
  try {
    if (manifest->generated) {
      sandbox->WriteFiles({SourceFile{manifest->file_name, manifest->content}});
    }
  } catch (const boost::filesystem::filesystem_error& e) {
    LOG(ERROR) << "Failed to write manifest of session " << session_id_
               << ": " << e.what();
    Fail("Failed to write " + manifest->file_name);
    return false;
  } catch (const SystemError&) {
    return false;
  }

  DependencyCache& cache = manager_.cache_;
  if (Optional<Path> cached = cache.Lookup(bundle.language, manifest->content)) {
    bool copied;
    try {
      copied = sandbox->WithScratchDir(
          [this, &cached, dependency_dir](const Path& scratch_dir) {
            return DependencyCache::CopyOut(
                *cached, scratch_dir / dependency_dir, cancel_);
          });
    } catch (const SystemError&) {
      return false;
    }
    if (copied) {
      return true;
    }
    if (IsCancelled(cancel_)) {
      return false;
    }
    LOG(WARNING) << "Installing dependencies of session " << session_id_
                 << " despite a cache hit";
    ErrorCode ignored;
    boost::filesystem::remove_all(sandbox->scratch_dir() / dependency_dir,
                                  ignored);
  }

  LOG(INFO) << "Installing " << language_.name()
            << " dependencies of session " << session_id_;
  // Output is relayed as it arrives, split only at character boundaries.
  String carry;
  auto relay = [this, &carry](StringView chunk) {
    carry.append(chunk.data(), chunk.size());
    std::size_t complete = CompleteUtf8Prefix(carry);
    PushOutput(StringView(carry).substr(0, complete));
    carry.erase(0, complete);
  };
  Sandbox::RunResult result;
  try {
    result = sandbox->Run(
        language_.InstallCommand(sandbox->visible_scratch_dir()),
        /*network=*/true, manager_.options_.install_timeout, relay);
  } catch (const SystemError& e) {
    if (!IsCancelled(cancel_)) {
      Fail(String("Failed to install dependencies: ") + e.what());
    }
    return false;
  }
  PushOutput(carry);
  if (IsCancelled(cancel_)) {
    return false;
  }
  if (result.timed_out) {
    Fail("Dependency installation timed out after " +
         std::to_string(manager_.options_.install_timeout.count()) +
         " seconds");
    return false;
  }
  if (result.exit_code != 0) {
    Fail("Dependency installation failed with exit code " +
         std::to_string(result.exit_code));
    return false;
  }
  ErrorCode ec = cache.Populate(bundle.language, manifest->content,
                                sandbox->scratch_dir() / dependency_dir,
                                cancel_);
  if (ec) {
    VLOG(1) << "Session " << session_id_ << " continues without caching: "
            << ec.message();
  }
  return true;
}

void Execution::PushOutput(StringView text) {
  String output = StripControlBytes(text);
  if (!output.empty()) {
    channel_->Push(Event::kOutput, std::move(output));
  }
}

void Execution::WriteInput(String data) {
  std::shared_ptr<StreamPump> pump;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    pump = pump_;
  }
  if (pump) {
    pump->Write(std::move(data));
  }
}

void Execution::Stop() {
  cancel_->store(true);
  Finish();
}

void Execution::HandleExit(int exit_code) {
  LOG(INFO) << "Program of session " << session_id_ << " exited with "
            << exit_code;
  exited_ = true;
  std::shared_ptr<Sandbox> sandbox;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    sandbox = sandbox_;
  }
  // Background children would keep the pipes open.
  if (sandbox) {
    sandbox->KillProcessGroups();
  }
  MaybeFinish();
}

void Execution::HandleDrained() {
  drained_ = true;
  MaybeFinish();
}

void Execution::HandleTimeout(const ErrorCode& error_code) {
  if (error_code == boost::asio::error::operation_aborted || finished_) {
    return;
  }
  LOG(INFO) << "Session " << session_id_ << " timed out";
  channel_->Push(Event::kError,
                 "Execution timed out after " +
                     std::to_string(manager_.options_.timeout.count()) +
                     " seconds");
  Stop();
}

void Execution::MaybeFinish() {
  if (exited_ && drained_) {
    Finish();
  }
}

void Execution::Finish() {
  if (finished_.exchange(true)) {
    return;
  }
  std::shared_ptr<Sandbox> sandbox;
  std::shared_ptr<ExecutionHandle> handle;
  std::shared_ptr<StreamPump> pump;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = SessionState::kTerminating;
    sandbox.swap(sandbox_);
    handle.swap(handle_);
    pump.swap(pump_);
  }
  auto self = shared_from_this();
  strand_.dispatch([self]() { self->timer_.cancel(); });
  if (pump) {
    pump->Close();
  }
  if (handle) {
    handle->Kill();
  }
  if (sandbox) {
    sandbox->Destroy();
  }
  manager_.Release(session_id_, this);
  SetState(SessionState::kIdle);
  channel_->Close();
  LOG(INFO) << "Session " << session_id_ << " finished";
}

void Execution::Fail(const String& message) {
  LOG(INFO) << "Session " << session_id_ << " failed: " << message;
  channel_->Push(Event::kError, message);
  Finish();
}

}  // namespace runbox
