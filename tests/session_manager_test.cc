#include "session_manager.h"

#include <gtest/gtest.h>
#include <cstdlib>
#include <thread>
#include "error.h"
#include "test_util.h"

namespace runbox {
namespace {

struct Transcript {
  String output;
  String error;
  // Types in arrival order, e.g. "output,error,end".
  String types;
  bool ended = false;
};

// Reads events until end or until |limit| passes.
Transcript Collect(EventChannel& channel,
                   std::chrono::seconds limit = std::chrono::seconds(30)) {
  Transcript transcript;
  auto deadline = std::chrono::steady_clock::now() + limit;
  while (!transcript.ended && std::chrono::steady_clock::now() < deadline) {
    Optional<Event> event = channel.ReceiveFor(std::chrono::milliseconds(100));
    if (!event) {
      continue;
    }
    if (!transcript.types.empty()) {
      transcript.types += ",";
    }
    transcript.types += EventTypeName(event->type);
    switch (event->type) {
      case Event::kOutput:
        transcript.output += event->data;
        break;
      case Event::kError:
        transcript.error += event->data;
        break;
      case Event::kEnd:
        transcript.ended = true;
        break;
    }
  }
  return transcript;
}

ExecuteRequest PythonRequest(const String& session_id, const String& code) {
  ExecuteRequest request;
  request.session_id = session_id;
  request.language = "python";
  request.files = {{"main.py", code}};
  request.entry_file = "main.py";
  return request;
}

class SessionManagerTest : public testing::Test {
 protected:
  SessionManagerTest()
      : provisioner_(MakeOptions(temp_.path())),
        cache_(temp_.path() / "cache"),
        work_(loop_) {
    for (int i = 0; i < 2; i++) {
      threads_.emplace_back([this]() { loop_.run(); });
    }
    MakeManager(std::chrono::seconds(20));
  }

  ~SessionManagerTest() override {
    manager_.reset();
    loop_.stop();
    for (auto& thread : threads_) {
      thread.join();
    }
  }

  static SandboxOptions MakeOptions(const Path& root) {
    SandboxOptions options;
    options.root = root / "sandboxes";
    options.isolation = Isolation::kNone;
    options.memory_limit_bytes = std::size_t(2) << 30;
    return options;
  }

  void MakeManager(std::chrono::seconds timeout) {
    SessionOptions options;
    options.timeout = timeout;
    options.install_timeout = std::chrono::seconds(20);
    manager_.reset();
    manager_.reset(new SessionManager(loop_, provisioner_, cache_, options));
  }

  std::shared_ptr<EventChannel> Start(const ExecuteRequest& request) {
    ErrorCode ec;
    std::shared_ptr<EventChannel> channel = manager_->Start(request, ec);
    EXPECT_FALSE(ec) << ec.message();
    return channel;
  }

  bool WaitForIdle(const String& session_id) {
    for (int i = 0; i < 500; i++) {
      if (manager_->State(session_id) == SessionState::kIdle) {
        return true;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return false;
  }

  TempDir temp_;
  SandboxProvisioner provisioner_;
  DependencyCache cache_;
  EventLoop loop_;
  EventLoop::work work_;
  std::vector<std::thread> threads_;
  std::unique_ptr<SessionManager> manager_;
};

#define REQUIRE_PROGRAM(name)                      \
  if (!HasProgram(name)) {                         \
    GTEST_SKIP() << name << " is not installed";   \
  }

TEST_F(SessionManagerTest, RejectsUnsupportedLanguage) {
  ExecuteRequest request = PythonRequest("s1", "IDENTIFICATION DIVISION.");
  request.language = "cobol";
  ErrorCode ec;
  EXPECT_EQ(manager_->Start(request, ec), nullptr);
  EXPECT_EQ(ec, Errc::kUnsupportedLanguage);
  EXPECT_EQ(provisioner_.live_count(), 0u);
  EXPECT_EQ(provisioner_.destroyed_count(), 0u);
  EXPECT_EQ(CountEntries(provisioner_.options().root), 0u);
  EXPECT_TRUE(manager_->ActiveSessions().empty());
}

TEST_F(SessionManagerTest, RejectsInvalidBundle) {
  ExecuteRequest request = PythonRequest("s1", "print(1)\n");
  request.entry_file = "missing.py";
  ErrorCode ec;
  EXPECT_EQ(manager_->Start(request, ec), nullptr);
  EXPECT_EQ(ec, Errc::kInvalidBundle);

  request = PythonRequest("", "print(1)\n");
  EXPECT_EQ(manager_->Start(request, ec), nullptr);
  EXPECT_EQ(ec, Errc::kInvalidBundle);

  request = PythonRequest("s1", "print(1)\n");
  request.files.push_back({"../escape.py", ""});
  EXPECT_EQ(manager_->Start(request, ec), nullptr);
  EXPECT_EQ(ec, Errc::kInvalidBundle);
  EXPECT_EQ(provisioner_.destroyed_count(), 0u);
}

TEST_F(SessionManagerTest, RunsPythonToCompletion) {
  REQUIRE_PROGRAM("python3");
  std::shared_ptr<EventChannel> channel =
      Start(PythonRequest("hello", "print('hi')\n"));
  ASSERT_NE(channel, nullptr);
  Transcript transcript = Collect(*channel);
  ASSERT_TRUE(transcript.ended);
  EXPECT_EQ(transcript.output, "hi\n");
  EXPECT_EQ(transcript.error, "");
  // The sandbox is gone by the time end is observed.
  EXPECT_EQ(provisioner_.live_count(), 0u);
  EXPECT_EQ(provisioner_.destroyed_count(), 1u);
  EXPECT_EQ(CountEntries(provisioner_.options().root), 0u);
  EXPECT_EQ(manager_->State("hello"), SessionState::kIdle);
  EXPECT_TRUE(manager_->ActiveSessions().empty());
}

TEST_F(SessionManagerTest, StderrBecomesErrorEvents) {
  REQUIRE_PROGRAM("python3");
  std::shared_ptr<EventChannel> channel = Start(PythonRequest(
      "stderr", "import sys\nsys.stderr.write('oops\\n')\nsys.exit(2)\n"));
  Transcript transcript = Collect(*channel);
  ASSERT_TRUE(transcript.ended);
  EXPECT_EQ(transcript.output, "");
  EXPECT_EQ(transcript.error, "oops\n");
}

TEST_F(SessionManagerTest, RelaysInput) {
  REQUIRE_PROGRAM("python3");
  std::shared_ptr<EventChannel> channel = Start(PythonRequest(
      "input", "name = input()\nprint('hello ' + name)\n"));
  EXPECT_EQ(manager_->State("input"), SessionState::kRunning);
  EXPECT_FALSE(manager_->WriteInput("input", "bob"));
  Transcript transcript = Collect(*channel);
  ASSERT_TRUE(transcript.ended);
  EXPECT_EQ(transcript.output, "hello bob\n");
}

TEST_F(SessionManagerTest, DeliversInitialInput) {
  REQUIRE_PROGRAM("python3");
  ExecuteRequest request =
      PythonRequest("initial", "print(input()[::-1])\n");
  request.input = String("abc");
  Transcript transcript = Collect(*Start(request));
  ASSERT_TRUE(transcript.ended);
  EXPECT_EQ(transcript.output, "cba\n");
}

TEST_F(SessionManagerTest, WriteInputWithoutRun) {
  EXPECT_EQ(manager_->WriteInput("nobody", "x"), Errc::kNoActiveSession);
  EXPECT_EQ(manager_->Stop("nobody"), Errc::kNoActiveSession);
  EXPECT_EQ(manager_->State("nobody"), SessionState::kIdle);
}

TEST_F(SessionManagerTest, TimesOut) {
  REQUIRE_PROGRAM("python3");
  MakeManager(std::chrono::seconds(1));
  auto start = std::chrono::steady_clock::now();
  std::shared_ptr<EventChannel> channel = Start(
      PythonRequest("slow", "import time\nprint('start', flush=True)\n"
                            "time.sleep(30)\n"));
  Transcript transcript = Collect(*channel);
  ASSERT_TRUE(transcript.ended);
  EXPECT_EQ(transcript.output, "start\n");
  EXPECT_EQ(transcript.error, "Execution timed out after 1 seconds");
  EXPECT_LT(std::chrono::steady_clock::now() - start,
            std::chrono::seconds(10));
  EXPECT_EQ(provisioner_.live_count(), 0u);
}

TEST_F(SessionManagerTest, ConcurrentStopsTearDownOnce) {
  REQUIRE_PROGRAM("python3");
  std::shared_ptr<EventChannel> channel =
      Start(PythonRequest("stop", "import time\ntime.sleep(30)\n"));
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; i++) {
    threads.emplace_back([this]() {
      ErrorCode ec = manager_->Stop("stop");
      EXPECT_TRUE(!ec || ec == Errc::kNoActiveSession) << ec.message();
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  Transcript transcript = Collect(*channel, std::chrono::seconds(5));
  ASSERT_TRUE(transcript.ended);
  EXPECT_EQ(transcript.types, "end");
  EXPECT_EQ(provisioner_.destroyed_count(), 1u);
  EXPECT_EQ(provisioner_.live_count(), 0u);
  EXPECT_EQ(manager_->Stop("stop"), Errc::kNoActiveSession);
}

TEST_F(SessionManagerTest, StartReplacesCurrentRun) {
  REQUIRE_PROGRAM("python3");
  std::shared_ptr<EventChannel> first =
      Start(PythonRequest("same", "import time\ntime.sleep(30)\n"));
  std::shared_ptr<EventChannel> second =
      Start(PythonRequest("same", "print('second')\n"));
  Transcript replaced = Collect(*first, std::chrono::seconds(5));
  ASSERT_TRUE(replaced.ended);
  EXPECT_EQ(replaced.output, "");
  Transcript transcript = Collect(*second);
  ASSERT_TRUE(transcript.ended);
  EXPECT_EQ(transcript.output, "second\n");
  EXPECT_EQ(provisioner_.destroyed_count(), 2u);
  EXPECT_EQ(provisioner_.live_count(), 0u);
}

TEST_F(SessionManagerTest, DisconnectStopsRun) {
  REQUIRE_PROGRAM("python3");
  std::shared_ptr<EventChannel> channel =
      Start(PythonRequest("gone", "import time\ntime.sleep(30)\n"));
  EXPECT_EQ(provisioner_.live_count(), 1u);
  channel->Disconnect();
  EXPECT_TRUE(WaitForIdle("gone"));
  EXPECT_EQ(provisioner_.live_count(), 0u);
  EXPECT_EQ(provisioner_.destroyed_count(), 1u);
}

TEST_F(SessionManagerTest, KeepsOutputOrder) {
  REQUIRE_PROGRAM("python3");
  Transcript transcript =
      Collect(*Start(PythonRequest("order", "print('A')\nprint('B')\n")));
  ASSERT_TRUE(transcript.ended);
  EXPECT_EQ(transcript.output, "A\nB\n");
}

TEST_F(SessionManagerTest, CompilesAndRunsCpp) {
  REQUIRE_PROGRAM("g++");
  ExecuteRequest request;
  request.session_id = "cpp";
  request.language = "cpp";
  request.files = {{"main.cpp",
                    "#include <iostream>\n"
                    "int main() {\n"
                    "  std::cout << \"A\" << std::endl;\n"
                    "  std::cout << \"B\" << std::endl;\n"
                    "}\n"}};
  request.entry_file = "main.cpp";
  Transcript transcript = Collect(*Start(request), std::chrono::seconds(60));
  ASSERT_TRUE(transcript.ended);
  EXPECT_EQ(transcript.output, "A\nB\n");
}

TEST_F(SessionManagerTest, ImportsProjectModules) {
  REQUIRE_PROGRAM("python3");
  ExecuteRequest request = PythonRequest(
      "project", "from pkg import util\nprint(util.X)\n");
  request.files.push_back({"pkg/__init__.py", ""});
  request.files.push_back({"pkg/util.py", "X = 42\n"});
  Transcript transcript = Collect(*Start(request));
  ASSERT_TRUE(transcript.ended);
  EXPECT_EQ(transcript.output, "42\n");
  EXPECT_EQ(transcript.error, "");
}

TEST_F(SessionManagerTest, UsesCachedDependencies) {
  REQUIRE_PROGRAM("python3");
  const String manifest = "fakepkg==1.0\n";
  Path installed = temp_.path() / "installed";
  WriteFile(installed / "fakepkg" / "__init__.py", "VALUE = 5\n");
  ASSERT_FALSE(cache_.Populate(Language::kPython, manifest, installed));

  ExecuteRequest request = PythonRequest(
      "cached", "import fakepkg\nprint(fakepkg.VALUE)\n");
  request.files.push_back({"requirements.txt", manifest});
  Transcript transcript = Collect(*Start(request));
  ASSERT_TRUE(transcript.ended);
  EXPECT_EQ(transcript.output, "5\n");
  EXPECT_EQ(transcript.error, "");
}

TEST_F(SessionManagerTest, ShutdownStopsEverySession) {
  REQUIRE_PROGRAM("python3");
  std::shared_ptr<EventChannel> a =
      Start(PythonRequest("a", "import time\ntime.sleep(30)\n"));
  std::shared_ptr<EventChannel> b =
      Start(PythonRequest("b", "import time\ntime.sleep(30)\n"));
  EXPECT_EQ(manager_->ActiveSessions().size(), 2u);
  manager_->Shutdown();
  EXPECT_TRUE(Collect(*a, std::chrono::seconds(5)).ended);
  EXPECT_TRUE(Collect(*b, std::chrono::seconds(5)).ended);
  EXPECT_EQ(provisioner_.live_count(), 0u);
  EXPECT_TRUE(manager_->ActiveSessions().empty());
}

TEST_F(SessionManagerTest, RefusesStartsAfterShutdown) {
  manager_->Shutdown();
  ErrorCode ec;
  EXPECT_EQ(manager_->Start(PythonRequest("late", "print(1)\n"), ec),
            nullptr);
  EXPECT_EQ(ec, Errc::kCancelled);
  ec.clear();
  EXPECT_EQ(manager_->StartAsync(PythonRequest("late", "print(1)\n"), ec),
            nullptr);
  EXPECT_EQ(ec, Errc::kCancelled);
  EXPECT_EQ(provisioner_.destroyed_count(), 0u);
  EXPECT_TRUE(manager_->ActiveSessions().empty());
}

TEST_F(SessionManagerTest, StartAsyncStreamsRun) {
  REQUIRE_PROGRAM("python3");
  ErrorCode ec;
  std::shared_ptr<EventChannel> channel =
      manager_->StartAsync(PythonRequest("async", "print('hi')\n"), ec);
  ASSERT_TRUE(channel) << ec.message();
  Transcript transcript = Collect(*channel);
  ASSERT_TRUE(transcript.ended);
  EXPECT_EQ(transcript.output, "hi\n");
  EXPECT_EQ(transcript.types, "output,end");
  EXPECT_TRUE(WaitForIdle("async"));
  EXPECT_EQ(provisioner_.live_count(), 0u);
}

TEST_F(SessionManagerTest, StartAsyncRejectsBeforeLaunch) {
  ExecuteRequest request = PythonRequest("bad", "print(1)\n");
  request.entry_file = "missing.py";
  ErrorCode ec;
  EXPECT_EQ(manager_->StartAsync(request, ec), nullptr);
  EXPECT_EQ(ec, Errc::kInvalidBundle);
  EXPECT_EQ(CountEntries(provisioner_.options().root), 0u);
}

TEST_F(SessionManagerTest, DisconnectDuringLaunch) {
  REQUIRE_PROGRAM("python3");
  ErrorCode ec;
  std::shared_ptr<EventChannel> channel = manager_->StartAsync(
      PythonRequest("gone", "import time\ntime.sleep(30)\n"), ec);
  ASSERT_TRUE(channel) << ec.message();
  channel->Disconnect();
  // Shutdown waits for the launch thread, which must notice the stop.
  auto started = std::chrono::steady_clock::now();
  manager_->Shutdown();
  EXPECT_LT(std::chrono::steady_clock::now() - started,
            std::chrono::seconds(10));
  EXPECT_TRUE(manager_->ActiveSessions().empty());
  EXPECT_EQ(provisioner_.live_count(), 0u);
}

TEST_F(SessionManagerTest, StreamsInstallOutput) {
  REQUIRE_PROGRAM("python3");
  if (std::system("python3 -m pip --version > /dev/null 2>&1") != 0) {
    GTEST_SKIP() << "pip is not installed";
  }
  // Rejected by pip before it touches the network.
  ExecuteRequest request = PythonRequest("install", "print(1)\n");
  request.files.push_back({"requirements.txt", "not a requirement!!\n"});
  Transcript transcript = Collect(*Start(request));
  ASSERT_TRUE(transcript.ended);
  EXPECT_NE(transcript.output.find("requirement"), String::npos)
      << transcript.output;
  EXPECT_NE(transcript.error.find("Dependency installation failed"),
            String::npos);
  EXPECT_EQ(transcript.types.compare(0, 7, "output,"), 0) << transcript.types;
  EXPECT_EQ(transcript.types.substr(transcript.types.size() - 9),
            "error,end");
  EXPECT_FALSE(cache_.Lookup(Language::kPython, "not a requirement!!\n"));
  EXPECT_EQ(provisioner_.live_count(), 0u);
}

}  // namespace
}  // namespace runbox
