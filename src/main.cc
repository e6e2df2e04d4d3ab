#include <signal.h>
#include <gflags/gflags.h>
#include <glog/logging.h>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/asio.hpp>
#include <thread>
#include "dependency_cache.h"
#include "http_server.h"
#include "sandbox.h"
#include "session_manager.h"

DEFINE_string(address, "0.0.0.0", "Address to listen on.");
DEFINE_int32(port, 8080, "Port to listen on.");
DEFINE_int32(io_threads, 4, "Threads running the event loop.");
DEFINE_string(sandbox_root, "/tmp/runbox/sandboxes",
              "Directory holding one directory per live sandbox.");
DEFINE_string(cache_root, "/tmp/runbox/cache",
              "Directory of the shared dependency cache.");
DEFINE_string(isolation, "namespaces",
              "Sandbox isolation: namespaces or none.");
DEFINE_int32(memory_limit_mb, 1024,
             "Address space limit of sandboxed processes, 0 for none.");
DEFINE_int32(tmpfs_size_mb, 64, "Size of the sandbox root and /tmp.");
DEFINE_int32(timeout_seconds, 30, "Wall-clock limit of a program run.");
DEFINE_int32(install_timeout_seconds, 300,
             "Wall-clock limit of a dependency install.");
DEFINE_string(system_mounts, "/bin,/etc,/lib,/lib64,/usr",
              "Host directories mounted read-only into every sandbox.");

namespace {

bool ValidatePositive(const char* flagname, int32_t value) {
  if (value > 0) {
    return true;
  }
  fprintf(stderr, "--%s must be positive\n", flagname);
  return false;
}

DEFINE_validator(io_threads, &ValidatePositive);
DEFINE_validator(timeout_seconds, &ValidatePositive);
DEFINE_validator(install_timeout_seconds, &ValidatePositive);
DEFINE_validator(tmpfs_size_mb, &ValidatePositive);

runbox::SandboxOptions MakeSandboxOptions() {
  runbox::SandboxOptions options;
  options.root = FLAGS_sandbox_root;
  if (FLAGS_isolation == "none") {
    options.isolation = runbox::Isolation::kNone;
  } else {
    CHECK_EQ(FLAGS_isolation, "namespaces") << "unknown --isolation";
    options.isolation = runbox::Isolation::kNamespaces;
  }
  options.memory_limit_bytes = std::size_t(FLAGS_memory_limit_mb) << 20;
  options.tmpfs_size_bytes = std::size_t(FLAGS_tmpfs_size_mb) << 20;
  runbox::Vector<runbox::String> mounts;
  boost::algorithm::split(mounts, FLAGS_system_mounts,
                          boost::algorithm::is_any_of(","),
                          boost::algorithm::token_compress_on);
  options.read_only_mounts.clear();
  for (const auto& mount : mounts) {
    if (!mount.empty()) {
      options.read_only_mounts.emplace_back(mount);
    }
  }
  return options;
}

}  // namespace

int main(int argc, char* argv[]) {
  gflags::SetUsageMessage("Sandboxed code execution daemon.");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);
  google::InstallFailureSignalHandler();
  // Peers and programs closing their end of a pipe must not kill us.
  signal(SIGPIPE, SIG_IGN);

  runbox::SandboxOptions sandbox_options = MakeSandboxOptions();
  if (sandbox_options.isolation == runbox::Isolation::kNamespaces &&
      !runbox::NamespacesAvailable()) {
    LOG(WARNING) << "Unprivileged user namespaces are unavailable; "
                 << "restart with --isolation=none to run without them";
    return 1;
  }
  runbox::SandboxProvisioner provisioner(sandbox_options);
  std::size_t stale = provisioner.RecoverStale();
  if (stale) {
    LOG(INFO) << "Removed " << stale << " stale sandboxes";
  }
  runbox::DependencyCache cache(FLAGS_cache_root);

  boost::asio::io_service io_service;
  boost::asio::io_service::work work(io_service);
  runbox::SessionOptions session_options;
  session_options.timeout = std::chrono::seconds(FLAGS_timeout_seconds);
  session_options.install_timeout =
      std::chrono::seconds(FLAGS_install_timeout_seconds);
  runbox::SessionManager sessions(io_service, provisioner, cache,
                                  session_options);

  runbox::ServerOptions server_options;
  server_options.address = FLAGS_address;
  server_options.port = static_cast<unsigned short>(FLAGS_port);
  runbox::HttpServer server(sessions, server_options);
  server.Listen();

  boost::asio::signal_set signals(io_service, SIGINT, SIGTERM);
  signals.async_wait([&server](const boost::system::error_code& error_code,
                               int signal_number) {
    if (!error_code) {
      LOG(INFO) << "Received signal " << signal_number;
      server.Stop();
    }
  });

  std::vector<std::thread> threads;
  for (int i = 0; i < FLAGS_io_threads; i++) {
    threads.emplace_back([&io_service]() { io_service.run(); });
  }
  server.Run();

  sessions.Shutdown();
  io_service.stop();
  for (auto& thread : threads) {
    thread.join();
  }
  LOG(INFO) << "Exiting";
  return 0;
}
