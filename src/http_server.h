#ifndef RUNBOX_HTTP_SERVER_H
#define RUNBOX_HTTP_SERVER_H

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <set>
#include "session_manager.h"
#include "shim.h"

namespace runbox {

struct ServerOptions {
  String address = "0.0.0.0";
  // 0 picks a free port.
  unsigned short port = 8080;
  // Idle time after which an event stream gets a keep-alive comment; a
  // consumer that went away is noticed on that write.
  std::chrono::milliseconds keep_alive_interval{5000};
};

// HTTP/1.1 front end of the session manager:
//   POST /execute  starts a run and streams its events as text/event-stream
//   POST /input    relays a line to the program's stdin
//   POST /stop     stops the run of a session
// Every connection is served by its own thread with blocking I/O. Run
// returns only after every connection thread has ended.
class HttpServer {
 public:
  using Request =
      boost::beast::http::request<boost::beast::http::string_body>;
  using Response =
      boost::beast::http::response<boost::beast::http::string_body>;

  HttpServer(SessionManager& sessions, ServerOptions options);

  // Binds the listening socket. Throws SystemError.
  void Listen();

  // Accepts connections until Stop, then waits for open connections.
  void Run();

  // Stops accepting and shuts down every open connection.
  void Stop();

  // The bound port, valid after Listen.
  unsigned short port() const;

  // Answers every request except the event stream of /execute.
  Response Handle(const Request& request);

 private:
  void Serve(boost::asio::ip::tcp::socket& socket);
  void StreamExecution(boost::asio::ip::tcp::socket& socket,
                       const Request& request);

  SessionManager& sessions_;
  const ServerOptions options_;
  EventLoop loop_;
  boost::asio::ip::tcp::acceptor acceptor_;
  std::atomic<bool> running_{false};

  std::mutex mutex_;
  std::condition_variable idle_;
  // Native handles of the connections being served.
  std::set<int> connections_;
  int active_ = 0;
};

}  // namespace runbox

#endif  // RUNBOX_HTTP_SERVER_H
