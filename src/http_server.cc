#include "http_server.h"

#include <sys/socket.h>
#include <memory>
#include <thread>
#include "error.h"
#include "protocol.h"

namespace runbox {

namespace http = boost::beast::http;
using boost::asio::ip::tcp;

namespace {

HttpServer::Response MakeResponse(const HttpServer::Request& request,
                                  http::status status,
                                  String body) {
  HttpServer::Response response{status, request.version()};
  response.set(http::field::server, "runbox");
  response.set(http::field::content_type, "application/json");
  response.keep_alive(request.keep_alive());
  response.body() = std::move(body);
  response.prepare_payload();
  return response;
}

}  // namespace

HttpServer::HttpServer(SessionManager& sessions, ServerOptions options)
    : sessions_(sessions), options_(std::move(options)), acceptor_(loop_) {}

void HttpServer::Listen() {
  tcp::endpoint endpoint(boost::asio::ip::make_address(options_.address),
                         options_.port);
  acceptor_.open(endpoint.protocol());
  acceptor_.set_option(tcp::acceptor::reuse_address(true));
  acceptor_.bind(endpoint);
  acceptor_.listen();
  running_ = true;
  LOG(INFO) << "Listening on " << acceptor_.local_endpoint();
}

unsigned short HttpServer::port() const {
  return acceptor_.local_endpoint().port();
}

void HttpServer::Run() {
  while (running_) {
    auto socket = std::make_unique<tcp::socket>(loop_);
    ErrorCode error_code;
    acceptor_.accept(*socket, error_code);
    if (error_code) {
      if (running_ && error_code != boost::asio::error::operation_aborted) {
        LOG(WARNING) << "Accept failed: " << error_code.message();
        continue;
      }
      break;
    }
    int fd = socket->native_handle();
    {
      std::lock_guard<std::mutex> lock(mutex_);
      // Stop has already shut down the connections it knew of.
      if (!running_) {
        break;
      }
      connections_.insert(fd);
      active_++;
    }
    std::thread([this, fd](std::unique_ptr<tcp::socket> socket) {
      Serve(*socket);
      std::lock_guard<std::mutex> lock(mutex_);
      connections_.erase(fd);
      socket.reset();
      if (--active_ == 0) {
        idle_.notify_all();
      }
    }, std::move(socket)).detach();
  }
  LOG(INFO) << "Stopped accepting connections";
  std::unique_lock<std::mutex> lock(mutex_);
  if (active_) {
    LOG(INFO) << "Waiting for " << active_ << " connections";
  }
  idle_.wait(lock, [this]() { return active_ == 0; });
}

void HttpServer::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  ErrorCode ignored;
  // Wakes the blocking accept.
  ::shutdown(acceptor_.native_handle(), SHUT_RDWR);
  acceptor_.close(ignored);
  std::lock_guard<std::mutex> lock(mutex_);
  // Blocked reads and writes fail; the sockets are closed by their threads.
  for (int fd : connections_) {
    ::shutdown(fd, SHUT_RDWR);
  }
}

void HttpServer::Serve(tcp::socket& socket) {
  boost::beast::flat_buffer buffer;
  ErrorCode error_code;
  for (;;) {
    Request request;
    http::read(socket, buffer, request, error_code);
    if (error_code) {
      if (error_code != http::error::end_of_stream) {
        VLOG(1) << "Reading request failed: " << error_code.message();
      }
      break;
    }
    VLOG(1) << request.method_string() << " " << request.target();
    if (request.target() == "/execute" &&
        request.method() == http::verb::post) {
      // The connection ends with the stream.
      StreamExecution(socket, request);
      break;
    }
    Response response = Handle(request);
    http::write(socket, response, error_code);
    if (error_code || !response.keep_alive()) {
      break;
    }
  }
  socket.shutdown(tcp::socket::shutdown_send, error_code);
}

HttpServer::Response HttpServer::Handle(const Request& request) {
  if (request.target() != "/execute" && request.target() != "/input" &&
      request.target() != "/stop") {
    return MakeResponse(request, http::status::not_found,
                        R"({"success":false,"error":"Not found"})");
  }
  if (request.method() != http::verb::post) {
    return MakeResponse(request, http::status::method_not_allowed,
                        R"({"success":false,"error":"Method not allowed"})");
  }
  String session_id;
  if (request.target() == "/input") {
    String input;
    ErrorCode ec = ParseInputRequest(request.body(), session_id, input);
    if (ec) {
      return MakeResponse(request, http::status::bad_request,
                          EncodeResult(ec));
    }
    ec = sessions_.WriteInput(session_id, input);
    return MakeResponse(
        request, ec ? http::status::not_found : http::status::ok,
        EncodeResult(ec));
  }
  if (request.target() == "/stop") {
    ErrorCode ec = ParseStopRequest(request.body(), session_id);
    if (ec) {
      return MakeResponse(request, http::status::bad_request,
                          EncodeResult(ec));
    }
    ec = sessions_.Stop(session_id);
    if (ec) {
      VLOG(1) << "Stop of session " << session_id << ": " << ec.message();
    }
    return MakeResponse(request, http::status::ok, EncodeResult(ErrorCode()));
  }
  return MakeResponse(request, http::status::bad_request,
                      EncodeResult(Errc::kInvalidBundle));
}

void HttpServer::StreamExecution(tcp::socket& socket, const Request& request) {
  ExecuteRequest execute;
  ErrorCode ec = ParseExecuteRequest(request.body(), execute);
  std::shared_ptr<EventChannel> channel;
  if (!ec) {
    // Provisioning and installs report on the stream, so a consumer that
    // leaves during them is noticed.
    channel = sessions_.StartAsync(execute, ec);
  }
  if (!channel) {
    Response response = MakeResponse(
        request,
        ec == Errc::kCancelled ? http::status::service_unavailable
                               : http::status::bad_request,
        EncodeResult(ec));
    response.keep_alive(false);
    http::write(socket, response, ec);
    return;
  }

  http::response<http::empty_body> response{http::status::ok,
                                            request.version()};
  response.set(http::field::server, "runbox");
  response.set(http::field::content_type, "text/event-stream");
  response.set(http::field::cache_control, "no-cache");
  response.keep_alive(false);
  response.chunked(true);
  http::response_serializer<http::empty_body> serializer{response};
  http::write_header(socket, serializer, ec);

  while (!ec) {
    Optional<Event> event = channel->ReceiveFor(options_.keep_alive_interval);
    String frame;
    if (event) {
      frame = EncodeEvent(*event);
    } else if (channel->drained()) {
      break;
    } else {
      frame = EncodeKeepAlive();
    }
    boost::asio::write(socket, http::make_chunk(boost::asio::buffer(frame)),
                       ec);
    if (event && event->type == Event::kEnd) {
      break;
    }
  }
  if (ec) {
    VLOG(1) << "Event stream of " << execute.session_id
            << " broken: " << ec.message();
    channel->Disconnect();
    return;
  }
  boost::asio::write(socket, http::make_chunk_last(), ec);
  if (ec) {
    VLOG(1) << "Closing event stream of " << execute.session_id
            << " failed: " << ec.message();
  }
}

}  // namespace runbox
