#include "stream.h"

#include <boost/bind.hpp>

namespace runbox {

const char* EventTypeName(Event::Type type) {
  switch (type) {
    case Event::kOutput:
      return "output";
    case Event::kError:
      return "error";
    case Event::kEnd:
      return "end";
  }
  return "unknown";
}

bool EventChannel::Push(Event::Type type, String data) {
  CHECK_NE(type, Event::kEnd) << "use Close()";
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_ || disconnected_) {
      return false;
    }
    events_.push_back(Event{type, std::move(data)});
  }
  ready_.notify_all();
  return true;
}

bool EventChannel::Close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return false;
    }
    closed_ = true;
    events_.push_back(Event{Event::kEnd, String()});
  }
  ready_.notify_all();
  return true;
}

Optional<Event> EventChannel::PopLocked() {
  if (events_.empty() || drained_) {
    return boost::none;
  }
  Event event = std::move(events_.front());
  events_.pop_front();
  if (event.type == Event::kEnd) {
    drained_ = true;
  }
  return event;
}

Optional<Event> EventChannel::Receive() {
  std::unique_lock<std::mutex> lock(mutex_);
  ready_.wait(lock, [this] { return !events_.empty() || drained_; });
  return PopLocked();
}

Optional<Event> EventChannel::ReceiveFor(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  ready_.wait_for(lock, timeout,
                  [this] { return !events_.empty() || drained_; });
  return PopLocked();
}

bool EventChannel::drained() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return drained_;
}

bool EventChannel::closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

void EventChannel::Disconnect() {
  std::function<void()> handler;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (disconnected_) {
      return;
    }
    disconnected_ = true;
    handler.swap(disconnect_handler_);
  }
  if (handler) {
    handler();
  }
}

void EventChannel::SetDisconnectHandler(std::function<void()> handler) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!disconnected_) {
      disconnect_handler_ = std::move(handler);
      return;
    }
  }
  handler();
}

String StripControlBytes(StringView text) {
  String stripped;
  stripped.reserve(text.size());
  for (char c : text) {
    if (static_cast<unsigned char>(c) > 0x08) {
      stripped.push_back(c);
    }
  }
  return stripped;
}

std::size_t CompleteUtf8Prefix(StringView text) {
  std::size_t size = text.size();
  // Look back at most three bytes for the lead byte of the last sequence.
  for (std::size_t back = 1; back <= 3 && back <= size; back++) {
    unsigned char c = text[size - back];
    if ((c & 0xC0) == 0x80) {
      continue;
    }
    std::size_t expected = 1;
    if ((c & 0xE0) == 0xC0) {
      expected = 2;
    } else if ((c & 0xF0) == 0xE0) {
      expected = 3;
    } else if ((c & 0xF8) == 0xF0) {
      expected = 4;
    }
    return expected > back ? size - back : size;
  }
  return size;
}

StreamPump::StreamPump(EventLoop::strand strand,
                       std::shared_ptr<ExecutionHandle> handle,
                       std::shared_ptr<EventChannel> channel,
                       std::function<void()> on_drained)
    : strand_(strand),
      handle_(std::move(handle)),
      channel_(std::move(channel)),
      on_drained_(std::move(on_drained)) {
  stdout_.pipe = &handle_->stdout_pipe();
  stdout_.type = Event::kOutput;
  stderr_.pipe = &handle_->stderr_pipe();
  stderr_.type = Event::kError;
}

void StreamPump::Start() {
  auto self = shared_from_this();
  strand_.dispatch([this, self]() {
    StartRead(stdout_);
    StartRead(stderr_);
  });
}

void StreamPump::StartRead(Source& source) {
  source.pipe->async_read_some(
      boost::asio::buffer(source.buffer),
      strand_.wrap(boost::bind(&StreamPump::HandleRead, shared_from_this(),
                               boost::ref(source),
                               boost::asio::placeholders::error,
                               boost::asio::placeholders::bytes_transferred)));
}

void StreamPump::HandleRead(Source& source,
                            const ErrorCode& error_code,
                            std::size_t length) {
  if (length) {
    source.carry.append(source.buffer.data(), length);
    std::size_t complete =
        error_code ? source.carry.size() : CompleteUtf8Prefix(source.carry);
    String text = StripControlBytes(StringView(source.carry).substr(0, complete));
    source.carry.erase(0, complete);
    VLOG(1) << EventTypeName(source.type) << " chunk of " << length
            << " bytes";
    if (!text.empty()) {
      channel_->Push(source.type, std::move(text));
    }
  }
  if (!error_code) {
    if (!closed_) {
      StartRead(source);
    }
    return;
  }
  if (!source.carry.empty()) {
    channel_->Push(source.type, StripControlBytes(source.carry));
    source.carry.clear();
  }
  if (error_code != boost::asio::error::eof &&
      error_code != boost::asio::error::operation_aborted) {
    LOG(WARNING) << "Reading " << EventTypeName(source.type)
                 << " failed: " << error_code.message();
  }
  if (--open_streams_ == 0 && !closed_ && on_drained_) {
    on_drained_();
  }
}

void StreamPump::Write(String data) {
  auto self = shared_from_this();
  strand_.dispatch([this, self, data]() {
    if (closed_) {
      return;
    }
    pending_writes_.push_back(data);
    if (pending_writes_.size() == 1) {
      StartWrite();
    }
  });
}

void StreamPump::StartWrite() {
  boost::asio::async_write(
      handle_->stdin_pipe(), boost::asio::buffer(pending_writes_.front()),
      strand_.wrap(boost::bind(&StreamPump::HandleWrite, shared_from_this(),
                               boost::asio::placeholders::error,
                               boost::asio::placeholders::bytes_transferred)));
}

void StreamPump::HandleWrite(const ErrorCode& error_code, std::size_t length) {
  if (error_code) {
    // The program closed its stdin or exited.
    VLOG(1) << "stdin write failed: " << error_code.message();
    pending_writes_.clear();
    return;
  }
  pending_writes_.pop_front();
  if (!pending_writes_.empty() && !closed_) {
    StartWrite();
  }
}

void StreamPump::Close() {
  auto self = shared_from_this();
  strand_.dispatch([this, self]() {
    if (closed_) {
      return;
    }
    closed_ = true;
    ErrorCode ignored;
    handle_->stdin_pipe().close(ignored);
    handle_->stdout_pipe().close(ignored);
    handle_->stderr_pipe().close(ignored);
  });
}

}  // namespace runbox
