#ifndef RUNBOX_STREAM_H
#define RUNBOX_STREAM_H

#include <array>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include "sandbox.h"
#include "shim.h"

namespace runbox {

struct Event {
  enum Type {
    kOutput,
    kError,
    kEnd,
  };

  Type type;
  String data;
};

const char* EventTypeName(Event::Type type);

// Ordered event stream of one run. Producers push from any thread; the
// stream ends with exactly one kEnd event, after which pushes are dropped.
class EventChannel {
 public:
  EventChannel() = default;
  EventChannel(const EventChannel&) = delete;
  EventChannel& operator=(const EventChannel&) = delete;

  // Returns false when the channel is already closed or disconnected.
  bool Push(Event::Type type, String data);

  // Appends kEnd. Only the first call has an effect.
  bool Close();

  // Blocks until the next event. None once kEnd has been received.
  Optional<Event> Receive();

  // As Receive, but gives up after |timeout|.
  Optional<Event> ReceiveFor(std::chrono::milliseconds timeout);

  // True once kEnd has been handed to the consumer.
  bool drained() const;
  bool closed() const;

  // The consumer went away. Fires the disconnect handler once and drops
  // every later event.
  void Disconnect();

  // Runs immediately when the consumer has already disconnected.
  void SetDisconnectHandler(std::function<void()> handler);

 private:
  Optional<Event> PopLocked();

  mutable std::mutex mutex_;
  std::condition_variable ready_;
  std::deque<Event> events_;
  bool closed_ = false;
  bool drained_ = false;
  bool disconnected_ = false;
  std::function<void()> disconnect_handler_;
};

// Removes NUL and the C0 controls 0x01-0x08 from program output.
String StripControlBytes(StringView text);

// Length of the longest prefix of |text| that does not end inside a UTF-8
// multibyte sequence.
std::size_t CompleteUtf8Prefix(StringView text);

// Moves bytes between an execution handle and an event channel. All work is
// serialized on |strand|. |on_drained| runs on the strand once stdout and
// stderr both reached end of file.
class StreamPump : public std::enable_shared_from_this<StreamPump> {
 public:
  StreamPump(EventLoop::strand strand,
             std::shared_ptr<ExecutionHandle> handle,
             std::shared_ptr<EventChannel> channel,
             std::function<void()> on_drained);

  void Start();

  // Queues |data| for the program's stdin.
  void Write(String data);

  // Cancels outstanding reads and writes.
  void Close();

 private:
  using Buffer = std::array<char, 4096>;

  struct Source {
    boost::process::async_pipe* pipe;
    Event::Type type;
    Buffer buffer;
    // Trailing bytes of an incomplete UTF-8 sequence.
    String carry;
  };

  void StartRead(Source& source);
  void HandleRead(Source& source,
                  const ErrorCode& error_code,
                  std::size_t length);
  void StartWrite();
  void HandleWrite(const ErrorCode& error_code, std::size_t length);

  EventLoop::strand strand_;
  std::shared_ptr<ExecutionHandle> handle_;
  std::shared_ptr<EventChannel> channel_;
  std::function<void()> on_drained_;
  Source stdout_;
  Source stderr_;
  int open_streams_ = 2;
  std::deque<String> pending_writes_;
  bool closed_ = false;
};

}  // namespace runbox

#endif  // RUNBOX_STREAM_H
