#include "stream.h"

#include <gtest/gtest.h>
#include <atomic>
#include <thread>

namespace runbox {
namespace {

TEST(EventChannelTest, DeliversInOrderAndEndsOnce) {
  EventChannel channel;
  EXPECT_TRUE(channel.Push(Event::kOutput, "A\n"));
  EXPECT_TRUE(channel.Push(Event::kError, "warn\n"));
  EXPECT_TRUE(channel.Push(Event::kOutput, "B\n"));
  EXPECT_TRUE(channel.Close());
  EXPECT_FALSE(channel.Close());
  EXPECT_FALSE(channel.Push(Event::kOutput, "late"));

  Optional<Event> event = channel.Receive();
  ASSERT_TRUE(event);
  EXPECT_EQ(event->type, Event::kOutput);
  EXPECT_EQ(event->data, "A\n");
  event = channel.Receive();
  ASSERT_TRUE(event);
  EXPECT_EQ(event->type, Event::kError);
  EXPECT_EQ(event->data, "warn\n");
  event = channel.Receive();
  ASSERT_TRUE(event);
  EXPECT_EQ(event->data, "B\n");
  EXPECT_FALSE(channel.drained());
  event = channel.Receive();
  ASSERT_TRUE(event);
  EXPECT_EQ(event->type, Event::kEnd);
  EXPECT_TRUE(channel.drained());
  EXPECT_FALSE(channel.Receive());
}

TEST(EventChannelTest, ReceiveForTimesOut) {
  EventChannel channel;
  EXPECT_FALSE(channel.ReceiveFor(std::chrono::milliseconds(20)));
  EXPECT_FALSE(channel.drained());
  EXPECT_FALSE(channel.closed());
}

TEST(EventChannelTest, ReceiveWakesOnPushFromAnotherThread) {
  EventChannel channel;
  std::thread producer([&channel]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    channel.Push(Event::kOutput, "hi\n");
    channel.Close();
  });
  Optional<Event> event = channel.Receive();
  ASSERT_TRUE(event);
  EXPECT_EQ(event->data, "hi\n");
  event = channel.Receive();
  ASSERT_TRUE(event);
  EXPECT_EQ(event->type, Event::kEnd);
  producer.join();
}

TEST(EventChannelTest, ConcurrentClosersProduceOneEnd) {
  EventChannel channel;
  std::atomic<int> closed{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; i++) {
    threads.emplace_back([&]() {
      if (channel.Close()) {
        closed++;
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  EXPECT_EQ(closed.load(), 1);
  Optional<Event> event = channel.Receive();
  ASSERT_TRUE(event);
  EXPECT_EQ(event->type, Event::kEnd);
  EXPECT_FALSE(channel.ReceiveFor(std::chrono::milliseconds(1)));
}

TEST(EventChannelTest, DisconnectFiresHandlerOnce) {
  EventChannel channel;
  int calls = 0;
  channel.SetDisconnectHandler([&calls]() { calls++; });
  channel.Disconnect();
  channel.Disconnect();
  EXPECT_EQ(calls, 1);
  EXPECT_FALSE(channel.Push(Event::kOutput, "dropped"));
}

TEST(EventChannelTest, LateHandlerRunsImmediately) {
  EventChannel channel;
  channel.Disconnect();
  bool called = false;
  channel.SetDisconnectHandler([&called]() { called = true; });
  EXPECT_TRUE(called);
}

TEST(StripControlBytesTest, RemovesTerminalNoise) {
  EXPECT_EQ(StripControlBytes(StringView("a\0b\x01\x08" "c", 6)), "abc");
  EXPECT_EQ(StripControlBytes("tab\tnew\nline\r"), "tab\tnew\nline\r");
  EXPECT_EQ(StripControlBytes("\x1b[31mred\x1b[0m"), "\x1b[31mred\x1b[0m");
  EXPECT_EQ(StripControlBytes("caf\xc3\xa9"), "caf\xc3\xa9");
}

TEST(CompleteUtf8PrefixTest, HoldsBackSplitSequences) {
  EXPECT_EQ(CompleteUtf8Prefix(""), 0u);
  EXPECT_EQ(CompleteUtf8Prefix("abc"), 3u);
  EXPECT_EQ(CompleteUtf8Prefix("a\xc3"), 1u);
  EXPECT_EQ(CompleteUtf8Prefix("a\xc3\xa9"), 3u);
  EXPECT_EQ(CompleteUtf8Prefix("\xe2\x82"), 0u);
  EXPECT_EQ(CompleteUtf8Prefix("\xe2\x82\xac"), 3u);
  EXPECT_EQ(CompleteUtf8Prefix("x\xf0\x9f\x98"), 1u);
  EXPECT_EQ(CompleteUtf8Prefix("x\xf0\x9f\x98\x80"), 5u);
}

TEST(EventTypeNameTest, WireNames) {
  EXPECT_STREQ(EventTypeName(Event::kOutput), "output");
  EXPECT_STREQ(EventTypeName(Event::kError), "error");
  EXPECT_STREQ(EventTypeName(Event::kEnd), "end");
}

}  // namespace
}  // namespace runbox
