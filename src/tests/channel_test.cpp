#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "utils/channel.hpp"

using namespace xs::utils;

TEST(ChannelTest, DeliversInOrder) {
  auto [tx, rx] = make_channel<int>(8);

  for (int i = 0; i < 5; ++i) {
    EXPECT_TRUE(tx.send(i));
  }
  for (int i = 0; i < 5; ++i) {
    auto value = rx.recv();
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, i);
  }
}

TEST(ChannelTest, EndOfStreamAfterSendersDrop) {
  auto [tx, rx] = make_channel<std::string>(4);
  tx.send("last");
  Sender<std::string> copy = tx;
  tx.reset();

  // One copy still holds the channel open
  EXPECT_FALSE(rx.is_disconnected());
  copy.reset();
  EXPECT_TRUE(rx.is_disconnected());

  // Queued values are still delivered before end of stream
  auto value = rx.recv();
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(*value, "last");
  EXPECT_FALSE(rx.recv().has_value());
}

TEST(ChannelTest, ErrorRaisedAfterQueuedValues) {
  auto [tx, rx] = make_channel<int>(4);
  tx.send(1);
  tx.close_with_error(std::make_exception_ptr(std::runtime_error("source failed")));
  EXPECT_FALSE(tx);

  auto value = rx.recv();
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(*value, 1);
  EXPECT_THROW(rx.recv(), std::runtime_error);
  EXPECT_THROW(rx.try_recv(), std::runtime_error);
}

TEST(ChannelTest, SendFailsOnceReceiverDrops) {
  auto [tx, rx] = make_channel<int>(4);
  EXPECT_FALSE(tx.is_closed());

  rx.reset();
  EXPECT_TRUE(tx.is_closed());
  EXPECT_FALSE(tx.send(1));
  EXPECT_EQ(tx.try_send(1), SendResult::Closed);
}

TEST(ChannelTest, TrySendReportsFull) {
  auto [tx, rx] = make_channel<int>(2);
  EXPECT_EQ(tx.try_send(1), SendResult::Sent);
  EXPECT_EQ(tx.try_send(2), SendResult::Sent);
  EXPECT_EQ(tx.try_send(3), SendResult::Full);
  EXPECT_EQ(rx.size(), 2u);

  EXPECT_EQ(rx.try_recv().value_or(-1), 1);
  EXPECT_EQ(tx.try_send(3), SendResult::Sent);
}

TEST(ChannelTest, SendBlocksWhileFull) {
  auto [tx, rx] = make_channel<int>(1);
  ASSERT_TRUE(tx.send(1));

  std::atomic<bool> second_sent{false};
  std::thread producer([&tx = tx, &second_sent]() {
    tx.send(2);
    second_sent = true;
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_FALSE(second_sent);

  EXPECT_EQ(rx.recv().value_or(-1), 1);
  producer.join();
  EXPECT_TRUE(second_sent);
  EXPECT_EQ(rx.recv().value_or(-1), 2);
}

TEST(ChannelTest, BlockedSenderReleasedWhenReceiverDrops) {
  auto [tx, rx] = make_channel<int>(1);
  ASSERT_TRUE(tx.send(1));

  std::atomic<bool> result{true};
  std::thread producer([&tx = tx, &result]() { result = tx.send(2); });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  rx.reset();
  producer.join();
  EXPECT_FALSE(result);
}

TEST(ChannelTest, RendezvousWaitsForHandoff) {
  auto [tx, rx] = make_channel<int>(0);

  std::atomic<bool> handed_off{false};
  std::thread producer([&tx = tx, &handed_off]() {
    EXPECT_TRUE(tx.send(7));
    handed_off = true;
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_FALSE(handed_off);

  EXPECT_EQ(rx.recv().value_or(-1), 7);
  producer.join();
  EXPECT_TRUE(handed_off);
}

TEST(ChannelTest, RecvForTimesOut) {
  auto [tx, rx] = make_channel<int>(1);
  auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(rx.recv_for(std::chrono::milliseconds(30)).has_value());
  EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(30));
  EXPECT_TRUE(tx.send(1));
}

TEST(ChannelTest, ConcurrentProducers) {
  auto [tx, rx] = make_channel<int>(16);
  const int producers = 4;
  const int per_producer = 250;

  std::vector<std::thread> threads;
  for (int p = 0; p < producers; ++p) {
    threads.emplace_back([tx = tx, p]() {
      for (int i = 0; i < per_producer; ++i) {
        tx.send(p * per_producer + i);
      }
    });
  }
  tx.reset();

  std::vector<bool> seen(producers * per_producer, false);
  int received = 0;
  while (auto value = rx.recv()) {
    EXPECT_FALSE(seen[*value]) << "Duplicate value " << *value;
    seen[*value] = true;
    ++received;
  }

  for (auto& thread : threads) {
    thread.join();
  }
  EXPECT_EQ(received, producers * per_producer);
}
