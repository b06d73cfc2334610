/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "utils/channel.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <optional>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using namespace weave;

/**
 * @file channel_test.cpp
 * @brief Unit tests for the bounded Channel covering send/receive behavior.
 */

/**
 * @brief Values come out in the order they were sent.
 */
TEST(ChannelTest, FifoOrder) {
  auto [recv, send] = Channel<int>::create_channel(8);

  ASSERT_TRUE(send.send(1));
  ASSERT_TRUE(send.send(2));
  ASSERT_TRUE(send.send(3));

  EXPECT_EQ(recv.receive(), 1);
  EXPECT_EQ(recv.receive(), 2);
  EXPECT_EQ(recv.receive(), 3);
}

/**
 * @brief trySend reports Full at capacity and succeeds after a receive.
 */
TEST(ChannelTest, TrySendRespectsCapacity) {
  auto [recv, send] = Channel<int>::create_channel(2);

  EXPECT_EQ(send.trySend(1), SendStatus::Sent);
  EXPECT_EQ(send.trySend(2), SendStatus::Sent);
  EXPECT_EQ(send.trySend(3), SendStatus::Full);
  EXPECT_EQ(recv.size(), 2);

  EXPECT_EQ(recv.receive(), 1);
  EXPECT_EQ(send.trySend(3), SendStatus::Sent);
}

/**
 * @brief sendFor gives up after the timeout when nobody consumes.
 */
TEST(ChannelTest, SendForTimesOut) {
  auto [recv, send] = Channel<int>::create_channel(1);

  ASSERT_EQ(send.trySend(1), SendStatus::Sent);
  auto started = std::chrono::steady_clock::now();
  EXPECT_EQ(send.sendFor(2, 20ms), SendStatus::Timeout);
  EXPECT_GE(std::chrono::steady_clock::now() - started, 20ms);
}

/**
 * @brief A blocked sender resumes once the receiver frees capacity.
 */
TEST(ChannelTest, BlockedSendResumes) {
  auto [recv, send] = Channel<int>::create_channel(1);
  ASSERT_TRUE(send.send(1));

  std::atomic_bool sent = false;
  std::thread t([&, &send = send] {
    sent = send.send(2);
  });

  std::this_thread::sleep_for(30ms);
  EXPECT_FALSE(sent);
  EXPECT_EQ(recv.receive(), 1);
  t.join();
  EXPECT_TRUE(sent);
  EXPECT_EQ(recv.receive(), 2);
}

/**
 * @brief Destroying the last sender wakes a waiting receiver with no value
 * once the queue is drained.
 */
TEST(ChannelTest, SenderDestructionNotifiesReceiver) {
  std::optional<Channel<int>::Receiver> recv;
  std::optional<Channel<int>::Sender> send;

  std::tie(recv, send) = Channel<int>::create_channel(4);
  ASSERT_TRUE(send->send(7));

  std::optional<int> first;
  std::optional<int> second;
  std::thread t([&] {
    first = recv->receive();
    second = recv->receive();
  });

  std::this_thread::sleep_for(50ms);
  send.reset();
  t.join();

  EXPECT_EQ(first, 7);
  EXPECT_FALSE(second.has_value());
  EXPECT_TRUE(recv->isFinished());
}

/**
 * @brief Closing the receiver fails pending and future sends.
 */
TEST(ChannelTest, CloseFailsSenders) {
  std::optional<Channel<int>::Receiver> recv;
  std::optional<Channel<int>::Sender> send;

  std::tie(recv, send) = Channel<int>::create_channel(1);
  ASSERT_TRUE(send->send(1));

  std::atomic_bool result = true;
  std::thread t([&] { result = send->send(2); });
  std::this_thread::sleep_for(30ms);
  recv.reset();
  t.join();

  EXPECT_FALSE(result);
  EXPECT_TRUE(send->isClosed());
  EXPECT_EQ(send->trySend(3), SendStatus::Closed);
}

/**
 * @brief receiveFor returns nothing after the timeout on an idle channel.
 */
TEST(ChannelTest, ReceiveForTimesOut) {
  auto [recv, send] = Channel<int>::create_channel(1);

  EXPECT_FALSE(recv.receiveFor(10ms).has_value());
  EXPECT_FALSE(recv.isFinished());
}

/**
 * @brief Several senders feed one receiver without losing values.
 */
TEST(ChannelTest, ManyProducers) {
  constexpr int kProducers = 4;
  constexpr int kEach = 250;
  auto [recv, send] = Channel<int>::create_channel(16);

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([send = send]() mutable {
      for (int i = 0; i < kEach; ++i) {
        ASSERT_TRUE(send.send(1));
      }
    });
  }

  int total = 0;
  for (int i = 0; i < kProducers * kEach; ++i) {
    total += recv.receive().value_or(0);
  }
  for (auto &t : producers) {
    t.join();
  }
  EXPECT_EQ(total, kProducers * kEach);
}
