/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/impl/watchdog.hpp"

#include <gtest/gtest.h>

#include "testutil/prepare_loggers.hpp"

using namespace std::chrono_literals;
using weave::Watchdog;

class WatchdogTest : public testing::Test {
 protected:
  void SetUp() override {
    watchdog_.setStallHandler(
        [this](const std::string &name) { stalled_.push_back(name); });
  }

  Watchdog watchdog_{testutil::prepareLoggers()};
  std::vector<std::string> stalled_;
  Watchdog::Clock::time_point start_ = Watchdog::Clock::now();
};

/**
 * @given a registered thread that stops pinging
 * @when the timeout passes
 * @then the stall is reported once, not again while shutdown is underway
 */
TEST_F(WatchdogTest, ReportsSilentThreadOnce) {
  auto ping = watchdog_.add();
  watchdog_.check(100ms, start_ + 50ms);
  EXPECT_TRUE(stalled_.empty());

  watchdog_.check(100ms, start_ + 150ms);
  ASSERT_EQ(stalled_.size(), 1);

  watchdog_.check(100ms, start_ + 300ms);
  EXPECT_EQ(stalled_.size(), 1);
}

TEST_F(WatchdogTest, PingKeepsThreadAlive) {
  auto ping = watchdog_.add();
  for (auto offset = 80ms; offset < 1s; offset += 80ms) {
    ping();
    watchdog_.check(100ms, start_ + offset);
  }
  EXPECT_TRUE(stalled_.empty());
}

/**
 * @given a thread that registered and then exited
 * @then it is forgotten and never reported
 */
TEST_F(WatchdogTest, ExitedThreadIsForgotten) {
  std::thread([this] { auto ping = watchdog_.add(); }).join();
  watchdog_.check(100ms, start_ + 1s);
  EXPECT_TRUE(stalled_.empty());
}
