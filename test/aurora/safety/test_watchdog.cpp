/*
 * Copyright (c) 2024 Aurora Poller Project
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "aurora_utils/safety/watchdog.hpp"
using aurora::safety::Watchdog;
using namespace std::chrono_literals;

#include <gtest/gtest.h>


TEST(WatchdogTest, TripsAfterTimeout) {
  Watchdog watchdog(std::chrono::milliseconds(50));
  auto start_time = std::chrono::steady_clock::now();
  watchdog.reset(start_time);

  ASSERT_FALSE(watchdog.tripped(start_time));

  // Just under the timeout
  ASSERT_FALSE(watchdog.tripped(start_time + 40ms));
  // Exactly at the timeout is still inside the window
  ASSERT_FALSE(watchdog.tripped(start_time + 50ms));

  ASSERT_TRUE(watchdog.tripped(start_time + 60ms));
}

TEST(WatchdogTest, ResetRestartsWindow) {
  Watchdog watchdog(std::chrono::milliseconds(50));
  auto start_time = std::chrono::steady_clock::now();
  watchdog.reset(start_time);

  auto time1 = start_time + 30ms;
  watchdog.reset(time1);

  ASSERT_FALSE(watchdog.tripped(time1 + 30ms));
  ASSERT_TRUE(watchdog.tripped(time1 + 60ms));
}

TEST(WatchdogTest, StaysTrippedUntilReset) {
  Watchdog watchdog(std::chrono::milliseconds(50));
  auto start_time = std::chrono::steady_clock::now();
  watchdog.reset(start_time);

  auto trip_time = start_time + 60ms;
  ASSERT_TRUE(watchdog.tripped(trip_time));
  // Going back inside the window does not clear the trip
  ASSERT_TRUE(watchdog.tripped(start_time + 10ms));

  watchdog.reset(trip_time);
  ASSERT_FALSE(watchdog.tripped(trip_time));
  ASSERT_FALSE(watchdog.tripped(trip_time + 50ms));
}

TEST(WatchdogTest, DisarmedNeverTrips) {
  Watchdog watchdog(std::chrono::milliseconds(50));
  auto start_time = std::chrono::steady_clock::now();

  // Not armed until the first reset
  ASSERT_FALSE(watchdog.armed());
  ASSERT_FALSE(watchdog.tripped(start_time + 1h));

  watchdog.reset(start_time);
  ASSERT_TRUE(watchdog.armed());
  watchdog.disarm();
  ASSERT_FALSE(watchdog.tripped(start_time + 1h));
}

TEST(WatchdogTest, DeadlineFollowsWindowStart) {
  Watchdog watchdog(std::chrono::seconds(30));
  auto start_time = std::chrono::steady_clock::now();
  watchdog.reset(start_time);

  EXPECT_EQ(watchdog.deadline(), start_time + 30s);
  EXPECT_EQ(watchdog.timeout(), Watchdog::Duration(30s));

  watchdog.reset(start_time + 5s);
  EXPECT_EQ(watchdog.deadline(), start_time + 35s);
}
