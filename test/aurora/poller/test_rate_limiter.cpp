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

#include <gtest/gtest.h>

#include <chrono>

#include "aurora_poller/rate_limiter.hpp"

using aurora_poller::RateLimiter;
using aurora_poller::TimePoint;
using namespace std::chrono_literals;

class RateLimiterTest : public ::testing::Test
{
protected:
  const TimePoint start_ = TimePoint{} + 1h;
};

TEST_F(RateLimiterTest, SkippedTicksRunImmediately) {
  RateLimiter limiter(5min, 2, start_);

  EXPECT_TRUE(limiter.ready(start_));

  auto first_emit = start_ + 2s;
  limiter.onEmit(first_emit);
  EXPECT_EQ(limiter.remainingSkips(), 1u);
  EXPECT_TRUE(limiter.ready(first_emit));

  auto second_emit = first_emit + 2s;
  limiter.onEmit(second_emit);
  EXPECT_EQ(limiter.remainingSkips(), 0u);

  // Third tick waits one interval from the second emission
  EXPECT_FALSE(limiter.ready(second_emit));
  EXPECT_FALSE(limiter.ready(second_emit + 5min - 1ms));
  EXPECT_TRUE(limiter.ready(second_emit + 5min));
  EXPECT_EQ(limiter.nextAllowed(), second_emit + 5min);
}

TEST_F(RateLimiterTest, LaterTicksSpacedByInterval) {
  RateLimiter limiter(10s, 2, start_);
  auto now = start_;
  limiter.onEmit(now);
  limiter.onEmit(now);

  for (int i = 0; i < 5; ++i) {
    now = limiter.nextAllowed() + 1s;   // tick takes 1s
    limiter.onEmit(now);
    EXPECT_EQ(limiter.nextAllowed() - now, std::chrono::steady_clock::duration(10s));
  }
}

TEST_F(RateLimiterTest, NoSkipsWaitsForFirstTick) {
  RateLimiter limiter(5min, 0, start_);

  EXPECT_FALSE(limiter.ready(start_));
  EXPECT_EQ(limiter.nextAllowed(), start_ + 5min);

  limiter.onEmit(start_ + 5min);
  EXPECT_EQ(limiter.nextAllowed(), start_ + 10min);
}

TEST_F(RateLimiterTest, SingleSkip) {
  RateLimiter limiter(1s, 1, start_);
  EXPECT_TRUE(limiter.ready(start_));

  limiter.onEmit(start_);
  EXPECT_EQ(limiter.nextAllowed(), start_ + 1s);
}

int main(int argc, char ** argv)
{
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
