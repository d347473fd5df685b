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

#ifndef AURORA_UTILS__SAFETY__WATCHDOG_HPP_
#define AURORA_UTILS__SAFETY__WATCHDOG_HPP_

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>

namespace aurora
{
namespace safety
{

/**
 * Trips once more than the timeout has passed since the window was started.
 *
 * Time is always passed in so the watchdog can be driven by a fake clock.
 * Once tripped it stays tripped until reset.
 */
class Watchdog
{
public:
  using TimePoint = std::chrono::steady_clock::time_point;
  using Duration = std::chrono::steady_clock::duration;

  explicit Watchdog(Duration timeout = std::chrono::seconds(1));

  // interval * multiplier; nullopt when either factor is not positive or the
  // product does not fit in Duration
  static std::optional<Duration> scaledWindow(Duration interval, uint32_t multiplier);

  // Start a new window at @p now
  void reset(TimePoint now);
  bool tripped(TimePoint now);

  TimePoint deadline() const {return window_start_ + timeout_;}
  Duration timeout() const {return timeout_;}
  bool armed() const {return armed_;}

  // Disarm; tripped() is false until the next reset()
  void disarm();

private:
  Duration timeout_;
  TimePoint window_start_;
  bool armed_ = false;
  bool tripped_ = false;
};

} // namespace safety
} // namespace aurora

#endif  // AURORA_UTILS__SAFETY__WATCHDOG_HPP_
