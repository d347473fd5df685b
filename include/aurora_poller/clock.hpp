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

#ifndef AURORA_POLLER__CLOCK_HPP_
#define AURORA_POLLER__CLOCK_HPP_

#pragma once

#include <chrono>
#include <thread>

namespace aurora_poller
{

using TimePoint = std::chrono::steady_clock::time_point;
using Duration = std::chrono::steady_clock::duration;

// Source of time for the session and poller; tests substitute a fake
class Clock
{
public:
  virtual ~Clock() = default;

  virtual TimePoint now() const = 0;
  virtual void sleepUntil(TimePoint when) = 0;
};

class SteadyClock : public Clock
{
public:
  TimePoint now() const override {return std::chrono::steady_clock::now();}
  void sleepUntil(TimePoint when) override {std::this_thread::sleep_until(when);}
};

} // namespace aurora_poller
#endif  // AURORA_POLLER__CLOCK_HPP_
