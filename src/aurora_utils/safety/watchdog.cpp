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

#include "watchdog.hpp"

namespace aurora
{
namespace safety
{

Watchdog::Watchdog(Duration timeout)
: timeout_(timeout)
{
}

std::optional<Watchdog::Duration> Watchdog::scaledWindow(Duration interval, uint32_t multiplier)
{
  if (interval <= Duration::zero() || multiplier == 0) {
    return std::nullopt;
  }
  if (interval > Duration::max() / multiplier) {
    return std::nullopt;
  }
  return interval * multiplier;
}

void Watchdog::reset(TimePoint now)
{
  window_start_ = now;
  armed_ = true;
  tripped_ = false;
}

bool Watchdog::tripped(TimePoint now)
{
  if (!armed_) {
    return false;
  }
  if (!tripped_ && now - window_start_ > timeout_) {
    tripped_ = true;
  }
  return tripped_;
}

void Watchdog::disarm()
{
  armed_ = false;
  tripped_ = false;
}

} // namespace safety
} // namespace aurora
