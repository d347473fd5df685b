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

#include "aurora_poller/rate_limiter.hpp"

namespace aurora_poller
{

RateLimiter::RateLimiter(Duration interval, uint32_t skip_ticks, TimePoint start)
: interval_(interval), remaining_skips_(skip_ticks),
  next_allowed_(skip_ticks > 0 ? start : start + interval)
{
}

void RateLimiter::onEmit(TimePoint now)
{
  if (remaining_skips_ > 0) {
    --remaining_skips_;
  }
  next_allowed_ = remaining_skips_ > 0 ? now : now + interval_;
}

} // namespace aurora_poller
