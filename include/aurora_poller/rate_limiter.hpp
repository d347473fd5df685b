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

#ifndef AURORA_POLLER__RATE_LIMITER_HPP_
#define AURORA_POLLER__RATE_LIMITER_HPP_

#pragma once

#include <cstdint>

#include "aurora_poller/clock.hpp"

namespace aurora_poller
{

/**
 * Spaces poll ticks at least one interval apart.
 *
 * The first @c skip_ticks ticks are allowed as soon as the previous one
 * finished, so an initial value comes out immediately. Every later tick is
 * allowed no earlier than one interval after the previous emission.
 */
class RateLimiter
{
public:
  RateLimiter(Duration interval, uint32_t skip_ticks, TimePoint start);

  TimePoint nextAllowed() const {return next_allowed_;}
  bool ready(TimePoint now) const {return now >= next_allowed_;}

  // Record an emission at @p now and schedule the next tick
  void onEmit(TimePoint now);

  uint32_t remainingSkips() const {return remaining_skips_;}
  Duration interval() const {return interval_;}

private:
  Duration interval_;
  uint32_t remaining_skips_;
  TimePoint next_allowed_;
};

} // namespace aurora_poller
#endif  // AURORA_POLLER__RATE_LIMITER_HPP_
