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

#ifndef AURORA_POLLER__ENERGY_VOLTAGE_POLLER_HPP_
#define AURORA_POLLER__ENERGY_VOLTAGE_POLLER_HPP_

#pragma once

#include <chrono>
#include <functional>

#include <cstdint>

#include "aurora_utils/safety/watchdog.hpp"
#include "aurora_poller/aurora_session.hpp"
#include "aurora_poller/clock.hpp"
#include "aurora_poller/rate_limiter.hpp"

namespace aurora_poller
{

enum class PollState
{
  IDLE,
  REQUESTING_ENERGY,
  REQUESTING_VOLTAGE,
  EMIT,
  FAILED
};

const char * toString(PollState state);

struct PollerOptions
{
  uint8_t address = 2;
  Duration poll_interval = std::chrono::minutes(5);
  uint32_t timeout_multiplier = 3;
  uint32_t skip_ticks = 2;
};

// Daily energy and input 1 voltage from one tick
struct Reading
{
  uint32_t energy_wh = 0;
  float voltage = 0.0f;
};

/**
 * Periodically reads daily energy then input 1 voltage from one inverter.
 *
 * Each tick sends CumulativeEnergy(DAILY) and, once that is answered,
 * Measure(INPUT1_VOLTAGE, global). A tick must complete within
 * poll_interval * timeout_multiplier of its start. Any failure moves the
 * poller to FAILED, which is terminal.
 */
class EnergyVoltagePoller
{
public:
  EnergyVoltagePoller(AuroraService & service, Clock & clock, const PollerOptions & options);

  // Block until the next reading. Throws AuroraError; STREAM_TERMINATED once failed.
  Reading next();

  // Feed readings to @p sink until the first failure, which propagates
  void run(const std::function<void(const Reading &)> & sink);

  PollState state() const {return state_;}
  uint64_t completedTicks() const {return completed_ticks_;}
  const PollerOptions & options() const {return options_;}

private:
  Reading tick();
  void checkDeadline(const char * phase);

  AuroraService & service_;
  Clock & clock_;
  PollerOptions options_;
  RateLimiter rate_limiter_;
  aurora::safety::Watchdog watchdog_;
  PollState state_ = PollState::IDLE;
  uint64_t completed_ticks_ = 0;
};

} // namespace aurora_poller
#endif  // AURORA_POLLER__ENERGY_VOLTAGE_POLLER_HPP_
