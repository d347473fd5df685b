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

#include "aurora_poller/energy_voltage_poller.hpp"

#include <stdexcept>
#include <string>
#include <variant>

#include "rclcpp/rclcpp.hpp"

namespace aurora_poller
{

namespace proto = aurora::protocol;

const char * toString(PollState state)
{
  switch (state) {
    case PollState::IDLE: return "IDLE";
    case PollState::REQUESTING_ENERGY: return "REQUESTING_ENERGY";
    case PollState::REQUESTING_VOLTAGE: return "REQUESTING_VOLTAGE";
    case PollState::EMIT: return "EMIT";
    case PollState::FAILED: return "FAILED";
  }
  return "UNKNOWN";
}

static Duration timeoutWindow(const PollerOptions & options)
{
  if (options.poll_interval <= Duration::zero()) {
    throw std::invalid_argument("poll_interval must be positive");
  }
  if (options.timeout_multiplier < 1) {
    throw std::invalid_argument("timeout_multiplier must be >= 1");
  }
  auto window = aurora::safety::Watchdog::scaledWindow(
    options.poll_interval, options.timeout_multiplier);
  if (!window) {
    throw std::invalid_argument("poll_interval * timeout_multiplier overflows the timeout window");
  }
  return *window;
}

EnergyVoltagePoller::EnergyVoltagePoller(
  AuroraService & service, Clock & clock,
  const PollerOptions & options)
: service_(service),
  clock_(clock),
  options_(options),
  rate_limiter_(options.poll_interval, options.skip_ticks, clock.now()),
  watchdog_(timeoutWindow(options))
{
}

Reading EnergyVoltagePoller::next()
{
  if (state_ == PollState::FAILED) {
    throw AuroraError(ErrorKind::STREAM_TERMINATED, "poller stopped after an earlier failure");
  }

  try {
    return tick();
  } catch (const std::exception & e) {
    RCLCPP_ERROR(
      rclcpp::get_logger("EnergyVoltagePoller"),
      "Tick %lu failed in %s: %s",
      static_cast<unsigned long>(completed_ticks_ + 1), toString(state_), e.what());
    state_ = PollState::FAILED;
    watchdog_.disarm();
    throw;
  }
}

void EnergyVoltagePoller::run(const std::function<void(const Reading &)> & sink)
{
  while (true) {
    sink(next());
  }
}

Reading EnergyVoltagePoller::tick()
{
  state_ = PollState::IDLE;
  if (!rate_limiter_.ready(clock_.now())) {
    clock_.sleepUntil(rate_limiter_.nextAllowed());
  }

  watchdog_.reset(clock_.now());
  const TimePoint deadline = watchdog_.deadline();

  state_ = PollState::REQUESTING_ENERGY;
  auto energy = service_.call(
    options_.address, proto::CumulativeEnergyRequest{proto::CumulativeDuration::DAILY}, deadline);
  checkDeadline("energy");
  const auto * energy_response = std::get_if<proto::CumulativeEnergyResponse>(&energy);
  if (!energy_response) {
    throw AuroraError(
      ErrorKind::PROTOCOL_VIOLATION, "energy request answered with a different response kind");
  }

  state_ = PollState::REQUESTING_VOLTAGE;
  auto voltage = service_.call(
    options_.address, proto::MeasureRequest{proto::MeasurementType::INPUT1_VOLTAGE, true},
    deadline);
  checkDeadline("voltage");
  const auto * voltage_response = std::get_if<proto::MeasureResponse>(&voltage);
  if (!voltage_response) {
    throw AuroraError(
      ErrorKind::PROTOCOL_VIOLATION, "voltage request answered with a different response kind");
  }

  state_ = PollState::EMIT;
  Reading reading;
  reading.energy_wh = energy_response->value;
  reading.voltage = voltage_response->value;

  const TimePoint emitted = clock_.now();
  rate_limiter_.onEmit(emitted);
  ++completed_ticks_;

  RCLCPP_DEBUG(
    rclcpp::get_logger("EnergyVoltagePoller"),
    "Tick %lu: %uWh, %.2fV", static_cast<unsigned long>(completed_ticks_),
    reading.energy_wh, static_cast<double>(reading.voltage));

  state_ = PollState::IDLE;
  return reading;
}

// A service that ignores the deadline must not stretch the tick
void EnergyVoltagePoller::checkDeadline(const char * phase)
{
  if (watchdog_.tripped(clock_.now())) {
    throw AuroraError(
      ErrorKind::TIMEOUT, std::string(phase) + " response arrived after the tick deadline");
  }
}

} // namespace aurora_poller
