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

// Primary include guard
#ifndef AURORA_UTILS__SERIAL__SIMULATED_INVERTER_BACKEND_HPP_
#define AURORA_UTILS__SERIAL__SIMULATED_INVERTER_BACKEND_HPP_

#pragma once

#include "serial_backend.hpp"
#include "aurora_utils/protocol/crc16.hpp"

#include <array>
#include <mutex>
#include <queue>
#include <vector>

namespace aurora
{
namespace serial
{

// Values the simulated device reports
struct SimulatedInverterState
{
  uint8_t address = 2;
  uint8_t transmission_state = 0;
  uint8_t global_state = 6;       // Run
  uint8_t inverter_state = 2;     // Run
  uint8_t dc1_state = 2;          // MPPT
  uint8_t dc2_state = 2;
  uint8_t alarm = 0;
  uint32_t daily_energy_wh = 0;
  uint32_t total_energy_wh = 0;
  float input1_voltage = 0.0f;
  float grid_power = 0.0f;
  std::array<uint8_t, 6> part_number{{'-', '3', 'G', '7', '4', '-'}};
  std::array<uint8_t, 6> serial_number{{'1', '2', '3', '4', '5', '6'}};
};

/**
 * @brief Serial backend that behaves like an Aurora inverter
 *
 * Every complete, CRC-valid request frame addressed to the simulated device
 * is answered with a response frame built from SimulatedInverterState.
 * Frames for other addresses are ignored, as on a shared RS-485 bus. Used
 * by integration tests and by the "simulated" transport of the poller.
 */
class SimulatedInverterBackend : public SerialBackend
{
public:
  explicit SimulatedInverterBackend(
    protocol::CrcVariant variant = protocol::CrcVariant::X25);
  ~SimulatedInverterBackend() override = default;

  bool open(const SerialOptions & opts) override;
  void close() override;
  bool is_open() const override;

  int read(uint8_t * buf, size_t len) override;
  int write(const uint8_t * buf, size_t len) override;

  std::string describe() const override;

  /**
   * @brief Replace the values reported from now on
   */
  void setState(const SimulatedInverterState & state);

  /**
   * @brief Stop answering requests (the device goes silent)
   */
  void setSilent(bool silent);

  /**
   * @brief Flip a bit in the CRC of the next response
   */
  void corruptNextResponse();

  /**
   * @brief Get the last request frame that was written
   *
   * @return Vector containing the last complete request frame
   */
  std::vector<uint8_t> getLastRequestFrame() const;

  size_t requestCount() const;

private:
  mutable std::mutex mutex_;
  bool is_open_;
  bool silent_;
  bool corrupt_next_;
  size_t request_count_;
  protocol::CrcVariant variant_;
  SimulatedInverterState state_;
  std::vector<uint8_t> partial_request_;
  std::queue<uint8_t> input_queue_;
  std::vector<uint8_t> last_request_frame_;

  // Answer one complete request frame
  void processRequestFrame(const uint8_t * data, size_t size);
};

} // namespace serial
} // namespace aurora

#endif  // AURORA_UTILS__SERIAL__SIMULATED_INVERTER_BACKEND_HPP_
