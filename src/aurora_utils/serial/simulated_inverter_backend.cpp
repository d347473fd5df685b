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

#include "simulated_inverter_backend.hpp"
#include "aurora_utils/protocol/frame.hpp"

#include <algorithm>

#include <cstring>

namespace aurora
{
namespace serial
{

using protocol::CommandCode;

SimulatedInverterBackend::SimulatedInverterBackend(protocol::CrcVariant variant)
: is_open_(false), silent_(false), corrupt_next_(false), request_count_(0), variant_(variant)
{
}

bool SimulatedInverterBackend::open(const SerialOptions & opts)
{
  (void)opts;
  std::lock_guard<std::mutex> lock(mutex_);
  is_open_ = true;
  return true;
}

void SimulatedInverterBackend::close()
{
  std::lock_guard<std::mutex> lock(mutex_);
  is_open_ = false;
  std::queue<uint8_t> empty;
  input_queue_.swap(empty);
  partial_request_.clear();
}

bool SimulatedInverterBackend::is_open() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return is_open_;
}

int SimulatedInverterBackend::read(uint8_t * buf, size_t len)
{
  std::lock_guard<std::mutex> lock(mutex_);

  if (!is_open_) {
    return -1;
  }

  size_t bytes_read = 0;
  while (bytes_read < len && !input_queue_.empty()) {
    buf[bytes_read++] = input_queue_.front();
    input_queue_.pop();
  }

  return static_cast<int>(bytes_read);
}

int SimulatedInverterBackend::write(const uint8_t * buf, size_t len)
{
  std::lock_guard<std::mutex> lock(mutex_);

  if (!is_open_) {
    return -1;
  }

  // Requests may arrive split across writes; answer each complete frame
  partial_request_.insert(partial_request_.end(), buf, buf + len);
  while (partial_request_.size() >= protocol::REQUEST_FRAME_SIZE) {
    processRequestFrame(partial_request_.data(), protocol::REQUEST_FRAME_SIZE);
    partial_request_.erase(
      partial_request_.begin(),
      partial_request_.begin() + protocol::REQUEST_FRAME_SIZE);
  }

  return static_cast<int>(len);
}

std::string SimulatedInverterBackend::describe() const
{
  return "simulated";
}

void SimulatedInverterBackend::setState(const SimulatedInverterState & state)
{
  std::lock_guard<std::mutex> lock(mutex_);
  state_ = state;
}

void SimulatedInverterBackend::setSilent(bool silent)
{
  std::lock_guard<std::mutex> lock(mutex_);
  silent_ = silent;
}

void SimulatedInverterBackend::corruptNextResponse()
{
  std::lock_guard<std::mutex> lock(mutex_);
  corrupt_next_ = true;
}

std::vector<uint8_t> SimulatedInverterBackend::getLastRequestFrame() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return last_request_frame_;
}

size_t SimulatedInverterBackend::requestCount() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return request_count_;
}

void SimulatedInverterBackend::processRequestFrame(const uint8_t * data, size_t size)
{
  last_request_frame_.assign(data, data + size);

  auto framing = protocol::tryParseRequestFrame(protocol::ByteSpan(data, size), variant_);
  if (framing != protocol::ParseResult::SUCCESS) {
    return;   // a real device stays silent on a bad frame
  }

  if (data[0] != state_.address || silent_) {
    return;
  }
  ++request_count_;

  uint8_t payload[protocol::RESPONSE_PAYLOAD_SIZE] = {};
  payload[0] = state_.transmission_state;
  payload[1] = state_.global_state;

  switch (static_cast<CommandCode>(data[1])) {
    case CommandCode::STATE:
      payload[2] = state_.inverter_state;
      payload[3] = state_.dc1_state;
      payload[4] = state_.dc2_state;
      payload[5] = state_.alarm;
      break;
    case CommandCode::PART_NUMBER:
      std::memcpy(payload, state_.part_number.data(), sizeof(payload));
      break;
    case CommandCode::VERSION:
      payload[2] = 'i';
      payload[3] = 'A';
      payload[4] = 'N';
      payload[5] = 'T';
      break;
    case CommandCode::MEASURE: {
        float value = 0.0f;
        auto type = static_cast<protocol::MeasurementType>(data[2]);
        if (type == protocol::MeasurementType::INPUT1_VOLTAGE) {
          value = state_.input1_voltage;
        } else if (type == protocol::MeasurementType::GRID_POWER) {
          value = state_.grid_power;
        }
        protocol::write_be_float(&payload[2], value);
        break;
      }
    case CommandCode::SERIAL_NUMBER:
      std::memcpy(payload, state_.serial_number.data(), sizeof(payload));
      break;
    case CommandCode::MANUFACTURE_DATE:
      payload[2] = '2';
      payload[3] = '4';
      payload[4] = '1';
      payload[5] = '9';
      break;
    case CommandCode::CUMULATIVE_ENERGY: {
        auto duration = static_cast<protocol::CumulativeDuration>(data[2]);
        uint32_t value = duration == protocol::CumulativeDuration::DAILY ?
          state_.daily_energy_wh : state_.total_energy_wh;
        protocol::write_be32(&payload[2], value);
        break;
      }
    default:
      payload[0] = static_cast<uint8_t>(protocol::TransmissionState::COMMAND_NOT_IMPLEMENTED);
      break;
  }

  uint8_t frame[protocol::RESPONSE_FRAME_SIZE];
  size_t bytes_written = 0;
  auto encode_result = protocol::encodeResponseFrame(
    payload, frame, sizeof(frame), bytes_written, variant_);
  if (encode_result != protocol::ErrorCode::OK) {
    return;
  }

  if (corrupt_next_) {
    frame[protocol::RESPONSE_CRC_OFFSET] ^= 0x01;
    corrupt_next_ = false;
  }

  for (size_t i = 0; i < bytes_written; ++i) {
    input_queue_.push(frame[i]);
  }
}

} // namespace serial
} // namespace aurora
