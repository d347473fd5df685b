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

#include "serial_port_backend.hpp"

#include <algorithm>
#include <exception>

#include <rclcpp/rclcpp.hpp>

namespace aurora
{
namespace serial
{

SerialPortBackend::~SerialPortBackend()
{
  close();
}

bool SerialPortBackend::open(const SerialOptions & opts)
{
  opts_ = opts;
  if (opts.device.empty()) {
    RCLCPP_ERROR(rclcpp::get_logger("SerialPortBackend"), "No serial device configured");
    return false;
  }

  try {
    port_.setPort(opts.device);
    port_.setBaudrate(static_cast<uint32_t>(opts.baud_rate));
    ::serial::Timeout tt = ::serial::Timeout::simpleTimeout(
      static_cast<uint32_t>(opts.read_timeout_ms));
    tt.write_timeout_constant = static_cast<uint32_t>(opts.write_timeout_ms);
    port_.setTimeout(tt);

    RCLCPP_INFO(
      rclcpp::get_logger("SerialPortBackend"), "Opening %s at %d baud",
      opts.device.c_str(), opts.baud_rate);
    port_.open();

    if (!port_.isOpen()) {
      RCLCPP_ERROR(
        rclcpp::get_logger("SerialPortBackend"), "Serial port %s opened but reports as not open",
        opts.device.c_str());
      return false;
    }
    port_.flushInput();
  } catch (const std::exception & e) {
    RCLCPP_ERROR(
      rclcpp::get_logger("SerialPortBackend"), "Failed to open serial port %s: %s",
      opts.device.c_str(), e.what());
    return false;
  }
  return true;
}

void SerialPortBackend::close()
{
  try {
    if (port_.isOpen()) {
      port_.close();
    }
  } catch (const std::exception & e) {
    RCLCPP_WARN(
      rclcpp::get_logger("SerialPortBackend"), "Error while closing %s: %s",
      opts_.device.c_str(), e.what());
  }
}

bool SerialPortBackend::is_open() const
{
  return port_.isOpen();
}

int SerialPortBackend::read(uint8_t * buf, size_t len)
{
  try {
    if (!port_.isOpen()) {
      return -1;
    }
    size_t available = port_.available();
    if (available == 0) {
      // Blocks for at most the configured read timeout
      if (!port_.waitReadable()) {
        return 0;
      }
      available = port_.available();
      if (available == 0) {
        return 0;
      }
    }
    size_t n = port_.read(buf, std::min(len, available));
    return static_cast<int>(n);
  } catch (const std::exception & e) {
    RCLCPP_ERROR(
      rclcpp::get_logger("SerialPortBackend"), "Serial read failed on %s: %s",
      opts_.device.c_str(), e.what());
    return -1;
  }
}

int SerialPortBackend::write(const uint8_t * buf, size_t len)
{
  try {
    if (!port_.isOpen()) {
      return -1;
    }
    return static_cast<int>(port_.write(buf, len));
  } catch (const std::exception & e) {
    RCLCPP_ERROR(
      rclcpp::get_logger("SerialPortBackend"), "Serial write failed on %s: %s",
      opts_.device.c_str(), e.what());
    return -1;
  }
}

std::string SerialPortBackend::describe() const
{
  return "serial://" + opts_.device;
}

} // namespace serial
} // namespace aurora
