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
#ifndef AURORA_UTILS__CONFIG__CONFIG_HPP_
#define AURORA_UTILS__CONFIG__CONFIG_HPP_

#pragma once  // Optional, redundant with guard but retained for faster builds

#include <chrono>
#include <string>

#include <cstdint>
#include <stdexcept>

#include "aurora_utils/protocol/crc16.hpp"

namespace aurora
{
namespace config
{

enum class TransportKind
{
  TCP,          // TCP serial server in front of the RS-485 line
  SERIAL,       // local RS-485 adapter
  SIMULATED     // in-process simulated inverter
};

struct PvOutputConfig
{
  std::string system_id;
  std::string api_key;
};

struct Config
{
  TransportKind transport = TransportKind::TCP;
  std::string tcp_address;              // host:port
  std::string serial_port;
  int baud_rate = 19200;
  int inverter_address = 2;             // 1..254
  int poll_interval_ms = 300000;        // >0
  int timeout_multiplier = 3;           // >=1
  int skip_ticks = 2;                   // >=0
  int read_timeout_ms = 100;            // >0
  protocol::CrcVariant crc_variant = protocol::CrcVariant::X25;

  PvOutputConfig pv_output;

  // Validate constraints; throws std::runtime_error on failure
  void validate() const;

  std::chrono::milliseconds poll_interval() const
  {
    return std::chrono::milliseconds(poll_interval_ms);
  }
  // poll_interval * timeout_multiplier; throws std::runtime_error if it overflows
  std::chrono::steady_clock::duration response_timeout() const;
};

// Parse a YAML string (minimal parser supporting the documented schema)
// Throws std::runtime_error on parse/validation error.
Config parse_from_yaml_string(const std::string & yaml);

// Load from a YAML file path
Config parse_from_yaml_file(const std::string & path);

const char * toString(TransportKind kind);

}   // namespace config
} // namespace aurora

#endif  // AURORA_UTILS__CONFIG__CONFIG_HPP_
