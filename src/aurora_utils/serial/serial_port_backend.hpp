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

#ifndef AURORA_UTILS__SERIAL__SERIAL_PORT_BACKEND_HPP_
#define AURORA_UTILS__SERIAL__SERIAL_PORT_BACKEND_HPP_

#pragma once

#include <string>

#include <serial/serial.h>

#include "serial_backend.hpp"

namespace aurora
{
namespace serial
{

/**
 * @brief Direct RS-485 link through a local serial adapter
 *
 * Thin wrapper over ::serial::Serial. Library exceptions are caught at this
 * boundary, logged, and reported through the SerialBackend return codes.
 */
class SerialPortBackend : public SerialBackend
{
public:
  SerialPortBackend() = default;
  ~SerialPortBackend() override;

  bool open(const SerialOptions & opts) override;
  void close() override;
  bool is_open() const override;

  int read(uint8_t * buf, size_t len) override;
  int write(const uint8_t * buf, size_t len) override;

  std::string describe() const override;

private:
  ::serial::Serial port_;
  SerialOptions opts_{};
};

} // namespace serial
} // namespace aurora

#endif  // AURORA_UTILS__SERIAL__SERIAL_PORT_BACKEND_HPP_
