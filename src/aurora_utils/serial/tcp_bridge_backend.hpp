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

#ifndef AURORA_UTILS__SERIAL__TCP_BRIDGE_BACKEND_HPP_
#define AURORA_UTILS__SERIAL__TCP_BRIDGE_BACKEND_HPP_

#pragma once

#include <string>

#include "serial_backend.hpp"

namespace aurora
{
namespace serial
{

/**
 * @brief Byte stream to an RS-485 line through a TCP serial server
 *
 * SerialOptions::device is "host:port". The baud rate is configured on the
 * bridge itself and ignored here. Reads wait at most read_timeout_ms for data
 * using poll(2); a peer that closes the connection is reported as a read error.
 */
class TcpBridgeBackend : public SerialBackend
{
public:
  TcpBridgeBackend() = default;
  ~TcpBridgeBackend() override;

  TcpBridgeBackend(const TcpBridgeBackend &) = delete;
  TcpBridgeBackend & operator=(const TcpBridgeBackend &) = delete;

  bool open(const SerialOptions & opts) override;
  void close() override;
  bool is_open() const override;

  int read(uint8_t * buf, size_t len) override;
  int write(const uint8_t * buf, size_t len) override;

  std::string describe() const override;

  // Split "host:port"; returns false on malformed input
  static bool splitAddress(const std::string & address, std::string & host, std::string & port);

private:
  int socket_fd_ = -1;
  SerialOptions opts_{};
};

} // namespace serial
} // namespace aurora

#endif  // AURORA_UTILS__SERIAL__TCP_BRIDGE_BACKEND_HPP_
