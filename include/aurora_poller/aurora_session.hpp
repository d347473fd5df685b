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

#ifndef AURORA_POLLER__AURORA_SESSION_HPP_
#define AURORA_POLLER__AURORA_SESSION_HPP_

#pragma once

#include <memory>
#include <vector>

#include <cstdint>

#include "aurora_utils/protocol/codec.hpp"
#include "aurora_utils/serial/serial_backend.hpp"
#include "aurora_utils/latency/latency_tracker.hpp"
#include "aurora_poller/aurora_error.hpp"
#include "aurora_poller/clock.hpp"

namespace aurora_poller
{

// Request/response seam used by the poller
class AuroraService
{
public:
  virtual ~AuroraService() = default;

  /**
   * Send @p request to @p address and wait for its response until @p deadline.
   * Throws AuroraError on any failure.
   */
  virtual aurora::protocol::Response call(
    uint8_t address, const aurora::protocol::Request & request,
    TimePoint deadline) = 0;
};

/**
 * One open link to an Aurora bus.
 *
 * The session owns the byte stream and the codec bound to it, so the
 * pending-request slot always belongs to exactly one connection. Requests
 * are strictly serialized and nothing is retried. After a failed receive
 * the exchange is abandoned: the pending request and any buffered bytes are
 * dropped so the next send starts clean.
 */
class AuroraSession : public AuroraService
{
public:
  AuroraSession(
    std::unique_ptr<aurora::serial::SerialBackend> backend, Clock & clock,
    aurora::protocol::CrcVariant variant = aurora::protocol::CrcVariant::X25);
  ~AuroraSession() override;

  AuroraSession(const AuroraSession &) = delete;
  AuroraSession & operator=(const AuroraSession &) = delete;

  // Write one request frame. Throws IO_FAILURE or PROTOCOL_VIOLATION.
  void send(uint8_t address, const aurora::protocol::Request & request);

  // Read until the pending request's response decodes or @p deadline passes
  aurora::protocol::Response receive(TimePoint deadline);

  aurora::protocol::Response call(
    uint8_t address, const aurora::protocol::Request & request,
    TimePoint deadline) override;

  bool hasPending() const {return codec_.hasPending();}
  const aurora::latency::LatencyTracker & latency() const {return latency_tracker_;}
  aurora::serial::SerialBackend & backend() {return *backend_;}

  void logLatencyStats() const;

private:
  void abandonExchange();
  [[noreturn]] void fail(ErrorKind kind, const std::string & message, uint8_t raw = 0);

  std::unique_ptr<aurora::serial::SerialBackend> backend_;
  Clock & clock_;
  aurora::protocol::FrameCodec codec_;
  std::vector<uint8_t> rx_buffer_;
  std::vector<uint8_t> tx_buffer_;
  aurora::latency::LatencyTracker latency_tracker_;
};

} // namespace aurora_poller
#endif  // AURORA_POLLER__AURORA_SESSION_HPP_
