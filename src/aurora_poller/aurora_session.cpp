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

#include "aurora_poller/aurora_session.hpp"

#include <string>
#include <utility>

#include "rclcpp/rclcpp.hpp"

namespace aurora_poller
{

namespace proto = aurora::protocol;

const char * toString(ErrorKind kind)
{
  switch (kind) {
    case ErrorKind::IO_FAILURE: return "IO_FAILURE";
    case ErrorKind::CRC_MISMATCH: return "CRC_MISMATCH";
    case ErrorKind::UNEXPECTED_RESPONSE: return "UNEXPECTED_RESPONSE";
    case ErrorKind::UNKNOWN_STATE_CODE: return "UNKNOWN_STATE_CODE";
    case ErrorKind::TIMEOUT: return "TIMEOUT";
    case ErrorKind::PROTOCOL_VIOLATION: return "PROTOCOL_VIOLATION";
    case ErrorKind::STREAM_TERMINATED: return "STREAM_TERMINATED";
  }
  return "UNKNOWN";
}

AuroraSession::AuroraSession(
  std::unique_ptr<aurora::serial::SerialBackend> backend, Clock & clock,
  proto::CrcVariant variant)
: backend_(std::move(backend)), clock_(clock), codec_(variant)
{
  if (!backend_) {
    throw AuroraError(ErrorKind::IO_FAILURE, "AuroraSession requires a backend");
  }
  rx_buffer_.reserve(64);
  tx_buffer_.reserve(proto::REQUEST_FRAME_SIZE);

  RCLCPP_INFO(
    rclcpp::get_logger("AuroraSession"),
    "Session on %s (crc=%s)", backend_->describe().c_str(), proto::toString(variant));
}

AuroraSession::~AuroraSession()
{
  if (backend_ && backend_->is_open()) {
    backend_->close();
  }
}

void AuroraSession::send(uint8_t address, const proto::Request & request)
{
  const auto command = proto::commandCodeOf(request);

  tx_buffer_.clear();
  auto result = codec_.encode(address, request, tx_buffer_);
  if (result == proto::ErrorCode::REQUEST_PENDING) {
    fail(
      ErrorKind::PROTOCOL_VIOLATION,
      std::string("cannot send ") + proto::toString(command) +
      ": previous request still awaiting a response");
  }
  if (result != proto::ErrorCode::OK) {
    fail(ErrorKind::PROTOCOL_VIOLATION, std::string("encode failed: ") + proto::toString(result));
  }

  if (!backend_->is_open()) {
    codec_.clearPending();
    fail(ErrorKind::IO_FAILURE, "backend " + backend_->describe() + " is not open");
  }

  int written = backend_->write(tx_buffer_.data(), tx_buffer_.size());
  if (written < 0 || static_cast<size_t>(written) != tx_buffer_.size()) {
    // No response can be owed for a frame that never made it out
    codec_.clearPending();
    fail(
      ErrorKind::IO_FAILURE,
      "short write to " + backend_->describe() + ": " + std::to_string(written) + " of " +
      std::to_string(tx_buffer_.size()) + " bytes");
  }

  latency_tracker_.recordRequestSent(static_cast<uint8_t>(command), clock_.now());

  RCLCPP_DEBUG(
    rclcpp::get_logger("AuroraSession"),
    "TX addr=%u cmd=%s (%zu bytes)", address, proto::toString(command), tx_buffer_.size());
}

proto::Response AuroraSession::receive(TimePoint deadline)
{
  uint8_t chunk[64];

  while (true) {
    if (rx_buffer_.size() >= proto::RESPONSE_FRAME_SIZE) {
      proto::ParsedResponse parsed;
      auto result = codec_.decode(rx_buffer_, parsed);
      switch (result) {
        case proto::ParseResult::SUCCESS:
          latency_tracker_.recordResponse(clock_.now());
          RCLCPP_DEBUG(rclcpp::get_logger("AuroraSession"), "RX response decoded");
          return std::move(parsed.response);

        case proto::ParseResult::CRC_MISMATCH:
          abandonExchange();
          fail(ErrorKind::CRC_MISMATCH, "response frame failed CRC check");

        case proto::ParseResult::UNEXPECTED_RESPONSE:
          abandonExchange();
          fail(ErrorKind::UNEXPECTED_RESPONSE, "response frame received with no request pending");

        case proto::ParseResult::UNKNOWN_STATE_CODE:
          abandonExchange();
          fail(
            ErrorKind::UNKNOWN_STATE_CODE,
            std::string("unknown ") + proto::toString(parsed.unknown_domain) +
            " state code " + std::to_string(parsed.unknown_code),
            parsed.unknown_code);

        case proto::ParseResult::INSUFFICIENT_DATA:
          break;
      }
    }

    if (clock_.now() >= deadline) {
      abandonExchange();
      fail(ErrorKind::TIMEOUT, "no response before deadline");
    }

    int bytes_read = backend_->read(chunk, sizeof(chunk));
    if (bytes_read < 0) {
      abandonExchange();
      fail(ErrorKind::IO_FAILURE, "read from " + backend_->describe() + " failed");
    }
    rx_buffer_.insert(rx_buffer_.end(), chunk, chunk + bytes_read);
  }
}

proto::Response AuroraSession::call(
  uint8_t address, const proto::Request & request, TimePoint deadline)
{
  send(address, request);
  return receive(deadline);
}

void AuroraSession::abandonExchange()
{
  codec_.clearPending();
  latency_tracker_.abandonPending();
  rx_buffer_.clear();
}

void AuroraSession::fail(ErrorKind kind, const std::string & message, uint8_t raw)
{
  RCLCPP_ERROR(
    rclcpp::get_logger("AuroraSession"), "%s: %s", toString(kind), message.c_str());
  throw AuroraError(kind, message, raw);
}

void AuroraSession::logLatencyStats() const
{
  if (latency_tracker_.getSampleCount() == 0) {
    return;
  }

  auto p95 = latency_tracker_.getP95Latency();
  auto mean = latency_tracker_.getMeanLatency();
  auto max = latency_tracker_.getMaxLatency();
  auto count = latency_tracker_.getSampleCount();

  auto p95_ms = std::chrono::duration_cast<std::chrono::milliseconds>(p95).count();
  auto mean_ms = std::chrono::duration_cast<std::chrono::milliseconds>(mean).count();
  auto max_ms = std::chrono::duration_cast<std::chrono::milliseconds>(max).count();

  RCLCPP_DEBUG(
    rclcpp::get_logger("AuroraSession"),
    "Latency stats: P95=%ldms, Mean=%ldms, Max=%ldms, Samples=%zu",
    static_cast<long>(p95_ms), static_cast<long>(mean_ms), static_cast<long>(max_ms), count);
}

} // namespace aurora_poller
