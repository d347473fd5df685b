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

#ifndef AURORA_UTILS__PROTOCOL__FRAME_HPP_
#define AURORA_UTILS__PROTOCOL__FRAME_HPP_

#pragma once

#include <cstdint>
#include <cstddef>

#include "crc16.hpp"
#include "device_state.hpp"
#include "types.hpp"

namespace aurora
{
namespace protocol
{

// Frame geometry. Neither direction carries a start byte or length field.
static constexpr size_t REQUEST_FRAME_SIZE = 10;    // addr, cmd, 6 payload, crc lo, crc hi
static constexpr size_t REQUEST_CRC_OFFSET = 8;
static constexpr size_t RESPONSE_FRAME_SIZE = 8;    // 6 payload, crc lo, crc hi
static constexpr size_t RESPONSE_PAYLOAD_SIZE = 6;
static constexpr size_t RESPONSE_CRC_OFFSET = 6;

// Encoder error codes
enum class ErrorCode : uint8_t
{
  OK = 0,
  BUFFER_TOO_SMALL = 1,
  REQUEST_PENDING = 2
};

// Decoder outcomes
enum class ParseResult
{
  SUCCESS,
  INSUFFICIENT_DATA,
  CRC_MISMATCH,
  UNEXPECTED_RESPONSE,
  UNKNOWN_STATE_CODE
};

// Byte span for input data
struct ByteSpan
{
  const uint8_t * data;
  size_t size;

  ByteSpan(const uint8_t * d, size_t s)
  : data(d), size(s) {}
};

// Result of interpreting a CRC-valid payload against a pending request
struct ParsedResponse
{
  ParseResult result = ParseResult::UNEXPECTED_RESPONSE;
  Response response;
  // Only meaningful when result == UNKNOWN_STATE_CODE
  uint8_t unknown_code = 0;
  StateDomain unknown_domain = StateDomain::TRANSMISSION;
};

/**
 * Encode one request frame.
 *
 * Writes REQUEST_FRAME_SIZE bytes: address, command code, the variant
 * specific parameters (zero filled), then the CRC of bytes 0..7 low byte
 * first.
 */
ErrorCode encodeRequest(
  uint8_t address, const Request & request, uint8_t * buffer, size_t buffer_size,
  size_t & bytes_written, CrcVariant variant = CrcVariant::X25);

/**
 * Encode one response frame around a 6 byte payload (device side of the
 * link; used by the simulated inverter and by tests).
 */
ErrorCode encodeResponseFrame(
  const uint8_t * payload, uint8_t * buffer, size_t buffer_size,
  size_t & bytes_written, CrcVariant variant = CrcVariant::X25);

/**
 * Check the framing of a response.
 *
 * Looks at the first RESPONSE_FRAME_SIZE bytes of @p input only. Returns
 * INSUFFICIENT_DATA when fewer are available and CRC_MISMATCH when the
 * trailing checksum does not cover bytes 0..5.
 */
ParseResult tryParseResponseFrame(ByteSpan input, CrcVariant variant = CrcVariant::X25);

// Device side counterpart: checks the CRC of bytes 0..7 of a request frame
ParseResult tryParseRequestFrame(ByteSpan input, CrcVariant variant = CrcVariant::X25);

/**
 * Map a 6 byte response payload to the response variant that answers
 * @p pending. Status bytes of a state response must be listed codes.
 */
ParsedResponse interpretPayload(const Request & pending, const uint8_t * payload);

// Big-endian helpers for payload fields
uint32_t read_be32(const uint8_t * buf);
float read_be_float(const uint8_t * buf);
void write_be32(uint8_t * buf, uint32_t value);
void write_be_float(uint8_t * buf, float value);

const char * toString(ParseResult result);
const char * toString(ErrorCode code);

} // namespace protocol
} // namespace aurora

#endif  // AURORA_UTILS__PROTOCOL__FRAME_HPP_
