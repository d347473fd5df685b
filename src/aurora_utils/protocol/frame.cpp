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

#include "frame.hpp"

#include <cstring>
#include <type_traits>

namespace aurora
{
namespace protocol
{

namespace
{

template<class>
inline constexpr bool always_false_v = false;

}  // namespace

CommandCode commandCodeOf(const Request & request)
{
  return std::visit(
    [](const auto & req) -> CommandCode {
      using T = std::decay_t<decltype(req)>;
      if constexpr (std::is_same_v<T, StateRequest>) {
        return CommandCode::STATE;
      } else if constexpr (std::is_same_v<T, PartNumberRequest>) {
        return CommandCode::PART_NUMBER;
      } else if constexpr (std::is_same_v<T, VersionRequest>) {
        return CommandCode::VERSION;
      } else if constexpr (std::is_same_v<T, MeasureRequest>) {
        return CommandCode::MEASURE;
      } else if constexpr (std::is_same_v<T, SerialNumberRequest>) {
        return CommandCode::SERIAL_NUMBER;
      } else if constexpr (std::is_same_v<T, ManufactureDateRequest>) {
        return CommandCode::MANUFACTURE_DATE;
      } else if constexpr (std::is_same_v<T, CumulativeEnergyRequest>) {
        return CommandCode::CUMULATIVE_ENERGY;
      } else {
        static_assert(always_false_v<T>, "unhandled request variant");
      }
    }, request);
}

const char * toString(CommandCode code)
{
  switch (code) {
    case CommandCode::STATE: return "State";
    case CommandCode::PART_NUMBER: return "PartNumber";
    case CommandCode::VERSION: return "Version";
    case CommandCode::MEASURE: return "Measure";
    case CommandCode::SERIAL_NUMBER: return "SerialNumber";
    case CommandCode::MANUFACTURE_DATE: return "ManufactureDate";
    case CommandCode::CUMULATIVE_ENERGY: return "CumulativeEnergy";
  }
  return "Unknown";
}

uint32_t read_be32(const uint8_t * buf)
{
  return (static_cast<uint32_t>(buf[0]) << 24) |
         (static_cast<uint32_t>(buf[1]) << 16) |
         (static_cast<uint32_t>(buf[2]) << 8) |
         static_cast<uint32_t>(buf[3]);
}

float read_be_float(const uint8_t * buf)
{
  static_assert(sizeof(float) == sizeof(uint32_t), "IEEE-754 single precision expected");
  uint32_t bits = read_be32(buf);
  float value;
  std::memcpy(&value, &bits, sizeof(value));
  return value;
}

void write_be32(uint8_t * buf, uint32_t value)
{
  buf[0] = static_cast<uint8_t>((value >> 24) & 0xFF);
  buf[1] = static_cast<uint8_t>((value >> 16) & 0xFF);
  buf[2] = static_cast<uint8_t>((value >> 8) & 0xFF);
  buf[3] = static_cast<uint8_t>(value & 0xFF);
}

void write_be_float(uint8_t * buf, float value)
{
  uint32_t bits;
  std::memcpy(&bits, &value, sizeof(bits));
  write_be32(buf, bits);
}

ErrorCode encodeRequest(
  uint8_t address, const Request & request, uint8_t * buffer, size_t buffer_size,
  size_t & bytes_written, CrcVariant variant)
{
  if (buffer == nullptr || buffer_size < REQUEST_FRAME_SIZE) {
    bytes_written = 0;
    return ErrorCode::BUFFER_TOO_SMALL;
  }

  std::memset(buffer, 0, REQUEST_FRAME_SIZE);
  buffer[0] = address;
  buffer[1] = static_cast<uint8_t>(commandCodeOf(request));

  if (const auto * measure = std::get_if<MeasureRequest>(&request)) {
    buffer[2] = static_cast<uint8_t>(measure->type);
    buffer[3] = measure->global ? 1 : 0;
  } else if (const auto * energy = std::get_if<CumulativeEnergyRequest>(&request)) {
    buffer[2] = static_cast<uint8_t>(energy->duration);
  }

  uint16_t crc = crc16(variant, buffer, REQUEST_CRC_OFFSET);
  buffer[REQUEST_CRC_OFFSET] = crc_lo(crc);
  buffer[REQUEST_CRC_OFFSET + 1] = crc_hi(crc);

  bytes_written = REQUEST_FRAME_SIZE;
  return ErrorCode::OK;
}

ErrorCode encodeResponseFrame(
  const uint8_t * payload, uint8_t * buffer, size_t buffer_size,
  size_t & bytes_written, CrcVariant variant)
{
  if (payload == nullptr || buffer == nullptr || buffer_size < RESPONSE_FRAME_SIZE) {
    bytes_written = 0;
    return ErrorCode::BUFFER_TOO_SMALL;
  }

  std::memcpy(buffer, payload, RESPONSE_PAYLOAD_SIZE);
  uint16_t crc = crc16(variant, buffer, RESPONSE_PAYLOAD_SIZE);
  buffer[RESPONSE_CRC_OFFSET] = crc_lo(crc);
  buffer[RESPONSE_CRC_OFFSET + 1] = crc_hi(crc);

  bytes_written = RESPONSE_FRAME_SIZE;
  return ErrorCode::OK;
}

ParseResult tryParseResponseFrame(ByteSpan input, CrcVariant variant)
{
  if (input.data == nullptr || input.size < RESPONSE_FRAME_SIZE) {
    return ParseResult::INSUFFICIENT_DATA;
  }

  uint16_t calculated = crc16(variant, input.data, RESPONSE_PAYLOAD_SIZE);
  if (input.data[RESPONSE_CRC_OFFSET] != crc_lo(calculated) ||
    input.data[RESPONSE_CRC_OFFSET + 1] != crc_hi(calculated))
  {
    return ParseResult::CRC_MISMATCH;
  }

  return ParseResult::SUCCESS;
}

ParseResult tryParseRequestFrame(ByteSpan input, CrcVariant variant)
{
  if (input.data == nullptr || input.size < REQUEST_FRAME_SIZE) {
    return ParseResult::INSUFFICIENT_DATA;
  }

  uint16_t calculated = crc16(variant, input.data, REQUEST_CRC_OFFSET);
  if (input.data[REQUEST_CRC_OFFSET] != crc_lo(calculated) ||
    input.data[REQUEST_CRC_OFFSET + 1] != crc_hi(calculated))
  {
    return ParseResult::CRC_MISMATCH;
  }

  return ParseResult::SUCCESS;
}

static ParsedResponse unknownCode(StateDomain domain, uint8_t raw)
{
  ParsedResponse parsed;
  parsed.result = ParseResult::UNKNOWN_STATE_CODE;
  parsed.unknown_domain = domain;
  parsed.unknown_code = raw;
  return parsed;
}

static ParsedResponse interpretState(const uint8_t * data)
{
  auto trans = decodeTransmissionState(data[0]);
  if (!trans) {return unknownCode(StateDomain::TRANSMISSION, data[0]);}
  auto global = decodeGlobalState(data[1]);
  if (!global) {return unknownCode(StateDomain::GLOBAL, data[1]);}
  auto inverter = decodeInverterState(data[2]);
  if (!inverter) {return unknownCode(StateDomain::INVERTER, data[2]);}
  auto dc1 = decodeDcDcState(data[3]);
  if (!dc1) {return unknownCode(StateDomain::DCDC, data[3]);}
  auto dc2 = decodeDcDcState(data[4]);
  if (!dc2) {return unknownCode(StateDomain::DCDC, data[4]);}

  StateResponse state;
  state.trans = *trans;
  state.global = *global;
  state.inverter = *inverter;
  state.dc1 = *dc1;
  state.dc2 = *dc2;
  state.alarm = data[5];

  ParsedResponse parsed;
  parsed.result = ParseResult::SUCCESS;
  parsed.response = state;
  return parsed;
}

ParsedResponse interpretPayload(const Request & pending, const uint8_t * data)
{
  if (std::holds_alternative<StateRequest>(pending)) {
    return interpretState(data);
  }

  ParsedResponse parsed;
  parsed.result = ParseResult::SUCCESS;
  parsed.response = std::visit(
    [data](const auto & req) -> Response {
      using T = std::decay_t<decltype(req)>;
      if constexpr (std::is_same_v<T, PartNumberRequest>) {
        PartNumberResponse r;
        std::memcpy(r.part_number.data(), data, RESPONSE_PAYLOAD_SIZE);
        return r;
      } else if constexpr (std::is_same_v<T, VersionRequest>) {
        VersionResponse r;
        r.trans = data[0];
        r.global = data[1];
        r.par1 = data[2];
        r.par2 = data[3];
        r.par3 = data[4];
        r.par4 = data[5];
        return r;
      } else if constexpr (std::is_same_v<T, MeasureRequest>) {
        MeasureResponse r;
        r.trans = data[0];
        r.global = data[1];
        r.value = read_be_float(&data[2]);
        r.type = req.type;
        return r;
      } else if constexpr (std::is_same_v<T, SerialNumberRequest>) {
        SerialNumberResponse r;
        std::memcpy(r.serial_number.data(), data, RESPONSE_PAYLOAD_SIZE);
        return r;
      } else if constexpr (std::is_same_v<T, ManufactureDateRequest>) {
        ManufactureDateResponse r;
        r.trans = data[0];
        r.global = data[1];
        r.week = {data[2], data[3]};
        r.year = {data[4], data[5]};
        return r;
      } else if constexpr (std::is_same_v<T, CumulativeEnergyRequest>) {
        CumulativeEnergyResponse r;
        r.trans = data[0];
        r.global = data[1];
        r.value = read_be32(&data[2]);
        r.duration = req.duration;
        return r;
      } else {
        // StateRequest is handled above
        return StateResponse{};
      }
    }, pending);
  return parsed;
}

const char * toString(ParseResult result)
{
  switch (result) {
    case ParseResult::SUCCESS: return "success";
    case ParseResult::INSUFFICIENT_DATA: return "insufficient data";
    case ParseResult::CRC_MISMATCH: return "CRC mismatch";
    case ParseResult::UNEXPECTED_RESPONSE: return "response without pending request";
    case ParseResult::UNKNOWN_STATE_CODE: return "unknown state code";
  }
  return "unknown";
}

const char * toString(ErrorCode code)
{
  switch (code) {
    case ErrorCode::OK: return "ok";
    case ErrorCode::BUFFER_TOO_SMALL: return "buffer too small";
    case ErrorCode::REQUEST_PENDING: return "a request is already pending";
  }
  return "unknown";
}

} // namespace protocol
} // namespace aurora
