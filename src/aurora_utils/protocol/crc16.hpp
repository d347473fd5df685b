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

#ifndef AURORA_UTILS__PROTOCOL__CRC16_HPP_
#define AURORA_UTILS__PROTOCOL__CRC16_HPP_

#pragma once

#include <cstdint>
#include <cstddef>

namespace aurora
{
namespace protocol
{

/**
 * CRC-16 flavours seen on Aurora links.
 *
 * X25 (CRC-16/X-25, a.k.a. CRC-16/IBM-SDLC):
 * - Polynomial: 0x1021 (processed reflected as 0x8408)
 * - Init: 0xFFFF
 * - Reflect In/Out: true
 * - XorOut: 0xFFFF
 * - Test vector: "123456789" -> 0x906E
 *
 * CCITT_FALSE (CRC-16/CCITT-FALSE):
 * - Polynomial: 0x1021
 * - Init: 0xFFFF
 * - Reflect In/Out: false
 * - XorOut: 0x0000
 * - Test vector: "123456789" -> 0x29B1
 */
enum class CrcVariant : uint8_t
{
  X25 = 0,
  CCITT_FALSE = 1
};

class CRC16
{
public:
  static constexpr uint16_t POLYNOMIAL = 0x1021;
  static constexpr uint16_t POLYNOMIAL_REFLECTED = 0x8408;
  static constexpr uint16_t INIT_VALUE = 0xFFFF;

  explicit CRC16(CrcVariant variant = CrcVariant::X25);

  void reset();
  void update(uint8_t byte);
  void update(const uint8_t * data, size_t len);
  uint16_t finalize() const;

  CrcVariant variant() const {return variant_;}

private:
  CrcVariant variant_;
  uint16_t crc_;
};

// Convenience functions for one-shot calculation
uint16_t crc16_x25(const uint8_t * data, size_t len);
uint16_t crc16_ccitt_false(const uint8_t * data, size_t len);
uint16_t crc16(CrcVariant variant, const uint8_t * data, size_t len);

// Aurora frames carry the checksum low byte first
inline uint8_t crc_lo(uint16_t crc) {return static_cast<uint8_t>(crc & 0xFF);}
inline uint8_t crc_hi(uint16_t crc) {return static_cast<uint8_t>((crc >> 8) & 0xFF);}

const char * toString(CrcVariant variant);

} // namespace protocol
} // namespace aurora

#endif  // AURORA_UTILS__PROTOCOL__CRC16_HPP_
