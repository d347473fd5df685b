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

#include "crc16.hpp"

namespace aurora
{
namespace protocol
{

CRC16::CRC16(CrcVariant variant)
: variant_(variant), crc_(INIT_VALUE)
{
}

void CRC16::reset()
{
  crc_ = INIT_VALUE;
}

void CRC16::update(uint8_t byte)
{
  if (variant_ == CrcVariant::X25) {
    // LSB-first shift register, equivalent to reflecting input and output
    crc_ ^= byte;
    for (int b = 0; b < 8; ++b) {
      if (crc_ & 0x0001) {
        crc_ = (crc_ >> 1) ^ POLYNOMIAL_REFLECTED;
      } else {
        crc_ >>= 1;
      }
    }
    return;
  }

  crc_ ^= static_cast<uint16_t>(byte) << 8;
  for (int b = 0; b < 8; ++b) {
    if (crc_ & 0x8000) {
      crc_ = (crc_ << 1) ^ POLYNOMIAL;
    } else {
      crc_ <<= 1;
    }
  }
}

void CRC16::update(const uint8_t * data, size_t len)
{
  for (size_t i = 0; i < len; ++i) {
    update(data[i]);
  }
}

uint16_t CRC16::finalize() const
{
  if (variant_ == CrcVariant::X25) {
    return static_cast<uint16_t>(~crc_);
  }
  return crc_;
}

uint16_t crc16(CrcVariant variant, const uint8_t * data, size_t len)
{
  CRC16 crc(variant);
  if (data != nullptr) {
    crc.update(data, len);
  }
  return crc.finalize();
}

uint16_t crc16_x25(const uint8_t * data, size_t len)
{
  return crc16(CrcVariant::X25, data, len);
}

uint16_t crc16_ccitt_false(const uint8_t * data, size_t len)
{
  return crc16(CrcVariant::CCITT_FALSE, data, len);
}

const char * toString(CrcVariant variant)
{
  switch (variant) {
    case CrcVariant::X25: return "x25";
    case CrcVariant::CCITT_FALSE: return "ccitt_false";
  }
  return "unknown";
}

} // namespace protocol
} // namespace aurora
