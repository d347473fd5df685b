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

#include <gtest/gtest.h>
#include "aurora_utils/protocol/crc16.hpp"
#include <string>
#include <vector>

using aurora::protocol::CRC16;
using aurora::protocol::CrcVariant;

class CRC16Test : public ::testing::Test
{
protected:
  const std::string check_input_ = "123456789";

  const uint8_t * checkData() const
  {
    return reinterpret_cast<const uint8_t *>(check_input_.c_str());
  }
};

TEST_F(CRC16Test, X25CheckValue) {
  // CRC-16/X-25 catalogue check value
  uint16_t result = aurora::protocol::crc16_x25(checkData(), check_input_.length());
  EXPECT_EQ(result, 0x906E);
}

TEST_F(CRC16Test, CcittFalseCheckValue) {
  uint16_t result = aurora::protocol::crc16_ccitt_false(checkData(), check_input_.length());
  EXPECT_EQ(result, 0x29B1);
}

TEST_F(CRC16Test, EmptyBuffer) {
  // X-25 inverts the init value on output, CCITT-FALSE returns it as is
  EXPECT_EQ(aurora::protocol::crc16_x25(nullptr, 0), 0x0000);
  EXPECT_EQ(aurora::protocol::crc16_ccitt_false(nullptr, 0), 0xFFFF);
}

TEST_F(CRC16Test, SingleZeroByte) {
  uint8_t data = 0x00;
  EXPECT_EQ(aurora::protocol::crc16_x25(&data, 1), 0xF078);
  EXPECT_EQ(aurora::protocol::crc16_ccitt_false(&data, 1), 0xE1F0);
}

TEST_F(CRC16Test, VariantDispatch) {
  EXPECT_EQ(
    aurora::protocol::crc16(CrcVariant::X25, checkData(), check_input_.length()), 0x906E);
  EXPECT_EQ(
    aurora::protocol::crc16(CrcVariant::CCITT_FALSE, checkData(), check_input_.length()),
    0x29B1);
}

TEST_F(CRC16Test, IncrementalUpdate) {
  for (auto variant : {CrcVariant::X25, CrcVariant::CCITT_FALSE}) {
    CRC16 crc(variant);
    for (char c : check_input_) {
      crc.update(static_cast<uint8_t>(c));
    }
    EXPECT_EQ(
      crc.finalize(), aurora::protocol::crc16(variant, checkData(), check_input_.length()))
      << "variant " << aurora::protocol::toString(variant);
  }
}

TEST_F(CRC16Test, ResetFunctionality) {
  CRC16 crc(CrcVariant::CCITT_FALSE);
  crc.update(0x42);

  crc.reset();
  EXPECT_EQ(crc.finalize(), CRC16::INIT_VALUE);
}

TEST_F(CRC16Test, LowByteFirstHelpers) {
  EXPECT_EQ(aurora::protocol::crc_lo(0x906E), 0x6E);
  EXPECT_EQ(aurora::protocol::crc_hi(0x906E), 0x90);
}

TEST_F(CRC16Test, VariantsDisagreeOnRequestHeader) {
  // Measure(INPUT1_VOLTAGE, global) to address 2
  std::vector<uint8_t> header = {0x02, 0x3B, 0x17, 0x01, 0x00, 0x00, 0x00, 0x00};

  EXPECT_EQ(aurora::protocol::crc16_x25(header.data(), header.size()), 0x7DF1);
  EXPECT_EQ(aurora::protocol::crc16_ccitt_false(header.data(), header.size()), 0xD4AE);
}

int main(int argc, char ** argv)
{
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
