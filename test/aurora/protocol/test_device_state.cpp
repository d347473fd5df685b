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
#include "aurora_utils/protocol/device_state.hpp"

#include <initializer_list>
#include <utility>

namespace proto = aurora::protocol;

namespace
{
// Inclusive code ranges of a state table
using CodeRanges = std::initializer_list<std::pair<int, int>>;

bool listed(int raw, CodeRanges ranges)
{
  for (const auto & range : ranges) {
    if (raw >= range.first && raw <= range.second) {
      return true;
    }
  }
  return false;
}

template<typename Decode>
void expectDecodesExactly(Decode decode, CodeRanges ranges)
{
  for (int raw = 0; raw <= 255; ++raw) {
    EXPECT_EQ(decode(static_cast<uint8_t>(raw)).has_value(), listed(raw, ranges))
      << "code " << raw;
  }
}
}  // namespace

TEST(DeviceStateTest, TransmissionDecodesOnlyListedCodes) {
  expectDecodesExactly(proto::decodeTransmissionState, {{0, 0}, {51, 58}});
}

TEST(DeviceStateTest, GlobalDecodesOnlyListedCodes) {
  expectDecodesExactly(proto::decodeGlobalState, {{0, 27}, {30, 38}, {98, 101}});
}

TEST(DeviceStateTest, InverterDecodesOnlyListedCodes) {
  expectDecodesExactly(proto::decodeInverterState, {{0, 31}, {40, 47}});
}

TEST(DeviceStateTest, DcDcDecodesOnlyListedCodes) {
  expectDecodesExactly(proto::decodeDcDcState, {{0, 19}});
}

TEST(DeviceStateTest, TransmissionCodes) {
  EXPECT_EQ(proto::decodeTransmissionState(0), proto::TransmissionState::OK);
  EXPECT_EQ(
    proto::decodeTransmissionState(51), proto::TransmissionState::COMMAND_NOT_IMPLEMENTED);
  EXPECT_TRUE(proto::decodeTransmissionState(58).has_value());

  // Gap between OK and the error block, and past the end of the table
  EXPECT_FALSE(proto::decodeTransmissionState(1).has_value());
  EXPECT_FALSE(proto::decodeTransmissionState(50).has_value());
  EXPECT_FALSE(proto::decodeTransmissionState(59).has_value());
  EXPECT_FALSE(proto::decodeTransmissionState(255).has_value());
}

TEST(DeviceStateTest, GlobalCodes) {
  EXPECT_EQ(proto::decodeGlobalState(6), proto::GlobalState::RUN);
  for (uint8_t raw = 0; raw <= 27; ++raw) {
    EXPECT_TRUE(proto::decodeGlobalState(raw).has_value()) << "code " << int(raw);
  }
  EXPECT_FALSE(proto::decodeGlobalState(28).has_value());
  EXPECT_FALSE(proto::decodeGlobalState(29).has_value());
  EXPECT_TRUE(proto::decodeGlobalState(30).has_value());
  EXPECT_TRUE(proto::decodeGlobalState(38).has_value());
  EXPECT_FALSE(proto::decodeGlobalState(39).has_value());
  EXPECT_TRUE(proto::decodeGlobalState(98).has_value());
  EXPECT_TRUE(proto::decodeGlobalState(101).has_value());
  EXPECT_FALSE(proto::decodeGlobalState(102).has_value());
}

TEST(DeviceStateTest, InverterCodes) {
  EXPECT_EQ(proto::decodeInverterState(0), proto::InverterState::STAND_BY);
  EXPECT_EQ(proto::decodeInverterState(2), proto::InverterState::RUN);
  EXPECT_TRUE(proto::decodeInverterState(31).has_value());
  EXPECT_FALSE(proto::decodeInverterState(32).has_value());
  EXPECT_FALSE(proto::decodeInverterState(39).has_value());
  EXPECT_TRUE(proto::decodeInverterState(40).has_value());
  EXPECT_TRUE(proto::decodeInverterState(47).has_value());
  EXPECT_FALSE(proto::decodeInverterState(48).has_value());
}

TEST(DeviceStateTest, DcDcCodes) {
  EXPECT_EQ(proto::decodeDcDcState(0), proto::DcDcState::OFF);
  EXPECT_EQ(proto::decodeDcDcState(2), proto::DcDcState::MPPT);
  EXPECT_TRUE(proto::decodeDcDcState(19).has_value());
  EXPECT_FALSE(proto::decodeDcDcState(20).has_value());
}

TEST(DeviceStateTest, NamesForLogging) {
  EXPECT_STREQ(proto::toString(proto::TransmissionState::OK), "Everything is OK");
  EXPECT_NE(proto::toString(proto::GlobalState::RUN), nullptr);
  EXPECT_EQ(proto::toString(static_cast<proto::InverterState>(99)), nullptr);
  EXPECT_NE(proto::toString(proto::StateDomain::DCDC), nullptr);
}
