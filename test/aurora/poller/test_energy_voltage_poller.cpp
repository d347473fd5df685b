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

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <variant>
#include <vector>

#include "aurora_poller/energy_voltage_poller.hpp"
#include "../test_doubles.hpp"

namespace proto = aurora::protocol;
using aurora_poller::AuroraError;
using aurora_poller::EnergyVoltagePoller;
using aurora_poller::ErrorKind;
using aurora_poller::PollerOptions;
using aurora_poller::PollState;
using aurora_poller::Reading;
using aurora_poller::TimePoint;
using ::testing::_;
using ::testing::InSequence;
using ::testing::Invoke;
using ::testing::Return;
using ::testing::Throw;
using ::testing::Truly;
using namespace std::chrono_literals;

namespace
{
bool isDailyEnergy(const proto::Request & request)
{
  const auto * energy = std::get_if<proto::CumulativeEnergyRequest>(&request);
  return energy && energy->duration == proto::CumulativeDuration::DAILY;
}

bool isInput1Voltage(const proto::Request & request)
{
  const auto * measure = std::get_if<proto::MeasureRequest>(&request);
  return measure && measure->type == proto::MeasurementType::INPUT1_VOLTAGE && measure->global;
}

proto::Response energyResponse(uint32_t wh)
{
  proto::CumulativeEnergyResponse response;
  response.value = wh;
  return response;
}

proto::Response voltageResponse(float volts)
{
  proto::MeasureResponse response;
  response.type = proto::MeasurementType::INPUT1_VOLTAGE;
  response.value = volts;
  return response;
}
}  // namespace

class EnergyVoltagePollerTest : public ::testing::Test
{
protected:
  PollerOptions options(uint32_t skip_ticks = 2)
  {
    PollerOptions opts;
    opts.address = 2;
    opts.poll_interval = 10s;
    opts.timeout_multiplier = 3;
    opts.skip_ticks = skip_ticks;
    return opts;
  }

  void expectTick(uint32_t wh, float volts)
  {
    EXPECT_CALL(service_, call(2, Truly(isDailyEnergy), _)).WillOnce(Return(energyResponse(wh)));
    EXPECT_CALL(service_, call(2, Truly(isInput1Voltage), _))
    .WillOnce(Return(voltageResponse(volts)));
  }

  FakeClock clock_;
  ::testing::StrictMock<MockAuroraService> service_;
};

TEST_F(EnergyVoltagePollerTest, EnergyThenVoltagePerTick) {
  {
    InSequence seq;
    expectTick(1200, 230.5f);
  }
  EnergyVoltagePoller poller(service_, clock_, options());

  Reading reading = poller.next();

  EXPECT_EQ(reading.energy_wh, 1200u);
  EXPECT_FLOAT_EQ(reading.voltage, 230.5f);
  EXPECT_EQ(poller.state(), PollState::IDLE);
  EXPECT_EQ(poller.completedTicks(), 1u);
}

TEST_F(EnergyVoltagePollerTest, ReadingsComeOutInOrder) {
  {
    InSequence seq;
    expectTick(100, 200.0f);
    expectTick(150, 210.0f);
    expectTick(175, 220.0f);
  }
  EnergyVoltagePoller poller(service_, clock_, options());

  EXPECT_EQ(poller.next().energy_wh, 100u);
  EXPECT_EQ(poller.next().energy_wh, 150u);
  Reading third = poller.next();
  EXPECT_EQ(third.energy_wh, 175u);
  EXPECT_FLOAT_EQ(third.voltage, 220.0f);
}

TEST_F(EnergyVoltagePollerTest, DeadlineIsTimeoutWindowFromTickStart) {
  const TimePoint tick_start = clock_.peek();
  std::vector<TimePoint> deadlines;
  EXPECT_CALL(service_, call(2, _, _))
  .WillOnce(
    Invoke(
      [&](uint8_t, const proto::Request &, TimePoint deadline) {
        deadlines.push_back(deadline);
        clock_.advance(2s);
        return energyResponse(1);
      }))
  .WillOnce(
    Invoke(
      [&](uint8_t, const proto::Request &, TimePoint deadline) {
        deadlines.push_back(deadline);
        return voltageResponse(1.0f);
      }));
  EnergyVoltagePoller poller(service_, clock_, options());

  poller.next();

  ASSERT_EQ(deadlines.size(), 2u);
  EXPECT_EQ(deadlines[0], tick_start + 30s);
  EXPECT_EQ(deadlines[1], tick_start + 30s);
}

TEST_F(EnergyVoltagePollerTest, SkipTicksThenRateLimited) {
  {
    InSequence seq;
    expectTick(1, 1.0f);
    expectTick(2, 1.0f);
    expectTick(3, 1.0f);
    expectTick(4, 1.0f);
  }
  EnergyVoltagePoller poller(service_, clock_, options(2));

  const TimePoint t0 = clock_.peek();
  poller.next();
  poller.next();
  EXPECT_TRUE(clock_.sleeps().empty());
  EXPECT_EQ(clock_.peek(), t0);

  poller.next();
  ASSERT_EQ(clock_.sleeps().size(), 1u);
  EXPECT_EQ(clock_.sleeps()[0], t0 + 10s);

  poller.next();
  ASSERT_EQ(clock_.sleeps().size(), 2u);
  EXPECT_EQ(clock_.sleeps()[1], t0 + 20s);
}

TEST_F(EnergyVoltagePollerTest, WithoutSkipsFirstTickWaits) {
  expectTick(1, 1.0f);
  const TimePoint t0 = clock_.peek();
  EnergyVoltagePoller poller(service_, clock_, options(0));

  poller.next();

  ASSERT_EQ(clock_.sleeps().size(), 1u);
  EXPECT_EQ(clock_.sleeps()[0], t0 + 10s);
}

TEST_F(EnergyVoltagePollerTest, TimeoutEndsTheStream) {
  EXPECT_CALL(service_, call(2, Truly(isDailyEnergy), _))
  .WillOnce(Throw(AuroraError(ErrorKind::TIMEOUT, "no response")));
  EnergyVoltagePoller poller(service_, clock_, options());

  try {
    poller.next();
    FAIL() << "expected timeout";
  } catch (const AuroraError & e) {
    EXPECT_EQ(e.kind(), ErrorKind::TIMEOUT);
  }
  EXPECT_EQ(poller.state(), PollState::FAILED);

  // Terminal: the service is never called again
  try {
    poller.next();
    FAIL() << "expected terminated stream";
  } catch (const AuroraError & e) {
    EXPECT_EQ(e.kind(), ErrorKind::STREAM_TERMINATED);
  }
}

TEST_F(EnergyVoltagePollerTest, LateResponseIsTimeout) {
  {
    InSequence seq;
    EXPECT_CALL(service_, call(2, Truly(isDailyEnergy), _))
    .WillOnce(
      Invoke(
        [&](uint8_t, const proto::Request &, TimePoint) {
          clock_.advance(31s);
          return energyResponse(1);
        }));
  }
  EnergyVoltagePoller poller(service_, clock_, options());

  try {
    poller.next();
    FAIL() << "expected timeout";
  } catch (const AuroraError & e) {
    EXPECT_EQ(e.kind(), ErrorKind::TIMEOUT);
  }
  EXPECT_EQ(poller.state(), PollState::FAILED);
}

TEST_F(EnergyVoltagePollerTest, VoltageFailureAfterEnergy) {
  {
    InSequence seq;
    EXPECT_CALL(service_, call(2, Truly(isDailyEnergy), _)).WillOnce(Return(energyResponse(5)));
    EXPECT_CALL(service_, call(2, Truly(isInput1Voltage), _))
    .WillOnce(Throw(AuroraError(ErrorKind::CRC_MISMATCH, "bad crc")));
  }
  EnergyVoltagePoller poller(service_, clock_, options());

  EXPECT_THROW(poller.next(), AuroraError);
  EXPECT_EQ(poller.state(), PollState::FAILED);
  EXPECT_EQ(poller.completedTicks(), 0u);
}

TEST_F(EnergyVoltagePollerTest, WrongResponseKindIsProtocolViolation) {
  EXPECT_CALL(service_, call(2, Truly(isDailyEnergy), _))
  .WillOnce(Return(voltageResponse(1.0f)));
  EnergyVoltagePoller poller(service_, clock_, options());

  try {
    poller.next();
    FAIL() << "expected protocol violation";
  } catch (const AuroraError & e) {
    EXPECT_EQ(e.kind(), ErrorKind::PROTOCOL_VIOLATION);
  }
}

TEST_F(EnergyVoltagePollerTest, RunFeedsSinkUntilFailure) {
  {
    InSequence seq;
    expectTick(10, 1.0f);
    expectTick(20, 2.0f);
    EXPECT_CALL(service_, call(2, Truly(isDailyEnergy), _))
    .WillOnce(Throw(AuroraError(ErrorKind::IO_FAILURE, "link down")));
  }
  EnergyVoltagePoller poller(service_, clock_, options());

  std::vector<Reading> readings;
  try {
    poller.run([&](const Reading & r) {readings.push_back(r);});
    FAIL() << "run() returned";
  } catch (const AuroraError & e) {
    EXPECT_EQ(e.kind(), ErrorKind::IO_FAILURE);
  }

  ASSERT_EQ(readings.size(), 2u);
  EXPECT_EQ(readings[0].energy_wh, 10u);
  EXPECT_EQ(readings[1].energy_wh, 20u);
}

TEST_F(EnergyVoltagePollerTest, RejectsInvalidOptions) {
  auto zero_interval = options();
  zero_interval.poll_interval = aurora_poller::Duration::zero();
  EXPECT_THROW(
    {EnergyVoltagePoller poller(service_, clock_, zero_interval);}, std::invalid_argument);

  auto zero_multiplier = options();
  zero_multiplier.timeout_multiplier = 0;
  EXPECT_THROW(
    {EnergyVoltagePoller poller(service_, clock_, zero_multiplier);}, std::invalid_argument);
}

TEST_F(EnergyVoltagePollerTest, RejectsWindowThatOverflows) {
  auto huge_multiplier = options();
  huge_multiplier.poll_interval = std::chrono::minutes(5);
  huge_multiplier.timeout_multiplier = 40000000;
  EXPECT_THROW(
    {EnergyVoltagePoller poller(service_, clock_, huge_multiplier);}, std::invalid_argument);

  // Largest multiplier that still fits is accepted
  auto largest = options();
  largest.poll_interval = std::chrono::minutes(5);
  largest.timeout_multiplier = static_cast<uint32_t>(
    aurora_poller::Duration::max() / largest.poll_interval);
  EXPECT_NO_THROW({EnergyVoltagePoller poller(service_, clock_, largest);});
}

int main(int argc, char ** argv)
{
  ::testing::InitGoogleMock(&argc, argv);
  return RUN_ALL_TESTS();
}
