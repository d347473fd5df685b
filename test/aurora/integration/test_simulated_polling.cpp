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

#include <chrono>
#include <string>
#include <vector>

#include "aurora_poller/aurora_session.hpp"
#include "aurora_poller/backend_factory.hpp"
#include "aurora_poller/energy_voltage_poller.hpp"
#include "aurora_utils/config/config.hpp"
#include "aurora_utils/serial/simulated_inverter_backend.hpp"
#include "aurora_utils/serial/tcp_bridge_backend.hpp"
#include "../test_doubles.hpp"

using aurora_poller::AuroraError;
using aurora_poller::AuroraSession;
using aurora_poller::EnergyVoltagePoller;
using aurora_poller::ErrorKind;
using namespace std::chrono_literals;

class SimulatedPollingTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    cfg_ = aurora::config::parse_from_yaml_string(
      "aurora_poller:\n"
      "  transport: simulated\n"
      "  inverter_address: 2\n"
      "  poll_interval_ms: 10000\n"
      "  timeout_multiplier: 3\n"
      "  skip_ticks: 2\n");
    session_ = std::make_unique<AuroraSession>(
      aurora_poller::makeBackend(cfg_), clock_, cfg_.crc_variant);
    inverter_ = dynamic_cast<aurora::serial::SimulatedInverterBackend *>(&session_->backend());
    ASSERT_NE(inverter_, nullptr);
  }

  aurora::config::Config cfg_;
  FakeClock clock_{1ms};
  std::unique_ptr<AuroraSession> session_;
  aurora::serial::SimulatedInverterBackend * inverter_ = nullptr;
};

TEST_F(SimulatedPollingTest, PollerOptionsFromConfig) {
  auto options = aurora_poller::makePollerOptions(cfg_);
  EXPECT_EQ(options.address, 2);
  EXPECT_EQ(options.poll_interval, aurora_poller::Duration(10s));
  EXPECT_EQ(options.timeout_multiplier, 3u);
  EXPECT_EQ(options.skip_ticks, 2u);
}

TEST_F(SimulatedPollingTest, ReadingsFromSimulatedInverter) {
  EnergyVoltagePoller poller(*session_, clock_, aurora_poller::makePollerOptions(cfg_));

  for (int i = 0; i < 3; ++i) {
    auto reading = poller.next();
    EXPECT_EQ(reading.energy_wh, 1234u);
    EXPECT_FLOAT_EQ(reading.voltage, 230.5f);
  }

  EXPECT_EQ(inverter_->requestCount(), 6u);
  // Voltage request is the last frame on the wire
  auto last = inverter_->getLastRequestFrame();
  ASSERT_EQ(last.size(), 10u);
  EXPECT_EQ(last[0], 2);
  EXPECT_EQ(last[1], 59);
  EXPECT_EQ(last[2], 23);
  EXPECT_EQ(last[3], 1);

  // Only the third tick waited for the rate limiter
  EXPECT_EQ(clock_.sleeps().size(), 1u);
}

TEST_F(SimulatedPollingTest, SilentInverterEndsStreamWithinWindow) {
  EnergyVoltagePoller poller(*session_, clock_, aurora_poller::makePollerOptions(cfg_));
  poller.next();

  inverter_->setSilent(true);
  const auto tick_start = clock_.peek();

  try {
    poller.next();
    FAIL() << "expected timeout";
  } catch (const AuroraError & e) {
    EXPECT_EQ(e.kind(), ErrorKind::TIMEOUT);
  }
  EXPECT_GE(clock_.peek() - tick_start, aurora_poller::Duration(30s));
  EXPECT_LE(clock_.peek() - tick_start, aurora_poller::Duration(30s + 10ms));

  try {
    poller.next();
    FAIL() << "expected terminated stream";
  } catch (const AuroraError & e) {
    EXPECT_EQ(e.kind(), ErrorKind::STREAM_TERMINATED);
  }
}

TEST_F(SimulatedPollingTest, CorruptFrameEndsStream) {
  EnergyVoltagePoller poller(*session_, clock_, aurora_poller::makePollerOptions(cfg_));
  inverter_->corruptNextResponse();

  try {
    poller.next();
    FAIL() << "expected CRC mismatch";
  } catch (const AuroraError & e) {
    EXPECT_EQ(e.kind(), ErrorKind::CRC_MISMATCH);
  }
  EXPECT_EQ(poller.state(), aurora_poller::PollState::FAILED);
}

TEST(SimulatedInverterTest, IgnoresRequestsWithAnyFlippedBit) {
  aurora::serial::SimulatedInverterBackend inverter;
  aurora::serial::SimulatedInverterState state;
  state.input1_voltage = 230.5f;
  inverter.setState(state);
  ASSERT_TRUE(inverter.open(aurora::serial::SerialOptions{}));

  // Measure(INPUT1_VOLTAGE, global) to address 2
  const std::vector<uint8_t> request = {0x02, 0x3B, 0x17, 0x01, 0x00, 0x00, 0x00, 0x00, 0xF1, 0x7D};
  uint8_t rx[16];

  for (size_t byte = 0; byte < request.size(); ++byte) {
    for (int bit = 0; bit < 8; ++bit) {
      std::vector<uint8_t> corrupted = request;
      corrupted[byte] ^= static_cast<uint8_t>(1u << bit);
      ASSERT_EQ(inverter.write(corrupted.data(), corrupted.size()), 10);
      EXPECT_EQ(inverter.requestCount(), 0u) << "byte " << byte << " bit " << bit;
      EXPECT_EQ(inverter.read(rx, sizeof(rx)), 0) << "byte " << byte << " bit " << bit;
    }
  }

  // The intact frame is answered
  ASSERT_EQ(inverter.write(request.data(), request.size()), 10);
  EXPECT_EQ(inverter.requestCount(), 1u);
  EXPECT_EQ(inverter.read(rx, sizeof(rx)), 8);
}

TEST(TcpBridgeAddressTest, SplitsHostAndPort) {
  std::string host, port;

  ASSERT_TRUE(aurora::serial::TcpBridgeBackend::splitAddress("192.168.1.50:8899", host, port));
  EXPECT_EQ(host, "192.168.1.50");
  EXPECT_EQ(port, "8899");

  ASSERT_TRUE(aurora::serial::TcpBridgeBackend::splitAddress("[fe80::1]:502", host, port));
  EXPECT_EQ(host, "fe80::1");
  EXPECT_EQ(port, "502");

  EXPECT_FALSE(aurora::serial::TcpBridgeBackend::splitAddress("inverter.local", host, port));
  EXPECT_FALSE(aurora::serial::TcpBridgeBackend::splitAddress("inverter.local:", host, port));
}
