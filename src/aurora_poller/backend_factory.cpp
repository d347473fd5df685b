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

#include "aurora_poller/backend_factory.hpp"

#include <string>
#include <utility>

#include "rclcpp/rclcpp.hpp"

#include "aurora_utils/serial/serial_port_backend.hpp"
#include "aurora_utils/serial/simulated_inverter_backend.hpp"
#include "aurora_utils/serial/tcp_bridge_backend.hpp"
#include "aurora_poller/aurora_error.hpp"

namespace aurora_poller
{

std::unique_ptr<aurora::serial::SerialBackend> makeBackend(const aurora::config::Config & cfg)
{
  aurora::serial::SerialOptions opts;
  opts.baud_rate = cfg.baud_rate;
  opts.read_timeout_ms = cfg.read_timeout_ms;
  opts.write_timeout_ms = cfg.read_timeout_ms;

  std::unique_ptr<aurora::serial::SerialBackend> backend;
  switch (cfg.transport) {
    case aurora::config::TransportKind::TCP:
      opts.device = cfg.tcp_address;
      backend = std::make_unique<aurora::serial::TcpBridgeBackend>();
      break;
    case aurora::config::TransportKind::SERIAL:
      opts.device = cfg.serial_port;
      backend = std::make_unique<aurora::serial::SerialPortBackend>();
      break;
    case aurora::config::TransportKind::SIMULATED: {
        opts.device = "simulated";
        auto simulated =
          std::make_unique<aurora::serial::SimulatedInverterBackend>(cfg.crc_variant);
        aurora::serial::SimulatedInverterState state;
        state.address = static_cast<uint8_t>(cfg.inverter_address);
        state.daily_energy_wh = 1234;
        state.total_energy_wh = 4567890;
        state.input1_voltage = 230.5f;
        state.grid_power = 1500.0f;
        simulated->setState(state);
        backend = std::move(simulated);
        break;
      }
  }

  if (!backend->open(opts)) {
    throw AuroraError(
      ErrorKind::IO_FAILURE,
      std::string("failed to open ") + aurora::config::toString(cfg.transport) +
      " transport " + opts.device);
  }

  RCLCPP_INFO(
    rclcpp::get_logger("aurora_poller"), "Connected via %s", backend->describe().c_str());
  return backend;
}

PollerOptions makePollerOptions(const aurora::config::Config & cfg)
{
  PollerOptions options;
  options.address = static_cast<uint8_t>(cfg.inverter_address);
  options.poll_interval = cfg.poll_interval();
  options.timeout_multiplier = static_cast<uint32_t>(cfg.timeout_multiplier);
  options.skip_ticks = static_cast<uint32_t>(cfg.skip_ticks);
  return options;
}

} // namespace aurora_poller
