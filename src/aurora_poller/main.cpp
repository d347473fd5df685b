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

#include <ctime>
#include <exception>
#include <string>

#include "rclcpp/rclcpp.hpp"

#include "aurora_utils/config/config.hpp"
#include "aurora_poller/aurora_session.hpp"
#include "aurora_poller/backend_factory.hpp"
#include "aurora_poller/energy_voltage_poller.hpp"
#include "aurora_poller/pvoutput_status.hpp"
#include "aurora_poller/status_uploader.hpp"

int main(int argc, char ** argv)
{
  const std::string config_path = argc > 1 ? argv[1] : "aurora_poller.yaml";
  auto logger = rclcpp::get_logger("aurora_poller");

  aurora::config::Config cfg;
  try {
    cfg = aurora::config::parse_from_yaml_file(config_path);
  } catch (const std::exception & e) {
    RCLCPP_ERROR(logger, "Couldn't load config %s: %s", config_path.c_str(), e.what());
    return 2;
  }

  RCLCPP_INFO(
    logger, "Polling inverter %d over %s every %dms", cfg.inverter_address,
    aurora::config::toString(cfg.transport), cfg.poll_interval_ms);

  const aurora_poller::PvOutputCredentials credentials{
    cfg.pv_output.system_id, cfg.pv_output.api_key};

  try {
    aurora_poller::SteadyClock clock;
    aurora_poller::AuroraSession session(
      aurora_poller::makeBackend(cfg), clock, cfg.crc_variant);
    aurora_poller::EnergyVoltagePoller poller(
      session, clock, aurora_poller::makePollerOptions(cfg));
    aurora_poller::CurlStatusSender uploader;

    poller.run(
      [&](const aurora_poller::Reading & reading) {
        RCLCPP_INFO(logger, "%uWh, %gV", reading.energy_wh, static_cast<double>(reading.voltage));

        std::time_t now = std::time(nullptr);
        std::tm local_time{};
        localtime_r(&now, &local_time);
        auto upload = aurora_poller::makeStatusUpload(reading, local_time, credentials);
        RCLCPP_INFO(logger, "Body: %s", upload.body.c_str());
        aurora_poller::deliverStatus(uploader, upload);
        session.logLatencyStats();
      });
  } catch (const aurora_poller::AuroraError & e) {
    RCLCPP_ERROR(
      logger, "Polling stopped (%s): %s", aurora_poller::toString(e.kind()), e.what());
    return 1;
  } catch (const std::exception & e) {
    RCLCPP_ERROR(logger, "Polling stopped: %s", e.what());
    return 1;
  }

  return 0;
}
