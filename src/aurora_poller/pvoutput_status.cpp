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

#include "aurora_poller/pvoutput_status.hpp"

#include <cstdio>
#include <cstdlib>
#include <limits>

namespace aurora_poller
{

const char * const PVOUTPUT_ADD_STATUS_URL = "http://pvoutput.org/service/r2/addstatus.jsp";

// Fewest digits that read back as the same float; 10.0 prints as "10"
std::string formatVoltage(float voltage)
{
  char text[32];
  for (int digits = 6; digits <= std::numeric_limits<float>::max_digits10; ++digits) {
    std::snprintf(text, sizeof(text), "%.*g", digits, static_cast<double>(voltage));
    if (std::strtof(text, nullptr) == voltage) {
      break;
    }
  }
  return text;
}

std::string formatStatusBody(const Reading & reading, const std::tm & local_time)
{
  char date[16];
  char time[8];
  std::snprintf(
    date, sizeof(date), "%04d%02d%02d",
    local_time.tm_year + 1900, local_time.tm_mon + 1, local_time.tm_mday);
  std::snprintf(time, sizeof(time), "%02d:%02d", local_time.tm_hour, local_time.tm_min);

  return std::string("d=") + date + "&t=" + time +
         "&v1=" + std::to_string(reading.energy_wh) +
         "&v6=" + formatVoltage(reading.voltage);
}

StatusUpload makeStatusUpload(
  const Reading & reading, const std::tm & local_time,
  const PvOutputCredentials & credentials)
{
  StatusUpload upload;
  upload.method = "POST";
  upload.url = PVOUTPUT_ADD_STATUS_URL;
  upload.headers.emplace_back("X-Pvoutput-Apikey", credentials.api_key);
  upload.headers.emplace_back("X-Pvoutput-SystemId", credentials.system_id);
  upload.headers.emplace_back("Content-Type", "application/x-www-form-urlencoded");
  upload.body = formatStatusBody(reading, local_time);
  return upload;
}

} // namespace aurora_poller
