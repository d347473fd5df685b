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

#ifndef AURORA_POLLER__PVOUTPUT_STATUS_HPP_
#define AURORA_POLLER__PVOUTPUT_STATUS_HPP_

#pragma once

#include <ctime>
#include <string>
#include <utility>
#include <vector>

#include "aurora_poller/energy_voltage_poller.hpp"

namespace aurora_poller
{

struct PvOutputCredentials
{
  std::string system_id;
  std::string api_key;
};

// A prepared addstatus.jsp POST; sending it is left to the caller
struct StatusUpload
{
  std::string method;
  std::string url;
  std::vector<std::pair<std::string, std::string>> headers;
  std::string body;
};

extern const char * const PVOUTPUT_ADD_STATUS_URL;

std::string formatVoltage(float voltage);

// d=YYYYMMDD&t=HH:MM&v1=<energy Wh>&v6=<voltage V>
std::string formatStatusBody(const Reading & reading, const std::tm & local_time);

StatusUpload makeStatusUpload(
  const Reading & reading, const std::tm & local_time,
  const PvOutputCredentials & credentials);

} // namespace aurora_poller
#endif  // AURORA_POLLER__PVOUTPUT_STATUS_HPP_
