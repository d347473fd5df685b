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

#ifndef AURORA_POLLER__STATUS_UPLOADER_HPP_
#define AURORA_POLLER__STATUS_UPLOADER_HPP_

#pragma once

#include <chrono>

#include "aurora_poller/pvoutput_status.hpp"

namespace aurora_poller
{

/**
 * Sends one prepared StatusUpload and reports the HTTP status code.
 *
 * Throws AuroraError(IO_FAILURE) when no HTTP response was received.
 */
class StatusSender
{
public:
  virtual ~StatusSender() = default;

  virtual long send(const StatusUpload & upload) = 0;
};

// StatusSender over libcurl's easy interface, one connection per upload
class CurlStatusSender : public StatusSender
{
public:
  explicit CurlStatusSender(std::chrono::seconds timeout = std::chrono::seconds(30));

  long send(const StatusUpload & upload) override;

private:
  std::chrono::seconds timeout_;
};

// Send @p upload. A non-200 answer is logged as a warning and false is
// returned; transport failures propagate.
bool deliverStatus(StatusSender & sender, const StatusUpload & upload);

} // namespace aurora_poller
#endif  // AURORA_POLLER__STATUS_UPLOADER_HPP_
