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

#include "aurora_poller/status_uploader.hpp"

#include <mutex>
#include <string>

#include <curl/curl.h>

#include "rclcpp/rclcpp.hpp"

#include "aurora_poller/aurora_error.hpp"

namespace aurora_poller
{

static size_t discardResponseBody(char *, size_t size, size_t nmemb, void *)
{
  return size * nmemb;
}

CurlStatusSender::CurlStatusSender(std::chrono::seconds timeout)
: timeout_(timeout)
{
}

long CurlStatusSender::send(const StatusUpload & upload)
{
  static std::once_flag curl_once;
  std::call_once(curl_once, []() {curl_global_init(CURL_GLOBAL_DEFAULT);});

  CURL * curl = curl_easy_init();
  if (!curl) {
    throw AuroraError(ErrorKind::IO_FAILURE, "curl_easy_init failed");
  }

  struct curl_slist * headers = nullptr;
  for (const auto & header : upload.headers) {
    headers = curl_slist_append(headers, (header.first + ": " + header.second).c_str());
  }

  curl_easy_setopt(curl, CURLOPT_URL, upload.url.c_str());
  curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, upload.method.c_str());
  curl_easy_setopt(curl, CURLOPT_POSTFIELDS, upload.body.c_str());
  curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(upload.body.size()));
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, discardResponseBody);
  curl_easy_setopt(curl, CURLOPT_PROTOCOLS, CURLPROTO_HTTP | CURLPROTO_HTTPS);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeout_.count()));

  const CURLcode res = curl_easy_perform(curl);
  long status = 0;
  if (res == CURLE_OK) {
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
  }
  curl_slist_free_all(headers);
  curl_easy_cleanup(curl);

  if (res != CURLE_OK) {
    throw AuroraError(
      ErrorKind::IO_FAILURE,
      std::string("status upload to ") + upload.url + " failed: " + curl_easy_strerror(res));
  }
  return status;
}

bool deliverStatus(StatusSender & sender, const StatusUpload & upload)
{
  auto logger = rclcpp::get_logger("aurora_poller");
  RCLCPP_INFO(logger, "Uploading values");

  const long status = sender.send(upload);
  if (status != 200) {
    RCLCPP_WARN(logger, "Failed to upload status (HTTP %ld), continuing", status);
    return false;
  }
  return true;
}

} // namespace aurora_poller
