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

// Header guard
#ifndef AURORA_UTILS__LATENCY__LATENCY_TRACKER_HPP_
#define AURORA_UTILS__LATENCY__LATENCY_TRACKER_HPP_

#pragma once

#include <chrono>
#include <optional>
#include <vector>

#include <cstdint>

namespace aurora
{
namespace latency
{

using TimePoint = std::chrono::steady_clock::time_point;
using Duration = std::chrono::steady_clock::duration;

/**
 * @brief Tracks request/response round-trip times on one link
 *
 * Only one request can be outstanding on an Aurora link, so the tracker
 * keeps a single pending send time. A sliding window of completed round
 * trips is kept for statistics (p95, mean, max).
 */
class LatencyTracker
{
public:
  /**
   * @brief Construct a new Latency Tracker
   *
   * @param window_size Maximum number of samples to keep in sliding window
   */
  explicit LatencyTracker(size_t window_size = 100);

  /**
   * @brief Record when a request frame was written
   *
   * @param command Command code of the request
   * @param send_time Time when the request was sent
   */
  void recordRequestSent(uint8_t command, TimePoint send_time);

  /**
   * @brief Record when the response to the pending request was decoded
   *
   * Ignored when no request is pending.
   *
   * @param receive_time Time when the response was received
   */
  void recordResponse(TimePoint receive_time);

  /**
   * @brief Forget the pending request without producing a sample
   */
  void abandonPending();

  /**
   * @brief Get the current 95th percentile latency
   *
   * @return Duration representing p95 latency, or zero if insufficient samples
   */
  Duration getP95Latency() const;

  Duration getMeanLatency() const;

  Duration getMaxLatency() const;

  size_t getSampleCount() const;

  /**
   * @brief Clear all measurements and reset state
   */
  void reset();

private:
  struct PendingRequest
  {
    uint8_t command;
    TimePoint send_time;
  };

  size_t window_size_;
  std::optional<PendingRequest> pending_;
  std::vector<Duration> latencies_;
};

} // namespace latency
} // namespace aurora

#endif  // AURORA_UTILS__LATENCY__LATENCY_TRACKER_HPP_
