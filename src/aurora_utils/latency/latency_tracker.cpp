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

#include "latency_tracker.hpp"

#include <algorithm>

#include <numeric>

namespace aurora
{
namespace latency
{

LatencyTracker::LatencyTracker(size_t window_size)
: window_size_(window_size == 0 ? 1 : window_size)
{
  latencies_.reserve(window_size_);
}

void LatencyTracker::recordRequestSent(uint8_t command, TimePoint send_time)
{
  pending_ = PendingRequest{command, send_time};
}

void LatencyTracker::recordResponse(TimePoint receive_time)
{
  if (!pending_) {
    return;
  }

  Duration latency = receive_time - pending_->send_time;
  pending_.reset();

  // Add to sliding window
  if (latencies_.size() >= window_size_) {
    latencies_.erase(latencies_.begin());
  }
  latencies_.push_back(latency);
}

void LatencyTracker::abandonPending()
{
  pending_.reset();
}

Duration LatencyTracker::getP95Latency() const
{
  if (latencies_.empty()) {
    return Duration::zero();
  }

  std::vector<Duration> sorted_latencies = latencies_;
  std::sort(sorted_latencies.begin(), sorted_latencies.end());

  size_t p95_index = static_cast<size_t>(0.95 * sorted_latencies.size());
  if (p95_index >= sorted_latencies.size()) {
    p95_index = sorted_latencies.size() - 1;
  }

  return sorted_latencies[p95_index];
}

Duration LatencyTracker::getMeanLatency() const
{
  if (latencies_.empty()) {
    return Duration::zero();
  }

  auto total = std::accumulate(latencies_.begin(), latencies_.end(), Duration::zero());
  return total / latencies_.size();
}

Duration LatencyTracker::getMaxLatency() const
{
  if (latencies_.empty()) {
    return Duration::zero();
  }

  return *std::max_element(latencies_.begin(), latencies_.end());
}

size_t LatencyTracker::getSampleCount() const
{
  return latencies_.size();
}

void LatencyTracker::reset()
{
  latencies_.clear();
  pending_.reset();
}

} // namespace latency
} // namespace aurora
