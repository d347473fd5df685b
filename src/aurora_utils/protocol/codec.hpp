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

#ifndef AURORA_UTILS__PROTOCOL__CODEC_HPP_
#define AURORA_UTILS__PROTOCOL__CODEC_HPP_

#pragma once

#include <optional>
#include <vector>

#include <cstdint>

#include "frame.hpp"

namespace aurora
{
namespace protocol
{

/**
 * @brief Request/response codec for one Aurora link
 *
 * Response frames carry no command tag, so the codec remembers the request it
 * last encoded and interprets the next response frame against it. At most one
 * request is pending: encode() refuses to overwrite an unanswered request and
 * a successful CRC check on a response always empties the slot.
 *
 * Not thread safe; a codec belongs to exactly one connection.
 */
class FrameCodec
{
public:
  explicit FrameCodec(CrcVariant variant = CrcVariant::X25);

  /**
   * @brief Append the encoded request frame to @p out and mark it pending
   *
   * @return REQUEST_PENDING (and nothing appended) if the previous request
   *         has not been answered yet
   */
  ErrorCode encode(uint8_t address, const Request & request, std::vector<uint8_t> & out);

  /**
   * @brief Try to decode one response from the front of @p buffer
   *
   * With fewer than RESPONSE_FRAME_SIZE bytes buffered nothing is consumed
   * and INSUFFICIENT_DATA is returned, so the call can be repeated as more
   * bytes arrive. Otherwise exactly one frame is consumed, whether or not it
   * decodes.
   */
  ParseResult decode(std::vector<uint8_t> & buffer, ParsedResponse & out);

  bool hasPending() const {return pending_.has_value();}
  const std::optional<Request> & pending() const {return pending_;}

  // Drop the pending request, e.g. after the caller gave up waiting
  void clearPending() {pending_.reset();}

private:
  CrcVariant variant_;
  std::optional<Request> pending_;
};

} // namespace protocol
} // namespace aurora

#endif  // AURORA_UTILS__PROTOCOL__CODEC_HPP_
