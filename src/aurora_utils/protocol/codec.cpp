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

#include "codec.hpp"

#include <algorithm>
#include <utility>

namespace aurora
{
namespace protocol
{

FrameCodec::FrameCodec(CrcVariant variant)
: variant_(variant)
{
}

ErrorCode FrameCodec::encode(
  uint8_t address, const Request & request,
  std::vector<uint8_t> & out)
{
  if (pending_) {
    return ErrorCode::REQUEST_PENDING;
  }

  uint8_t frame[REQUEST_FRAME_SIZE];
  size_t bytes_written = 0;
  ErrorCode err = encodeRequest(address, request, frame, sizeof(frame), bytes_written, variant_);
  if (err != ErrorCode::OK) {
    return err;
  }

  out.insert(out.end(), frame, frame + bytes_written);
  pending_ = request;
  return ErrorCode::OK;
}

ParseResult FrameCodec::decode(std::vector<uint8_t> & buffer, ParsedResponse & out)
{
  if (buffer.size() < RESPONSE_FRAME_SIZE) {
    return ParseResult::INSUFFICIENT_DATA;
  }

  uint8_t frame[RESPONSE_FRAME_SIZE];
  std::copy(buffer.begin(), buffer.begin() + RESPONSE_FRAME_SIZE, frame);
  buffer.erase(buffer.begin(), buffer.begin() + RESPONSE_FRAME_SIZE);

  ParseResult framing = tryParseResponseFrame(ByteSpan(frame, sizeof(frame)), variant_);
  if (framing != ParseResult::SUCCESS) {
    out.result = framing;
    return framing;
  }

  if (!pending_) {
    out.result = ParseResult::UNEXPECTED_RESPONSE;
    return out.result;
  }

  Request pending = std::move(*pending_);
  pending_.reset();

  out = interpretPayload(pending, frame);
  return out.result;
}

} // namespace protocol
} // namespace aurora
