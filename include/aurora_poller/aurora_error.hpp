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

#ifndef AURORA_POLLER__AURORA_ERROR_HPP_
#define AURORA_POLLER__AURORA_ERROR_HPP_

#pragma once

#include <stdexcept>
#include <string>

#include <cstdint>

namespace aurora_poller
{

enum class ErrorKind
{
  IO_FAILURE,
  CRC_MISMATCH,
  UNEXPECTED_RESPONSE,
  UNKNOWN_STATE_CODE,
  TIMEOUT,
  PROTOCOL_VIOLATION,
  STREAM_TERMINATED
};

const char * toString(ErrorKind kind);

class AuroraError : public std::runtime_error
{
public:
  AuroraError(ErrorKind kind, const std::string & message, uint8_t raw = 0)
  : std::runtime_error(message), kind_(kind), raw_(raw) {}

  ErrorKind kind() const noexcept {return kind_;}
  // Offending byte for UNKNOWN_STATE_CODE, 0 otherwise
  uint8_t raw() const noexcept {return raw_;}

private:
  ErrorKind kind_;
  uint8_t raw_;
};

} // namespace aurora_poller
#endif  // AURORA_POLLER__AURORA_ERROR_HPP_
