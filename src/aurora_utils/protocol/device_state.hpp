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

#ifndef AURORA_UTILS__PROTOCOL__DEVICE_STATE_HPP_
#define AURORA_UTILS__PROTOCOL__DEVICE_STATE_HPP_

#pragma once

#include <optional>

#include <cstdint>

#include "types.hpp"

namespace aurora
{
namespace protocol
{

// Which status table a raw byte was checked against
enum class StateDomain : uint8_t
{
  TRANSMISSION,
  GLOBAL,
  INVERTER,
  DCDC
};

/**
 * Status byte decoders.
 *
 * Each decoder accepts exactly the codes listed in the protocol tables and
 * returns std::nullopt for anything else. Callers must treat std::nullopt as
 * a decode failure; there is no fallback state.
 */
std::optional<TransmissionState> decodeTransmissionState(uint8_t raw);
std::optional<GlobalState> decodeGlobalState(uint8_t raw);
std::optional<InverterState> decodeInverterState(uint8_t raw);
std::optional<DcDcState> decodeDcDcState(uint8_t raw);

// Human readable names; nullptr for values outside the tables
const char * toString(TransmissionState state);
const char * toString(GlobalState state);
const char * toString(InverterState state);
const char * toString(DcDcState state);
const char * toString(StateDomain domain);

} // namespace protocol
} // namespace aurora

#endif  // AURORA_UTILS__PROTOCOL__DEVICE_STATE_HPP_
