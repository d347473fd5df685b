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

#ifndef AURORA_UTILS__PROTOCOL__TYPES_HPP_
#define AURORA_UTILS__PROTOCOL__TYPES_HPP_

#pragma once

#include <array>
#include <variant>

#include <cstdint>

namespace aurora
{
namespace protocol
{

// Command codes (byte 1 of a request frame)
enum class CommandCode : uint8_t
{
  STATE = 50,
  PART_NUMBER = 52,
  VERSION = 58,
  MEASURE = 59,
  SERIAL_NUMBER = 63,
  MANUFACTURE_DATE = 65,
  CUMULATIVE_ENERGY = 78
};

// DSP measurement selectors for command 59
enum class MeasurementType : uint8_t
{
  GRID_VOLTAGE = 1,
  GRID_CURRENT = 2,
  GRID_POWER = 3,
  FREQUENCY = 4,
  VBULK = 5,
  ILEAK_DCDC = 6,
  ILEAK_INVERTER = 7,
  PIN1 = 8,
  PIN2 = 9,
  INVERTER_TEMPERATURE = 21,
  BOOSTER_TEMPERATURE = 22,
  INPUT1_VOLTAGE = 23,
  INPUT1_CURRENT = 25,
  INPUT2_VOLTAGE = 26,
  INPUT2_CURRENT = 27,
  GRID_VOLTAGE_DCDC = 28,
  GRID_FREQUENCY_DCDC = 29,
  ISOLATION_RESISTANCE = 30,
  VBULK_DCDC = 31,
  AVERAGE_GRID_VOLTAGE = 32,
  VBULK_MID = 33,
  PEAK_POWER = 34,
  PEAK_POWER_TODAY = 35,
  GRID_VOLTAGE_NEUTRAL = 36,
  WIND_GENERATOR_FREQUENCY = 37,
  GRID_VOLTAGE_NEUTRAL_PHASE = 38,
  GRID_CURRENT_PHASE_R = 39,
  GRID_CURRENT_PHASE_S = 40,
  GRID_CURRENT_PHASE_T = 41,
  FREQUENCY_PHASE_R = 42,
  FREQUENCY_PHASE_S = 43,
  FREQUENCY_PHASE_T = 44,
  VBULK_POSITIVE = 45,
  VBULK_NEGATIVE = 46,
  SUPERVISOR_TEMPERATURE = 47,
  ALIM_TEMPERATURE = 48,
  HEAT_SINK_TEMPERATURE = 49,
  TEMPERATURE_1 = 50,
  TEMPERATURE_2 = 51,
  TEMPERATURE_3 = 52,
  FAN_SPEED_1 = 53,
  FAN_SPEED_2 = 54,
  FAN_SPEED_3 = 55,
  FAN_SPEED_4 = 56,
  FAN_SPEED_5 = 57,
  POWER_SATURATION_LIMIT = 58,
  REFERENCE_RING_BULK = 59,
  VPANEL_MICRO = 60,
  GRID_VOLTAGE_PHASE_R = 61,
  GRID_VOLTAGE_PHASE_S = 62,
  GRID_VOLTAGE_PHASE_T = 63
};

// Period selector for command 78; code 2 is reserved by the protocol
enum class CumulativeDuration : uint8_t
{
  DAILY = 0,
  WEEKLY = 1,
  MONTHLY = 3,
  YEARLY = 4,
  TOTAL = 5,
  SINCE_RESET = 6
};

enum class TransmissionState : uint8_t
{
  OK = 0,
  COMMAND_NOT_IMPLEMENTED = 51,
  VARIABLE_DOES_NOT_EXIST = 52,
  VARIABLE_OUT_OF_RANGE = 53,
  EEPROM_NOT_ACCESSIBLE = 54,
  NOT_TOGGLED_SERVICE_MODE = 55,
  INTERNAL_MICRO_UNREACHABLE = 56,
  COMMAND_NOT_EXECUTED = 57,
  VARIABLE_NOT_AVAILABLE = 58
};

enum class GlobalState : uint8_t
{
  SENDING_PARAMETERS = 0,
  WAIT_SUN_GRID = 1,
  CHECKING_GRID = 2,
  MEASURING_RISO = 3,
  DCDC_START = 4,
  INVERTER_START = 5,
  RUN = 6,
  RECOVERY = 7,
  PAUSE = 8,
  GROUND_FAULT = 9,
  OTH_FAULT = 10,
  ADDRESS_SETTING = 11,
  SELF_TEST = 12,
  SELF_TEST_FAIL = 13,
  SENSOR_TEST_MEAS_RISO = 14,
  LEAK_FAULT = 15,
  WAITING_MANUAL_RESET = 16,
  INTERNAL_ERROR_E026 = 17,
  INTERNAL_ERROR_E027 = 18,
  INTERNAL_ERROR_E028 = 19,
  INTERNAL_ERROR_E029 = 20,
  INTERNAL_ERROR_E030 = 21,
  SENDING_WIND_TABLE = 22,
  FAILED_SENDING_TABLE = 23,
  UTH_FAULT = 24,
  REMOTE_OFF = 25,
  INTERLOCK_FAIL = 26,
  EXECUTING_AUTOTEST = 27,
  WAITING_SUN = 30,
  TEMPERATURE_FAULT = 31,
  FAN_STUCK = 32,
  INTERNAL_COMM_FAULT = 33,
  SLAVE_INSERTION = 34,
  DC_SWITCH_OPEN = 35,
  TRAS_SWITCH_OPEN = 36,
  MASTER_EXCLUSION = 37,
  AUTO_EXCLUSION = 38,
  ERASING_INTERNAL_EEPROM = 98,
  ERASING_EXTERNAL_EEPROM = 99,
  COUNTING_EEPROM = 100,
  FREEZE = 101
};

enum class InverterState : uint8_t
{
  STAND_BY = 0,
  CHECKING_GRID = 1,
  RUN = 2,
  BULK_OV = 3,
  OUT_OC = 4,
  IGBT_SAT = 5,
  BULK_UV = 6,
  DEGAUSS_ERROR = 7,
  NO_PARAMETERS = 8,
  BULK_LOW = 9,
  GRID_OV = 10,
  COMMUNICATION_ERROR = 11,
  DEGAUSSING = 12,
  STARTING = 13,
  BULK_CAP_FAIL = 14,
  LEAK_FAIL = 15,
  DCDC_FAIL = 16,
  ILEAK_SENSOR_FAIL = 17,
  SELF_TEST_RELAY_INVERTER = 18,
  SELF_TEST_WAIT_SENSOR_TEST = 19,
  SELF_TEST_RELAY_DCDC_SENSOR = 20,
  SELF_TEST_RELAY_INVERTER_FAIL = 21,
  SELF_TEST_TIMEOUT_FAIL = 22,
  SELF_TEST_RELAY_DCDC_FAIL = 23,
  SELF_TEST_1 = 24,
  WAITING_SELF_TEST_START = 25,
  DC_INJECTION = 26,
  SELF_TEST_2 = 27,
  SELF_TEST_3 = 28,
  SELF_TEST_4 = 29,
  INTERNAL_ERROR_30 = 30,
  INTERNAL_ERROR_31 = 31,
  FORBIDDEN_STATE = 40,
  INPUT_UC = 41,
  ZERO_POWER = 42,
  GRID_NOT_PRESENT = 43,
  WAITING_START = 44,
  MPPT = 45,
  GRID_FAIL = 46,
  INPUT_OC = 47
};

enum class DcDcState : uint8_t
{
  OFF = 0,
  RAMP_START = 1,
  MPPT = 2,
  NOT_USED = 3,
  INPUT_OC = 4,
  INPUT_UV = 5,
  INPUT_OV = 6,
  INPUT_LOW = 7,
  NO_PARAMETERS = 8,
  BULK_OV = 9,
  COMMUNICATION_ERROR = 10,
  RAMP_FAIL = 11,
  INTERNAL_ERROR = 12,
  INPUT_MODE_ERROR = 13,
  GROUND_FAULT = 14,
  INVERTER_FAIL = 15,
  IGBT_SAT = 16,
  ILEAK_FAIL = 17,
  GRID_FAIL = 18,
  COMM_ERROR = 19
};

// Requests

struct StateRequest {};
struct PartNumberRequest {};
struct VersionRequest {};

struct MeasureRequest
{
  MeasurementType type = MeasurementType::GRID_VOLTAGE;
  bool global = false;      // module (true) or string-level value
};

struct SerialNumberRequest {};
struct ManufactureDateRequest {};

struct CumulativeEnergyRequest
{
  CumulativeDuration duration = CumulativeDuration::DAILY;
};

using Request = std::variant<
  StateRequest,
  PartNumberRequest,
  VersionRequest,
  MeasureRequest,
  SerialNumberRequest,
  ManufactureDateRequest,
  CumulativeEnergyRequest>;

// Responses
//
// Only StateResponse decodes its status bytes into enums. The remaining
// variants keep trans/global as received; see device_state.hpp for the
// on-demand decoders.

struct StateResponse
{
  TransmissionState trans = TransmissionState::OK;
  GlobalState global = GlobalState::SENDING_PARAMETERS;
  InverterState inverter = InverterState::STAND_BY;
  DcDcState dc1 = DcDcState::OFF;
  DcDcState dc2 = DcDcState::OFF;
  uint8_t alarm = 0;
};

struct PartNumberResponse
{
  std::array<uint8_t, 6> part_number{};
};

struct VersionResponse
{
  uint8_t trans = 0;
  uint8_t global = 0;
  uint8_t par1 = 0;
  uint8_t par2 = 0;
  uint8_t par3 = 0;
  uint8_t par4 = 0;
};

struct MeasureResponse
{
  uint8_t trans = 0;
  uint8_t global = 0;
  float value = 0.0f;
  MeasurementType type = MeasurementType::GRID_VOLTAGE;
};

struct SerialNumberResponse
{
  std::array<uint8_t, 6> serial_number{};
};

struct ManufactureDateResponse
{
  uint8_t trans = 0;
  uint8_t global = 0;
  std::array<uint8_t, 2> week{};
  std::array<uint8_t, 2> year{};
};

struct CumulativeEnergyResponse
{
  uint8_t trans = 0;
  uint8_t global = 0;
  uint32_t value = 0;       // Wh
  CumulativeDuration duration = CumulativeDuration::DAILY;
};

using Response = std::variant<
  StateResponse,
  PartNumberResponse,
  VersionResponse,
  MeasureResponse,
  SerialNumberResponse,
  ManufactureDateResponse,
  CumulativeEnergyResponse>;

CommandCode commandCodeOf(const Request & request);
const char * toString(CommandCode code);

} // namespace protocol
} // namespace aurora

#endif  // AURORA_UTILS__PROTOCOL__TYPES_HPP_
