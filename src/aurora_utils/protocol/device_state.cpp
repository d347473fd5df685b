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

#include "device_state.hpp"

namespace aurora
{
namespace protocol
{

const char * toString(TransmissionState state)
{
  switch (state) {
    case TransmissionState::OK: return "Everything is OK";
    case TransmissionState::COMMAND_NOT_IMPLEMENTED: return "Command is not implemented";
    case TransmissionState::VARIABLE_DOES_NOT_EXIST: return "Variable does not exist";
    case TransmissionState::VARIABLE_OUT_OF_RANGE: return "Variable value is out of range";
    case TransmissionState::EEPROM_NOT_ACCESSIBLE: return "EEprom not accessible";
    case TransmissionState::NOT_TOGGLED_SERVICE_MODE: return "Not toggled service mode";
    case TransmissionState::INTERNAL_MICRO_UNREACHABLE:
      return "Can not send the command to internal micro";
    case TransmissionState::COMMAND_NOT_EXECUTED: return "Command not executed";
    case TransmissionState::VARIABLE_NOT_AVAILABLE: return "Variable not available, retry";
  }
  return nullptr;
}

const char * toString(GlobalState state)
{
  switch (state) {
    case GlobalState::SENDING_PARAMETERS: return "Sending Parameters";
    case GlobalState::WAIT_SUN_GRID: return "Wait Sun/Grid";
    case GlobalState::CHECKING_GRID: return "Checking Grid";
    case GlobalState::MEASURING_RISO: return "Measuring Riso";
    case GlobalState::DCDC_START: return "DcDc Start";
    case GlobalState::INVERTER_START: return "Inverter Start";
    case GlobalState::RUN: return "Run";
    case GlobalState::RECOVERY: return "Recovery";
    case GlobalState::PAUSE: return "Pause";
    case GlobalState::GROUND_FAULT: return "Ground Fault";
    case GlobalState::OTH_FAULT: return "OTH Fault";
    case GlobalState::ADDRESS_SETTING: return "Address Setting";
    case GlobalState::SELF_TEST: return "Self Test";
    case GlobalState::SELF_TEST_FAIL: return "Self Test Fail";
    case GlobalState::SENSOR_TEST_MEAS_RISO: return "Sensor Test + Meas.Riso";
    case GlobalState::LEAK_FAULT: return "Leak Fault";
    case GlobalState::WAITING_MANUAL_RESET: return "Waiting for manual reset";
    case GlobalState::INTERNAL_ERROR_E026: return "Internal Error E026";
    case GlobalState::INTERNAL_ERROR_E027: return "Internal Error E027";
    case GlobalState::INTERNAL_ERROR_E028: return "Internal Error E028";
    case GlobalState::INTERNAL_ERROR_E029: return "Internal Error E029";
    case GlobalState::INTERNAL_ERROR_E030: return "Internal Error E030";
    case GlobalState::SENDING_WIND_TABLE: return "Sending Wind Table";
    case GlobalState::FAILED_SENDING_TABLE: return "Failed Sending table";
    case GlobalState::UTH_FAULT: return "UTH Fault";
    case GlobalState::REMOTE_OFF: return "Remote OFF";
    case GlobalState::INTERLOCK_FAIL: return "Interlock Fail";
    case GlobalState::EXECUTING_AUTOTEST: return "Executing Autotest";
    case GlobalState::WAITING_SUN: return "Waiting Sun";
    case GlobalState::TEMPERATURE_FAULT: return "Temperature Fault";
    case GlobalState::FAN_STUCK: return "Fan Stucked";
    case GlobalState::INTERNAL_COMM_FAULT: return "Int.Com.Fault";
    case GlobalState::SLAVE_INSERTION: return "Slave Insertion";
    case GlobalState::DC_SWITCH_OPEN: return "DC Switch Open";
    case GlobalState::TRAS_SWITCH_OPEN: return "TRAS Switch Open";
    case GlobalState::MASTER_EXCLUSION: return "MASTER Exclusion";
    case GlobalState::AUTO_EXCLUSION: return "Auto Exclusion";
    case GlobalState::ERASING_INTERNAL_EEPROM: return "Erasing Internal EEprom";
    case GlobalState::ERASING_EXTERNAL_EEPROM: return "Erasing External EEprom";
    case GlobalState::COUNTING_EEPROM: return "Counting EEprom";
    case GlobalState::FREEZE: return "Freeze";
  }
  return nullptr;
}

const char * toString(InverterState state)
{
  switch (state) {
    case InverterState::STAND_BY: return "Stand By";
    case InverterState::CHECKING_GRID: return "Checking Grid";
    case InverterState::RUN: return "Run";
    case InverterState::BULK_OV: return "Bulk OV";
    case InverterState::OUT_OC: return "Out OC";
    case InverterState::IGBT_SAT: return "IGBT Sat";
    case InverterState::BULK_UV: return "Bulk UV";
    case InverterState::DEGAUSS_ERROR: return "Degauss Error";
    case InverterState::NO_PARAMETERS: return "No Parameters";
    case InverterState::BULK_LOW: return "Bulk Low";
    case InverterState::GRID_OV: return "Grid OV";
    case InverterState::COMMUNICATION_ERROR: return "Communication Error";
    case InverterState::DEGAUSSING: return "Degaussing";
    case InverterState::STARTING: return "Starting";
    case InverterState::BULK_CAP_FAIL: return "Bulk Cap Fail";
    case InverterState::LEAK_FAIL: return "Leak Fail";
    case InverterState::DCDC_FAIL: return "DcDc Fail";
    case InverterState::ILEAK_SENSOR_FAIL: return "Ileak Sensor Fail";
    case InverterState::SELF_TEST_RELAY_INVERTER: return "SelfTest: relay inverter";
    case InverterState::SELF_TEST_WAIT_SENSOR_TEST: return "SelfTest: wait for sensor test";
    case InverterState::SELF_TEST_RELAY_DCDC_SENSOR: return "SelfTest: test relay DcDc + sensor";
    case InverterState::SELF_TEST_RELAY_INVERTER_FAIL: return "SelfTest: relay inverter fail";
    case InverterState::SELF_TEST_TIMEOUT_FAIL: return "SelfTest timeout fail";
    case InverterState::SELF_TEST_RELAY_DCDC_FAIL: return "SelfTest: relay DcDc fail";
    case InverterState::SELF_TEST_1: return "Self Test 1";
    case InverterState::WAITING_SELF_TEST_START: return "Waiting self test start";
    case InverterState::DC_INJECTION: return "Dc Injection";
    case InverterState::SELF_TEST_2: return "Self Test 2";
    case InverterState::SELF_TEST_3: return "Self Test 3";
    case InverterState::SELF_TEST_4: return "Self Test 4";
    case InverterState::INTERNAL_ERROR_30: return "Internal Error (30)";
    case InverterState::INTERNAL_ERROR_31: return "Internal Error (31)";
    case InverterState::FORBIDDEN_STATE: return "Forbidden State";
    case InverterState::INPUT_UC: return "Input UC";
    case InverterState::ZERO_POWER: return "Zero Power";
    case InverterState::GRID_NOT_PRESENT: return "Grid Not Present";
    case InverterState::WAITING_START: return "Waiting Start";
    case InverterState::MPPT: return "MPPT";
    case InverterState::GRID_FAIL: return "Grid Fail";
    case InverterState::INPUT_OC: return "Input OC";
  }
  return nullptr;
}

const char * toString(DcDcState state)
{
  switch (state) {
    case DcDcState::OFF: return "DcDc OFF";
    case DcDcState::RAMP_START: return "Ramp Start";
    case DcDcState::MPPT: return "MPPT";
    case DcDcState::NOT_USED: return "Not Used";
    case DcDcState::INPUT_OC: return "Input OC";
    case DcDcState::INPUT_UV: return "Input UV";
    case DcDcState::INPUT_OV: return "Input OV";
    case DcDcState::INPUT_LOW: return "Input Low";
    case DcDcState::NO_PARAMETERS: return "No Parameters";
    case DcDcState::BULK_OV: return "Bulk OV";
    case DcDcState::COMMUNICATION_ERROR: return "Communication Error";
    case DcDcState::RAMP_FAIL: return "Ramp Fail";
    case DcDcState::INTERNAL_ERROR: return "Internal Error";
    case DcDcState::INPUT_MODE_ERROR: return "Input mode Error";
    case DcDcState::GROUND_FAULT: return "Ground Fault";
    case DcDcState::INVERTER_FAIL: return "Inverter Fail";
    case DcDcState::IGBT_SAT: return "DcDc IGBT Sat";
    case DcDcState::ILEAK_FAIL: return "DcDc ILEAK Fail";
    case DcDcState::GRID_FAIL: return "DcDc Grid Fail";
    case DcDcState::COMM_ERROR: return "DcDc Comm.Error";
  }
  return nullptr;
}

const char * toString(StateDomain domain)
{
  switch (domain) {
    case StateDomain::TRANSMISSION: return "transmission";
    case StateDomain::GLOBAL: return "global";
    case StateDomain::INVERTER: return "inverter";
    case StateDomain::DCDC: return "dcdc";
  }
  return "unknown";
}

// A raw byte is legal exactly when the name table has an entry for it
template<typename StateT>
static std::optional<StateT> decodeListed(uint8_t raw)
{
  const auto candidate = static_cast<StateT>(raw);
  if (toString(candidate) == nullptr) {
    return std::nullopt;
  }
  return candidate;
}

std::optional<TransmissionState> decodeTransmissionState(uint8_t raw)
{
  return decodeListed<TransmissionState>(raw);
}

std::optional<GlobalState> decodeGlobalState(uint8_t raw)
{
  return decodeListed<GlobalState>(raw);
}

std::optional<InverterState> decodeInverterState(uint8_t raw)
{
  return decodeListed<InverterState>(raw);
}

std::optional<DcDcState> decodeDcDcState(uint8_t raw)
{
  return decodeListed<DcDcState>(raw);
}

} // namespace protocol
} // namespace aurora
