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

#include "config.hpp"

#include "aurora_utils/safety/watchdog.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace aurora
{
namespace config
{

static inline std::string trim(const std::string & s)
{
  size_t i = 0, j = s.size();
  while (i < j && std::isspace(static_cast<unsigned char>(s[i]))) {++i;}
  while (j > i && std::isspace(static_cast<unsigned char>(s[j - 1]))) {--j;}
  return s.substr(i, j - i);
}

// '#' inside a quoted value is data, not a comment (API keys may contain it)
static inline std::string strip_inline_comment(const std::string & s)
{
  char quote = 0;
  for (size_t i = 0; i < s.size(); ++i) {
    char c = s[i];
    if (quote) {
      if (c == quote) {quote = 0;}
    } else if (c == '"' || c == '\'') {
      quote = c;
    } else if (c == '#') {
      return s.substr(0, i);
    }
  }
  return s;
}

static inline bool ieq(const std::string & a, const std::string & b)
{
  if (a.size() != b.size()) {return false;}
  for (size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
      std::tolower(static_cast<unsigned char>(b[i]))) {return false;}
  }
  return true;
}

void Config::validate() const
{
  if (transport == TransportKind::TCP && tcp_address.empty()) {
    throw std::runtime_error("tcp_address missing");
  }
  if (transport == TransportKind::TCP && tcp_address.find(':') == std::string::npos) {
    throw std::runtime_error("tcp_address must be host:port");
  }
  if (transport == TransportKind::SERIAL && serial_port.empty()) {
    throw std::runtime_error("serial_port missing");
  }
  if (baud_rate <= 0) {throw std::runtime_error("baud_rate must be >0");}
  if (inverter_address < 1 || inverter_address > 254) {
    throw std::runtime_error("inverter_address out of range");
  }
  if (poll_interval_ms <= 0) {throw std::runtime_error("poll_interval_ms must be >0");}
  if (timeout_multiplier < 1) {throw std::runtime_error("timeout_multiplier must be >=1");}
  response_timeout();   // throws when the window overflows
  if (skip_ticks < 0) {throw std::runtime_error("skip_ticks must be >=0");}
  if (read_timeout_ms <= 0) {throw std::runtime_error("read_timeout_ms must be >0");}
}

std::chrono::steady_clock::duration Config::response_timeout() const
{
  auto window = safety::Watchdog::scaledWindow(
    poll_interval(), static_cast<uint32_t>(std::max(timeout_multiplier, 0)));
  if (!window) {
    throw std::runtime_error(
      "timeout_multiplier too large for poll_interval_ms (window overflows)");
  }
  return *window;
}

// Very small YAML-ish line parser helpers
static inline bool parse_kv_scalar(const std::string & line, std::string & key, std::string & value)
{
  auto s = strip_inline_comment(line);
  auto pos = s.find(':');
  if (pos == std::string::npos) {return false;}
  key = trim(s.substr(0, pos));
  value = trim(s.substr(pos + 1));
  return !key.empty();
}

static inline int to_int(const std::string & key, const std::string & v)
{
  try {
    size_t used = 0;
    int parsed = std::stoi(v, &used);
    if (used != v.size()) {
      throw std::invalid_argument(v);
    }
    return parsed;
  } catch (const std::exception &) {
    throw std::runtime_error("invalid integer for " + key + ": " + v);
  }
}

static inline std::string unquote(std::string v)
{
  if (!v.empty() && (v.front() == '"' || v.front() == '\'')) {
    if (v.size() >= 2 && v.back() == v.front()) {v = v.substr(1, v.size() - 2);}
  }
  return v;
}

static TransportKind to_transport(const std::string & v)
{
  if (ieq(v, "tcp")) {return TransportKind::TCP;}
  if (ieq(v, "serial")) {return TransportKind::SERIAL;}
  if (ieq(v, "simulated")) {return TransportKind::SIMULATED;}
  throw std::runtime_error("invalid transport: " + v);
}

static protocol::CrcVariant to_crc_variant(const std::string & v)
{
  if (ieq(v, "x25") || ieq(v, "x-25")) {return protocol::CrcVariant::X25;}
  if (ieq(v, "ccitt_false") || ieq(v, "ccitt-false")) {return protocol::CrcVariant::CCITT_FALSE;}
  throw std::runtime_error("invalid crc_variant: " + v);
}

Config parse_from_yaml_string(const std::string & yaml)
{
  Config cfg;

  enum class Sect { NONE, ROOT, PV_OUTPUT };
  Sect sect = Sect::NONE;

  std::stringstream in(yaml);
  std::string line;
  while (std::getline(in, line)) {
    line = strip_inline_comment(line);
    line = trim(line);
    if (line.empty()) {continue;}

    // Section headers
    if (line == "aurora_poller:") {sect = Sect::ROOT; continue;}
    if (line == "pv_output:") {sect = Sect::PV_OUTPUT; continue;}

    // Nested keys are matched against the last seen section; indent is ignored.
    std::string key, value;
    if (!parse_kv_scalar(line, key, value)) {continue;}

    value = unquote(value);

    switch (sect) {
      case Sect::ROOT:
        if (key == "transport") {
          cfg.transport = to_transport(value);
        } else if (key == "tcp_address") {
          cfg.tcp_address = value;
        } else if (key == "serial_port") {
          cfg.serial_port = value;
        } else if (key == "baud_rate") {
          cfg.baud_rate = to_int(key, value);
        } else if (key == "inverter_address") {
          cfg.inverter_address = to_int(key, value);
        } else if (key == "poll_interval_ms") {
          cfg.poll_interval_ms = to_int(key, value);
        } else if (key == "timeout_multiplier") {
          cfg.timeout_multiplier = to_int(key, value);
        } else if (key == "skip_ticks") {
          cfg.skip_ticks = to_int(key, value);
        } else if (key == "read_timeout_ms") {
          cfg.read_timeout_ms = to_int(key, value);
        } else if (key == "crc_variant") {
          cfg.crc_variant = to_crc_variant(value);
        }
        break;

      case Sect::PV_OUTPUT:
        if (key == "system_id") {
          cfg.pv_output.system_id = value;
        } else if (key == "api_key") {
          cfg.pv_output.api_key = value;
        }
        break;

      default: break;
    }
  }

  // Validate at end
  cfg.validate();
  return cfg;
}

Config parse_from_yaml_file(const std::string & path)
{
  std::ifstream in(path);
  if (!in) {throw std::runtime_error("failed to open YAML: " + path);}
  std::stringstream ss; ss << in.rdbuf();
  return parse_from_yaml_string(ss.str());
}

const char * toString(TransportKind kind)
{
  switch (kind) {
    case TransportKind::TCP: return "tcp";
    case TransportKind::SERIAL: return "serial";
    case TransportKind::SIMULATED: return "simulated";
  }
  return "unknown";
}

} // namespace config
} // namespace aurora
